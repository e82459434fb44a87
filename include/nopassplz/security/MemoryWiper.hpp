#ifndef INCLUDE_NOPASSPLZ_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace nopassplz::security
{

// Zeroes `bytes` with a call the optimizer may not drop as a dead store.
void secureWipe(std::span<std::byte> bytes) noexcept;

// True when every byte is zero. Reads the whole span regardless of content.
[[nodiscard]] bool isWiped(std::span<const std::byte> bytes) noexcept;

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T, Extent> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T>{ buffer }));
}

template <typename T, std::size_t Extent>
    requires std::is_trivially_copyable_v<T>
[[nodiscard]] bool isWiped(std::span<T, Extent> buffer) noexcept
{
    return isWiped(std::as_bytes(std::span<const T>{ buffer }));
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_MEMORYWIPER_HPP
