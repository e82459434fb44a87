#ifndef INCLUDE_NOPASSPLZ_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_SECUREEQUALS_HPP

#include "nopassplz/security/SecureBuffer.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <cstddef>
#include <span>
#include <type_traits>

namespace nopassplz::security
{

// Time depends on the length only, never on where the first difference is.
// Used for password confirmation and for comparing key material in tests.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::byte diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff = diff | (a[i] ^ b[i]);
    }
    return diff == std::byte{};
}

template <typename T, std::size_t ExtentA, std::size_t ExtentB>
    requires std::is_trivially_copyable_v<T>
[[nodiscard]] bool secureEquals(std::span<const T, ExtentA> a, std::span<const T, ExtentB> b) noexcept
{
    return secureEquals(std::as_bytes(std::span<const T>{ a }), std::as_bytes(std::span<const T>{ b }));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureString& a, const SecureString& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_SECUREEQUALS_HPP
