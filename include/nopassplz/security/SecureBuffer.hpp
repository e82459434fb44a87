#ifndef INCLUDE_NOPASSPLZ_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_SECUREBUFFER_HPP

#include "nopassplz/security/ZeroAllocator.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace nopassplz::security
{
// Variable-length secret bytes: digests, MAC outputs and raw KDF output.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

// Copies `bytes` into wiping storage, e.g. for C APIs that want a mutable pointer.
[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::byte> bytes)
{
    SecureBuffer out(bytes.size());
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](std::byte b) { return std::to_integer<std::uint8_t>(b); });
    return out;
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(asSpan(b));
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

// Zeroes the contents but keeps the size.
inline void secureWipeSize(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
}

// Zeroes the contents and gives the storage back.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeSize(b);
    SecureBuffer{}.swap(b);
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_SECUREBUFFER_HPP
