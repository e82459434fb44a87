#ifndef INCLUDE_NOPASSPLZ_SECURITY_SECURESTRING_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_SECURESTRING_HPP

#include "nopassplz/security/SecureBuffer.hpp"
#include "nopassplz/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace nopassplz::security
{
// UTF-8 text that must not outlive its use: credentials and derived passwords.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Use parentheses to strictly enforce the Range Constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

// Counts code points, not bytes: every byte except UTF-8 continuation bytes (10xxxxxx) starts one.
[[nodiscard]] inline std::size_t utf8CharLength(const SecureString& s) noexcept
{
    constexpr unsigned char kContinuationMask{ 0xC0U };
    constexpr unsigned char kContinuationTag{ 0x80U };

    std::size_t count{};
    for (const char c : s)
    {
        if ((static_cast<unsigned char>(c) & kContinuationMask) != kContinuationTag)
        {
            ++count;
        }
    }
    return count;
}

inline void secureWipeSize(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipeSize(s);
    SecureString temp{};
    s.swap(temp);
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_SECURESTRING_HPP
