#ifndef INCLUDE_NOPASSPLZ_SECURITY_HEX_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_HEX_HPP

#include "nopassplz/security/SecureString.hpp"
#include <cstdint>
#include <span>

namespace nopassplz::security
{

// Lowercase hex, written straight into wiping storage so no plain std::string copy exists.
[[nodiscard]] inline SecureString toHexSecure(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    SecureString out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_HEX_HPP
