#ifndef INCLUDE_NOPASSPLZ_CORE_INDEXDERIVER_HPP
#define INCLUDE_NOPASSPLZ_CORE_INDEXDERIVER_HPP

#include "nopassplz/core/Seed.hpp"
#include "nopassplz/crypto/ICryptoProvider.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>

namespace nopassplz::core
{

constexpr std::size_t g_kDerivedPasswordChars{ 128 };

// hex(HMAC-SHA3-512(key = seed, message = big-endian u32 index)): 128 lowercase hex characters.
// Pure function of (seed, index). Throws std::logic_error if the seed was erased.
[[nodiscard]] nopassplz::security::SecureString deriveAt(const nopassplz::crypto::ICryptoProvider& crypto,
                                                         const Seed& seed, std::uint32_t index);

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_INDEXDERIVER_HPP
