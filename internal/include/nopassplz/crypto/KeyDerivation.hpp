#ifndef INTERNAL_NOPASSPLZ_CRYPTO_KEYDERIVATION_HPP
#define INTERNAL_NOPASSPLZ_CRYPTO_KEYDERIVATION_HPP

#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace nopassplz::crypto
{

constexpr std::size_t g_kArgon2MinSaltBytes{ 8 };
constexpr std::uint32_t g_kArgon2MinOutputBytes{ 4U };
constexpr std::uint32_t g_kArgon2MaxOutputBytes{ 1024U };

constexpr std::uint32_t g_kIterationsCap{ 32U };
constexpr std::uint32_t g_kParallelismCap{ 16U };
constexpr std::uint32_t g_kMemoryKiBCap{ 16U * 1024U * 1024U };

// Shared by every backend so they reject the same inputs. Throws std::invalid_argument.
void requireArgon2idInputsSafe(std::span<const std::byte> password, std::span<const std::byte> salt,
                               const KdfParameters& params);

// Monocypher-backed Argon2id.
[[nodiscard]] nopassplz::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, const KdfParameters& params);

} // namespace nopassplz::crypto

#endif // INTERNAL_NOPASSPLZ_CRYPTO_KEYDERIVATION_HPP
