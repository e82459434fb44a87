#ifndef INCLUDE_NOPASSPLZ_CRYPTO_KDFPARAMETERS_HPP
#define INCLUDE_NOPASSPLZ_CRYPTO_KDFPARAMETERS_HPP

#include <cstddef>
#include <cstdint>

namespace nopassplz::crypto
{

constexpr std::size_t g_kSeedBytes{ 64 };
constexpr std::size_t g_kSha3_512DigestBytes{ 64 };

// Argon2 version v1.3 (0x13). Monocypher is hardcoded to this.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

// Argon2id cost configuration. Immutable once chosen for a derivation.
struct KdfParameters final
{
    std::uint32_t memoryKiB;
    std::uint32_t iterations;
    std::uint32_t parallelism;
    std::uint32_t outputBytes{ static_cast<std::uint32_t>(g_kSeedBytes) };

    friend bool operator==(const KdfParameters&, const KdfParameters&) = default;
};

} // namespace nopassplz::crypto

#endif // INCLUDE_NOPASSPLZ_CRYPTO_KDFPARAMETERS_HPP
