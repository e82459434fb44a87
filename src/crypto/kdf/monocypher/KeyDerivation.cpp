#include "nopassplz/crypto/KeyDerivation.hpp"

#include "nopassplz/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <vector>

namespace nopassplz::crypto
{

[[nodiscard]] nopassplz::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, const KdfParameters& params)
{
    requireArgon2idInputsSafe(password, salt, params);

    const std::uint32_t passSize{ static_cast<std::uint32_t>(password.size()) };
    const std::uint32_t saltSize{ static_cast<std::uint32_t>(salt.size()) };

    // The work area holds every Argon2 block; it is wiped on release like any other secret.
    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, nopassplz::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    nopassplz::security::SecureBuffer key;
    key.resize(params.outputBytes);

    const auto* passPtr{ reinterpret_cast<const std::uint8_t*>(password.data()) };
    const auto* saltPtr{ reinterpret_cast<const std::uint8_t*>(salt.data()) };

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = passPtr, .salt = saltPtr, .pass_size = passSize, .salt_size = saltSize };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return key;
}

} // namespace nopassplz::crypto
