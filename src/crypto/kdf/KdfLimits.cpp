#include "nopassplz/crypto/KeyDerivation.hpp"

#include <limits>
#include <stdexcept>

namespace nopassplz::crypto
{

void requireArgon2idInputsSafe(std::span<const std::byte> password, std::span<const std::byte> salt,
                               const KdfParameters& params)
{
    if (password.empty())
    {
        throw std::invalid_argument("deriveKey: empty password");
    }
    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKey: password too large");
    }
    if (salt.size() < g_kArgon2MinSaltBytes || salt.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKey: invalid salt size");
    }
    if (params.outputBytes < g_kArgon2MinOutputBytes || params.outputBytes > g_kArgon2MaxOutputBytes)
    {
        throw std::invalid_argument("deriveKey: invalid output length");
    }

    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }
    if (params.parallelism > g_kParallelismCap || params.memoryKiB > g_kMemoryKiBCap ||
        params.iterations > g_kIterationsCap)
    {
        throw std::invalid_argument("deriveKey: unsafe Argon2id parameters");
    }

    // Argon2 needs two blocks per lane per sync point; memory must split evenly into the 4 segments of each lane.
    if (const std::uint32_t minMemoryKiB{ params.parallelism * 8U }; params.memoryKiB < minMemoryKiB)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }
    const std::uint32_t memoryMultiple{ params.parallelism * 4U };
    if ((params.memoryKiB % memoryMultiple) != 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }
}

} // namespace nopassplz::crypto
