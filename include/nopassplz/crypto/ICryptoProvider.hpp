#ifndef INCLUDE_NOPASSPLZ_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_NOPASSPLZ_CRYPTO_ICRYPTOPROVIDER_HPP

#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace nopassplz::crypto
{

// Implementations must be safe to call from several threads at once.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Argon2id v1.3, no secret key, no associated data.
    // Contract violations (empty password, short salt, unsafe params) throw std::invalid_argument;
    // backend failures throw std::runtime_error.
    [[nodiscard]] virtual nopassplz::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                                      std::span<const std::byte> salt,
                                                                      const KdfParameters& params) const = 0;

    [[nodiscard]] virtual nopassplz::security::SecureBuffer digestSha3_512(std::span<const std::byte> data) const = 0;

    [[nodiscard]] virtual nopassplz::security::SecureBuffer hmacSha3_512(std::span<const std::uint8_t> key,
                                                                         std::span<const std::byte> message) const = 0;
};

} // namespace nopassplz::crypto

#endif // INCLUDE_NOPASSPLZ_CRYPTO_ICRYPTOPROVIDER_HPP
