#include "nopassplz/crypto/KeyDerivation.hpp"
#include "nopassplz/crypto/OpenSslDigest.hpp"
#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace nopassplz::crypto::providers
{
namespace
{

class NativeCryptoProvider final : public nopassplz::crypto::ICryptoProvider
{
public:
    [[nodiscard]] nopassplz::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::byte> salt,
                                                              const nopassplz::crypto::KdfParameters& params) const override
    {
        return nopassplz::crypto::deriveKeyArgon2id(password, salt, params);
    }

    [[nodiscard]] nopassplz::security::SecureBuffer digestSha3_512(std::span<const std::byte> data) const override
    {
        return nopassplz::crypto::openssl::sha3_512(data);
    }

    [[nodiscard]] nopassplz::security::SecureBuffer hmacSha3_512(std::span<const std::uint8_t> key,
                                                                 std::span<const std::byte> message) const override
    {
        return nopassplz::crypto::openssl::hmacSha3_512(key, message);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace nopassplz::crypto::providers
