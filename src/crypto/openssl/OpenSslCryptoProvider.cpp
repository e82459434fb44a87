#include "nopassplz/crypto/KeyDerivation.hpp"
#include "nopassplz/crypto/OpenSslDigest.hpp"
#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>

namespace nopassplz::crypto::providers
{
namespace
{

// Parameter names of the OpenSSL 3.2 Argon2 KDF; spelled out so the code still builds against 3.0/3.1 headers.
constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    if (EVP_KDF * kdf{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr) }; kdf != nullptr)
    {
        return EvpKdfPtr{ kdf, &EVP_KDF_free };
    }
    return EvpKdfPtr{ nullptr, &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public nopassplz::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] nopassplz::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::byte> salt,
                                                              const nopassplz::crypto::KdfParameters& params) const override
    {
        nopassplz::crypto::requireArgon2idInputsSafe(password, salt, params);

        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveKey: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        // Lane count fixes the output; thread count does not. One thread avoids OSSL_set_max_threads.
        std::uint32_t threads{ 1U };
        std::uint32_t version{ nopassplz::crypto::g_kArgon2VersionV13 };

        // OSSL_PARAM takes non-const pointers even for inputs.
        auto passwordCopy{ nopassplz::security::secureBufferFrom(password) };
        auto saltCopy{ nopassplz::security::secureBufferFrom(salt) };

        OSSL_PARAM osslParams[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        nopassplz::security::SecureBuffer out{};
        out.resize(params.outputBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), osslParams) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
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

private:
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace nopassplz::crypto::providers
