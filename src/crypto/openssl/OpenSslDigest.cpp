#include "nopassplz/crypto/OpenSslDigest.hpp"

#include "nopassplz/crypto/KdfParameters.hpp"
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <stdexcept>

namespace nopassplz::crypto::openssl
{
namespace
{

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

} // namespace

nopassplz::security::SecureBuffer sha3_512(std::span<const std::byte> data)
{
    EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("sha3_512: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_512(), nullptr) != 1)
    {
        throw std::runtime_error("sha3_512: EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("sha3_512: EVP_DigestUpdate failed");
    }

    nopassplz::security::SecureBuffer out{};
    out.resize(g_kSha3_512DigestBytes);
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("sha3_512: EVP_DigestFinal_ex failed");
    }
    return out;
}

nopassplz::security::SecureBuffer hmacSha3_512(std::span<const std::uint8_t> key, std::span<const std::byte> message)
{
    if (key.empty())
    {
        throw std::invalid_argument("hmacSha3_512: empty key");
    }

    EvpMacPtr mac{ EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free };
    if (!mac)
    {
        throw std::runtime_error("hmacSha3_512: OpenSSL HMAC not available");
    }

    EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(mac.get()), &EVP_MAC_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("hmacSha3_512: EVP_MAC_CTX_new failed");
    }

    // OSSL_PARAM takes a non-const char*; keep the digest name in a writable local instead of casting.
    char digestName[]{ "SHA3-512" };
    OSSL_PARAM params[]{
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName, 0),
        OSSL_PARAM_construct_end(),
    };

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1)
    {
        throw std::runtime_error("hmacSha3_512: EVP_MAC_init failed");
    }

    const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
    if (EVP_MAC_update(ctx.get(), msg, message.size()) != 1)
    {
        throw std::runtime_error("hmacSha3_512: EVP_MAC_update failed");
    }

    nopassplz::security::SecureBuffer out{};
    out.resize(g_kSha3_512DigestBytes);
    std::size_t written{ out.size() };
    if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
    {
        throw std::runtime_error("hmacSha3_512: EVP_MAC_final failed");
    }
    return out;
}

} // namespace nopassplz::crypto::openssl
