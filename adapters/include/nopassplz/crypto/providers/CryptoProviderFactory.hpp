#ifndef INCLUDE_NOPASSPLZ_CRYPTO_PROVIDERS_CRYPTOPROVIDERFACTORY_HPP
#define INCLUDE_NOPASSPLZ_CRYPTO_PROVIDERS_CRYPTOPROVIDERFACTORY_HPP

#include "nopassplz/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace nopassplz::crypto::providers
{

// Both backends derive identical bytes for identical inputs.
enum class CryptoBackend : std::uint8_t
{
    // Argon2id from Monocypher; SHA3 primitives from OpenSSL.
    Native,
    // Every primitive from OpenSSL. Argon2id needs OpenSSL 3.2 or newer at runtime;
    // older libraries make deriveKey throw std::runtime_error.
    OpenSsl,
};

[[nodiscard]] std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeNativeCryptoProvider();
[[nodiscard]] std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeOpenSslCryptoProvider();
[[nodiscard]] std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeCryptoProvider(CryptoBackend backend);

// "native" or "openssl".
[[nodiscard]] std::string_view cryptoBackendName(CryptoBackend backend) noexcept;
[[nodiscard]] std::optional<CryptoBackend> parseCryptoBackend(std::string_view name) noexcept;

} // namespace nopassplz::crypto::providers

#endif // INCLUDE_NOPASSPLZ_CRYPTO_PROVIDERS_CRYPTOPROVIDERFACTORY_HPP
