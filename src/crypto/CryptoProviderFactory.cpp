#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"

namespace nopassplz::crypto::providers
{

std::unique_ptr<nopassplz::crypto::ICryptoProvider> makeCryptoProvider(CryptoBackend backend)
{
    switch (backend)
    {
    case CryptoBackend::Native:
        return makeNativeCryptoProvider();
    case CryptoBackend::OpenSsl:
        return makeOpenSslCryptoProvider();
    }
    return makeNativeCryptoProvider();
}

std::string_view cryptoBackendName(CryptoBackend backend) noexcept
{
    return backend == CryptoBackend::OpenSsl ? "openssl" : "native";
}

std::optional<CryptoBackend> parseCryptoBackend(std::string_view name) noexcept
{
    for (const CryptoBackend backend : { CryptoBackend::Native, CryptoBackend::OpenSsl })
    {
        if (cryptoBackendName(backend) == name)
        {
            return backend;
        }
    }
    return std::nullopt;
}

} // namespace nopassplz::crypto::providers
