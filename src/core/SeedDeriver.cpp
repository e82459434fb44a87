#include "nopassplz/core/SeedDeriver.hpp"

#include "nopassplz/security/ScopeWipe.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <exception>
#include <optional>

namespace nopassplz::core
{

DerivationResult<Seed> deriveSeed(const nopassplz::crypto::ICryptoProvider& crypto,
                                  const nopassplz::security::SecureString& username,
                                  const nopassplz::security::SecureString& password,
                                  const nopassplz::crypto::KdfParameters& params)
{
    // The output must fill the seed exactly; there is no point paying for the KDF otherwise.
    if (params.outputBytes != Seed::size())
    {
        return DerivationError::SeedConversionFailure;
    }

    nopassplz::security::SecureBuffer salt{};
    nopassplz::security::SecureBuffer key{};
    try
    {
        salt = crypto.digestSha3_512(nopassplz::security::asBytes(username));
        auto wipeSalt = nopassplz::security::scopeWipe(salt);

        key = crypto.deriveKey(nopassplz::security::asBytes(password), nopassplz::security::asBytes(salt), params);
    }
    catch (const std::exception&)
    {
        return DerivationError::KdfFailure;
    }
    auto wipeKey = nopassplz::security::scopeWipe(key);

    std::optional<Seed> seed{ Seed::fromBytes(nopassplz::security::asSpan(key)) };
    if (!seed.has_value())
    {
        return DerivationError::SeedConversionFailure;
    }
    return std::move(*seed);
}

} // namespace nopassplz::core
