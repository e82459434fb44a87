#include "nopassplz/core/IndexDeriver.hpp"

#include "BigEndian.hpp"
#include "nopassplz/security/Hex.hpp"
#include "nopassplz/security/ScopeWipe.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include <span>

namespace nopassplz::core
{

nopassplz::security::SecureString deriveAt(const nopassplz::crypto::ICryptoProvider& crypto, const Seed& seed,
                                           std::uint32_t index)
{
    const auto message{ detail::encodeU32BE(index) };

    return seed.unlock(
        [&](std::span<const std::uint8_t, Seed::g_kSize> key)
        {
            nopassplz::security::SecureBuffer mac{ crypto.hmacSha3_512(key, std::span<const std::byte>{ message }) };
            auto wipeMac = nopassplz::security::scopeWipe(mac);

            return nopassplz::security::toHexSecure(nopassplz::security::asSpan(mac));
        });
}

} // namespace nopassplz::core
