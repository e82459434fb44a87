#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"
#include "nopassplz/security/SecureEquals.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

} // namespace

TEST(CryptoProviderParity, DeriveKeyNativeEqualsOpenSsl)
{
    auto native{ nopassplz::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ nopassplz::crypto::providers::makeOpenSslCryptoProvider() };

    std::array<std::byte, 64> salt{};
    salt[0] = std::byte{ 0x42 };
    salt[1] = std::byte{ 0x99 };

    constexpr std::string_view kPassword{ "password" };

    for (const std::uint32_t lanes : { 1U, 2U })
    {
        const nopassplz::crypto::KdfParameters params{ .memoryKiB = 64U, .iterations = 2U, .parallelism = lanes };

        const auto nativeKey{ native->deriveKey(asBytes(kPassword), std::span{ salt }, params) };

        nopassplz::security::SecureBuffer opensslKey{};
        try
        {
            opensslKey = openssl->deriveKey(asBytes(kPassword), std::span{ salt }, params);
        }
        catch (const std::runtime_error& e)
        {
            GTEST_SKIP() << e.what();
        }

        ASSERT_EQ(nativeKey.size(), nopassplz::crypto::g_kSeedBytes);
        ASSERT_EQ(opensslKey.size(), nopassplz::crypto::g_kSeedBytes);
        EXPECT_TRUE(nopassplz::security::secureEquals(nativeKey, opensslKey)) << "lanes=" << lanes;
    }
}
