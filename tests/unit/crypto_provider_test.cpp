#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "test_utils/TestUtils.hpp"
#include "nopassplz/crypto/KeyDerivation.hpp"
#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"
#include "nopassplz/security/SecureEquals.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

using nopassplz::crypto::providers::CryptoBackend;

class CryptoProviderDigestTest : public ::testing::TestWithParam<CryptoBackend>
{
protected:
    std::unique_ptr<nopassplz::crypto::ICryptoProvider> m_provider{ // NOLINT
        nopassplz::crypto::providers::makeCryptoProvider(GetParam())
    };
};

} // namespace

TEST_P(CryptoProviderDigestTest, Sha3_512OfEmptyInput)
{
    const auto digest = m_provider->digestSha3_512({});
    EXPECT_EQ(nopassplz::test_utils::toHex(nopassplz::security::asSpan(digest)),
              "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
              "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
}

TEST_P(CryptoProviderDigestTest, Sha3_512OfAbc)
{
    const auto digest = m_provider->digestSha3_512(asBytes("abc"));
    EXPECT_EQ(nopassplz::test_utils::toHex(nopassplz::security::asSpan(digest)),
              "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
              "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST_P(CryptoProviderDigestTest, HmacIsKeyedAndDeterministic)
{
    std::array<std::uint8_t, 64> keyA{};
    std::array<std::uint8_t, 64> keyB{};
    keyB[0] = 0x01U;
    const std::array<std::byte, 4> message{ std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 }, std::byte{ 7 } };

    const auto a1 = m_provider->hmacSha3_512(std::span<const std::uint8_t>{ keyA }, std::span{ message });
    const auto a2 = m_provider->hmacSha3_512(std::span<const std::uint8_t>{ keyA }, std::span{ message });
    const auto b = m_provider->hmacSha3_512(std::span<const std::uint8_t>{ keyB }, std::span{ message });

    ASSERT_EQ(a1.size(), nopassplz::crypto::g_kSha3_512DigestBytes);
    EXPECT_TRUE(nopassplz::security::secureEquals(a1, a2));
    EXPECT_FALSE(nopassplz::security::secureEquals(a1, b));
}

INSTANTIATE_TEST_SUITE_P(Backends, CryptoProviderDigestTest,
                         ::testing::Values(CryptoBackend::Native, CryptoBackend::OpenSsl),
                         [](const ::testing::TestParamInfo<CryptoBackend>& info)
                         { return std::string{ info.param == CryptoBackend::Native ? "Native" : "OpenSsl" }; });

TEST(NativeCryptoProvider, DeriveKeyMatchesKdfBackend)
{
    auto provider = nopassplz::crypto::providers::makeNativeCryptoProvider();

    std::array<std::byte, 16> salt{};
    salt[0] = std::byte{ 0x01 };
    constexpr nopassplz::crypto::KdfParameters kParams{ .memoryKiB = 8U, .iterations = 1U, .parallelism = 1U };

    const auto a = provider->deriveKey(asBytes("password"), std::span{ salt }, kParams);
    const auto b = nopassplz::crypto::deriveKeyArgon2id(asBytes("password"), std::span{ salt }, kParams);

    ASSERT_EQ(a.size(), nopassplz::crypto::g_kSeedBytes);
    EXPECT_TRUE(nopassplz::security::secureEquals(a, b));
}

TEST(OpenSslCryptoProvider, DeriveKeyValidatesBeforeBackendLookup)
{
    auto provider = nopassplz::crypto::providers::makeOpenSslCryptoProvider();
    std::array<std::byte, 16> salt{};

    EXPECT_THROW((void)provider->deriveKey({}, std::span{ salt }, { .memoryKiB = 8U, .iterations = 1U, .parallelism = 1U }),
                 std::invalid_argument);
}

TEST(CryptoBackendTest, NamesRoundTripThroughParse)
{
    using nopassplz::crypto::providers::cryptoBackendName;
    using nopassplz::crypto::providers::parseCryptoBackend;

    EXPECT_EQ(cryptoBackendName(CryptoBackend::Native), "native");
    EXPECT_EQ(cryptoBackendName(CryptoBackend::OpenSsl), "openssl");
    EXPECT_EQ(parseCryptoBackend("openssl"), CryptoBackend::OpenSsl);
    EXPECT_EQ(parseCryptoBackend("native"), CryptoBackend::Native);
    EXPECT_FALSE(parseCryptoBackend("OpenSSL").has_value());
    EXPECT_FALSE(parseCryptoBackend("").has_value());
}
