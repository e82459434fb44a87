#include "nopassplz/security/SecureBuffer.hpp"
#include "nopassplz/security/SecureEquals.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <gtest/gtest.h>
#include <vector>

namespace
{

using namespace nopassplz::security;

TEST(SecureEqualsTest, MismatchedSizesReturnFalse)
{
    std::vector<std::byte> a(10);
    std::vector<std::byte> b(5);
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, LastByteDifferenceIsDetected)
{
    SecureBuffer a(64, 0x01U);
    SecureBuffer b(64, 0x01U);
    b.back() = 0x02U;
    EXPECT_FALSE(secureEquals(asSpan(a), asSpan(b)));
    b.back() = 0x01U;
    EXPECT_TRUE(secureEquals(asSpan(a), asSpan(b)));
}

TEST(SecureEqualsTest, ComparesSecureStrings)
{
    EXPECT_TRUE(secureEquals(secureStringFrom("password"), secureStringFrom("password")));
    EXPECT_FALSE(secureEquals(secureStringFrom("password"), secureStringFrom("Password")));
    EXPECT_FALSE(secureEquals(secureStringFrom("password"), secureStringFrom("password ")));
    EXPECT_TRUE(secureEquals(SecureString{}, SecureString{}));
}

TEST(SecureEqualsTest, ComparesFixedSizeSeeds)
{
    std::array<std::uint8_t, 64> a{};
    std::array<std::uint8_t, 64> b{};
    a.fill(0x7FU);
    b.fill(0x7FU);

    EXPECT_TRUE(secureEquals(std::span<const std::uint8_t, 64>{ a }, std::span<const std::uint8_t, 64>{ b }));
    b[0] = 0x00U;
    EXPECT_FALSE(secureEquals(std::span<const std::uint8_t, 64>{ a }, std::span<const std::uint8_t, 64>{ b }));
}

} // namespace
