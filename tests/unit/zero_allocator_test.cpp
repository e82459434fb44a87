#include <gtest/gtest.h>

#include "nopassplz/security/ZeroAllocator.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using nopassplz::security::ZeroAllocator;

TEST(ZeroAllocatorTests, GrowingVectorKeepsContents)
{
    constexpr std::size_t kLargeSize = 4096;

    std::vector<char, ZeroAllocator<char>> password;
    for (const char c : std::string{ "correct horse" })
    {
        password.push_back(c);
    }

    // Forces reallocation; the abandoned buffer is wiped by deallocate().
    password.resize(kLargeSize, 'x');

    ASSERT_EQ(password.size(), kLargeSize);
    EXPECT_EQ(std::string(password.begin(), password.begin() + 13), "correct horse");
}

TEST(ZeroAllocatorTests, RebindingPreservesEquality)
{
    ZeroAllocator<char> a1;
    ZeroAllocator<std::uint8_t> a2(a1);
    ZeroAllocator<char> a3;

    EXPECT_TRUE(a1 == a2);
    EXPECT_TRUE(a1 == a3);
    EXPECT_FALSE(a1 != a3);
}

TEST(ZeroAllocatorTests, AllocateZeroReturnsNull)
{
    ZeroAllocator<std::uint8_t> alloc;
    EXPECT_EQ(alloc.allocate(0), nullptr);
}

TEST(ZeroAllocatorTests, AllocateTooLargeThrows)
{
    ZeroAllocator<std::uint64_t> alloc;
    const std::size_t impossibleSize = std::numeric_limits<std::size_t>::max();

    EXPECT_THROW({ [[maybe_unused]] auto* ptr = alloc.allocate(impossibleSize); }, std::bad_array_new_length);
}

TEST(ZeroAllocatorTests, DeallocateNullDoesNotCrash)
{
    ZeroAllocator<std::uint8_t> alloc;
    alloc.deallocate(nullptr, 64);

    SUCCEED();
}

TEST(ZeroAllocatorTests, MaxSizeScalesWithElementSize)
{
    EXPECT_EQ(ZeroAllocator<std::uint64_t>::max_size(), std::numeric_limits<std::size_t>::max() / 8U);
    EXPECT_EQ(ZeroAllocator<std::uint8_t>::max_size(), std::numeric_limits<std::size_t>::max());
}

TEST(ZeroAllocatorTests, ShrinkToFitKeepsContents)
{
    std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>> seed(128U, 0x42U);
    seed.resize(64U);
    seed.shrink_to_fit();

    ASSERT_EQ(seed.size(), 64U);
    EXPECT_EQ(seed.front(), 0x42U);
    EXPECT_EQ(seed.back(), 0x42U);
}
