#include "ssz/core/bit-utils.h"
#include <cstdint>
#include <gtest/gtest.h>

using namespace ssz::core;

TEST(BitUtils, CtzBasic)
{
    EXPECT_EQ(ctz64(1u), 0);
    EXPECT_EQ(ctz64(2u), 1);
    EXPECT_EQ(ctz64(8u), 3);
    EXPECT_EQ(ctz64(0b1100), 2);
    EXPECT_EQ(ctz64(0x8000000000000000ULL), 63);
}

TEST(BitUtils, ClzBasic)
{
    EXPECT_EQ(clz64(1u), 63);
    EXPECT_EQ(clz64(0xFF), 56);
    EXPECT_EQ(clz64(0x8000000000000000ULL), 0);
    EXPECT_EQ(clz64(0xFFFFFFFFFFFFFFFFULL), 0);
}

TEST(BitUtils, IsPowerOfTwo)
{
    EXPECT_FALSE(is_power_of_two(0));
    EXPECT_TRUE(is_power_of_two(1));
    EXPECT_TRUE(is_power_of_two(2));
    EXPECT_FALSE(is_power_of_two(3));
    EXPECT_FALSE(is_power_of_two(6));
    for (int i = 0; i < 64; ++i)
    {
        EXPECT_TRUE(is_power_of_two(std::uint64_t{1} << i));
    }
}

TEST(BitUtils, NextPowerOfTwo)
{
    EXPECT_EQ(next_power_of_two(0), 1u);
    EXPECT_EQ(next_power_of_two(1), 1u);
    EXPECT_EQ(next_power_of_two(2), 2u);
    EXPECT_EQ(next_power_of_two(3), 4u);
    EXPECT_EQ(next_power_of_two(5), 8u);
    EXPECT_EQ(next_power_of_two(1024), 1024u);
    EXPECT_EQ(next_power_of_two(1025), 2048u);
    EXPECT_EQ(
        next_power_of_two((std::uint64_t{1} << 62) + 1),
        std::uint64_t{1} << 63);
    EXPECT_EQ(next_power_of_two(std::uint64_t{1} << 63), std::uint64_t{1} << 63);
}

TEST(BitUtils, NextPowerOfTwoOverflowIsZero)
{
    EXPECT_EQ(next_power_of_two((std::uint64_t{1} << 63) + 1), 0u);
}

TEST(BitUtils, Log2Exact)
{
    for (int i = 0; i < 64; ++i)
    {
        EXPECT_EQ(log2_exact(std::uint64_t{1} << i), i);
    }
}
