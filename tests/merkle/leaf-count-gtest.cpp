#include "ssz/merkle/leaf-count.h"
#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>

using ssz::merkle::LeafCount;

TEST(LeafCount, ExactAcceptsPowersOfTwo)
{
    EXPECT_EQ(LeafCount::exact(1).value(), 1u);
    EXPECT_EQ(LeafCount::exact(1).depth(), 0u);
    EXPECT_EQ(LeafCount::exact(1024).depth(), 10u);
    auto largest = LeafCount::exact(std::uint64_t{1} << 63);
    EXPECT_EQ(largest.depth(), 63u);
    EXPECT_EQ(largest.value(), std::uint64_t{1} << 63);
}

TEST(LeafCount, ExactRejectsOthers)
{
    EXPECT_THROW(LeafCount::exact(0), std::invalid_argument);
    EXPECT_THROW(LeafCount::exact(3), std::invalid_argument);
    EXPECT_THROW(LeafCount::exact(1000), std::invalid_argument);
}

TEST(LeafCount, CoveringRoundsUp)
{
    EXPECT_EQ(LeafCount::covering(0).value(), 1u);
    EXPECT_EQ(LeafCount::covering(1).value(), 1u);
    EXPECT_EQ(LeafCount::covering(2).value(), 2u);
    EXPECT_EQ(LeafCount::covering(3).value(), 4u);
    EXPECT_EQ(LeafCount::covering(70).value(), 128u);
    EXPECT_EQ(LeafCount::covering(70).depth(), 7u);
    EXPECT_EQ(
        LeafCount::covering((std::uint64_t{1} << 62) + 1),
        LeafCount::exact(std::uint64_t{1} << 63));
}

TEST(LeafCount, CoveringRejectsUnrepresentable)
{
    EXPECT_THROW(
        LeafCount::covering((std::uint64_t{1} << 63) + 1), std::out_of_range);
}
