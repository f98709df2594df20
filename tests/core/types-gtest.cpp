#include "ssz/core/types.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using ssz::Node;

TEST(Node, DefaultIsZero)
{
    Node node;
    for (std::size_t i = 0; i < Node::size(); ++i)
    {
        EXPECT_EQ(node[i], 0);
    }
    EXPECT_EQ(node, Node::zero());
    EXPECT_EQ(
        node.hex(),
        "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST(Node, HexRoundTrip)
{
    const std::string hex =
        "f5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b";
    Node node = Node::from_hex(hex);
    EXPECT_EQ(node[0], 0xf5);
    EXPECT_EQ(node[31], 0x4b);
    EXPECT_EQ(node.hex(), hex);
    EXPECT_EQ(Node::from_hex("0x" + hex), node);
    EXPECT_EQ(
        Node::from_hex(
            "F5A5FD42D16A20302798EF6ED309979B43003D2320D9F0E8EA9831A92759FB4B"),
        node);
}

TEST(Node, FromHexRejectsBadInput)
{
    EXPECT_THROW(Node::from_hex("00"), std::invalid_argument);
    EXPECT_THROW(
        Node::from_hex(
            "zz00000000000000000000000000000000000000000000000000000000000000"),
        std::invalid_argument);
}

TEST(Node, OrderingIsBytewise)
{
    Node low;
    Node high;
    high[0] = 1;
    Node mid;
    mid[31] = 0xff;
    EXPECT_TRUE(low < high);
    EXPECT_TRUE(mid < high);
    EXPECT_TRUE(low < mid);
    EXPECT_FALSE(high < low);
    EXPECT_NE(low, high);
}

TEST(HexToBytes, Decodes)
{
    EXPECT_TRUE(ssz::hex_to_bytes("").empty());
    auto bytes = ssz::hex_to_bytes("0x01ff");
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0x01);
    EXPECT_EQ(bytes[1], 0xff);
    EXPECT_THROW(ssz::hex_to_bytes("abc"), std::invalid_argument);
}
