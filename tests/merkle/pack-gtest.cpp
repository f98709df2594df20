#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/pack.h"
#include "ssz/test-utils/test-utils.h"
#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ssz::merkle;

TEST(Pack, SingleBool)
{
    std::vector<bool> input = {true};
    auto result = pack_basic(input);

    std::vector<uint8_t> expected(BYTES_PER_CHUNK, 0);
    expected[0] = 1;
    EXPECT_EQ(result, expected);
}

TEST(Pack, SeveralBools)
{
    std::vector<bool> input = {true, false, false, true};
    auto result = pack_basic(input);

    std::vector<uint8_t> expected(BYTES_PER_CHUNK, 0);
    expected[0] = 1;
    expected[3] = 1;
    EXPECT_EQ(result, expected);
}

TEST(Pack, WholeChunksAreNotPadded)
{
    std::vector<std::vector<uint8_t>> input(3, std::vector<uint8_t>(32, 1));
    auto result =
        pack(input, [](const std::vector<uint8_t>& v, std::vector<uint8_t>& out) {
            out.insert(out.end(), v.begin(), v.end());
        });
    EXPECT_EQ(result, std::vector<uint8_t>(3 * 32, 1));
}

TEST(Pack, IntegersAreLittleEndian)
{
    std::vector<std::uint16_t> input = {0x0102, 0xffff};
    auto result = pack_basic(input);
    ASSERT_EQ(result.size(), BYTES_PER_CHUNK);
    EXPECT_EQ(result[0], 0x02);
    EXPECT_EQ(result[1], 0x01);
    EXPECT_EQ(result[2], 0xff);
    EXPECT_EQ(result[3], 0xff);
    EXPECT_EQ(result[4], 0x00);

    std::vector<std::uint64_t> wide = {1, 2, 3, 4, 5};
    EXPECT_EQ(pack_basic(wide).size(), 2 * BYTES_PER_CHUNK);
}

TEST(Pack, MixedWidthMatchesHex)
{
    std::vector<std::uint32_t> input = {0x01020304, 0xdeadbeef};
    EXPECT_EQ(
        pack_basic(input),
        hex_to_vector("04030201efbeadde" + std::string(48, '0')));
}

TEST(Pack, EmptyInputIsEmpty)
{
    std::vector<std::uint32_t> input;
    EXPECT_TRUE(pack_basic(input).empty());
}

TEST(Pack, SerializerFailurePropagates)
{
    std::vector<int> input = {1, 2, 3};
    try
    {
        (void)pack(input, [](int v, std::vector<uint8_t>& out) {
            if (v == 2)
                throw std::runtime_error("value 2 has no encoding");
            out.push_back(static_cast<uint8_t>(v));
        });
        FAIL() << "Expected SerializationException";
    }
    catch (const SerializationException& e)
    {
        EXPECT_NE(
            std::string(e.what()).find("value 2 has no encoding"),
            std::string::npos);
    }
}

TEST(PackBytes, PadsToChunkBoundary)
{
    for (std::size_t len : {1u, 31u, 33u, 63u, 100u})
    {
        std::vector<uint8_t> buffer(len, 0xab);
        pack_bytes(buffer);
        EXPECT_EQ(buffer.size() % BYTES_PER_CHUNK, 0u);
        EXPECT_GE(buffer.size(), len);
        EXPECT_LT(buffer.size(), len + BYTES_PER_CHUNK);
        for (std::size_t i = 0; i < buffer.size(); ++i)
        {
            EXPECT_EQ(buffer[i], i < len ? 0xab : 0x00);
        }
    }
}

TEST(PackBytes, Idempotent)
{
    std::vector<uint8_t> buffer = {1, 2, 3};
    pack_bytes(buffer);
    auto once = buffer;
    pack_bytes(buffer);
    EXPECT_EQ(buffer, once);

    std::vector<uint8_t> empty;
    pack_bytes(empty);
    EXPECT_TRUE(empty.empty());
}

TEST(PackBits, LeastSignificantBitFirst)
{
    std::vector<bool> bits = {false, true, false, true};
    auto result = pack_bits(bits);
    ASSERT_EQ(result.size(), BYTES_PER_CHUNK);
    EXPECT_EQ(result[0], 0x0a);

    std::vector<bool> nine(9, true);
    result = pack_bits(nine);
    EXPECT_EQ(result[0], 0xff);
    EXPECT_EQ(result[1], 0x01);
    EXPECT_EQ(result[2], 0x00);
}

TEST(RequireChunks, RejectsPartialChunk)
{
    EXPECT_NO_THROW(require_chunks(std::vector<uint8_t>(64)));
    EXPECT_NO_THROW(require_chunks(std::vector<uint8_t>()));
    try
    {
        require_chunks(std::vector<uint8_t>(33));
        FAIL() << "Expected PartialChunkException";
    }
    catch (const PartialChunkException& e)
    {
        EXPECT_EQ(e.length(), 33u);
    }
}
