#include "merkle-test-utils.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkleize.h"
#include <cstring>

using namespace ssz;
using namespace ssz::merkle;

std::vector<uint8_t>
filled_chunks(uint8_t fill, std::size_t count)
{
    return std::vector<uint8_t>(count * BYTES_PER_CHUNK, fill);
}

std::vector<uint8_t>
numbered_chunks(std::size_t count)
{
    std::vector<uint8_t> chunks(count * BYTES_PER_CHUNK, 0);
    for (std::size_t i = 0; i < count; ++i)
    {
        chunks[i * BYTES_PER_CHUNK] = static_cast<uint8_t>(i + 1);
        chunks[i * BYTES_PER_CHUNK + 1] = static_cast<uint8_t>((i + 1) >> 8);
    }
    return chunks;
}

Node
naive_merkleize(const std::vector<uint8_t>& chunks, std::size_t leaf_count)
{
    const std::size_t node_count = 2 * leaf_count - 1;
    const std::size_t leaf_start = (node_count - leaf_count) * BYTES_PER_CHUNK;

    std::vector<uint8_t> buffer(node_count * BYTES_PER_CHUNK, 0);
    if (!chunks.empty())
    {
        std::memcpy(buffer.data() + leaf_start, chunks.data(), chunks.size());
    }

    crypto::Sha256Hasher hasher;
    for (std::size_t i = node_count - 1; i > 0; i -= 2)
    {
        const std::size_t parent = (i - 1) / 2;
        hash_nodes(
            hasher,
            buffer.data() + (i - 1) * BYTES_PER_CHUNK,
            buffer.data() + i * BYTES_PER_CHUNK,
            buffer.data() + parent * BYTES_PER_CHUNK);
    }
    return Node(buffer.data());
}

Node
node(const std::string& hex)
{
    return Node::from_hex(hex);
}

const Context&
test_context()
{
    static const Context context;
    return context;
}
