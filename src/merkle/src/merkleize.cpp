#include "ssz/merkle/merkleize.h"
#include "ssz/core/logger.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"
#include <cstring>

namespace ssz::merkle {

void
hash_nodes(
    crypto::Sha256Hasher& hasher,
    const uint8_t* left,
    const uint8_t* right,
    uint8_t* out)
{
    hasher.update(left, BYTES_PER_CHUNK);
    hasher.update(right, BYTES_PER_CHUNK);
    Node parent = hasher.finalize();
    std::memcpy(out, parent.data(), BYTES_PER_CHUNK);
}

Node
hash_nodes(crypto::Sha256Hasher& hasher, const Node& left, const Node& right)
{
    hasher.update(left.data(), Node::size());
    hasher.update(right.data(), Node::size());
    return hasher.finalize();
}

Node
merkleize(
    const std::vector<uint8_t>& chunks,
    std::optional<std::size_t> limit,
    const Context& context)
{
    require_chunks(chunks);
    const std::size_t count = chunk_count(chunks);
    if (limit && *limit < count)
    {
        LOGD("Refusing ", count, " chunks against limit ", *limit);
        throw InputExceedsLimitException(*limit);
    }
    return merkleize_chunks_with_virtual_padding(
        chunks, LeafCount::covering(limit.value_or(count)), context);
}

Node
merkleize(
    const std::vector<Node>& nodes,
    std::optional<std::size_t> limit,
    const Context& context)
{
    std::vector<uint8_t> chunks(nodes.size() * BYTES_PER_CHUNK);
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        std::memcpy(
            chunks.data() + i * BYTES_PER_CHUNK,
            nodes[i].data(),
            BYTES_PER_CHUNK);
    }
    return merkleize(chunks, limit, context);
}

Node
merkleize_chunks_with_virtual_padding(
    const std::vector<uint8_t>& chunks,
    LeafCount leaf_count,
    const Context& context)
{
    require_chunks(chunks);
    const std::size_t count = chunk_count(chunks);
    if (count > leaf_count.value())
    {
        throw InputExceedsLimitException(leaf_count.value());
    }

    if (count == 0)
    {
        return context[leaf_count.depth()];
    }

    // Working buffer holding the real nodes of the current level, node i at
    // offset i * BYTES_PER_CHUNK. Parents are written back into the same
    // buffer: the parent of pair (i, i + 1) goes to slot i / 2, which is
    // either the left child itself (i == 0) or a slot whose node was already
    // consumed earlier in this level. hash_nodes reads both children before
    // writing, so no unread child is ever overwritten.
    std::vector<uint8_t> layer(chunks);
    crypto::Sha256Hasher hasher;

    // Nodes beyond last_index are virtual and never read from the buffer
    std::size_t last_index = count - 1;
    for (std::size_t depth = 0; depth < leaf_count.depth(); ++depth)
    {
        for (std::size_t i = 0; i <= last_index; i += 2)
        {
            uint8_t* left = layer.data() + i * BYTES_PER_CHUNK;
            const uint8_t* right = (i < last_index)
                ? left + BYTES_PER_CHUNK
                : context[depth].data();
            hash_nodes(
                hasher, left, right, layer.data() + (i / 2) * BYTES_PER_CHUNK);
        }
        last_index /= 2;
    }

    return Node(layer.data());
}

std::vector<Node>
hash_level(
    crypto::Sha256Hasher& hasher,
    const std::vector<Node>& level,
    std::size_t depth,
    const Context& context)
{
    std::vector<Node> parents;
    parents.reserve((level.size() + 1) / 2);
    for (std::size_t i = 0; i < level.size(); i += 2)
    {
        const Node& right =
            (i + 1 < level.size()) ? level[i + 1] : context[depth];
        parents.push_back(hash_nodes(hasher, level[i], right));
    }
    return parents;
}

}  // namespace ssz::merkle
