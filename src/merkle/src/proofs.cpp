#include "ssz/merkle/proofs.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/merkleize.h"
#include <stdexcept>
#include <string>

namespace ssz::merkle {

bool
is_valid_merkle_branch(
    const Node& leaf,
    const std::vector<Node>& branch,
    std::size_t depth,
    std::uint64_t index,
    const Node& root)
{
    if (branch.size() != depth)
    {
        throw std::invalid_argument(
            "Merkle branch has " + std::to_string(branch.size()) +
            " nodes, expected " + std::to_string(depth));
    }

    crypto::Sha256Hasher hasher;
    Node value = leaf;
    for (std::size_t i = 0; i < depth; ++i)
    {
        const bool is_right = i < 64 && ((index >> i) & 1) != 0;
        value = is_right ? hash_nodes(hasher, branch[i], value)
                         : hash_nodes(hasher, value, branch[i]);
    }
    return value == root;
}

std::vector<Node>
compute_merkle_branch(
    const std::vector<uint8_t>& chunks,
    LeafCount leaf_count,
    std::uint64_t index,
    const Context& context)
{
    require_chunks(chunks);
    if (chunk_count(chunks) > leaf_count.value())
    {
        throw InputExceedsLimitException(leaf_count.value());
    }
    if (index >= leaf_count.value())
    {
        throw std::out_of_range(
            "Leaf index " + std::to_string(index) + " out of range for " +
            std::to_string(leaf_count.value()) + " leaves");
    }

    std::vector<Node> level;
    level.reserve(chunk_count(chunks));
    for (std::size_t i = 0; i < chunk_count(chunks); ++i)
    {
        level.emplace_back(chunks.data() + i * BYTES_PER_CHUNK);
    }

    crypto::Sha256Hasher hasher;
    std::vector<Node> branch;
    branch.reserve(leaf_count.depth());
    for (std::size_t depth = 0; depth < leaf_count.depth(); ++depth)
    {
        const std::uint64_t sibling = index ^ 1;
        branch.push_back(
            sibling < level.size() ? level[sibling] : context[depth]);
        level = hash_level(hasher, level, depth, context);
        index >>= 1;
    }
    return branch;
}

}  // namespace ssz::merkle
