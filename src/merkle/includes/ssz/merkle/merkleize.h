#pragma once

#include "ssz/core/types.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/context.h"
#include "ssz/merkle/leaf-count.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ssz::merkle {

/**
 * H(left || right) written to `out`.
 *
 * Both inputs are fed to the hasher before anything is written, so `out`
 * may alias `left` or `right`.
 */
void
hash_nodes(
    crypto::Sha256Hasher& hasher,
    const uint8_t* left,
    const uint8_t* right,
    uint8_t* out);

Node
hash_nodes(crypto::Sha256Hasher& hasher, const Node& left, const Node& right);

/**
 * Root of the tree whose leaves are `chunks`, padded with zero chunks to
 * next_power_of_two(limit) leaves, or to next_power_of_two(chunk count)
 * when no limit is given.
 *
 * @throws PartialChunkException if chunks.size() is not a multiple of 32
 * @throws InputExceedsLimitException if limit < chunk count
 */
Node
merkleize(
    const std::vector<uint8_t>& chunks,
    std::optional<std::size_t> limit,
    const Context& context);

// merkleize() over a sequence of nodes (field or element roots)
Node
merkleize(
    const std::vector<Node>& nodes,
    std::optional<std::size_t> limit,
    const Context& context);

/**
 * Root of a perfect tree of `leaf_count` leaves whose leftmost leaves are
 * `chunks` and the rest zero chunks.
 *
 * Only the real chunks are stored and hashed. Any subtree to the right of
 * the last real node is taken from the context, so the cost is
 * O(chunk count + depth) whatever the leaf count.
 *
 * @throws PartialChunkException if chunks.size() is not a multiple of 32
 * @throws InputExceedsLimitException if there are more chunks than leaves
 */
Node
merkleize_chunks_with_virtual_padding(
    const std::vector<uint8_t>& chunks,
    LeafCount leaf_count,
    const Context& context);

/**
 * Parents of one level of real nodes sitting at `depth` above the leaves.
 * A missing right sibling is the zero-subtree root context[depth]. The
 * result has (level.size() + 1) / 2 nodes.
 */
std::vector<Node>
hash_level(
    crypto::Sha256Hasher& hasher,
    const std::vector<Node>& level,
    std::size_t depth,
    const Context& context);

}  // namespace ssz::merkle
