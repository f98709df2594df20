#pragma once

#include "ssz/core/types.h"
#include "ssz/merkle/context.h"
#include "ssz/merkle/leaf-count.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ssz::merkle {

/**
 * Check that `leaf` sits at `index` of a tree of height `depth` with root
 * `root`, given the sibling of each node on the path, lowest first.
 *
 * Bit i of `index` tells whether the node at height i is a right child.
 * No zero hashes are involved: the proof carries every sibling.
 *
 * @throws std::invalid_argument if branch.size() != depth
 */
bool
is_valid_merkle_branch(
    const Node& leaf,
    const std::vector<Node>& branch,
    std::size_t depth,
    std::uint64_t index,
    const Node& root);

/**
 * Branch proving the chunk at `index` of the tree built by
 * merkleize_chunks_with_virtual_padding(chunks, leaf_count, context).
 * Virtual siblings are taken from the context. An index past the real
 * chunks proves a zero leaf.
 *
 * @throws PartialChunkException if chunks.size() is not a multiple of 32
 * @throws InputExceedsLimitException if there are more chunks than leaves
 * @throws std::out_of_range if index >= leaf_count.value()
 */
std::vector<Node>
compute_merkle_branch(
    const std::vector<uint8_t>& chunks,
    LeafCount leaf_count,
    std::uint64_t index,
    const Context& context);

}  // namespace ssz::merkle
