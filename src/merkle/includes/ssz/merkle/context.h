#pragma once

#include "ssz/core/types.h"
#include "ssz/merkle/chunks.h"
#include <array>
#include <cstddef>

namespace ssz::merkle {

/**
 * Precomputed roots of all-zero subtrees.
 *
 * Entry `i` is the root of a perfect binary tree of height `i` whose leaves
 * are all the zero chunk, so entry 0 is the zero chunk and entry `i + 1` is
 * H(entry[i] || entry[i]).
 *
 * A Context holds no per-call state. Build one at startup and pass it by
 * const reference into every hashing call, from any number of threads.
 */
class Context
{
public:
    static constexpr std::size_t MAX_DEPTH = MAX_MERKLE_TREE_DEPTH;

    Context();

    /**
     * Zero-subtree root at `depth`.
     * @throws InvalidDepthException if depth >= MAX_DEPTH
     */
    const Node&
    operator[](std::size_t depth) const;

    const Node&
    zero_hash(std::size_t depth) const
    {
        return (*this)[depth];
    }

private:
    std::array<Node, MAX_DEPTH> zero_hashes_;
};

}  // namespace ssz::merkle
