#pragma once

#include "ssz/core/types.h"
#include "ssz/merkle/context.h"
#include "ssz/merkle/pack.h"
#include <vector>

namespace ssz::merkle {

/**
 * Anything that has a hash tree root.
 *
 * The context can be shared by every call for the lifetime of the program.
 * hash_tree_root is non-const so that implementations may refresh a
 * MerkleCache they own.
 */
class Merkleized
{
public:
    virtual ~Merkleized() = default;

    virtual Node
    hash_tree_root(const Context& context) = 0;
};

/**
 * Root of a basic value: its little-endian encoding in a single zero padded
 * chunk. No hashing is involved.
 */
template <BasicValue T>
Node
hash_tree_root(T value, const Context& /* context */)
{
    std::vector<uint8_t> chunk;
    serialize_basic<T>(value, chunk);
    pack_bytes(chunk);
    return Node(chunk.data());
}

// A node is a fixed-size basic value and is its own root
inline Node
hash_tree_root(const Node& node, const Context& /* context */)
{
    return node;
}

}  // namespace ssz::merkle
