#include "ssz/merkle/context.h"
#include "ssz/core/logger.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/merkleize.h"

namespace ssz::merkle {

Context::Context()
{
    crypto::Sha256Hasher hasher;
    zero_hashes_[0] = Node::zero();
    for (std::size_t i = 0; i + 1 < MAX_DEPTH; ++i)
    {
        zero_hashes_[i + 1] =
            hash_nodes(hasher, zero_hashes_[i], zero_hashes_[i]);
    }
    LOGD("Computed zero hashes for ", MAX_DEPTH, " tree depths");
}

const Node&
Context::operator[](std::size_t depth) const
{
    if (depth >= MAX_DEPTH)
    {
        throw InvalidDepthException(depth, MAX_DEPTH - 1);
    }
    return zero_hashes_[depth];
}

}  // namespace ssz::merkle
