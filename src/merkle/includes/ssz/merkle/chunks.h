#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ssz::merkle {

// Size of one leaf of the tree
inline constexpr std::size_t BYTES_PER_CHUNK = 32;

// Number of entries in the zero-hash table (depths 0..63)
inline constexpr std::size_t MAX_MERKLE_TREE_DEPTH = 64;

inline std::size_t
chunk_count(const std::vector<uint8_t>& chunks)
{
    return chunks.size() / BYTES_PER_CHUNK;
}

/**
 * Checks that a buffer holds a whole number of chunks.
 * @throws PartialChunkException otherwise
 */
void
require_chunks(const std::vector<uint8_t>& buffer);

}  // namespace ssz::merkle
