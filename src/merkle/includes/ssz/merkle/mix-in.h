#pragma once

#include "ssz/core/types.h"
#include "ssz/merkle/context.h"
#include <cstdint>

namespace ssz::merkle {

// Largest selector a union may carry
inline constexpr std::uint64_t MAX_UNION_SELECTOR = 127;

/**
 * H(root || hash_tree_root(decoration)), the decoration being encoded as a
 * little-endian 256-bit unsigned integer in a single chunk.
 */
Node
mix_in_decoration(
    const Node& root,
    std::uint64_t decoration,
    const Context& context);

// Binds the element count of a variable-length sequence into its root
Node
mix_in_length(const Node& root, std::uint64_t length, const Context& context);

/**
 * Binds the active variant of a union into its root.
 * @throws std::invalid_argument if selector > MAX_UNION_SELECTOR
 */
Node
mix_in_selector(
    const Node& root,
    std::uint64_t selector,
    const Context& context);

}  // namespace ssz::merkle
