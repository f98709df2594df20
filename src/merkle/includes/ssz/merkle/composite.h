#pragma once

#include "ssz/core/types.h"
#include "ssz/merkle/context.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ssz::merkle {

/**
 * Packing and decoration policies of the composite kinds.
 *
 * Each function takes what the serialization layer already produced
 * (packed bytes, bits, or the roots of nested values) and applies the
 * padding limit and decoration of its kind. A concrete container type
 * implements Merkleized by calling the one matching its shape.
 */

// Chunks needed for `count` basic elements of `element_size` bytes each
std::size_t
chunk_count_for_basic(std::size_t element_size, std::size_t count);

// Chunks needed for `bit_count` bits
std::size_t
chunk_count_for_bits(std::size_t bit_count);

// Struct of fields: one leaf per field root
Node
container_root(const std::vector<Node>& field_roots, const Context& context);

// Fixed-length sequence of basic values, already packed
Node
basic_vector_root(const std::vector<uint8_t>& packed, const Context& context);

/**
 * Variable-length sequence of basic values, already packed.
 * @param length element count mixed into the root
 * @param limit_chunks chunk capacity of the declared maximum length
 */
Node
basic_list_root(
    const std::vector<uint8_t>& packed,
    std::uint64_t length,
    std::size_t limit_chunks,
    const Context& context);

// Fixed-length sequence of composite values, one leaf per element root
Node
composite_vector_root(
    const std::vector<Node>& element_roots,
    const Context& context);

// Variable-length sequence of composite values
Node
composite_list_root(
    const std::vector<Node>& element_roots,
    std::size_t max_elements,
    const Context& context);

Node
bitvector_root(const std::vector<bool>& bits, const Context& context);

/**
 * @param bits the bits without the length delimiter of the wire encoding
 * @param bit_limit declared maximum number of bits
 * @throws InputExceedsLimitException if bits.size() > bit_limit
 */
Node
bitlist_root(
    const std::vector<bool>& bits,
    std::size_t bit_limit,
    const Context& context);

/**
 * Tagged union. A missing value root is the empty variant and contributes
 * the zero node.
 */
Node
union_root(
    std::uint64_t selector,
    const std::optional<Node>& value_root,
    const Context& context);

}  // namespace ssz::merkle
