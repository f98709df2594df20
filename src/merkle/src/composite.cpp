#include "ssz/merkle/composite.h"
#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/merkleize.h"
#include "ssz/merkle/mix-in.h"
#include "ssz/merkle/pack.h"

namespace ssz::merkle {

std::size_t
chunk_count_for_basic(std::size_t element_size, std::size_t count)
{
    return (element_size * count + BYTES_PER_CHUNK - 1) / BYTES_PER_CHUNK;
}

std::size_t
chunk_count_for_bits(std::size_t bit_count)
{
    return (bit_count + 255) / 256;
}

Node
container_root(const std::vector<Node>& field_roots, const Context& context)
{
    return merkleize(field_roots, std::nullopt, context);
}

Node
basic_vector_root(const std::vector<uint8_t>& packed, const Context& context)
{
    return merkleize(packed, std::nullopt, context);
}

Node
basic_list_root(
    const std::vector<uint8_t>& packed,
    std::uint64_t length,
    std::size_t limit_chunks,
    const Context& context)
{
    return mix_in_length(merkleize(packed, limit_chunks, context), length, context);
}

Node
composite_vector_root(
    const std::vector<Node>& element_roots,
    const Context& context)
{
    return merkleize(element_roots, std::nullopt, context);
}

Node
composite_list_root(
    const std::vector<Node>& element_roots,
    std::size_t max_elements,
    const Context& context)
{
    return mix_in_length(
        merkleize(element_roots, max_elements, context),
        element_roots.size(),
        context);
}

Node
bitvector_root(const std::vector<bool>& bits, const Context& context)
{
    return merkleize(
        pack_bits(bits), chunk_count_for_bits(bits.size()), context);
}

Node
bitlist_root(
    const std::vector<bool>& bits,
    std::size_t bit_limit,
    const Context& context)
{
    if (bits.size() > bit_limit)
    {
        throw InputExceedsLimitException(bit_limit);
    }
    return mix_in_length(
        merkleize(pack_bits(bits), chunk_count_for_bits(bit_limit), context),
        bits.size(),
        context);
}

Node
union_root(
    std::uint64_t selector,
    const std::optional<Node>& value_root,
    const Context& context)
{
    return mix_in_selector(value_root.value_or(Node::zero()), selector, context);
}

}  // namespace ssz::merkle
