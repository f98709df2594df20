#include "ssz/merkle/mix-in.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/merkleize.h"
#include "ssz/merkle/merkleized.h"
#include <stdexcept>
#include <string>

namespace ssz::merkle {

Node
mix_in_decoration(
    const Node& root,
    std::uint64_t decoration,
    const Context& context)
{
    const Node decoration_root = hash_tree_root(decoration, context);
    crypto::Sha256Hasher hasher;
    return hash_nodes(hasher, root, decoration_root);
}

Node
mix_in_length(const Node& root, std::uint64_t length, const Context& context)
{
    return mix_in_decoration(root, length, context);
}

Node
mix_in_selector(
    const Node& root,
    std::uint64_t selector,
    const Context& context)
{
    if (selector > MAX_UNION_SELECTOR)
    {
        throw std::invalid_argument(
            "Union selector out of range: " + std::to_string(selector));
    }
    return mix_in_decoration(root, selector, context);
}

}  // namespace ssz::merkle
