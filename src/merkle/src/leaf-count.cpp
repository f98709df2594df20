#include "ssz/merkle/leaf-count.h"
#include "ssz/core/bit-utils.h"
#include <stdexcept>
#include <string>

namespace ssz::merkle {

LeafCount
LeafCount::exact(std::uint64_t n)
{
    if (!core::is_power_of_two(n))
    {
        throw std::invalid_argument(
            "Leaf count must be a power of two, got " + std::to_string(n));
    }
    return LeafCount(static_cast<std::size_t>(core::log2_exact(n)));
}

LeafCount
LeafCount::covering(std::uint64_t n)
{
    if (n > (std::uint64_t{1} << 63))
    {
        throw std::out_of_range(
            "No power of two leaf count covers " + std::to_string(n));
    }
    return exact(core::next_power_of_two(n));
}

}  // namespace ssz::merkle
