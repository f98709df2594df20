#pragma once

#include <cstddef>
#include <cstdint>

namespace ssz::merkle {

/**
 * Number of leaves of a padded tree. Always a power of two, so it can only
 * be built through the checked factories below.
 */
class LeafCount
{
public:
    /**
     * @throws std::invalid_argument unless n is a non-zero power of two
     */
    static LeafCount
    exact(std::uint64_t n);

    /**
     * Smallest leaf count holding n chunks; covering(0) == covering(1) == 1.
     * @throws std::out_of_range if n > 2^63
     */
    static LeafCount
    covering(std::uint64_t n);

    std::uint64_t
    value() const
    {
        return std::uint64_t{1} << depth_;
    }

    // log2(value()), the height of the tree above its leaves
    std::size_t
    depth() const
    {
        return depth_;
    }

    bool
    operator==(const LeafCount& other) const
    {
        return depth_ == other.depth_;
    }

private:
    explicit LeafCount(std::size_t depth) : depth_(depth)
    {
    }

    std::size_t depth_;
};

}  // namespace ssz::merkle
