#pragma once

#include "ssz/core/logger.h"
#include "ssz/core/types.h"
#include "ssz/merkle/context.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace ssz::merkle {

/**
 * Incremental hash cache owned by one value.
 *
 * Stores every real (non-virtual) node of the value's tree, level by level:
 * level 0 holds the leaf chunks, level l + 1 holds (size(l) + 1) / 2
 * parents. Each stored node has a dirty flag. Changing a leaf marks it and
 * all of its ancestors dirty, and root() rehashes only the dirty nodes,
 * reusing every clean sibling.
 *
 * A change in leaf count moves leaf positions, so resize() drops every
 * cached node instead of trying to reuse them.
 *
 * The cache is mutated in place; sharing the owning value across threads
 * needs external synchronization. It holds no reference to the Context.
 */
class MerkleCache
{
public:
    MerkleCache() = default;

    explicit MerkleCache(std::size_t leaf_count);

    // Structural change: discard everything and track `leaf_count` leaves
    void
    resize(std::size_t leaf_count);

    /**
     * Store a leaf chunk. The leaf's path is only invalidated when the
     * value actually changes.
     * @throws std::out_of_range if index >= leaf_count()
     */
    void
    set_leaf(std::size_t index, const Node& leaf);

    const Node&
    leaf(std::size_t index) const;

    /**
     * Mark a leaf and its ancestors dirty after an external mutation.
     * @throws std::out_of_range if index >= leaf_count()
     */
    void
    mark_dirty(std::size_t index);

    // Mark every node dirty, keeping the leaves
    void
    invalidate();

    std::size_t
    leaf_count() const;

    // True when the next root() call has hashing to do
    bool
    is_dirty() const;

    /**
     * True when the leaf was marked dirty since the last root() call, so
     * its owner should refresh it with set_leaf().
     * @throws std::out_of_range if index >= leaf_count()
     */
    bool
    is_dirty(std::size_t index) const;

    /**
     * Root of the leaves padded with zero chunks up to
     * next_power_of_two(limit) leaves (or the leaf count when no limit is
     * given).
     * @throws InputExceedsLimitException if limit < leaf_count()
     */
    Node
    root(std::optional<std::size_t> limit, const Context& context);

    // Hash operations spent by the last root() call
    std::size_t
    hashes_performed() const
    {
        return hashes_performed_;
    }

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    void
    check_index(std::size_t index) const;

    void
    mark_path_dirty(std::size_t index);

    std::vector<std::vector<Node>> levels_;
    std::vector<std::vector<bool>> dirty_;

    // Root of the last root() call and the tree depth it was computed for
    std::optional<Node> root_;
    std::size_t root_depth_ = 0;

    std::size_t hashes_performed_ = 0;

    static LogPartition log_partition_;
};

}  // namespace ssz::merkle
