#include "ssz/merkle/merkle-cache.h"
#include "ssz/core/log-macros.h"
#include "ssz/core/logger.h"
#include "ssz/crypto/sha256-hasher.h"
#include "ssz/merkle/leaf-count.h"
#include "ssz/merkle/merkle-errors.h"
#include "ssz/merkle/merkleize.h"
#include <stdexcept>
#include <string>

namespace ssz::merkle {

LogPartition MerkleCache::log_partition_("MerkleCache", LogLevel::INHERIT);

MerkleCache::MerkleCache(std::size_t leaf_count)
{
    resize(leaf_count);
}

void
MerkleCache::resize(std::size_t leaf_count)
{
    OLOGD("Resizing from ", this->leaf_count(), " to ", leaf_count, " leaves");
    levels_.clear();
    dirty_.clear();
    root_.reset();

    for (std::size_t n = leaf_count; n > 0; n = (n + 1) / 2)
    {
        levels_.emplace_back(n);
        dirty_.emplace_back(n, true);
        if (n == 1)
        {
            break;
        }
    }
}

void
MerkleCache::check_index(std::size_t index) const
{
    if (index >= leaf_count())
    {
        throw std::out_of_range(
            "MerkleCache leaf index " + std::to_string(index) +
            " out of range for " + std::to_string(leaf_count()) + " leaves");
    }
}

void
MerkleCache::set_leaf(std::size_t index, const Node& leaf)
{
    check_index(index);
    if (levels_[0][index] == leaf)
    {
        return;
    }
    levels_[0][index] = leaf;
    mark_path_dirty(index);
}

const Node&
MerkleCache::leaf(std::size_t index) const
{
    check_index(index);
    return levels_[0][index];
}

void
MerkleCache::mark_dirty(std::size_t index)
{
    check_index(index);
    mark_path_dirty(index);
}

void
MerkleCache::mark_path_dirty(std::size_t index)
{
    for (auto& flags : dirty_)
    {
        flags[index] = true;
        index /= 2;
    }
    root_.reset();
}

void
MerkleCache::invalidate()
{
    for (auto& flags : dirty_)
    {
        flags.assign(flags.size(), true);
    }
    root_.reset();
}

std::size_t
MerkleCache::leaf_count() const
{
    return levels_.empty() ? 0 : levels_[0].size();
}

bool
MerkleCache::is_dirty() const
{
    return !root_.has_value();
}

bool
MerkleCache::is_dirty(std::size_t index) const
{
    check_index(index);
    return dirty_[0][index];
}

Node
MerkleCache::root(std::optional<std::size_t> limit, const Context& context)
{
    const std::size_t count = leaf_count();
    if (limit && *limit < count)
    {
        throw InputExceedsLimitException(*limit);
    }
    const LeafCount tree = LeafCount::covering(limit.value_or(count));

    hashes_performed_ = 0;
    if (root_ && root_depth_ == tree.depth())
    {
        return *root_;
    }

    Node result;
    if (count == 0)
    {
        result = context[tree.depth()];
    }
    else
    {
        crypto::Sha256Hasher hasher;
        for (std::size_t level = 1; level < levels_.size(); ++level)
        {
            const auto& children = levels_[level - 1];
            auto& parents = levels_[level];
            auto& dirty = dirty_[level];
            for (std::size_t j = 0; j < parents.size(); ++j)
            {
                if (!dirty[j])
                {
                    continue;
                }
                const std::size_t left = 2 * j;
                const Node& right = (left + 1 < children.size())
                    ? children[left + 1]
                    : context[level - 1];
                parents[j] = hash_nodes(hasher, children[left], right);
                dirty[j] = false;
                ++hashes_performed_;
            }
        }
        dirty_[0].assign(dirty_[0].size(), false);

        // Extend the real subtree up to the declared capacity
        result = levels_.back()[0];
        for (std::size_t depth = levels_.size() - 1; depth < tree.depth();
             ++depth)
        {
            result = hash_nodes(hasher, result, context[depth]);
            ++hashes_performed_;
        }
    }

    root_ = result;
    root_depth_ = tree.depth();
    OLOGD("Recomputed root with ", hashes_performed_, " hashes");
    OLOGD_NODE("Root: ", result);
    return result;
}

}  // namespace ssz::merkle
