#include "ssz/merkle/merkle-errors.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace ssz::merkle {

MerkleizationException::MerkleizationException(const std::string& message)
    : std::runtime_error(message)
{
}

SerializationException::SerializationException(const std::string& reason)
    : MerkleizationException("failed to serialize value: " + reason)
{
}

PartialChunkException::PartialChunkException(size_t length)
    : MerkleizationException(
          "cannot merkleize a partial chunk of length " +
          std::to_string(length))
    , length_(length)
{
}

size_t
PartialChunkException::length() const
{
    return length_;
}

InputExceedsLimitException::InputExceedsLimitException(size_t limit)
    : MerkleizationException(
          "cannot merkleize data that exceeds the declared limit " +
          std::to_string(limit))
    , limit_(limit)
{
}

size_t
InputExceedsLimitException::limit() const
{
    return limit_;
}

InvalidDepthException::InvalidDepthException(size_t depth, size_t maxAllowed)
    : MerkleizationException(
          "Invalid tree depth (" + std::to_string(depth) +
          "). Max allowed: " + std::to_string(maxAllowed))
    , depth_(depth)
    , max_allowed_(maxAllowed)
{
}

size_t
InvalidDepthException::depth() const
{
    return depth_;
}

size_t
InvalidDepthException::max_allowed() const
{
    return max_allowed_;
}

}  // namespace ssz::merkle
