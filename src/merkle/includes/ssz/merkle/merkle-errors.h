#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ssz::merkle {

//----------------------------------------------------------
// Merkleization Exception Classes
//----------------------------------------------------------
class MerkleizationException : public std::runtime_error
{
public:
    explicit MerkleizationException(const std::string& message);
};

// The byte-producing collaborator failed before chunks could be packed
class SerializationException : public MerkleizationException
{
public:
    explicit SerializationException(const std::string& reason);
};

// A chunk buffer whose length is not a multiple of the chunk size
class PartialChunkException : public MerkleizationException
{
public:
    explicit PartialChunkException(size_t length);
    size_t
    length() const;

private:
    size_t length_;
};

// More chunks than the declared capacity of the value
class InputExceedsLimitException : public MerkleizationException
{
public:
    explicit InputExceedsLimitException(size_t limit);
    size_t
    limit() const;

private:
    size_t limit_;
};

// A tree depth outside of the zero-hash table
class InvalidDepthException : public MerkleizationException
{
public:
    explicit InvalidDepthException(size_t depth, size_t maxAllowed);
    size_t
    depth() const;
    size_t
    max_allowed() const;

private:
    size_t depth_;
    size_t max_allowed_;
};

}  // namespace ssz::merkle
