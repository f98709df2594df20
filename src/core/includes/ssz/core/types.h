#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace ssz {

/**
 * Zero-copy reference to a data buffer.
 */
class Slice
{
private:
    const uint8_t* data_;
    size_t size_;

public:
    Slice() : data_(nullptr), size_(0)
    {
    }
    Slice(const uint8_t* data, size_t size) : data_(data), size_(size)
    {
    }

    const uint8_t*
    data() const
    {
        return data_;
    }
    size_t
    size() const
    {
        return size_;
    }
    bool
    empty() const
    {
        return size_ == 0;
    }
};

/**
 * Utility function to convert a data slice to hexadecimal representation
 */
void
slice_hex(Slice sl, std::string& result);

/**
 * Decode an even-length hex string, optionally prefixed with "0x".
 * @throws std::invalid_argument on odd length or a non-hex digit
 */
std::vector<uint8_t>
hex_to_bytes(std::string_view hex);

/**
 * A 32-byte tree node: a chunk, an interior hash or a root.
 *
 * Default constructed nodes are all zero. Equality and ordering are
 * byte-wise.
 */
class Node
{
private:
    std::array<uint8_t, 32> data_;

public:
    Node() : data_()
    {
        data_.fill(0);
    }
    explicit Node(const std::array<uint8_t, 32>& data) : data_(data)
    {
    }
    explicit Node(const uint8_t* data) : data_()
    {
        std::memcpy(data_.data(), data, 32);
    }

    uint8_t*
    data()
    {
        return data_.data();
    }
    const uint8_t*
    data() const
    {
        return data_.data();
    }
    static constexpr std::size_t
    size()
    {
        return 32;
    }

    uint8_t&
    operator[](std::size_t i)
    {
        return data_[i];
    }
    uint8_t
    operator[](std::size_t i) const
    {
        return data_[i];
    }

    static Node const&
    zero()
    {
        static Node zero;
        return zero;
    }

    bool
    operator==(const Node& other) const
    {
        return data_ == other.data_;
    }
    bool
    operator!=(const Node& other) const
    {
        return !(*this == other);
    }
    bool
    operator<(const Node& other) const
    {
        return data_ < other.data_;
    }

    Slice
    slice() const
    {
        return {data(), size()};
    }

    // Lower case hex, 64 characters
    [[nodiscard]] std::string
    hex() const;

    /**
     * Parse 64 hex digits, optionally prefixed with "0x".
     * @throws std::invalid_argument on any other input
     */
    static Node
    from_hex(std::string_view hex);
};

}  // namespace ssz
