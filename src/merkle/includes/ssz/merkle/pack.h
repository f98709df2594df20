#pragma once

#include "ssz/merkle/chunks.h"
#include "ssz/merkle/merkle-errors.h"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

namespace ssz::merkle {

/**
 * Right-pad `buffer` with zero bytes up to a multiple of BYTES_PER_CHUNK.
 * Idempotent: an already aligned buffer is left untouched.
 */
void
pack_bytes(std::vector<uint8_t>& buffer);

/**
 * Pack bits little-endian within each byte (bit i goes to byte i / 8, bit
 * position i % 8), then pad to a chunk boundary.
 */
std::vector<uint8_t>
pack_bits(const std::vector<bool>& bits);

template <typename T>
concept BasicValue = std::unsigned_integral<T> || std::same_as<T, bool>;

// Little-endian fixed-width encoding of a basic value
template <BasicValue T>
void
serialize_basic(T value, std::vector<uint8_t>& out)
{
    if constexpr (std::same_as<T, bool>)
    {
        out.push_back(value ? 1 : 0);
    }
    else
    {
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
}

/**
 * Serialize each value in sequence into one buffer, then pad it to a chunk
 * boundary.
 *
 * `serialize` is called as serialize(value, buffer) and appends the value's
 * encoding. Any exception it raises is rethrown as SerializationException.
 */
template <std::ranges::input_range Range, typename Serializer>
std::vector<uint8_t>
pack(const Range& values, Serializer&& serialize)
{
    std::vector<uint8_t> buffer;
    for (auto&& value : values)
    {
        try
        {
            serialize(value, buffer);
        }
        catch (const MerkleizationException&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw SerializationException(e.what());
        }
    }
    pack_bytes(buffer);
    return buffer;
}

// pack() for sequences of unsigned integers or bools
template <std::ranges::input_range Range>
    requires BasicValue<std::ranges::range_value_t<Range>>
std::vector<uint8_t>
pack_basic(const Range& values)
{
    using T = std::ranges::range_value_t<Range>;
    return pack(values, [](T value, std::vector<uint8_t>& out) {
        serialize_basic<T>(value, out);
    });
}

}  // namespace ssz::merkle
