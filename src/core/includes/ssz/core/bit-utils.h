#pragma once

#include <cstdint>

#if __cplusplus >= 202002L && __has_include(<bit>)
#include <bit>
#endif

namespace ssz::core {

/**
 * Portable bit manipulation utilities for 64-bit tree arithmetic
 *
 * These wrap compiler builtins and C++20 standard functions
 * to provide a consistent interface across compilers.
 */

/**
 * Count trailing zero bits
 * @param x The value to count trailing zeros in (must be non-zero)
 * @return Number of trailing 0 bits
 */
inline int
ctz64(std::uint64_t x) noexcept
{
    // Undefined behavior if x == 0, same as builtins
#if __cplusplus >= 202002L && __has_include(<bit>)
    return std::countr_zero(x);
#elif defined(__GNUC__) || defined(__clang__)
    return __builtin_ctzll(x);
#else
    if (x == 0)
        return 64;
    int count = 0;
    while ((x & 1) == 0)
    {
        x >>= 1;
        count++;
    }
    return count;
#endif
}

/**
 * Count leading zero bits
 * @param x The value to count leading zeros in (must be non-zero)
 * @return Number of leading 0 bits
 */
inline int
clz64(std::uint64_t x) noexcept
{
#if __cplusplus >= 202002L && __has_include(<bit>)
    return std::countl_zero(x);
#elif defined(__GNUC__) || defined(__clang__)
    return __builtin_clzll(x);
#else
    if (x == 0)
        return 64;
    int count = 0;
    std::uint64_t mask = 0x8000000000000000ULL;
    while ((x & mask) == 0)
    {
        mask >>= 1;
        count++;
    }
    return count;
#endif
}

inline bool
is_power_of_two(std::uint64_t x) noexcept
{
    return x != 0 && (x & (x - 1)) == 0;
}

/**
 * Smallest power of two >= x, with next_power_of_two(0) == 1.
 * Only meaningful for x <= 2^63; larger inputs wrap to 0.
 */
inline std::uint64_t
next_power_of_two(std::uint64_t x) noexcept
{
    if (x <= 1)
        return 1;
    if (x > (std::uint64_t{1} << 63))
        return 0;
    return std::uint64_t{1} << (64 - clz64(x - 1));
}

/**
 * log2 of a power of two (the depth of a perfect tree with x leaves)
 */
inline int
log2_exact(std::uint64_t x) noexcept
{
    return ctz64(x);
}

}  // namespace ssz::core
