#ifndef CPSWAP_UINT256_HPP
#define CPSWAP_UINT256_HPP

#include <optional>

#include "types.hpp"

namespace cpswap {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
//
// Only the operations the constant-product math needs: widening multiply,
// add/sub/shift/compare, floor division by a 128-bit divisor and isqrt.
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    // Wrapping add / sub (callers guarantee no overflow)
    U256 operator+(const U256& other) const {
        U256 r;
        r.lo = lo + other.lo;
        r.hi = hi + other.hi + (r.lo < lo ? 1 : 0);
        return r;
    }
    U256 operator-(const U256& other) const {
        U256 r;
        r.lo = lo - other.lo;
        r.hi = hi - other.hi - (lo < other.lo ? 1 : 0);
        return r;
    }

    U256 operator<<(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 256) return U256{};
        if (n >= 128) return U256{0, lo << (n - 128)};
        return U256{lo << n, (hi << n) | (lo >> (128 - n))};
    }
    U256 operator>>(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 256) return U256{};
        if (n >= 128) return U256{hi >> (n - 128), 0};
        return U256{(lo >> n) | (hi << (128 - n)), hi >> n};
    }
    U256 operator|(const U256& other) const {
        return U256{lo | other.lo, hi | other.hi};
    }

    // Index of the highest set bit + 1 (0 for zero)
    unsigned bit_length() const;
};

// Full 128x128 -> 256 product
U256 mul_wide(U128 a, U128 b);

// Floor division; `remainder` receives num mod denom when non-null.
// Requires denom != 0.
U256 div_floor(const U256& num, U128 denom, U128* remainder = nullptr);

// floor(a * b / denom), or nullopt when denom == 0 or the result exceeds U128
std::optional<U128> mul_div(U128 a, U128 b, U128 denom);

// floor(sqrt(x)); always fits in U128
U128 isqrt(const U256& x);

// Decimal rendering
std::string to_string(const U256& v);

} // namespace cpswap

#endif // CPSWAP_UINT256_HPP
