// =============================================================================
// uint256.cpp - 256-bit intermediate arithmetic for exact reserve math
// =============================================================================

#include "cpswap/uint256.hpp"
#include <algorithm>

namespace cpswap {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

unsigned bit_length_u128(U128 v) {
    unsigned n = 0;
    uint64_t hi = static_cast<uint64_t>(v >> 64);
    if (hi != 0) {
        n = 64;
        v = hi;
    }
    uint64_t w = static_cast<uint64_t>(v);
    while (w != 0) {
        w >>= 1;
        ++n;
    }
    return n;
}

inline bool test_bit(const U256& v, unsigned i) {
    return i >= 128 ? ((v.hi >> (i - 128)) & 1) != 0 : ((v.lo >> i) & 1) != 0;
}

} // anonymous namespace

unsigned U256::bit_length() const {
    if (hi != 0) return 128 + bit_length_u128(hi);
    return bit_length_u128(lo);
}

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle column with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

U256 div_floor(const U256& num, U128 denom, U128* remainder) {
    U256 quot;
    U128 rem = 0;

    // Binary long division, most significant bit first. `rem` stays below
    // denom, so a shifted-out top bit means rem exceeds denom.
    for (unsigned i = num.bit_length(); i-- > 0;) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | (test_bit(num, i) ? 1 : 0);
        if (carry || rem >= denom) {
            rem -= denom;
            quot = quot | (U256(1) << i);
        }
    }

    if (remainder) *remainder = rem;
    return quot;
}

std::optional<U128> mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) return std::nullopt;
    U256 q = div_floor(mul_wide(a, b), denom);
    if (!q.fits_u128()) return std::nullopt;
    return q.lo;
}

U128 isqrt(const U256& x) {
    unsigned bits = x.bit_length();
    if (bits == 0) return 0;

    // Digit-by-digit method, starting at the highest power of four <= x
    U256 num = x;
    U256 res;
    U256 bit = U256(1) << ((bits - 1) & ~1u);

    while (!bit.is_zero()) {
        U256 trial = res + bit;
        if (num >= trial) {
            num = num - trial;
            res = (res >> 1) + bit;
        } else {
            res = res >> 1;
        }
        bit = bit >> 2;
    }
    return res.lo;
}

std::string to_string(const U256& v) {
    if (v.fits_u128()) return to_string(v.lo);

    std::string out;
    U256 cur = v;
    while (!cur.is_zero()) {
        U128 digit = 0;
        cur = div_floor(cur, 10, &digit);
        out.push_back(static_cast<char>('0' + static_cast<int>(digit)));
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace cpswap
