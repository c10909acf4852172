#ifndef CPSWAP_MATH_HPP
#define CPSWAP_MATH_HPP

#include "types.hpp"
#include "uint256.hpp"

namespace cpswap {

// =============================================================================
// Constant-Product Math
//
// Pure functions over explicit reserves. All division floors, which always
// rounds in favour of the pool. Domain failures throw PoolError.
// =============================================================================

namespace amm_math {

// Output of an exact-input swap with the 0.3% fee:
//   in_with_fee = amount_in * 997
//   out = floor(in_with_fee * reserve_out / (reserve_in * 1000 + in_with_fee))
// Returns 0 for amount_in == 0 or reserve_out == 0. Throws NO_LIQUIDITY when
// the denominator is zero (reserve_in == 0 and amount_in == 0) and
// RESERVE_OVERFLOW if an argument exceeds MAX_RESERVE.
U128 get_amount_out(U128 amount_in, U128 reserve_in, U128 reserve_out);

// Shares minted by the first deposit: floor(sqrt(amount_a * amount_b))
U128 initial_shares(U128 amount_a, U128 amount_b);

// Exact ratio test: amount_a * reserve_b == amount_b * reserve_a
bool ratio_matches(U128 amount_a, U128 amount_b, U128 reserve_a, U128 reserve_b);

// Shares minted by a ratio-matched deposit: floor(amount_a * total_shares / reserve_a)
U128 shares_for_deposit(U128 amount_a, U128 reserve_a, U128 total_shares);

// Proportional claim of `shares` on the reserves, floored per leg
Reserves amounts_for_shares(U128 shares, U128 reserve_a, U128 reserve_b,
                            U128 total_shares);

// reserve_a_after * reserve_b_after >= reserve_a_before * reserve_b_before
bool product_non_decreasing(U128 reserve_a_before, U128 reserve_b_before,
                            U128 reserve_a_after, U128 reserve_b_after);

// floor(reserve_b / reserve_a)
U128 spot_price(U128 reserve_a, U128 reserve_b);

// reserve_b / reserve_a as X18 fixed point (floor)
U128 price_x18(U128 reserve_a, U128 reserve_b);

} // namespace amm_math

} // namespace cpswap

#endif // CPSWAP_MATH_HPP
