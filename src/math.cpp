// =============================================================================
// math.cpp - Constant-product pricing and share accounting
// =============================================================================

#include "cpswap/math.hpp"
#include "cpswap/errors.hpp"

namespace cpswap {
namespace amm_math {

U128 get_amount_out(U128 amount_in, U128 reserve_in, U128 reserve_out) {
    if (amount_in > MAX_RESERVE || reserve_in > MAX_RESERVE || reserve_out > MAX_RESERVE) {
        throw PoolError(ErrorCode::RESERVE_OVERFLOW, "quote argument exceeds 112 bits");
    }
    if (reserve_in == 0 && amount_in == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "quote with a zero denominator");
    }
    if (amount_in == 0 || reserve_out == 0) return 0;

    // < 2^122, and the denominator < 2^123: both fit in 128 bits
    U128 amount_in_with_fee = amount_in * fees::FEE_NUMERATOR;
    U128 denominator = reserve_in * fees::FEE_DENOMINATOR + amount_in_with_fee;

    U256 numerator = mul_wide(amount_in_with_fee, reserve_out);

    // Quotient <= reserve_out, so it fits in the low limb
    return div_floor(numerator, denominator).lo;
}

U128 initial_shares(U128 amount_a, U128 amount_b) {
    return isqrt(mul_wide(amount_a, amount_b));
}

bool ratio_matches(U128 amount_a, U128 amount_b, U128 reserve_a, U128 reserve_b) {
    return mul_wide(amount_a, reserve_b) == mul_wide(amount_b, reserve_a);
}

U128 shares_for_deposit(U128 amount_a, U128 reserve_a, U128 total_shares) {
    if (reserve_a == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "deposit against an empty reserve");
    }
    auto shares = mul_div(amount_a, total_shares, reserve_a);
    if (!shares) {
        throw PoolError(ErrorCode::RESERVE_OVERFLOW, "minted shares exceed 128 bits");
    }
    return *shares;
}

Reserves amounts_for_shares(U128 shares, U128 reserve_a, U128 reserve_b,
                            U128 total_shares) {
    if (total_shares == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "no shares outstanding");
    }
    if (shares > total_shares) {
        throw PoolError(ErrorCode::INSUFFICIENT_SHARES,
                        to_string(shares) + " > total " + to_string(total_shares));
    }
    // shares <= total_shares bounds each leg by its reserve
    return Reserves{
        *mul_div(shares, reserve_a, total_shares),
        *mul_div(shares, reserve_b, total_shares)
    };
}

bool product_non_decreasing(U128 reserve_a_before, U128 reserve_b_before,
                            U128 reserve_a_after, U128 reserve_b_after) {
    return mul_wide(reserve_a_after, reserve_b_after) >=
           mul_wide(reserve_a_before, reserve_b_before);
}

U128 spot_price(U128 reserve_a, U128 reserve_b) {
    if (reserve_a == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "price of an empty pool");
    }
    return reserve_b / reserve_a;
}

U128 price_x18(U128 reserve_a, U128 reserve_b) {
    if (reserve_a == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "price of an empty pool");
    }
    auto price = mul_div(reserve_b, X18_ONE, reserve_a);
    if (!price) {
        throw PoolError(ErrorCode::RESERVE_OVERFLOW, "price exceeds X18 range");
    }
    return *price;
}

} // namespace amm_math
} // namespace cpswap
