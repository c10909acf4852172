// cpswap - Constant-Product Math Tests

#include <catch2/catch.hpp>
#include <cpswap/math.hpp>
#include "test_support.hpp"

using namespace cpswap;
using cpswap::test::error_of;
using cpswap::test::u128;

TEST_CASE("Swap output with 0.3% fee", "[math]") {
    SECTION("Reference quote") {
        // floor(10 * 997 * 200 / (100 * 1000 + 10 * 997)) = floor(1994000 / 109970)
        U128 out = amm_math::get_amount_out(10, 100, 200);
        REQUIRE(out == 18);
    }

    SECTION("Reverse direction") {
        REQUIRE(amm_math::get_amount_out(20, 200, 100) == 9);
    }

    SECTION("Output stays below the fee-free spot amount") {
        U128 in = 10;
        U128 out = amm_math::get_amount_out(in, 100, 200);
        REQUIRE(out > 0);
        REQUIRE(out < 200);
        // out / 200 < in / (100 + in)
        REQUIRE(out * (100 + in) < in * 200);
    }

    SECTION("Zero input quotes zero") {
        REQUIRE(amm_math::get_amount_out(0, 100, 200) == 0);
    }

    SECTION("Dust input floors to zero") {
        REQUIRE(amm_math::get_amount_out(1, 1000, 1) == 0);
    }

    SECTION("Empty reserves follow the formula") {
        REQUIRE(amm_math::get_amount_out(10, 100, 0) == 0);
        REQUIRE(amm_math::get_amount_out(0, 100, 0) == 0);
        // Denominator is the fee-adjusted input alone
        REQUIRE(amm_math::get_amount_out(10, 0, 200) == 200);
    }

    SECTION("Zero denominator") {
        REQUIRE(error_of([] { amm_math::get_amount_out(0, 0, 200); }) == ErrorCode::NO_LIQUIDITY);
        REQUIRE(error_of([] { amm_math::get_amount_out(0, 0, 0); }) == ErrorCode::NO_LIQUIDITY);
    }

    SECTION("Arguments above the reserve bound") {
        REQUIRE(error_of([] { amm_math::get_amount_out(MAX_RESERVE + 1, 100, 200); }) ==
                ErrorCode::RESERVE_OVERFLOW);
    }

    SECTION("Extreme reserves do not overflow") {
        U128 out = amm_math::get_amount_out(MAX_RESERVE - 1, 1, MAX_RESERVE);
        REQUIRE(out == u128("5192296858534827628530496329220093"));
        REQUIRE(out < MAX_RESERVE);
    }

    SECTION("Large 18-decimal amounts") {
        U128 e23 = u128("100000000000000000000000");
        U128 out = amm_math::get_amount_out(e23, e23, 2 * e23);
        REQUIRE(out == u128("99849774661992989484226"));
    }
}

TEST_CASE("Share issuance", "[math]") {
    SECTION("First deposit mints floor(sqrt(a * b))") {
        REQUIRE(amm_math::initial_shares(100, 200) == 141);
        REQUIRE(amm_math::initial_shares(1, 1) == 1);
        REQUIRE(amm_math::initial_shares(MAX_RESERVE, MAX_RESERVE) == MAX_RESERVE);
    }

    SECTION("Later deposit mints pro rata, floored") {
        REQUIRE(amm_math::shares_for_deposit(50, 100, 141) == 70);
        REQUIRE(amm_math::shares_for_deposit(100, 100, 141) == 141);
    }

    SECTION("Deposit against an empty reserve") {
        REQUIRE(error_of([] { amm_math::shares_for_deposit(50, 0, 141); }) ==
                ErrorCode::NO_LIQUIDITY);
    }
}

TEST_CASE("Exact ratio check", "[math]") {
    REQUIRE(amm_math::ratio_matches(50, 100, 100, 200));
    REQUIRE(amm_math::ratio_matches(3, 6, 100, 200));
    REQUIRE_FALSE(amm_math::ratio_matches(50, 90, 100, 200));
    REQUIRE_FALSE(amm_math::ratio_matches(50, 101, 100, 200));

    // No truncation at the reserve bound
    REQUIRE(amm_math::ratio_matches(MAX_RESERVE, MAX_RESERVE - 1, MAX_RESERVE, MAX_RESERVE - 1));
    REQUIRE_FALSE(amm_math::ratio_matches(MAX_RESERVE, MAX_RESERVE, MAX_RESERVE, MAX_RESERVE - 1));
}

TEST_CASE("Withdrawal amounts", "[math]") {
    SECTION("Full burn returns full reserves") {
        Reserves out = amm_math::amounts_for_shares(141, 100, 200, 141);
        REQUIRE(out.reserve_a == 100);
        REQUIRE(out.reserve_b == 200);
    }

    SECTION("Partial burn floors each leg") {
        Reserves out = amm_math::amounts_for_shares(70, 100, 200, 141);
        REQUIRE(out.reserve_a == 49);
        REQUIRE(out.reserve_b == 99);
    }

    SECTION("A leg may floor to zero") {
        Reserves out = amm_math::amounts_for_shares(1, 1, 1000, 31);
        REQUIRE(out.reserve_a == 0);
        REQUIRE(out.reserve_b == 32);
    }

    SECTION("Rejects") {
        REQUIRE(error_of([] { amm_math::amounts_for_shares(1, 0, 0, 0); }) ==
                ErrorCode::NO_LIQUIDITY);
        REQUIRE(error_of([] { amm_math::amounts_for_shares(142, 100, 200, 141); }) ==
                ErrorCode::INSUFFICIENT_SHARES);
    }
}

TEST_CASE("Spot price", "[math]") {
    SECTION("Whole units of B per A, floored") {
        REQUIRE(amm_math::spot_price(100, 200) == 2);
        REQUIRE(amm_math::spot_price(200, 100) == 0);
        REQUIRE(amm_math::spot_price(110, 182) == 1);
        REQUIRE(amm_math::spot_price(1, MAX_RESERVE) == MAX_RESERVE);
        REQUIRE(error_of([] { amm_math::spot_price(0, 0); }) == ErrorCode::NO_LIQUIDITY);
    }

    SECTION("X18 fixed point") {
        REQUIRE(amm_math::price_x18(100, 200) == 2 * X18_ONE);
        REQUIRE(amm_math::price_x18(200, 100) == X18_ONE / 2);
        REQUIRE(amm_math::price_x18(110, 182) == u128("1654545454545454545"));
        REQUIRE(error_of([] { amm_math::price_x18(0, 0); }) == ErrorCode::NO_LIQUIDITY);
        REQUIRE(error_of([] { amm_math::price_x18(1, MAX_RESERVE); }) ==
                ErrorCode::RESERVE_OVERFLOW);
    }
}

TEST_CASE("Product check", "[math]") {
    REQUIRE(amm_math::product_non_decreasing(100, 200, 110, 182));
    REQUIRE(amm_math::product_non_decreasing(100, 200, 100, 200));
    REQUIRE_FALSE(amm_math::product_non_decreasing(100, 200, 110, 181));
}
