// cpswap - Token Ledger Tests

#include <catch2/catch.hpp>
#include <cpswap/custody.hpp>
#include "test_support.hpp"

using namespace cpswap;

TEST_CASE("Token ledger balances", "[custody]") {
    TokenLedger token("TKA");
    const Address alice = make_address(1);
    const Address bob = make_address(2);

    REQUIRE(token.symbol() == "TKA");
    REQUIRE(token.mint(alice, 1000));

    SECTION("Mint credits the account") {
        REQUIRE(token.balance_of(alice) == 1000);
        REQUIRE(token.balance_of(bob) == 0);
        REQUIRE(token.total_supply() == 1000);
    }

    SECTION("Transfer moves between accounts") {
        REQUIRE(token.transfer(alice, bob, 400));
        REQUIRE(token.balance_of(alice) == 600);
        REQUIRE(token.balance_of(bob) == 400);
        REQUIRE_FALSE(token.transfer(bob, alice, 401));
        REQUIRE(token.balance_of(bob) == 400);
    }

    SECTION("Mint refuses to overflow supply") {
        REQUIRE_FALSE(token.mint(bob, ~U128(0)));
        REQUIRE(token.balance_of(bob) == 0);
    }

    SECTION("Emptied accounts disappear from the snapshot") {
        REQUIRE(token.transfer(alice, bob, 1000));
        auto balances = token.balances();
        REQUIRE(balances.size() == 1);
        REQUIRE(balances.count(bob) == 1);
    }
}

TEST_CASE("Token ledger custody", "[custody]") {
    TokenLedger token("TKB");
    const Address alice = make_address(1);
    const Address bob = make_address(2);
    REQUIRE(token.mint(alice, 500));

    SECTION("Pull moves into custody") {
        REQUIRE(token.pull_from(alice, 200));
        REQUIRE(token.balance_of(alice) == 300);
        REQUIRE(token.custody_balance() == 200);
        REQUIRE(token.total_supply() == 500);
    }

    SECTION("Pull beyond balance is refused without effect") {
        REQUIRE_FALSE(token.pull_from(alice, 501));
        REQUIRE_FALSE(token.pull_from(bob, 1));
        REQUIRE(token.balance_of(alice) == 500);
        REQUIRE(token.custody_balance() == 0);
    }

    SECTION("Push pays out of custody only") {
        REQUIRE(token.pull_from(alice, 200));
        REQUIRE(token.push_to(bob, 150));
        REQUIRE(token.balance_of(bob) == 150);
        REQUIRE(token.custody_balance() == 50);
        REQUIRE_FALSE(token.push_to(bob, 51));
        REQUIRE(token.custody_balance() == 50);
    }

    SECTION("Load replaces everything") {
        std::map<Address, U128> image{{bob, 7}, {alice, 0}};
        token.load(image, 3);
        REQUIRE(token.balance_of(alice) == 0);
        REQUIRE(token.balance_of(bob) == 7);
        REQUIRE(token.custody_balance() == 3);
        REQUIRE(token.balances().size() == 1);
    }
}
