// cpswap - Persistence Tests

#include <catch2/catch.hpp>
#include <cpswap/exchange.hpp>
#include <cpswap/state.hpp>
#include <nlohmann/json.hpp>
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using namespace cpswap;
using cpswap::test::error_of;
using cpswap::test::u128;
using json = nlohmann::json;

namespace {

const Address ALICE = make_address(1);
const Address BOB = make_address(2);

// Exchange with two providers and one swap applied
void populate(Exchange& ex) {
    ex.token(Asset::A).mint(ALICE, 1000);
    ex.token(Asset::B).mint(ALICE, 1000);
    ex.token(Asset::A).mint(BOB, 1000);
    ex.token(Asset::B).mint(BOB, 1000);
    ex.pool().provide_liquidity(ALICE, 100, 200);
    ex.pool().provide_liquidity(BOB, 50, 100);
    ex.pool().swap_a_for_b(BOB, 10);
}

std::filesystem::path temp_state_path(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

} // namespace

TEST_CASE("Amount encoding", "[state]") {
    json big = state::encode_amount(MAX_RESERVE);
    REQUIRE(big.is_string());
    REQUIRE(state::decode_amount(big, "x") == MAX_RESERVE);

    REQUIRE(error_of([] { state::decode_amount(json(12), "x"); }) == ErrorCode::INVALID_STATE);
    REQUIRE(error_of([] { state::decode_amount(json("-1"), "x"); }) == ErrorCode::INVALID_STATE);
    REQUIRE(error_of([] { state::decode_amount(json(""), "x"); }) == ErrorCode::INVALID_STATE);
}

TEST_CASE("State document layout", "[state]") {
    Exchange ex("TKA", "TKB");
    populate(ex);

    json doc = ex.to_json();
    REQUIRE(doc["version"] == state::STATE_VERSION);
    REQUIRE(doc["pool"]["reserve_a"] == "160");
    REQUIRE(doc["pool"]["total_shares"] == "211");
    REQUIRE(doc["pool"]["providers"][to_hex(BOB)] == "70");
    REQUIRE(doc["tokens"]["a"]["symbol"] == "TKA");
    REQUIRE(doc["tokens"]["a"]["custody"] == "160");
    REQUIRE(doc["tokens"]["b"]["balances"][to_hex(ALICE)] == "800");
}

TEST_CASE("Exchange round trip", "[state]") {
    Exchange ex("TKA", "TKB");
    populate(ex);

    Exchange copy("TKA", "TKB");
    copy.load_json(ex.to_json());

    REQUIRE(copy.pool().get_reserves() == ex.pool().get_reserves());
    REQUIRE(copy.pool().total_shares() == 211);
    REQUIRE(copy.pool().share_of(ALICE) == 141);
    REQUIRE(copy.pool().share_of(BOB) == 70);
    REQUIRE(copy.token(Asset::A).balance_of(BOB) == ex.token(Asset::A).balance_of(BOB));
    REQUIRE(copy.token(Asset::B).custody_balance() == ex.pool().get_reserves().reserve_b);

    // The restored pool keeps trading identically
    REQUIRE(copy.pool().swap_b_for_a(ALICE, 30).amount_out ==
            ex.pool().swap_b_for_a(ALICE, 30).amount_out);
}

TEST_CASE("Rejected state documents leave the exchange untouched", "[state]") {
    Exchange ex("TKA", "TKB");
    populate(ex);
    const json good = ex.to_json();

    Exchange target("TKA", "TKB");
    target.token(Asset::A).mint(ALICE, 5);

    SECTION("Unsupported version") {
        json doc = good;
        doc["version"] = 2;
        REQUIRE(error_of([&] { target.load_json(doc); }) == ErrorCode::INVALID_STATE);
    }

    SECTION("Custody differs from reserves") {
        json doc = good;
        doc["tokens"]["a"]["custody"] = "159";
        REQUIRE(error_of([&] { target.load_json(doc); }) == ErrorCode::INVALID_STATE);
    }

    SECTION("Provider shares do not sum to total") {
        json doc = good;
        doc["pool"]["providers"][to_hex(BOB)] = "71";
        REQUIRE(error_of([&] { target.load_json(doc); }) == ErrorCode::INVALID_STATE);
    }

    SECTION("Symbol mismatch") {
        Exchange other("USD", "ETH");
        REQUIRE(error_of([&] { other.load_json(good); }) == ErrorCode::INVALID_STATE);
    }

    SECTION("Token supply beyond 128 bits") {
        json doc = good;
        doc["tokens"]["b"]["balances"][to_hex(ALICE)] = "340282366920938463463374607431768211455";
        REQUIRE(error_of([&] { target.load_json(doc); }) == ErrorCode::INVALID_STATE);
    }

    SECTION("Malformed address") {
        json doc = good;
        doc["tokens"]["a"]["balances"]["0x1234"] = "1";
        REQUIRE(error_of([&] { target.load_json(doc); }) == ErrorCode::INVALID_STATE);
    }

    REQUIRE(target.pool().total_shares() == 0);
    REQUIRE(target.token(Asset::A).balance_of(ALICE) == 5);
}

TEST_CASE("State file save and load", "[state]") {
    auto path = temp_state_path("cpswap-test-state.json");

    {
        Exchange ex("TKA", "TKB");
        populate(ex);
        ex.save(path.string());
    }

    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = Exchange::load(path.string());
    REQUIRE(loaded->token(Asset::A).symbol() == "TKA");
    REQUIRE(loaded->pool().get_reserves() == Reserves{160, 282});
    REQUIRE(loaded->pool().get_price() == 1);
    REQUIRE(loaded->pool().get_price_x18() == u128("1762500000000000000"));

    std::filesystem::remove(path);
}

TEST_CASE("Unreadable state files", "[state]") {
    SECTION("Missing file") {
        auto path = temp_state_path("cpswap-test-missing.json");
        REQUIRE_THROWS_AS(Exchange::load(path.string()), std::runtime_error);
    }

    SECTION("Not JSON") {
        auto path = temp_state_path("cpswap-test-garbage.json");
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE(error_of([&] { Exchange::load(path.string()); }) == ErrorCode::INVALID_STATE);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Counters survive a reload", "[state]") {
    Exchange ex("TKA", "TKB");
    populate(ex);

    json doc = ex.to_json();
    REQUIRE(doc["pool"]["stats"]["total_swaps"] == 1);
    REQUIRE(doc["pool"]["stats"]["volume_a_in"] == "10");

    Exchange copy("TKA", "TKB");
    copy.load_json(doc);
    Pool::Stats stats = copy.pool().get_stats();
    REQUIRE(stats.total_swaps == 1);
    REQUIRE(stats.total_liquidity_ops == 2);
    REQUIRE(stats.volume_a_in == 10);
    REQUIRE(stats.providers == 2);

    SECTION("Documents without counters start from zero") {
        doc["pool"].erase("stats");
        Exchange fresh("TKA", "TKB");
        fresh.load_json(doc);
        REQUIRE(fresh.pool().get_stats().total_swaps == 0);
        REQUIRE(fresh.pool().get_stats().providers == 2);
    }
}
