// =============================================================================
// state.cpp - JSON encoding of pool and token ledger snapshots
// =============================================================================

#include "cpswap/state.hpp"
#include "cpswap/errors.hpp"
#include <nlohmann/json.hpp>

namespace cpswap {
namespace state {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw PoolError(ErrorCode::INVALID_STATE, "malformed state: " + what);
}

const json& require(const json& j, const char* field) {
    if (!j.is_object()) malformed(std::string("expected object around '") + field + "'");
    auto it = j.find(field);
    if (it == j.end()) malformed(std::string("missing '") + field + "'");
    return *it;
}

Address decode_address(const std::string& text) {
    auto addr = address_from_hex(text);
    if (!addr) malformed("bad address '" + text + "'");
    return *addr;
}

std::map<Address, U128> decode_balances(const json& j, const char* field) {
    const json& obj = require(j, field);
    if (!obj.is_object()) malformed(std::string("'") + field + "' is not an object");

    std::map<Address, U128> out;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        U128 amount = decode_amount(it.value(), field);
        if (amount != 0) out[decode_address(it.key())] = amount;
    }
    return out;
}

uint64_t decode_counter(const json& j, const char* field) {
    const json& value = require(j, field);
    if (!value.is_number_unsigned()) {
        malformed(std::string("'") + field + "' must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

json encode_balances(const std::map<Address, U128>& balances) {
    json obj = json::object();
    for (const auto& [addr, amount] : balances) {
        obj[to_hex(addr)] = encode_amount(amount);
    }
    return obj;
}

} // anonymous namespace

// =============================================================================
// Amounts
// =============================================================================

json encode_amount(U128 value) {
    return to_string(value);
}

U128 decode_amount(const json& j, const char* field) {
    if (!j.is_string()) malformed(std::string("'") + field + "' must be a decimal string");
    auto value = parse_u128(j.get<std::string>());
    if (!value) malformed(std::string("'") + field + "' is not a valid amount");
    return *value;
}

// =============================================================================
// Pool
// =============================================================================

json encode_pool(const PoolSnapshot& snapshot) {
    return json{
        {"reserve_a", encode_amount(snapshot.state.reserve_a)},
        {"reserve_b", encode_amount(snapshot.state.reserve_b)},
        {"total_shares", encode_amount(snapshot.state.total_shares)},
        {"providers", encode_balances(snapshot.shares)},
        {"stats", {
            {"total_swaps", snapshot.stats.total_swaps},
            {"total_liquidity_ops", snapshot.stats.total_liquidity_ops},
            {"volume_a_in", encode_amount(snapshot.stats.volume_a_in)},
            {"volume_b_in", encode_amount(snapshot.stats.volume_b_in)}
        }}
    };
}

PoolSnapshot decode_pool(const json& j) {
    PoolSnapshot snapshot{};
    snapshot.state.reserve_a = decode_amount(require(j, "reserve_a"), "reserve_a");
    snapshot.state.reserve_b = decode_amount(require(j, "reserve_b"), "reserve_b");
    snapshot.state.total_shares = decode_amount(require(j, "total_shares"), "total_shares");
    snapshot.shares = decode_balances(j, "providers");
    snapshot.stats.providers = snapshot.shares.size();

    // Counters are optional; older documents start from zero
    if (j.contains("stats")) {
        const json& stats = j["stats"];
        snapshot.stats.total_swaps = decode_counter(stats, "total_swaps");
        snapshot.stats.total_liquidity_ops = decode_counter(stats, "total_liquidity_ops");
        snapshot.stats.volume_a_in = decode_amount(require(stats, "volume_a_in"), "volume_a_in");
        snapshot.stats.volume_b_in = decode_amount(require(stats, "volume_b_in"), "volume_b_in");
    }
    return snapshot;
}

// =============================================================================
// Token Ledger
// =============================================================================

json encode_ledger(const TokenLedger& ledger) {
    return json{
        {"symbol", ledger.symbol()},
        {"custody", encode_amount(ledger.custody_balance())},
        {"balances", encode_balances(ledger.balances())}
    };
}

LedgerImage decode_ledger(const json& j) {
    LedgerImage image{};
    const json& symbol = require(j, "symbol");
    if (!symbol.is_string()) malformed("'symbol' must be a string");
    image.symbol = symbol.get<std::string>();
    image.custody = decode_amount(require(j, "custody"), "custody");
    image.balances = decode_balances(j, "balances");
    return image;
}

} // namespace state
} // namespace cpswap
