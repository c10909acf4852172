// =============================================================================
// exchange.cpp - Token ledgers + pool bundle with JSON persistence
// =============================================================================

#include "cpswap/exchange.hpp"
#include "cpswap/state.hpp"
#include "cpswap/errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cpswap {

using json = nlohmann::json;

namespace {

// custody + all balances must be representable, or later mints would wrap
void check_supply(const state::LedgerImage& image) {
    constexpr U128 U128_MAX = ~U128(0);
    U128 supply = image.custody;
    for (const auto& [addr, balance] : image.balances) {
        if (balance > U128_MAX - supply) {
            throw PoolError(ErrorCode::INVALID_STATE,
                            "total supply of " + image.symbol + " overflows 128 bits");
        }
        supply += balance;
    }
}

} // anonymous namespace

Exchange::Exchange(std::string symbol_a, std::string symbol_b)
    : token_a_(std::move(symbol_a)),
      token_b_(std::move(symbol_b)),
      pool_(token_a_, token_b_) {}

// =============================================================================
// JSON
// =============================================================================

json Exchange::to_json() const {
    return json{
        {"version", state::STATE_VERSION},
        {"pool", state::encode_pool(pool_.snapshot())},
        {"tokens", {
            {"a", state::encode_ledger(token_a_)},
            {"b", state::encode_ledger(token_b_)}
        }}
    };
}

void Exchange::load_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("version") || !doc["version"].is_number_integer()) {
        throw PoolError(ErrorCode::INVALID_STATE, "missing state version");
    }
    if (doc["version"].get<int>() != state::STATE_VERSION) {
        throw PoolError(ErrorCode::INVALID_STATE,
                        "unsupported state version " + std::to_string(doc["version"].get<int>()));
    }
    if (!doc.contains("pool") || !doc.contains("tokens") || !doc["tokens"].is_object() ||
        !doc["tokens"].contains("a") || !doc["tokens"].contains("b")) {
        throw PoolError(ErrorCode::INVALID_STATE, "state needs 'pool', 'tokens.a' and 'tokens.b'");
    }

    PoolSnapshot snapshot = state::decode_pool(doc["pool"]);
    state::LedgerImage image_a = state::decode_ledger(doc["tokens"]["a"]);
    state::LedgerImage image_b = state::decode_ledger(doc["tokens"]["b"]);

    if (image_a.symbol != token_a_.symbol() || image_b.symbol != token_b_.symbol()) {
        throw PoolError(ErrorCode::INVALID_STATE,
                        "token symbols " + image_a.symbol + "/" + image_b.symbol +
                        " do not match " + token_a_.symbol() + "/" + token_b_.symbol());
    }

    // The pool only ever moves custody balances together with its reserves
    if (image_a.custody != snapshot.state.reserve_a ||
        image_b.custody != snapshot.state.reserve_b) {
        throw PoolError(ErrorCode::INVALID_STATE, "custody balances differ from reserves");
    }

    check_supply(image_a);
    check_supply(image_b);

    // restore() validates before touching anything
    pool_.restore(snapshot);
    token_a_.load(image_a.balances, image_a.custody);
    token_b_.load(image_b.balances, image_b.custody);
}

// =============================================================================
// Files
// =============================================================================

void Exchange::save(const std::string& path) const {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file{tmp_path, std::ios::trunc};
        if (!file.is_open()) {
            throw std::runtime_error("Cannot write state file: " + tmp_path);
        }
        file << to_json().dump(2) << "\n";
        if (!file) {
            throw std::runtime_error("Failed writing state file: " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace state file " + path + ": " + ec.message());
    }
}

std::unique_ptr<Exchange> Exchange::load(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open state file: " + path);
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        throw PoolError(ErrorCode::INVALID_STATE, "state file is not valid JSON: " + path);
    }

    const json* tokens = doc.is_object() && doc.contains("tokens") ? &doc["tokens"] : nullptr;
    if (!tokens || !tokens->is_object() || !tokens->contains("a") || !tokens->contains("b")) {
        throw PoolError(ErrorCode::INVALID_STATE, "state file has no token section: " + path);
    }

    auto exchange = std::make_unique<Exchange>(
        state::decode_ledger((*tokens)["a"]).symbol,
        state::decode_ledger((*tokens)["b"]).symbol);
    exchange->load_json(doc);
    return exchange;
}

} // namespace cpswap
