#ifndef CPSWAP_EXCHANGE_HPP
#define CPSWAP_EXCHANGE_HPP

#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "custody.hpp"
#include "pool.hpp"

namespace cpswap {

// =============================================================================
// Exchange - Host bundle: two token ledgers and the pool that holds them
// =============================================================================

class Exchange {
public:
    Exchange(std::string symbol_a, std::string symbol_b);
    ~Exchange() = default;

    // Non-copyable (the pool holds references to the ledgers)
    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Pool& pool() { return pool_; }
    const Pool& pool() const { return pool_; }

    TokenLedger& token(Asset asset) { return asset == Asset::A ? token_a_ : token_b_; }
    const TokenLedger& token(Asset asset) const { return asset == Asset::A ? token_a_ : token_b_; }

    // =========================================================================
    // Persistence
    // =========================================================================

    nlohmann::json to_json() const;

    // Replace ledgers and pool from a state document. Validates the pool
    // invariants and that each custody balance equals its reserve; throws
    // PoolError(INVALID_STATE) otherwise, leaving this exchange unchanged.
    void load_json(const nlohmann::json& doc);

    // Write atomically (temp file + rename); throws std::runtime_error on I/O failure
    void save(const std::string& path) const;

    static std::unique_ptr<Exchange> load(const std::string& path);

private:
    TokenLedger token_a_;
    TokenLedger token_b_;
    Pool pool_;
};

} // namespace cpswap

#endif // CPSWAP_EXCHANGE_HPP
