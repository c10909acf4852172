#ifndef CPSWAP_CUSTODY_HPP
#define CPSWAP_CUSTODY_HPP

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "types.hpp"

namespace cpswap {

// =============================================================================
// Custody Interface (one instance per pooled asset)
// =============================================================================

class ITokenCustody {
public:
    virtual ~ITokenCustody() = default;

    // Move `amount` from `who` into pool custody. All-or-nothing.
    virtual bool pull_from(const Address& who, U128 amount) = 0;

    // Move `amount` out of pool custody to `who`. All-or-nothing.
    virtual bool push_to(const Address& who, U128 amount) = 0;
};

// =============================================================================
// TokenLedger - In-memory fungible token with a pool custody account
// =============================================================================

class TokenLedger : public ITokenCustody {
public:
    explicit TokenLedger(std::string symbol);
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // =========================================================================
    // Custody
    // =========================================================================

    bool pull_from(const Address& who, U128 amount) override;
    bool push_to(const Address& who, U128 amount) override;

    // =========================================================================
    // Token Operations
    // =========================================================================

    // Credit new tokens; false if the balance would overflow
    bool mint(const Address& to, U128 amount);

    // Account-to-account transfer
    bool transfer(const Address& from, const Address& to, U128 amount);

    U128 balance_of(const Address& who) const;

    // Tokens currently held on behalf of the pool
    U128 custody_balance() const;

    U128 total_supply() const;

    const std::string& symbol() const { return symbol_; }

    // =========================================================================
    // Snapshot
    // =========================================================================

    std::map<Address, U128> balances() const;

    // Replace all balances (used when loading persisted state)
    void load(const std::map<Address, U128>& balances, U128 custody);

private:
    std::string symbol_;

    std::map<Address, U128> balances_;
    U128 custody_{0};
    mutable std::shared_mutex mutex_;
};

} // namespace cpswap

#endif // CPSWAP_CUSTODY_HPP
