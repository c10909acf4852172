// =============================================================================
// custody.cpp - In-memory token ledger backing the pool's custody
// =============================================================================

#include "cpswap/custody.hpp"

namespace cpswap {

namespace {

constexpr U128 U128_MAX = ~U128(0);

} // anonymous namespace

TokenLedger::TokenLedger(std::string symbol) : symbol_(std::move(symbol)) {}

// =============================================================================
// Custody
// =============================================================================

bool TokenLedger::pull_from(const Address& who, U128 amount) {
    std::unique_lock lock(mutex_);

    auto it = balances_.find(who);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (custody_ > U128_MAX - amount) {
        return false;
    }

    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    custody_ += amount;
    return true;
}

bool TokenLedger::push_to(const Address& who, U128 amount) {
    std::unique_lock lock(mutex_);

    if (custody_ < amount) {
        return false;
    }
    auto it = balances_.find(who);
    U128 balance = it != balances_.end() ? it->second : 0;
    if (balance > U128_MAX - amount) {
        return false;
    }
    if (amount == 0) return true;

    custody_ -= amount;
    balances_[who] = balance + amount;
    return true;
}

// =============================================================================
// Token Operations
// =============================================================================

bool TokenLedger::mint(const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);

    U128 supply = custody_;
    for (const auto& [addr, bal] : balances_) supply += bal;
    if (supply > U128_MAX - amount) {
        return false;
    }
    if (amount == 0) return true;

    balances_[to] += amount;
    return true;
}

bool TokenLedger::transfer(const Address& from, const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (amount == 0 || from == to) return true;

    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    balances_[to] += amount;
    return true;
}

U128 TokenLedger::balance_of(const Address& who) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(who);
    return it != balances_.end() ? it->second : 0;
}

U128 TokenLedger::custody_balance() const {
    std::shared_lock lock(mutex_);
    return custody_;
}

U128 TokenLedger::total_supply() const {
    std::shared_lock lock(mutex_);
    U128 total = custody_;
    for (const auto& [addr, bal] : balances_) total += bal;
    return total;
}

// =============================================================================
// Snapshot
// =============================================================================

std::map<Address, U128> TokenLedger::balances() const {
    std::shared_lock lock(mutex_);
    return balances_;
}

void TokenLedger::load(const std::map<Address, U128>& balances, U128 custody) {
    std::unique_lock lock(mutex_);
    balances_.clear();
    for (const auto& [addr, bal] : balances) {
        if (bal != 0) balances_[addr] = bal;
    }
    custody_ = custody;
}

} // namespace cpswap
