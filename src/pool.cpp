// =============================================================================
// pool.cpp - Constant-product pool engine
// Reserves, LP share ledger, fee-inclusive swaps with custody rollback
// =============================================================================

#include "cpswap/pool.hpp"
#include "cpswap/math.hpp"
#include <algorithm>

namespace cpswap {

// =============================================================================
// Internal Helpers
// =============================================================================

namespace {

constexpr U128 U128_MAX = ~U128(0);

// Completed custody legs of one operation, in order. A failing leg, refused
// or thrown, reverses every earlier leg (LIFO) before CUSTODY_TRANSFER_FAILED
// propagates.
class TransferJournal {
public:
    TransferJournal() { legs_.reserve(2); }

    void pull(ITokenCustody& token, const Address& who, U128 amount, const char* what) {
        if (amount == 0) return;
        std::string detail = std::string("pull of ") + what + " (" + to_string(amount) + ")";
        bool ok = false;
        try {
            ok = token.pull_from(who, amount);
        } catch (const std::exception& e) {
            fail(detail + " threw: " + e.what());
        }
        if (!ok) fail(detail + " refused");
        legs_.push_back({&token, who, amount, true});
    }

    void push(ITokenCustody& token, const Address& who, U128 amount, const char* what) {
        if (amount == 0) return;
        std::string detail = std::string("push of ") + what + " (" + to_string(amount) + ")";
        bool ok = false;
        try {
            ok = token.push_to(who, amount);
        } catch (const std::exception& e) {
            fail(detail + " threw: " + e.what());
        }
        if (!ok) fail(detail + " refused");
        legs_.push_back({&token, who, amount, false});
    }

private:
    struct Leg {
        ITokenCustody* token;
        Address who;
        U128 amount;
        bool pulled;
    };
    std::vector<Leg> legs_;

    static bool reverse(const Leg& leg) {
        try {
            return leg.pulled ? leg.token->push_to(leg.who, leg.amount)
                              : leg.token->pull_from(leg.who, leg.amount);
        } catch (const std::exception&) {
            return false;
        }
    }

    [[noreturn]] void fail(std::string msg) {
        size_t uncompensated = 0;
        for (auto it = legs_.rbegin(); it != legs_.rend(); ++it) {
            if (!reverse(*it)) ++uncompensated;
        }
        legs_.clear();
        if (uncompensated != 0) {
            msg += "; " + std::to_string(uncompensated) + " earlier transfer(s) could not be reversed";
        }
        throw PoolError(ErrorCode::CUSTODY_TRANSFER_FAILED, msg);
    }
};

const char* asset_name(Asset asset) {
    return asset == Asset::A ? "asset A" : "asset B";
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

Pool::Pool(ITokenCustody& token_a, ITokenCustody& token_b)
    : token_a_(token_a), token_b_(token_b) {}

// =============================================================================
// Provide Liquidity
// =============================================================================

U128 Pool::provide_liquidity(const Address& provider, U128 amount_a, U128 amount_b) {
    if (amount_a == 0 || amount_b == 0) {
        throw PoolError(ErrorCode::ZERO_AMOUNT, "both deposit amounts must be positive");
    }

    std::unique_lock lock(pool_mutex_);

    if (amount_a > MAX_RESERVE - state_.reserve_a ||
        amount_b > MAX_RESERVE - state_.reserve_b) {
        throw PoolError(ErrorCode::RESERVE_OVERFLOW, "deposit exceeds reserve capacity");
    }

    U128 minted = 0;
    if (state_.total_shares == 0) {
        // First provider sets the price
        minted = amm_math::initial_shares(amount_a, amount_b);
        if (minted == 0) {
            throw PoolError(ErrorCode::INSUFFICIENT_INITIAL_LIQUIDITY,
                            "sqrt(" + to_string(amount_a) + " * " + to_string(amount_b) +
                            ") floors to zero");
        }
    } else {
        if (!amm_math::ratio_matches(amount_a, amount_b, state_.reserve_a, state_.reserve_b)) {
            throw PoolError(ErrorCode::RATIO_MISMATCH,
                            to_string(amount_a) + ":" + to_string(amount_b) +
                            " does not match reserves " + to_string(state_.reserve_a) +
                            ":" + to_string(state_.reserve_b));
        }
        minted = amm_math::shares_for_deposit(amount_a, state_.reserve_a, state_.total_shares);
        if (minted == 0) {
            throw PoolError(ErrorCode::ZERO_AMOUNT, "deposit too small to mint a share");
        }
        if (minted > U128_MAX - state_.total_shares) {
            throw PoolError(ErrorCode::RESERVE_OVERFLOW, "total shares overflow");
        }
    }

    PoolState next = state_;
    next.reserve_a += amount_a;
    next.reserve_b += amount_b;
    next.total_shares += minted;

    TransferJournal journal;
    journal.pull(token_a_, provider, amount_a, asset_name(Asset::A));
    journal.pull(token_b_, provider, amount_b, asset_name(Asset::B));

    // Commit
    state_ = next;
    shares_[provider] += minted;
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    lock.unlock();

    LiquidityAdded event{provider, amount_a, amount_b, minted};
    for (IPoolListener* listener : listeners_copy()) {
        listener->on_liquidity_added(event);
    }

    return minted;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

WithdrawResult Pool::remove_liquidity(const Address& provider, U128 share_amount) {
    if (share_amount == 0) {
        throw PoolError(ErrorCode::ZERO_AMOUNT, "share amount must be positive");
    }

    std::unique_lock lock(pool_mutex_);

    auto it = shares_.find(provider);
    U128 held = it != shares_.end() ? it->second : 0;
    if (share_amount > held) {
        throw PoolError(ErrorCode::INSUFFICIENT_SHARES,
                        "requested " + to_string(share_amount) + ", holds " + to_string(held));
    }

    // A leg may floor to zero; it is paid as zero
    Reserves out = amm_math::amounts_for_shares(share_amount, state_.reserve_a,
                                                state_.reserve_b, state_.total_shares);

    PoolState next = state_;
    next.reserve_a -= out.reserve_a;
    next.reserve_b -= out.reserve_b;
    next.total_shares -= share_amount;

    TransferJournal journal;
    journal.push(token_a_, provider, out.reserve_a, asset_name(Asset::A));
    journal.push(token_b_, provider, out.reserve_b, asset_name(Asset::B));

    // Commit
    state_ = next;
    it->second -= share_amount;
    if (it->second == 0) shares_.erase(it);
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    lock.unlock();

    LiquidityRemoved event{provider, share_amount, out.reserve_a, out.reserve_b};
    for (IPoolListener* listener : listeners_copy()) {
        listener->on_liquidity_removed(event);
    }

    return WithdrawResult{out.reserve_a, out.reserve_b};
}

// =============================================================================
// Swap
// =============================================================================

SwapResult Pool::swap_a_for_b(const Address& caller, U128 amount_in) {
    return swap(caller, SwapDirection::A_TO_B, amount_in);
}

SwapResult Pool::swap_b_for_a(const Address& caller, U128 amount_in) {
    return swap(caller, SwapDirection::B_TO_A, amount_in);
}

SwapResult Pool::swap(const Address& caller, SwapDirection direction, U128 amount_in) {
    if (amount_in == 0) {
        throw PoolError(ErrorCode::ZERO_SWAP_AMOUNT, "swap input must be positive");
    }

    std::unique_lock lock(pool_mutex_);

    if (state_.total_shares == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "pool has no liquidity");
    }

    const bool a_to_b = direction == SwapDirection::A_TO_B;
    const U128 reserve_in = a_to_b ? state_.reserve_a : state_.reserve_b;
    const U128 reserve_out = a_to_b ? state_.reserve_b : state_.reserve_a;

    if (amount_in > MAX_RESERVE - reserve_in) {
        throw PoolError(ErrorCode::RESERVE_OVERFLOW, "swap input exceeds reserve capacity");
    }

    U128 amount_out = amm_math::get_amount_out(amount_in, reserve_in, reserve_out);
    if (amount_out == 0) {
        throw PoolError(ErrorCode::INSUFFICIENT_OUTPUT,
                        "input " + to_string(amount_in) + " yields no output");
    }
    if (amount_out >= reserve_out) {
        throw PoolError(ErrorCode::INSUFFICIENT_OUTPUT, "swap would drain the output reserve");
    }

    const U128 new_in = reserve_in + amount_in;
    const U128 new_out = reserve_out - amount_out;
    if (!amm_math::product_non_decreasing(reserve_in, reserve_out, new_in, new_out)) {
        throw PoolError(ErrorCode::INVARIANT_VIOLATION, "constant product would decrease");
    }

    TransferJournal journal;
    journal.pull(custody(input_asset(direction)), caller, amount_in,
                 asset_name(input_asset(direction)));
    journal.push(custody(output_asset(direction)), caller, amount_out,
                 asset_name(output_asset(direction)));

    // Commit
    if (a_to_b) {
        state_.reserve_a = new_in;
        state_.reserve_b = new_out;
        volume_a_in_ += amount_in;
    } else {
        state_.reserve_b = new_in;
        state_.reserve_a = new_out;
        volume_b_in_ += amount_in;
    }
    total_swaps_.fetch_add(1, std::memory_order_relaxed);

    lock.unlock();

    SwapEvent event{caller, direction, amount_in, amount_out};
    for (IPoolListener* listener : listeners_copy()) {
        listener->on_swap(event);
    }

    return SwapResult{amount_in, amount_out};
}

// =============================================================================
// Query Operations
// =============================================================================

Reserves Pool::get_reserves() const {
    std::shared_lock lock(pool_mutex_);
    return Reserves{state_.reserve_a, state_.reserve_b};
}

U128 Pool::get_price() const {
    std::shared_lock lock(pool_mutex_);
    return amm_math::spot_price(state_.reserve_a, state_.reserve_b);
}

U128 Pool::get_price_x18() const {
    std::shared_lock lock(pool_mutex_);
    return amm_math::price_x18(state_.reserve_a, state_.reserve_b);
}

U128 Pool::share_of(const Address& provider) const {
    std::shared_lock lock(pool_mutex_);
    auto it = shares_.find(provider);
    return it != shares_.end() ? it->second : 0;
}

U128 Pool::total_shares() const {
    std::shared_lock lock(pool_mutex_);
    return state_.total_shares;
}

U128 Pool::quote_out(U128 amount_in, U128 reserve_in, U128 reserve_out) {
    return amm_math::get_amount_out(amount_in, reserve_in, reserve_out);
}

U128 Pool::quote(SwapDirection direction, U128 amount_in) const {
    std::shared_lock lock(pool_mutex_);
    if (state_.total_shares == 0) {
        throw PoolError(ErrorCode::NO_LIQUIDITY, "pool has no liquidity");
    }
    return direction == SwapDirection::A_TO_B
        ? quote_out(amount_in, state_.reserve_a, state_.reserve_b)
        : quote_out(amount_in, state_.reserve_b, state_.reserve_a);
}

// =============================================================================
// Snapshot / Restore
// =============================================================================

PoolSnapshot Pool::snapshot() const {
    std::shared_lock lock(pool_mutex_);
    return PoolSnapshot{state_, shares_, stats_locked()};
}

void Pool::check_invariants(const PoolSnapshot& snapshot) {
    const PoolState& s = snapshot.state;

    if (s.reserve_a > MAX_RESERVE || s.reserve_b > MAX_RESERVE) {
        throw PoolError(ErrorCode::INVALID_STATE, "reserve exceeds 112 bits");
    }
    if (s.total_shares == 0) {
        if (s.reserve_a != 0 || s.reserve_b != 0) {
            throw PoolError(ErrorCode::INVALID_STATE, "reserves without outstanding shares");
        }
    } else if (s.reserve_a == 0 || s.reserve_b == 0) {
        throw PoolError(ErrorCode::INVALID_STATE, "outstanding shares with an empty reserve");
    }

    U128 sum = 0;
    for (const auto& [provider, amount] : snapshot.shares) {
        if (amount > U128_MAX - sum) {
            throw PoolError(ErrorCode::INVALID_STATE, "share ledger overflows");
        }
        sum += amount;
    }
    if (sum != s.total_shares) {
        throw PoolError(ErrorCode::INVALID_STATE,
                        "ledger sums to " + to_string(sum) + ", total is " +
                        to_string(s.total_shares));
    }
}

void Pool::restore(const PoolSnapshot& snapshot) {
    check_invariants(snapshot);

    std::unique_lock lock(pool_mutex_);
    state_ = snapshot.state;
    shares_.clear();
    for (const auto& [provider, amount] : snapshot.shares) {
        if (amount != 0) shares_[provider] = amount;
    }
    total_swaps_.store(snapshot.stats.total_swaps, std::memory_order_relaxed);
    total_liquidity_ops_.store(snapshot.stats.total_liquidity_ops, std::memory_order_relaxed);
    volume_a_in_ = snapshot.stats.volume_a_in;
    volume_b_in_ = snapshot.stats.volume_b_in;
}

// =============================================================================
// Listener Registration
// =============================================================================

void Pool::add_listener(IPoolListener* listener) {
    if (!listener) return;
    std::lock_guard lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Pool::remove_listener(IPoolListener* listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

std::vector<IPoolListener*> Pool::listeners_copy() const {
    std::lock_guard lock(listeners_mutex_);
    return listeners_;
}

// =============================================================================
// Statistics
// =============================================================================

Pool::Stats Pool::get_stats() const {
    std::shared_lock lock(pool_mutex_);
    return stats_locked();
}

PoolStats Pool::stats_locked() const {
    return PoolStats{
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed),
        volume_a_in_,
        volume_b_in_,
        static_cast<uint64_t>(shares_.size())
    };
}

} // namespace cpswap
