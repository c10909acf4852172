#ifndef CPSWAP_POOL_HPP
#define CPSWAP_POOL_HPP

#include <map>
#include <vector>
#include <shared_mutex>
#include <mutex>
#include <atomic>

#include "types.hpp"
#include "errors.hpp"
#include "custody.hpp"
#include "events.hpp"

namespace cpswap {

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    U128 reserve_a;
    U128 reserve_b;
    U128 total_shares;
};

// Activity counters (`providers` is derived from the ledger)
struct PoolStats {
    uint64_t total_swaps;
    uint64_t total_liquidity_ops;
    U128 volume_a_in;
    U128 volume_b_in;
    uint64_t providers;
};

// Pool state plus the provider share ledger (provider -> shares, no zero entries)
struct PoolSnapshot {
    PoolState state;
    std::map<Address, U128> shares;
    PoolStats stats{};
};

struct WithdrawResult {
    U128 amount_a;
    U128 amount_b;
};

struct SwapResult {
    U128 amount_in;
    U128 amount_out;
};

// =============================================================================
// Pool - Two-asset constant-product pool with proportional LP shares
//
// Mutations are serialized on one exclusive lock held through validation,
// custody transfers and commit. A custody failure rolls the operation back
// and throws CUSTODY_TRANSFER_FAILED. Listeners run after the lock is
// released. Custody implementations must not call back into the pool.
// =============================================================================

class Pool {
public:
    Pool(ITokenCustody& token_a, ITokenCustody& token_b);
    ~Pool() = default;

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Deposit both assets; returns the shares minted to `provider`
    U128 provide_liquidity(const Address& provider, U128 amount_a, U128 amount_b);

    // Burn `share_amount` of the provider's shares; returns the amounts paid out
    WithdrawResult remove_liquidity(const Address& provider, U128 share_amount);

    // =========================================================================
    // Swaps
    // =========================================================================

    SwapResult swap_a_for_b(const Address& caller, U128 amount_in);
    SwapResult swap_b_for_a(const Address& caller, U128 amount_in);
    SwapResult swap(const Address& caller, SwapDirection direction, U128 amount_in);

    // =========================================================================
    // Queries
    // =========================================================================

    Reserves get_reserves() const;

    // floor(reserve_b / reserve_a), in whole units of B per unit of A
    U128 get_price() const;

    // reserve_b / reserve_a as X18 fixed point
    U128 get_price_x18() const;

    U128 share_of(const Address& provider) const;
    U128 total_shares() const;

    // Pure fee-inclusive quote over explicit reserves
    static U128 quote_out(U128 amount_in, U128 reserve_in, U128 reserve_out);

    // quote_out against the current reserves
    U128 quote(SwapDirection direction, U128 amount_in) const;

    // =========================================================================
    // Snapshot / Restore
    // =========================================================================

    PoolSnapshot snapshot() const;

    // Replace state, ledger and counters; throws INVALID_STATE if the
    // snapshot breaks a pool invariant
    void restore(const PoolSnapshot& snapshot);

    // =========================================================================
    // Listeners
    // =========================================================================

    void add_listener(IPoolListener* listener);
    void remove_listener(IPoolListener* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    using Stats = PoolStats;
    Stats get_stats() const;

private:
    ITokenCustody& token_a_;
    ITokenCustody& token_b_;

    PoolState state_{};
    std::map<Address, U128> shares_;
    mutable std::shared_mutex pool_mutex_;

    std::vector<IPoolListener*> listeners_;
    mutable std::mutex listeners_mutex_;

    // Statistics
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    U128 volume_a_in_{0};   // guarded by pool_mutex_
    U128 volume_b_in_{0};

    ITokenCustody& custody(Asset asset) {
        return asset == Asset::A ? token_a_ : token_b_;
    }

    std::vector<IPoolListener*> listeners_copy() const;

    // Caller holds pool_mutex_
    PoolStats stats_locked() const;

    static void check_invariants(const PoolSnapshot& snapshot);
};

} // namespace cpswap

#endif // CPSWAP_POOL_HPP
