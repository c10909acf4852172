#ifndef CPSWAP_EVENTS_HPP
#define CPSWAP_EVENTS_HPP

#include "types.hpp"

namespace cpswap {

// =============================================================================
// Pool Notifications
// =============================================================================

struct LiquidityAdded {
    Address provider;
    U128 amount_a;
    U128 amount_b;
    U128 shares_minted;
};

struct LiquidityRemoved {
    Address provider;
    U128 shares_burned;
    U128 amount_a;
    U128 amount_b;
};

struct SwapEvent {
    Address caller;
    SwapDirection direction;
    U128 amount_in;
    U128 amount_out;
};

// =============================================================================
// Listener Interface
//
// Called after the operation's state change and transfers are committed,
// outside the pool lock. Must not throw.
// =============================================================================

class IPoolListener {
public:
    virtual ~IPoolListener() = default;

    virtual void on_liquidity_added(const LiquidityAdded& event) {}
    virtual void on_liquidity_removed(const LiquidityRemoved& event) {}
    virtual void on_swap(const SwapEvent& event) {}
};

// Null listener (no-op)
class NullListener : public IPoolListener {};

} // namespace cpswap

#endif // CPSWAP_EVENTS_HPP
