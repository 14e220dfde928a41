#ifndef CPMM_EVENTS_HPP
#define CPMM_EVENTS_HPP

#include "types.hpp"

namespace cpmm {

// =============================================================================
// Notifications (emitted after an operation has fully settled)
// =============================================================================

struct LiquidityAdded {
    Address provider;        // Account the assets were pulled from
    Address recipient;       // Account credited with the shares
    Asset asset_a;
    Asset asset_b;
    I128 amount_a;
    I128 amount_b;
    I128 shares;
};

struct LiquidityRemoved {
    Address provider;        // Account whose shares were burned
    Address recipient;       // Account the assets were paid to
    Asset asset_a;
    Asset asset_b;
    I128 amount_a;
    I128 amount_b;
    I128 shares;
};

struct TokensSwapped {
    Address sender;
    Address recipient;
    Asset asset_in;
    Asset asset_out;
    I128 amount_in;
    I128 amount_out;
};

// =============================================================================
// Listener Interface
// =============================================================================

class IAmmEvents {
public:
    virtual ~IAmmEvents() = default;

    virtual void on_liquidity_added(const LiquidityAdded& event) {}
    virtual void on_liquidity_removed(const LiquidityRemoved& event) {}
    virtual void on_tokens_swapped(const TokensSwapped& event) {}
};

// Null listener (no-op)
class NullEvents : public IAmmEvents {};

} // namespace cpmm

#endif // CPMM_EVENTS_HPP
