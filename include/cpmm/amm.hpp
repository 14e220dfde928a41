#ifndef CPMM_AMM_HPP
#define CPMM_AMM_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "math.hpp"
#include "registry.hpp"
#include "ledger.hpp"
#include "events.hpp"
#include "log.hpp"

namespace cpmm {

// =============================================================================
// Operation Parameters
// =============================================================================

struct AddLiquidityParams {
    Asset asset_a;
    Asset asset_b;
    I128 amount_a_desired;
    I128 amount_b_desired;
    I128 amount_a_min;
    I128 amount_b_min;
    Address recipient;       // Credited with the minted shares
    uint64_t deadline;       // Unix seconds
};

struct RemoveLiquidityParams {
    Asset asset_a;
    Asset asset_b;
    I128 shares;             // Shares to burn from the sender's balance
    I128 amount_a_min;
    I128 amount_b_min;
    Address recipient;       // Receives the withdrawn assets
    uint64_t deadline;
};

struct SwapExactInParams {
    I128 amount_in;
    I128 amount_out_min;
    std::vector<Asset> path;  // Exactly [asset_in, asset_out]
    Address recipient;
    uint64_t deadline;
};

struct SwapExactOutParams {
    I128 amount_out;
    I128 amount_in_max;
    std::vector<Asset> path;  // Exactly [asset_in, asset_out]
    Address recipient;
    uint64_t deadline;
};

// =============================================================================
// Results (error_code == errors::OK on success; amounts are zero otherwise)
// =============================================================================

struct LiquidityResult {
    int32_t error_code;
    I128 amount_a;           // In the caller's asset_a / asset_b order
    I128 amount_b;
    I128 shares;
};

struct SwapResult {
    int32_t error_code;
    std::vector<I128> amounts;  // [amount_in, amount_out]
};

struct PriceResult {
    int32_t error_code;
    I128 price_x18;          // Units of b per unit of a, scaled by 1e18
};

struct Reserves {
    I128 reserve_a;
    I128 reserve_b;
};

// =============================================================================
// Engine Configuration
// =============================================================================

struct EngineConfig {
    Address custody = addresses::POOL_CUSTODY;  // Holds every pool's reserves
};

// Current time in unix seconds
using Clock = std::function<uint64_t()>;

// =============================================================================
// AmmEngine - constant-product pools over an external token ledger
// =============================================================================

class AmmEngine {
public:
    // Uses the system clock when `clock` is empty
    explicit AmmEngine(ITokenLedger& ledger, EngineConfig config = {}, Clock clock = {});
    ~AmmEngine() = default;

    // Non-copyable
    AmmEngine(const AmmEngine&) = delete;
    AmmEngine& operator=(const AmmEngine&) = delete;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // Deposits both assets at the pool ratio (or sets it, for a new pair) and
    // mints shares to params.recipient. Assets are pulled from `sender`, which
    // must have approved the custody account on both ledgers.
    LiquidityResult add_liquidity(const Address& sender, const AddLiquidityParams& params);

    // Burns the sender's shares and pays the proportional reserves out
    LiquidityResult remove_liquidity(const Address& sender, const RemoveLiquidityParams& params);

    // =========================================================================
    // Swaps
    // =========================================================================

    SwapResult swap_exact_tokens_for_tokens(const Address& sender, const SwapExactInParams& params);
    SwapResult swap_tokens_for_exact_tokens(const Address& sender, const SwapExactOutParams& params);

    // =========================================================================
    // Pricing
    // =========================================================================

    // reserve(b) * 1e18 / reserve(a)
    PriceResult get_price(const Asset& asset_a, const Asset& asset_b) const;

    static amm_math::QuoteResult get_amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out) {
        return amm_math::get_amount_out(amount_in, reserve_in, reserve_out);
    }
    static amm_math::QuoteResult get_amount_in(I128 amount_out, I128 reserve_in, I128 reserve_out) {
        return amm_math::get_amount_in(amount_out, reserve_in, reserve_out);
    }
    static amm_math::QuoteResult quote(I128 amount_a, I128 reserve_a, I128 reserve_b) {
        return amm_math::quote(amount_a, reserve_a, reserve_b);
    }

    // =========================================================================
    // Query Operations
    // =========================================================================

    // Reserves in the argument order; nullopt if the pair does not exist
    std::optional<Reserves> get_reserves(const Asset& asset_a, const Asset& asset_b) const;

    // Snapshot of the pair record
    std::optional<Pair> get_pair(const Asset& asset_a, const Asset& asset_b) const;

    I128 shares_of(const Asset& asset_a, const Asset& asset_b, const Address& owner) const;
    bool pair_exists(const Asset& asset_a, const Asset& asset_b) const;
    size_t pair_count() const;

    const Address& custody() const { return config_.custody; }

    // =========================================================================
    // Listeners
    // =========================================================================

    void add_listener(IAmmEvents* listener);
    void remove_listener(IAmmEvents* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pairs;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    ITokenLedger& ledger_;
    EngineConfig config_;
    Clock clock_;

    // Pair storage; exclusive for mutations, shared for queries
    PoolRegistry registry_;
    mutable std::shared_mutex pools_mutex_;

    std::vector<IAmmEvents*> listeners_;
    mutable std::shared_mutex listeners_mutex_;

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};

    util::Logger log_{"AMM"};

    // State saved before a mutation so a failed settlement can undo it
    struct Checkpoint {
        I128 reserve_low;
        I128 reserve_high;
        I128 total_shares;
        Address owner;
        std::optional<I128> owner_shares;  // nullopt: owner had no entry
    };
    static Checkpoint checkpoint(const Pair& pair, const Address& owner);
    static void restore(Pair& pair, const Checkpoint& cp);

    // One ledger movement: pulls go sender -> custody, pushes custody -> `to`
    struct Leg {
        Asset asset;
        Address counterparty;
        I128 amount;
        bool pull;
    };

    // Executes legs in order. On failure `rollback` undoes the pool state,
    // the completed legs are reversed and the ledger's error code is returned.
    // Throws std::runtime_error if a reversal fails (after `rollback` ran).
    int32_t settle(const std::vector<Leg>& legs, const std::function<void()>& rollback);

    // Shared tail of both swap flavours; caller holds pools_mutex_
    int32_t execute_swap(Pair& pair, const Address& sender, const Asset& asset_in,
                         const Asset& asset_out, I128 amount_in, I128 amount_out,
                         const Address& recipient);

    // Identical / null asset checks on a two-element path
    static int32_t check_path_assets(const std::vector<Asset>& path);

    bool expired(uint64_t deadline) const;
    int32_t reject(const char* op, int32_t code) const;

    std::vector<IAmmEvents*> snapshot_listeners() const;
};

} // namespace cpmm

#endif // CPMM_AMM_HPP
