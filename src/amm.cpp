// =============================================================================
// amm.cpp - Constant-product AMM engine
// Liquidity provision, exact-in/exact-out swaps and price queries
// =============================================================================

#include "cpmm/amm.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

namespace cpmm {

namespace {

uint64_t system_now() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

std::string addr_str(const Address& a) { return addresses::to_hex(a); }
std::string amt(I128 v) { return amount_to_string(v); }

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

AmmEngine::AmmEngine(ITokenLedger& ledger, EngineConfig config, Clock clock)
    : ledger_(ledger)
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock{system_now}) {}

// =============================================================================
// Internal Helpers
// =============================================================================

bool AmmEngine::expired(uint64_t deadline) const {
    return deadline < clock_();
}

int32_t AmmEngine::reject(const char* op, int32_t code) const {
    LOG(log_.debug()) << fmt::format("{} rejected: {}", op, error_string(code));
    return code;
}

AmmEngine::Checkpoint AmmEngine::checkpoint(const Pair& pair, const Address& owner) {
    Checkpoint cp{pair.reserve_low, pair.reserve_high, pair.total_shares, owner, std::nullopt};
    auto it = pair.shares_by_owner.find(owner);
    if (it != pair.shares_by_owner.end()) {
        cp.owner_shares = it->second;
    }
    return cp;
}

void AmmEngine::restore(Pair& pair, const Checkpoint& cp) {
    pair.reserve_low = cp.reserve_low;
    pair.reserve_high = cp.reserve_high;
    pair.total_shares = cp.total_shares;
    if (cp.owner_shares) {
        pair.shares_by_owner[cp.owner] = *cp.owner_shares;
    } else {
        pair.shares_by_owner.erase(cp.owner);
    }
}

int32_t AmmEngine::settle(const std::vector<Leg>& legs, const std::function<void()>& rollback) {
    const Address& custody = config_.custody;

    size_t done = 0;
    int32_t rc = errors::OK;
    for (; done < legs.size(); ++done) {
        const Leg& leg = legs[done];
        if (leg.amount == 0) continue;

        rc = leg.pull
            ? ledger_.transfer_from(leg.asset, custody, leg.counterparty, custody, leg.amount)
            : ledger_.transfer(leg.asset, custody, leg.counterparty, leg.amount);
        if (rc != errors::OK) break;
    }
    if (rc == errors::OK) {
        return rc;
    }

    // Undo pool state before touching the ledger again
    rollback();

    LOG(log_.warn()) << fmt::format("settlement leg {} failed ({}), reversing {} completed legs",
                                    done, error_string(rc), done);

    // Reverse completed legs, newest first
    while (done > 0) {
        const Leg& leg = legs[--done];
        if (leg.amount == 0) continue;

        int32_t undo = leg.pull
            ? ledger_.transfer(leg.asset, custody, leg.counterparty, leg.amount)
            : ledger_.transfer(leg.asset, leg.counterparty, custody, leg.amount);
        if (undo != errors::OK) {
            LOG(log_.fatal()) << fmt::format("could not reverse {} {} with {}: {}",
                                             leg.asset.to_string(), amt(leg.amount),
                                             addr_str(leg.counterparty), error_string(undo));
            throw std::runtime_error("AmmEngine: ledger compensation failed");
        }
    }
    return rc;
}

std::vector<IAmmEvents*> AmmEngine::snapshot_listeners() const {
    std::shared_lock lock(listeners_mutex_);
    return listeners_;
}

int32_t AmmEngine::check_path_assets(const std::vector<Asset>& path) {
    if (path[0] == path[1]) {
        return errors::IDENTICAL_ASSETS;
    }
    if (path[0].is_null() || path[1].is_null()) {
        return errors::ZERO_ADDRESS;
    }
    return errors::OK;
}

// =============================================================================
// Add Liquidity
// =============================================================================

LiquidityResult AmmEngine::add_liquidity(const Address& sender, const AddLiquidityParams& p) {
    constexpr const char* OP = "add_liquidity";

    if (expired(p.deadline)) {
        return {reject(OP, errors::EXPIRED), 0, 0, 0};
    }
    if (p.asset_a == p.asset_b) {
        return {reject(OP, errors::IDENTICAL_ASSETS), 0, 0, 0};
    }
    if (p.asset_a.is_null() || p.asset_b.is_null()) {
        return {reject(OP, errors::ZERO_ADDRESS), 0, 0, 0};
    }
    if (addresses::is_zero(p.recipient)) {
        return {reject(OP, errors::NULL_IDENTITY), 0, 0, 0};
    }
    if (p.amount_a_desired <= 0 || p.amount_b_desired <= 0) {
        return {reject(OP, errors::INSUFFICIENT_AMOUNT), 0, 0, 0};
    }
    if (p.amount_a_desired < p.amount_a_min || p.amount_b_desired < p.amount_b_min) {
        return {reject(OP, errors::INSUFFICIENT_MIN_AMOUNT), 0, 0, 0};
    }
    if (p.amount_a_desired > MAX_RESERVE || p.amount_b_desired > MAX_RESERVE) {
        return {reject(OP, errors::ARITHMETIC_OVERFLOW), 0, 0, 0};
    }

    std::unique_lock lock(pools_mutex_);

    bool created = false;
    Pair* pair = registry_.get_or_create(p.asset_a, p.asset_b, &created);
    const PairKey key = pair->key();

    // Drops a record this call inserted, so failed first deposits leave no pair
    auto fail = [&](int32_t code) -> LiquidityResult {
        if (created) registry_.discard(key);
        return {reject(OP, code), 0, 0, 0};
    };

    const I128 reserve_a = pair->reserve_of(p.asset_a);
    const I128 reserve_b = pair->reserve_of(p.asset_b);

    I128 amount_a = 0;
    I128 amount_b = 0;
    I128 shares = 0;

    if (pair->total_shares == 0) {
        // First provider sets the price
        amount_a = p.amount_a_desired;
        amount_b = p.amount_b_desired;
        shares = amm_math::sqrt_product(amount_a, amount_b);
    } else {
        // b branch first, then a
        auto optimal_b = amm_math::mul_div(p.amount_a_desired, reserve_b, reserve_a);
        if (!optimal_b) return fail(errors::ARITHMETIC_OVERFLOW);

        if (*optimal_b <= p.amount_b_desired) {
            if (*optimal_b < p.amount_b_min) return fail(errors::INSUFFICIENT_B_AMOUNT);
            amount_a = p.amount_a_desired;
            amount_b = *optimal_b;
        } else {
            auto optimal_a = amm_math::mul_div(p.amount_b_desired, reserve_a, reserve_b);
            if (!optimal_a) return fail(errors::ARITHMETIC_OVERFLOW);
            if (*optimal_a > p.amount_a_desired || *optimal_a < p.amount_a_min) {
                return fail(errors::INSUFFICIENT_A_AMOUNT);
            }
            amount_a = *optimal_a;
            amount_b = p.amount_b_desired;
        }

        // Lesser of the two proportional claims
        auto shares_a = amm_math::mul_div(amount_a, pair->total_shares, reserve_a);
        auto shares_b = amm_math::mul_div(amount_b, pair->total_shares, reserve_b);
        if (!shares_a || !shares_b) return fail(errors::ARITHMETIC_OVERFLOW);
        shares = std::min(*shares_a, *shares_b);
    }

    if (shares <= 0) {
        return fail(errors::INSUFFICIENT_LIQUIDITY_MINTED);
    }
    if (reserve_a > MAX_RESERVE - amount_a || reserve_b > MAX_RESERVE - amount_b) {
        return fail(errors::ARITHMETIC_OVERFLOW);
    }

    // Commit state, then settle
    const Checkpoint cp = checkpoint(*pair, p.recipient);
    pair->reserve_ref(p.asset_a) += amount_a;
    pair->reserve_ref(p.asset_b) += amount_b;
    pair->total_shares += shares;
    pair->shares_by_owner[p.recipient] += shares;

    int32_t rc = settle({
        {p.asset_a, sender, amount_a, true},
        {p.asset_b, sender, amount_b, true},
    }, [&] {
        restore(*pair, cp);
        if (created) registry_.discard(key);
    });
    if (rc != errors::OK) {
        return fail(rc);
    }

    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
    LOG(log_.info()) << fmt::format("add_liquidity {} {}/{} amounts {}/{} shares {} -> {}",
                                    addr_str(sender), p.asset_a.to_string(), p.asset_b.to_string(),
                                    amt(amount_a), amt(amount_b), amt(shares), addr_str(p.recipient));

    lock.unlock();

    LiquidityAdded event{sender, p.recipient, p.asset_a, p.asset_b, amount_a, amount_b, shares};
    for (IAmmEvents* listener : snapshot_listeners()) {
        listener->on_liquidity_added(event);
    }

    return {errors::OK, amount_a, amount_b, shares};
}

// =============================================================================
// Remove Liquidity
// =============================================================================

LiquidityResult AmmEngine::remove_liquidity(const Address& sender, const RemoveLiquidityParams& p) {
    constexpr const char* OP = "remove_liquidity";

    if (expired(p.deadline)) {
        return {reject(OP, errors::EXPIRED), 0, 0, 0};
    }
    if (p.asset_a == p.asset_b) {
        return {reject(OP, errors::IDENTICAL_ASSETS), 0, 0, 0};
    }
    if (p.asset_a.is_null() || p.asset_b.is_null()) {
        return {reject(OP, errors::ZERO_ADDRESS), 0, 0, 0};
    }
    if (addresses::is_zero(p.recipient)) {
        return {reject(OP, errors::NULL_IDENTITY), 0, 0, 0};
    }
    if (p.shares <= 0) {
        return {reject(OP, errors::INSUFFICIENT_AMOUNT), 0, 0, 0};
    }

    std::unique_lock lock(pools_mutex_);

    Pair* pair = registry_.get_existing(p.asset_a, p.asset_b);
    if (!pair) {
        return {reject(OP, errors::PAIR_NOT_FOUND), 0, 0, 0};
    }
    if (pair->shares_of(sender) < p.shares) {
        return {reject(OP, errors::INSUFFICIENT_SHARE_BALANCE), 0, 0, 0};
    }

    // Pro-rata against pre-burn reserves; total_shares >= p.shares > 0 here
    auto amount_a = amm_math::mul_div(p.shares, pair->reserve_of(p.asset_a), pair->total_shares);
    auto amount_b = amm_math::mul_div(p.shares, pair->reserve_of(p.asset_b), pair->total_shares);
    if (!amount_a || !amount_b) {
        return {reject(OP, errors::ARITHMETIC_OVERFLOW), 0, 0, 0};
    }
    if (*amount_a < p.amount_a_min || *amount_b < p.amount_b_min) {
        return {reject(OP, errors::INSUFFICIENT_OUTPUT_AMOUNT), 0, 0, 0};
    }

    const Checkpoint cp = checkpoint(*pair, sender);
    pair->reserve_ref(p.asset_a) -= *amount_a;
    pair->reserve_ref(p.asset_b) -= *amount_b;
    pair->total_shares -= p.shares;
    I128& balance = pair->shares_by_owner[sender];
    balance -= p.shares;
    if (balance == 0) {
        pair->shares_by_owner.erase(sender);
    }

    int32_t rc = settle({
        {p.asset_a, p.recipient, *amount_a, false},
        {p.asset_b, p.recipient, *amount_b, false},
    }, [&] { restore(*pair, cp); });
    if (rc != errors::OK) {
        return {reject(OP, rc), 0, 0, 0};
    }

    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
    LOG(log_.info()) << fmt::format("remove_liquidity {} {}/{} shares {} amounts {}/{} -> {}",
                                    addr_str(sender), p.asset_a.to_string(), p.asset_b.to_string(),
                                    amt(p.shares), amt(*amount_a), amt(*amount_b), addr_str(p.recipient));

    lock.unlock();

    LiquidityRemoved event{sender, p.recipient, p.asset_a, p.asset_b, *amount_a, *amount_b, p.shares};
    for (IAmmEvents* listener : snapshot_listeners()) {
        listener->on_liquidity_removed(event);
    }

    return {errors::OK, *amount_a, *amount_b, p.shares};
}

// =============================================================================
// Swap
// =============================================================================

int32_t AmmEngine::execute_swap(Pair& pair, const Address& sender, const Asset& asset_in,
                                const Asset& asset_out, I128 amount_in, I128 amount_out,
                                const Address& recipient) {
    const I128 reserve_in = pair.reserve_of(asset_in);
    const I128 reserve_out = pair.reserve_of(asset_out);

    if (reserve_in > MAX_RESERVE - amount_in) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    // Formula keeps amount_out < reserve_out; checked as an invariant
    if (amount_out >= reserve_out) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    const I128 new_in = reserve_in + amount_in;
    const I128 new_out = reserve_out - amount_out;
    if (amm_math::product(new_in, new_out) < amm_math::product(reserve_in, reserve_out)) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    const Checkpoint cp = checkpoint(pair, sender);
    pair.reserve_ref(asset_in) = new_in;
    pair.reserve_ref(asset_out) = new_out;

    return settle({
        {asset_in, sender, amount_in, true},
        {asset_out, recipient, amount_out, false},
    }, [&] { restore(pair, cp); });
}

SwapResult AmmEngine::swap_exact_tokens_for_tokens(const Address& sender, const SwapExactInParams& p) {
    constexpr const char* OP = "swap_exact_tokens_for_tokens";

    if (expired(p.deadline)) {
        return {reject(OP, errors::EXPIRED), {}};
    }
    if (p.path.size() != 2) {
        return {reject(OP, errors::INVALID_PATH), {}};
    }
    if (p.amount_in <= 0) {
        return {reject(OP, errors::INSUFFICIENT_AMOUNT), {}};
    }
    if (addresses::is_zero(p.recipient)) {
        return {reject(OP, errors::NULL_IDENTITY), {}};
    }
    if (int32_t rc = check_path_assets(p.path); rc != errors::OK) {
        return {reject(OP, rc), {}};
    }

    const Asset& asset_in = p.path[0];
    const Asset& asset_out = p.path[1];

    std::unique_lock lock(pools_mutex_);

    Pair* pair = registry_.get_existing(asset_in, asset_out);
    if (!pair) {
        return {reject(OP, errors::PAIR_NOT_FOUND), {}};
    }

    auto out = amm_math::get_amount_out(p.amount_in, pair->reserve_of(asset_in),
                                        pair->reserve_of(asset_out));
    if (out.error_code != errors::OK) {
        return {reject(OP, out.error_code), {}};
    }
    if (out.amount == 0 || out.amount < p.amount_out_min) {
        return {reject(OP, errors::INSUFFICIENT_OUTPUT_AMOUNT), {}};
    }

    int32_t rc = execute_swap(*pair, sender, asset_in, asset_out, p.amount_in, out.amount, p.recipient);
    if (rc != errors::OK) {
        return {reject(OP, rc), {}};
    }

    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    LOG(log_.info()) << fmt::format("swap {} {} {} -> {} {} to {}", addr_str(sender),
                                    amt(p.amount_in), asset_in.to_string(),
                                    amt(out.amount), asset_out.to_string(), addr_str(p.recipient));

    lock.unlock();

    TokensSwapped event{sender, p.recipient, asset_in, asset_out, p.amount_in, out.amount};
    for (IAmmEvents* listener : snapshot_listeners()) {
        listener->on_tokens_swapped(event);
    }

    return {errors::OK, {p.amount_in, out.amount}};
}

SwapResult AmmEngine::swap_tokens_for_exact_tokens(const Address& sender, const SwapExactOutParams& p) {
    constexpr const char* OP = "swap_tokens_for_exact_tokens";

    if (expired(p.deadline)) {
        return {reject(OP, errors::EXPIRED), {}};
    }
    if (p.path.size() != 2) {
        return {reject(OP, errors::INVALID_PATH), {}};
    }
    if (p.amount_out <= 0) {
        return {reject(OP, errors::INSUFFICIENT_OUTPUT_AMOUNT), {}};
    }
    if (addresses::is_zero(p.recipient)) {
        return {reject(OP, errors::NULL_IDENTITY), {}};
    }
    if (int32_t rc = check_path_assets(p.path); rc != errors::OK) {
        return {reject(OP, rc), {}};
    }

    const Asset& asset_in = p.path[0];
    const Asset& asset_out = p.path[1];

    std::unique_lock lock(pools_mutex_);

    Pair* pair = registry_.get_existing(asset_in, asset_out);
    if (!pair) {
        return {reject(OP, errors::PAIR_NOT_FOUND), {}};
    }

    auto in = amm_math::get_amount_in(p.amount_out, pair->reserve_of(asset_in),
                                      pair->reserve_of(asset_out));
    if (in.error_code != errors::OK) {
        return {reject(OP, in.error_code), {}};
    }
    if (in.amount > p.amount_in_max) {
        return {reject(OP, errors::EXCESSIVE_INPUT_AMOUNT), {}};
    }

    int32_t rc = execute_swap(*pair, sender, asset_in, asset_out, in.amount, p.amount_out, p.recipient);
    if (rc != errors::OK) {
        return {reject(OP, rc), {}};
    }

    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    LOG(log_.info()) << fmt::format("swap {} {} {} -> {} {} to {}", addr_str(sender),
                                    amt(in.amount), asset_in.to_string(),
                                    amt(p.amount_out), asset_out.to_string(), addr_str(p.recipient));

    lock.unlock();

    TokensSwapped event{sender, p.recipient, asset_in, asset_out, in.amount, p.amount_out};
    for (IAmmEvents* listener : snapshot_listeners()) {
        listener->on_tokens_swapped(event);
    }

    return {errors::OK, {in.amount, p.amount_out}};
}

// =============================================================================
// Pricing
// =============================================================================

PriceResult AmmEngine::get_price(const Asset& asset_a, const Asset& asset_b) const {
    if (asset_a == asset_b) {
        return {errors::IDENTICAL_ASSETS, 0};
    }

    std::shared_lock lock(pools_mutex_);
    const Pair* pair = registry_.get_existing(asset_a, asset_b);
    if (!pair) {
        return {errors::PAIR_NOT_FOUND, 0};
    }

    const I128 reserve_a = pair->reserve_of(asset_a);
    if (reserve_a == 0) {
        return {errors::EMPTY_POOL, 0};
    }

    auto price = amm_math::mul_div(pair->reserve_of(asset_b), PRICE_SCALE, reserve_a);
    if (!price) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, *price};
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Reserves> AmmEngine::get_reserves(const Asset& asset_a, const Asset& asset_b) const {
    std::shared_lock lock(pools_mutex_);
    const Pair* pair = registry_.get_existing(asset_a, asset_b);
    if (!pair) return std::nullopt;
    return Reserves{pair->reserve_of(asset_a), pair->reserve_of(asset_b)};
}

std::optional<Pair> AmmEngine::get_pair(const Asset& asset_a, const Asset& asset_b) const {
    std::shared_lock lock(pools_mutex_);
    const Pair* pair = registry_.get_existing(asset_a, asset_b);
    return pair ? std::optional<Pair>{*pair} : std::nullopt;
}

I128 AmmEngine::shares_of(const Asset& asset_a, const Asset& asset_b, const Address& owner) const {
    std::shared_lock lock(pools_mutex_);
    const Pair* pair = registry_.get_existing(asset_a, asset_b);
    return pair ? pair->shares_of(owner) : 0;
}

bool AmmEngine::pair_exists(const Asset& asset_a, const Asset& asset_b) const {
    std::shared_lock lock(pools_mutex_);
    return registry_.get_existing(asset_a, asset_b) != nullptr;
}

size_t AmmEngine::pair_count() const {
    std::shared_lock lock(pools_mutex_);
    return registry_.size();
}

// =============================================================================
// Listeners
// =============================================================================

void AmmEngine::add_listener(IAmmEvents* listener) {
    if (!listener) return;
    std::unique_lock lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void AmmEngine::remove_listener(IAmmEvents* listener) {
    std::unique_lock lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

// =============================================================================
// Statistics
// =============================================================================

AmmEngine::Stats AmmEngine::get_stats() const {
    std::shared_lock lock(pools_mutex_);
    return Stats{
        static_cast<uint64_t>(registry_.size()),
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed)
    };
}

} // namespace cpmm
