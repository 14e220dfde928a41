#ifndef CPMM_REGISTRY_HPP
#define CPMM_REGISTRY_HPP

#include <unordered_map>
#include <optional>

#include "types.hpp"

namespace cpmm {

// =============================================================================
// Pair Key (content-addressed, order-independent)
// =============================================================================

struct PairKey {
    Asset asset_low;     // Sorted: asset_low < asset_high
    Asset asset_high;

    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : asset_low.addr) h = h * 31 + b;
        for (auto b : asset_high.addr) h = h * 31 + b;
        return h;
    }

    bool operator==(const PairKey& other) const {
        return asset_low == other.asset_low && asset_high == other.asset_high;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }
};

struct PairKeyHash {
    size_t operator()(const PairKey& key) const { return static_cast<size_t>(key.id()); }
};

// =============================================================================
// Pair (one constant-product pool)
// =============================================================================

struct Pair {
    Asset asset_low;
    Asset asset_high;
    I128 reserve_low = 0;
    I128 reserve_high = 0;
    I128 total_shares = 0;
    std::unordered_map<Address, I128, AddressHash> shares_by_owner;

    PairKey key() const { return {asset_low, asset_high}; }

    bool empty() const { return total_shares == 0; }

    // `asset` must be one of the pair's two assets
    I128 reserve_of(const Asset& asset) const {
        return asset == asset_low ? reserve_low : reserve_high;
    }
    I128& reserve_ref(const Asset& asset) {
        return asset == asset_low ? reserve_low : reserve_high;
    }

    I128 shares_of(const Address& owner) const {
        auto it = shares_by_owner.find(owner);
        return it != shares_by_owner.end() ? it->second : 0;
    }
};

// =============================================================================
// PoolRegistry - unordered asset pair -> Pair
// =============================================================================

// Not synchronized; the owning engine serializes access.
class PoolRegistry {
public:
    PoolRegistry() = default;

    // Orders the two identifiers (smaller first).
    // nullopt when x == y (identical assets).
    static std::optional<PairKey> canonical_key(const Asset& x, const Asset& y);

    // Existing record, or a fresh zero-reserve record. nullptr when x == y.
    // `created` reports whether a record was inserted by this call.
    Pair* get_or_create(const Asset& x, const Asset& y, bool* created = nullptr);

    // nullptr when the pair never received liquidity (or x == y)
    Pair* get_existing(const Asset& x, const Asset& y);
    const Pair* get_existing(const Asset& x, const Asset& y) const;

    // Drops a record inserted by get_or_create whose first funding failed
    void discard(const PairKey& key);

    size_t size() const { return pairs_.size(); }

private:
    std::unordered_map<PairKey, Pair, PairKeyHash> pairs_;
};

} // namespace cpmm

#endif // CPMM_REGISTRY_HPP
