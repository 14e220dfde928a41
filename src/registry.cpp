// =============================================================================
// registry.cpp - Canonical pair lookup
// =============================================================================

#include "cpmm/registry.hpp"

namespace cpmm {

std::optional<PairKey> PoolRegistry::canonical_key(const Asset& x, const Asset& y) {
    if (x == y) {
        return std::nullopt;
    }
    return x < y ? PairKey{x, y} : PairKey{y, x};
}

Pair* PoolRegistry::get_or_create(const Asset& x, const Asset& y, bool* created) {
    if (created) *created = false;

    auto key = canonical_key(x, y);
    if (!key) {
        return nullptr;
    }

    auto it = pairs_.find(*key);
    if (it != pairs_.end()) {
        return &it->second;
    }

    Pair pair{};
    pair.asset_low = key->asset_low;
    pair.asset_high = key->asset_high;

    auto [inserted, ok] = pairs_.emplace(*key, std::move(pair));
    if (created) *created = ok;
    return &inserted->second;
}

Pair* PoolRegistry::get_existing(const Asset& x, const Asset& y) {
    auto key = canonical_key(x, y);
    if (!key) {
        return nullptr;
    }
    auto it = pairs_.find(*key);
    return it != pairs_.end() ? &it->second : nullptr;
}

const Pair* PoolRegistry::get_existing(const Asset& x, const Asset& y) const {
    auto key = canonical_key(x, y);
    if (!key) {
        return nullptr;
    }
    auto it = pairs_.find(*key);
    return it != pairs_.end() ? &it->second : nullptr;
}

void PoolRegistry::discard(const PairKey& key) {
    auto it = pairs_.find(key);
    if (it != pairs_.end() && it->second.empty()) {
        pairs_.erase(it);
    }
}

} // namespace cpmm
