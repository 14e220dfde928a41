// CPMM - Pool Registry Tests

#include <catch2/catch_test_macros.hpp>
#include <cpmm/registry.hpp>

using namespace cpmm;

namespace {
const Asset LOW{addresses::from_u64(0x10)};
const Asset HIGH{addresses::from_u64(0x20)};
const Asset OTHER{addresses::from_u64(0x30)};
}

TEST_CASE("Canonical pair key", "[registry]") {
    SECTION("Order independent") {
        auto k1 = PoolRegistry::canonical_key(LOW, HIGH);
        auto k2 = PoolRegistry::canonical_key(HIGH, LOW);
        REQUIRE(k1.has_value());
        REQUIRE(k2.has_value());
        REQUIRE(*k1 == *k2);
        REQUIRE(k1->id() == k2->id());
    }

    SECTION("Smaller identifier first") {
        auto key = PoolRegistry::canonical_key(HIGH, LOW);
        REQUIRE(key->asset_low == LOW);
        REQUIRE(key->asset_high == HIGH);
    }

    SECTION("Identical assets have no key") {
        REQUIRE_FALSE(PoolRegistry::canonical_key(LOW, LOW).has_value());
    }

    SECTION("Distinct pairs get distinct keys") {
        REQUIRE(*PoolRegistry::canonical_key(LOW, HIGH) != *PoolRegistry::canonical_key(LOW, OTHER));
    }
}

TEST_CASE("Pair lookup and creation", "[registry]") {
    PoolRegistry registry;

    SECTION("Missing pair") {
        REQUIRE(registry.get_existing(LOW, HIGH) == nullptr);
        REQUIRE(registry.size() == 0);
    }

    SECTION("Create once, find from either side") {
        bool created = false;
        Pair* pair = registry.get_or_create(HIGH, LOW, &created);
        REQUIRE(pair != nullptr);
        REQUIRE(created);
        REQUIRE(pair->asset_low == LOW);
        REQUIRE(pair->asset_high == HIGH);
        REQUIRE(pair->reserve_low == 0);
        REQUIRE(pair->reserve_high == 0);
        REQUIRE(pair->empty());

        Pair* again = registry.get_or_create(LOW, HIGH, &created);
        REQUIRE_FALSE(created);
        REQUIRE(again == pair);
        REQUIRE(registry.get_existing(HIGH, LOW) == pair);
        REQUIRE(registry.size() == 1);
    }

    SECTION("Identical assets are refused") {
        REQUIRE(registry.get_or_create(LOW, LOW) == nullptr);
        REQUIRE(registry.get_existing(LOW, LOW) == nullptr);
    }

    SECTION("Reserves follow the asset, not the argument order") {
        Pair* pair = registry.get_or_create(HIGH, LOW);
        pair->reserve_ref(LOW) = 1000;
        pair->reserve_ref(HIGH) = 4000;
        REQUIRE(pair->reserve_low == 1000);
        REQUIRE(pair->reserve_of(HIGH) == 4000);
    }

    SECTION("Discard only drops empty pairs") {
        Pair* pair = registry.get_or_create(LOW, HIGH);
        PairKey key = pair->key();
        pair->total_shares = 10;
        registry.discard(key);
        REQUIRE(registry.size() == 1);

        registry.get_existing(LOW, HIGH)->total_shares = 0;
        registry.discard(key);
        REQUIRE(registry.size() == 0);
    }
}
