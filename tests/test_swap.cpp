// CPMM - Swap Tests

#include <catch2/catch_test_macros.hpp>
#include <cpmm/amm.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

#include "fixtures.hpp"

using namespace cpmm;
using namespace cpmm::test;

TEST_CASE("Exact-input swap", "[swap]") {
    PoolFixture f;
    f.seed_pool();
    f.fund(BOB, TOKEN_A, 100);

    auto r = f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(100));
    REQUIRE(r.error_code == errors::OK);
    REQUIRE(r.amounts.size() == 2);
    REQUIRE(r.amounts[0] == 100);
    REQUIRE(r.amounts[1] == 362);

    REQUIRE(f.balance(TOKEN_A, BOB) == 0);
    REQUIRE(f.balance(TOKEN_B, BOB) == 362);

    auto reserves = f.engine.get_reserves(TOKEN_A, TOKEN_B);
    REQUIRE(reserves->reserve_a == 1100);
    REQUIRE(reserves->reserve_b == 3638);
    REQUIRE(f.custody_balance(TOKEN_A) == 1100);
    REQUIRE(f.custody_balance(TOKEN_B) == 3638);

    SECTION("Product of reserves does not decrease") {
        REQUIRE(amm_math::product(1100, 3638) >= amm_math::product(1000, 4000));
    }

    SECTION("Shares are untouched") {
        REQUIRE(f.engine.get_pair(TOKEN_A, TOKEN_B)->total_shares == 2000);
    }

    SECTION("Fees accrue to providers") {
        auto out = f.engine.remove_liquidity(ALICE, f.remove_params(2000));
        REQUIRE(out.amount_a == 1100);
        REQUIRE(out.amount_b == 3638);
    }

    SECTION("Reverse direction") {
        SwapExactInParams p{362, 0, {TOKEN_B, TOKEN_A}, BOB, NOW + 60};
        auto back = f.engine.swap_exact_tokens_for_tokens(BOB, p);
        REQUIRE(back.error_code == errors::OK);
        REQUIRE(back.amounts[1] < 100);
    }
}

TEST_CASE("Swap preconditions", "[swap]") {
    PoolFixture f;
    f.seed_pool();
    f.fund(BOB, TOKEN_A, 1000);

    SECTION("Slippage bound") {
        auto r = f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(100, 363));
        REQUIRE(r.error_code == errors::INSUFFICIENT_OUTPUT_AMOUNT);
        REQUIRE(r.amounts.empty());
        REQUIRE(f.balance(TOKEN_A, BOB) == 1000);
    }

    SECTION("Input too small to produce output") {
        // 1 A buys floor(997 * 4000 / 1000997) = 3 B
        auto r = f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(1));
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amounts[1] == 3);

        SwapExactInParams p{1, 0, {TOKEN_B, TOKEN_A}, BOB, NOW + 60};
        f.fund(BOB, TOKEN_B, 1);
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code ==
                errors::INSUFFICIENT_OUTPUT_AMOUNT);
    }

    SECTION("Path must have two hops") {
        auto p = f.swap_params(100);
        p.path = {TOKEN_A, TOKEN_B, TOKEN_C};
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code == errors::INVALID_PATH);
        p.path = {TOKEN_A};
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code == errors::INVALID_PATH);
    }

    SECTION("Identical path assets") {
        auto p = f.swap_params(100);
        p.path = {TOKEN_A, TOKEN_A};
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code ==
                errors::IDENTICAL_ASSETS);
    }

    SECTION("Zero input") {
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(0)).error_code ==
                errors::INSUFFICIENT_AMOUNT);
    }

    SECTION("Null recipient") {
        auto p = f.swap_params(100, 0, Address{});
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code == errors::NULL_IDENTITY);
    }

    SECTION("Unknown pair") {
        auto p = f.swap_params(100);
        p.path = {TOKEN_A, TOKEN_C};
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code == errors::PAIR_NOT_FOUND);
        REQUIRE(f.engine.pair_count() == 1);
    }

    SECTION("Expired deadline") {
        auto p = f.swap_params(100);
        p.deadline = NOW - 1;
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, p).error_code == errors::EXPIRED);
        REQUIRE(f.engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_a == 1000);
    }

    SECTION("Drained pool") {
        f.engine.remove_liquidity(ALICE, f.remove_params(2000));
        REQUIRE(f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(100)).error_code ==
                errors::EMPTY_RESERVES);
    }

    SECTION("Missing allowance leaves the pool untouched") {
        auto r = f.engine.swap_exact_tokens_for_tokens(CAROL, f.swap_params(100, 0, CAROL));
        REQUIRE(r.error_code == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(f.engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_b == 4000);
    }
}

TEST_CASE("Exact-output swap", "[swap]") {
    PoolFixture f;
    f.seed_pool();
    f.fund(BOB, TOKEN_A, 1000);

    SwapExactOutParams p{362, 100, {TOKEN_A, TOKEN_B}, BOB, NOW + 60};

    SECTION("Pays the minimum input") {
        auto r = f.engine.swap_tokens_for_exact_tokens(BOB, p);
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amounts[0] == 100);
        REQUIRE(r.amounts[1] == 362);
        REQUIRE(f.balance(TOKEN_A, BOB) == 900);
        REQUIRE(f.balance(TOKEN_B, BOB) == 362);
    }

    SECTION("Input above maximum") {
        p.amount_in_max = 99;
        REQUIRE(f.engine.swap_tokens_for_exact_tokens(BOB, p).error_code ==
                errors::EXCESSIVE_INPUT_AMOUNT);
    }

    SECTION("Whole reserve") {
        p.amount_out = 4000;
        p.amount_in_max = MAX_RESERVE;
        REQUIRE(f.engine.swap_tokens_for_exact_tokens(BOB, p).error_code ==
                errors::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Zero output") {
        p.amount_out = 0;
        REQUIRE(f.engine.swap_tokens_for_exact_tokens(BOB, p).error_code ==
                errors::INSUFFICIENT_OUTPUT_AMOUNT);
    }

    SECTION("Expired deadline") {
        p.deadline = NOW - 1;
        REQUIRE(f.engine.swap_tokens_for_exact_tokens(BOB, p).error_code == errors::EXPIRED);
        REQUIRE(f.balance(TOKEN_A, BOB) == 1000);
        REQUIRE(f.engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_b == 4000);
    }

    SECTION("Engine quotes agree with the pool") {
        auto reserves = f.engine.get_reserves(TOKEN_A, TOKEN_B);
        auto out = AmmEngine::get_amount_out(100, reserves->reserve_a, reserves->reserve_b);
        REQUIRE(out.error_code == errors::OK);
        REQUIRE(out.amount == 362);

        auto in = AmmEngine::get_amount_in(362, reserves->reserve_a, reserves->reserve_b);
        REQUIRE(in.amount == 100);

        auto q = AmmEngine::quote(250, reserves->reserve_a, reserves->reserve_b);
        REQUIRE(q.amount == 1000);
    }
}

TEST_CASE("Failed payout reverses the pull", "[swap]") {
    quiet_logs();
    TokenLedger ledger;
    FlakyLedger flaky{ledger};
    AmmEngine engine(flaky, EngineConfig{}, [] { return NOW; });

    ledger.mint(TOKEN_A, ALICE, 1000);
    ledger.mint(TOKEN_B, ALICE, 4000);
    ledger.approve(TOKEN_A, ALICE, engine.custody(), 1000);
    ledger.approve(TOKEN_B, ALICE, engine.custody(), 4000);
    ledger.mint(TOKEN_A, BOB, 100);
    ledger.approve(TOKEN_A, BOB, engine.custody(), 100);
    REQUIRE(engine.add_liquidity(ALICE, PoolFixture::add_params(1000, 4000)).error_code == errors::OK);

    SECTION("Reserves and balances restored") {
        flaky.fail_push_asset = TOKEN_B;
        auto r = engine.swap_exact_tokens_for_tokens(BOB, PoolFixture::swap_params(100));
        REQUIRE(r.error_code == errors::INSUFFICIENT_FUNDS);
        REQUIRE(ledger.balance_of(TOKEN_A, BOB) == 100);
        REQUIRE(ledger.balance_of(TOKEN_B, BOB) == 0);
        REQUIRE(engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_a == 1000);
        REQUIRE(engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_b == 4000);
        REQUIRE(engine.get_stats().total_swaps == 0);
    }

    SECTION("Withdrawal restores shares") {
        flaky.fail_push_asset = TOKEN_B;
        auto r = engine.remove_liquidity(ALICE, PoolFixture::remove_params(2000));
        REQUIRE(r.error_code == errors::INSUFFICIENT_FUNDS);
        REQUIRE(ledger.balance_of(TOKEN_A, ALICE) == 0);
        REQUIRE(engine.shares_of(TOKEN_A, TOKEN_B, ALICE) == 2000);
        REQUIRE(engine.get_pair(TOKEN_A, TOKEN_B)->total_shares == 2000);
    }

    SECTION("Compensation failure is fatal") {
        flaky.fail_all_transfers = true;
        REQUIRE_THROWS_AS(engine.swap_exact_tokens_for_tokens(BOB, PoolFixture::swap_params(100)),
                          std::runtime_error);
        REQUIRE(engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_a == 1000);
        REQUIRE(engine.get_reserves(TOKEN_A, TOKEN_B)->reserve_b == 4000);
    }
}

TEST_CASE("Swap notifications", "[swap][events]") {
    PoolFixture f;
    f.seed_pool();
    f.fund(BOB, TOKEN_A, 100);

    NullEvents ignored;
    RecordingEvents events;
    f.engine.add_listener(&ignored);
    f.engine.add_listener(&events);
    f.engine.add_listener(&events);   // duplicate ignored

    f.engine.swap_exact_tokens_for_tokens(BOB, f.swap_params(100, 0, CAROL));
    REQUIRE(events.swapped.size() == 1);
    REQUIRE(events.swapped[0].sender == BOB);
    REQUIRE(events.swapped[0].recipient == CAROL);
    REQUIRE(events.swapped[0].asset_in == TOKEN_A);
    REQUIRE(events.swapped[0].asset_out == TOKEN_B);
    REQUIRE(events.swapped[0].amount_out == 362);
    REQUIRE(f.balance(TOKEN_B, CAROL) == 362);
}

TEST_CASE("Concurrent swaps keep reserves and custody in step", "[swap][concurrency]") {
    PoolFixture f;
    f.fund(ALICE, TOKEN_A, 1000000);
    f.fund(ALICE, TOKEN_B, 1000000);
    REQUIRE(f.engine.add_liquidity(ALICE, f.add_params(1000000, 1000000)).error_code == errors::OK);

    constexpr int THREADS = 4;
    constexpr int SWAPS = 200;
    std::vector<Address> traders;
    for (int t = 0; t < THREADS; ++t) {
        Address trader = addresses::from_u64(0x2000 + t);
        f.fund(trader, TOKEN_A, 10 * SWAPS);
        f.fund(trader, TOKEN_B, 10 * SWAPS);
        traders.push_back(trader);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < SWAPS; ++i) {
                bool forward = (i + t) % 2 == 0;
                SwapExactInParams p{10, 0,
                                    forward ? std::vector<Asset>{TOKEN_A, TOKEN_B}
                                            : std::vector<Asset>{TOKEN_B, TOKEN_A},
                                    traders[t], NOW + 60};
                f.engine.swap_exact_tokens_for_tokens(traders[t], p);
            }
        });
    }
    for (auto& th : threads) th.join();

    auto reserves = f.engine.get_reserves(TOKEN_A, TOKEN_B);
    REQUIRE(reserves->reserve_a == f.custody_balance(TOKEN_A));
    REQUIRE(reserves->reserve_b == f.custody_balance(TOKEN_B));
    REQUIRE(amm_math::product(reserves->reserve_a, reserves->reserve_b) >=
            amm_math::product(1000000, 1000000));
    REQUIRE(f.engine.get_stats().total_swaps == THREADS * SWAPS);
}
