// CPMM - shared test fixtures

#ifndef CPMM_TESTS_FIXTURES_HPP
#define CPMM_TESTS_FIXTURES_HPP

#include <cpmm/amm.hpp>
#include <cpmm/ledger.hpp>
#include <cpmm/log.hpp>

#include <optional>
#include <vector>

namespace cpmm::test {

constexpr uint64_t NOW = 1700000000;

inline const Asset TOKEN_A{addresses::from_u64(0xA1)};
inline const Asset TOKEN_B{addresses::from_u64(0xB2)};
inline const Asset TOKEN_C{addresses::from_u64(0xC3)};

constexpr Address ALICE = addresses::from_u64(0x1001);
constexpr Address BOB = addresses::from_u64(0x1002);
constexpr Address CAROL = addresses::from_u64(0x1003);

// Only fatal records reach the console while tests run
inline void quiet_logs() {
    util::LogConfig config;
    config.level = util::Severity::FTL;
    util::LogService::init(config);
}

// Ledger wrapper that can be told to refuse specific movements
class FlakyLedger : public ITokenLedger {
public:
    explicit FlakyLedger(TokenLedger& inner) : inner_(inner) {}

    std::optional<Asset> fail_pull_asset;   // transfer_from of this asset fails
    std::optional<Asset> fail_push_asset;   // transfer of this asset fails
    bool fail_all_transfers = false;        // every transfer fails

    int32_t transfer(const Asset& asset, const Address& from,
                     const Address& to, I128 amount) override {
        if (fail_all_transfers || (fail_push_asset && *fail_push_asset == asset)) {
            return errors::INSUFFICIENT_FUNDS;
        }
        return inner_.transfer(asset, from, to, amount);
    }

    int32_t transfer_from(const Asset& asset, const Address& spender,
                          const Address& from, const Address& to,
                          I128 amount) override {
        if (fail_pull_asset && *fail_pull_asset == asset) {
            return errors::INSUFFICIENT_FUNDS;
        }
        return inner_.transfer_from(asset, spender, from, to, amount);
    }

private:
    TokenLedger& inner_;
};

// Records every notification in order
class RecordingEvents : public IAmmEvents {
public:
    std::vector<LiquidityAdded> added;
    std::vector<LiquidityRemoved> removed;
    std::vector<TokensSwapped> swapped;

    void on_liquidity_added(const LiquidityAdded& e) override { added.push_back(e); }
    void on_liquidity_removed(const LiquidityRemoved& e) override { removed.push_back(e); }
    void on_tokens_swapped(const TokensSwapped& e) override { swapped.push_back(e); }
};

// Ledger + engine with a pinned clock
struct PoolFixture {
    TokenLedger ledger;
    AmmEngine engine;

    PoolFixture() : engine(ledger, EngineConfig{}, [] { return NOW; }) {
        quiet_logs();
    }

    // Mint to `owner` and let the custody account pull it
    void fund(const Address& owner, const Asset& asset, I128 amount) {
        ledger.mint(asset, owner, amount);
        ledger.approve(asset, owner, engine.custody(), MAX_RESERVE);
    }

    I128 balance(const Asset& asset, const Address& owner) const {
        return ledger.balance_of(asset, owner);
    }

    I128 custody_balance(const Asset& asset) const {
        return ledger.balance_of(asset, engine.custody());
    }

    static AddLiquidityParams add_params(I128 amount_a, I128 amount_b,
                                         I128 min_a = 0, I128 min_b = 0,
                                         const Address& recipient = ALICE) {
        return AddLiquidityParams{TOKEN_A, TOKEN_B, amount_a, amount_b,
                                  min_a, min_b, recipient, NOW + 60};
    }

    static RemoveLiquidityParams remove_params(I128 shares, I128 min_a = 0, I128 min_b = 0,
                                               const Address& recipient = ALICE) {
        return RemoveLiquidityParams{TOKEN_A, TOKEN_B, shares, min_a, min_b,
                                     recipient, NOW + 60};
    }

    static SwapExactInParams swap_params(I128 amount_in, I128 min_out = 0,
                                         const Address& recipient = BOB) {
        return SwapExactInParams{amount_in, min_out, {TOKEN_A, TOKEN_B}, recipient, NOW + 60};
    }

    // The 1000 A / 4000 B pool owned by ALICE
    void seed_pool() {
        fund(ALICE, TOKEN_A, 1000);
        fund(ALICE, TOKEN_B, 4000);
        engine.add_liquidity(ALICE, add_params(1000, 4000));
    }
};

} // namespace cpmm::test

#endif // CPMM_TESTS_FIXTURES_HPP
