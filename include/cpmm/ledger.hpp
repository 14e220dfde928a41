#ifndef CPMM_LEDGER_HPP
#define CPMM_LEDGER_HPP

#include <unordered_map>
#include <shared_mutex>

#include "types.hpp"
#include "log.hpp"

namespace cpmm {

// =============================================================================
// Token Ledger Interface
// =============================================================================

// Balance/allowance primitives the engine settles against. Every call either
// moves the full amount or moves nothing and returns an error code.
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    // Move amount of asset from `from` to `to`.
    // Returns OK or INSUFFICIENT_FUNDS.
    virtual int32_t transfer(const Asset& asset, const Address& from,
                             const Address& to, I128 amount) = 0;

    // Move amount of asset from `from` to `to` on behalf of `spender`,
    // consuming the allowance from -> spender.
    // Returns OK, INSUFFICIENT_FUNDS or INSUFFICIENT_ALLOWANCE.
    virtual int32_t transfer_from(const Asset& asset, const Address& spender,
                                  const Address& from, const Address& to,
                                  I128 amount) = 0;
};

// =============================================================================
// TokenLedger - in-memory multi-asset ledger
// =============================================================================

class TokenLedger : public ITokenLedger {
public:
    TokenLedger();
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // =========================================================================
    // Supply
    // =========================================================================

    // Credit newly issued units to `to`
    int32_t mint(const Asset& asset, const Address& to, I128 amount);

    // =========================================================================
    // ITokenLedger
    // =========================================================================

    int32_t transfer(const Asset& asset, const Address& from,
                     const Address& to, I128 amount) override;

    int32_t transfer_from(const Asset& asset, const Address& spender,
                          const Address& from, const Address& to,
                          I128 amount) override;

    // =========================================================================
    // Allowances
    // =========================================================================

    // Sets (not adds to) the allowance owner -> spender
    int32_t approve(const Asset& asset, const Address& owner,
                    const Address& spender, I128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    I128 balance_of(const Asset& asset, const Address& owner) const;
    I128 allowance(const Asset& asset, const Address& owner, const Address& spender) const;
    I128 total_supply(const Asset& asset) const;

private:
    using AllowanceMap = std::unordered_map<Address, I128, AddressHash>;  // spender -> amount

    struct TokenBook {
        I128 total_supply = 0;
        std::unordered_map<Address, I128, AddressHash> balances;
        std::unordered_map<Address, AllowanceMap, AddressHash> allowances;  // owner -> spenders
    };

    std::unordered_map<Address, TokenBook, AddressHash> tokens_;  // asset -> book
    mutable std::shared_mutex tokens_mutex_;

    util::Logger log_{"Ledger"};

    const TokenBook* get_book(const Asset& asset) const;

    // Caller holds tokens_mutex_ exclusively
    int32_t move_locked(TokenBook& book, const Address& from, const Address& to, I128 amount);
};

} // namespace cpmm

#endif // CPMM_LEDGER_HPP
