// =============================================================================
// ledger.cpp - In-memory token ledger (balances + allowances)
// =============================================================================

#include "cpmm/ledger.hpp"

#include <fmt/core.h>

namespace cpmm {

namespace {

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

} // anonymous namespace

TokenLedger::TokenLedger() = default;

// =============================================================================
// Internal Helpers
// =============================================================================

const TokenLedger::TokenBook* TokenLedger::get_book(const Asset& asset) const {
    auto it = tokens_.find(asset.addr);
    return it != tokens_.end() ? &it->second : nullptr;
}

int32_t TokenLedger::move_locked(TokenBook& book, const Address& from,
                                 const Address& to, I128 amount) {
    auto it = book.balances.find(from);
    if (it == book.balances.end() || it->second < amount) {
        return errors::INSUFFICIENT_FUNDS;
    }
    if (from == to) {
        return errors::OK;
    }

    it->second -= amount;
    book.balances[to] += amount;
    return errors::OK;
}

// =============================================================================
// Supply
// =============================================================================

int32_t TokenLedger::mint(const Asset& asset, const Address& to, I128 amount) {
    if (amount <= 0) {
        return errors::INSUFFICIENT_AMOUNT;
    }
    if (asset.is_null() || addresses::is_zero(to)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(tokens_mutex_);
    TokenBook& book = tokens_[asset.addr];
    if (book.total_supply > I128_MAX - amount) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    book.total_supply += amount;
    book.balances[to] += amount;

    LOG(log_.trace()) << fmt::format("mint {} {} -> {}", asset.to_string(),
                                     amount_to_string(amount), addresses::to_hex(to));
    return errors::OK;
}

// =============================================================================
// Transfers
// =============================================================================

int32_t TokenLedger::transfer(const Asset& asset, const Address& from,
                              const Address& to, I128 amount) {
    if (amount <= 0) {
        return errors::INSUFFICIENT_AMOUNT;
    }

    std::unique_lock lock(tokens_mutex_);
    auto book = tokens_.find(asset.addr);
    if (book == tokens_.end()) {
        return errors::INSUFFICIENT_FUNDS;
    }

    int32_t rc = move_locked(book->second, from, to, amount);
    if (rc == errors::OK) {
        LOG(log_.trace()) << fmt::format("transfer {} {} {} -> {}", asset.to_string(),
                                         amount_to_string(amount),
                                         addresses::to_hex(from), addresses::to_hex(to));
    }
    return rc;
}

int32_t TokenLedger::transfer_from(const Asset& asset, const Address& spender,
                                   const Address& from, const Address& to,
                                   I128 amount) {
    if (amount <= 0) {
        return errors::INSUFFICIENT_AMOUNT;
    }

    std::unique_lock lock(tokens_mutex_);
    auto book = tokens_.find(asset.addr);
    if (book == tokens_.end()) {
        return errors::INSUFFICIENT_FUNDS;
    }

    // Allowance and balance are both checked before anything moves
    auto owner_it = book->second.allowances.find(from);
    if (owner_it == book->second.allowances.end()) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }
    auto spender_it = owner_it->second.find(spender);
    if (spender_it == owner_it->second.end() || spender_it->second < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }

    int32_t rc = move_locked(book->second, from, to, amount);
    if (rc != errors::OK) {
        return rc;
    }
    spender_it->second -= amount;

    LOG(log_.trace()) << fmt::format("transfer_from {} {} {} -> {} by {}", asset.to_string(),
                                     amount_to_string(amount), addresses::to_hex(from),
                                     addresses::to_hex(to), addresses::to_hex(spender));
    return errors::OK;
}

// =============================================================================
// Allowances
// =============================================================================

int32_t TokenLedger::approve(const Asset& asset, const Address& owner,
                             const Address& spender, I128 amount) {
    if (amount < 0) {
        return errors::INSUFFICIENT_AMOUNT;
    }
    if (asset.is_null() || addresses::is_zero(owner) || addresses::is_zero(spender)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(tokens_mutex_);
    tokens_[asset.addr].allowances[owner][spender] = amount;
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

I128 TokenLedger::balance_of(const Asset& asset, const Address& owner) const {
    std::shared_lock lock(tokens_mutex_);
    const TokenBook* book = get_book(asset);
    if (!book) return 0;

    auto it = book->balances.find(owner);
    return it != book->balances.end() ? it->second : 0;
}

I128 TokenLedger::allowance(const Asset& asset, const Address& owner,
                            const Address& spender) const {
    std::shared_lock lock(tokens_mutex_);
    const TokenBook* book = get_book(asset);
    if (!book) return 0;

    auto owner_it = book->allowances.find(owner);
    if (owner_it == book->allowances.end()) return 0;
    auto spender_it = owner_it->second.find(spender);
    return spender_it != owner_it->second.end() ? spender_it->second : 0;
}

I128 TokenLedger::total_supply(const Asset& asset) const {
    std::shared_lock lock(tokens_mutex_);
    const TokenBook* book = get_book(asset);
    return book ? book->total_supply : 0;
}

} // namespace cpmm
