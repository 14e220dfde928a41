#ifndef CPMM_TYPES_HPP
#define CPMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace cpmm {

// =============================================================================
// Addresses (20-byte account / asset identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Default pool custody account
constexpr Address POOL_CUSTODY = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x90,0x10};

// Helper to create a short address from a number (tests, tooling)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// "0x" + 40 hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x" prefix; shorter inputs are left-padded
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

// Bucket hash for address-keyed containers (equality stays full-content)
struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Integer Amounts
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Reserves are capped at 112 bits so every intermediate product of two
// amounts (and the 997/1000 fee scaling) fits in 256 bits.
constexpr I128 MAX_RESERVE = (I128(1) << 112) - 1;

// Fixed-point scale for price queries (1e18)
constexpr I128 PRICE_SCALE = 1000000000000000000LL;

// Swap fee: input is multiplied by FEE_NUMERATOR / FEE_DENOMINATOR
constexpr I128 FEE_NUMERATOR = 997;
constexpr I128 FEE_DENOMINATOR = 1000;

std::string amount_to_string(I128 v);
std::optional<I128> amount_from_string(std::string_view s);

// =============================================================================
// Asset (fungible token identifier)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool is_null() const { return addresses::is_zero(addr); }

    std::string to_string() const { return addresses::to_hex(addr); }

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t EXPIRED = -1;
constexpr int32_t IDENTICAL_ASSETS = -2;
constexpr int32_t ZERO_ADDRESS = -3;
constexpr int32_t NULL_IDENTITY = -4;
constexpr int32_t INSUFFICIENT_AMOUNT = -5;
constexpr int32_t INSUFFICIENT_MIN_AMOUNT = -6;
constexpr int32_t INSUFFICIENT_A_AMOUNT = -7;
constexpr int32_t INSUFFICIENT_B_AMOUNT = -8;
constexpr int32_t PAIR_NOT_FOUND = -10;
constexpr int32_t INSUFFICIENT_SHARE_BALANCE = -11;
constexpr int32_t INSUFFICIENT_OUTPUT_AMOUNT = -12;
constexpr int32_t INVALID_PATH = -13;
constexpr int32_t EMPTY_RESERVES = -14;
constexpr int32_t EMPTY_POOL = -15;
constexpr int32_t INSUFFICIENT_LIQUIDITY_MINTED = -16;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -17;
constexpr int32_t EXCESSIVE_INPUT_AMOUNT = -18;
constexpr int32_t ARITHMETIC_OVERFLOW = -19;
constexpr int32_t INSUFFICIENT_FUNDS = -20;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -21;
}

const char* error_string(int32_t code);

} // namespace cpmm

#endif // CPMM_TYPES_HPP
