// =============================================================================
// types.cpp - Address/amount formatting and error names
// =============================================================================

#include "cpmm/types.hpp"
#include <algorithm>

namespace cpmm {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > 40) return std::nullopt;

    // Left-pad to a full 40 digits
    std::string digits(40 - hex.size(), '0');
    digits.append(hex.begin(), hex.end());

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Amount Formatting (__int128 has no iostream support)
// =============================================================================

std::string amount_to_string(I128 v) {
    if (v == 0) return "0";

    bool neg = v < 0;
    U128 u = neg ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);

    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<I128> amount_from_string(std::string_view s) {
    if (s.empty()) return std::nullopt;

    bool neg = false;
    if (s[0] == '-') {
        neg = true;
        s.remove_prefix(1);
        if (s.empty()) return std::nullopt;
    }

    // 38 digits always fit in a signed 128-bit value
    if (s.size() > 38) return std::nullopt;

    I128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (c - '0');
    }
    return neg ? -v : v;
}

// =============================================================================
// Error Names
// =============================================================================

const char* error_string(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::EXPIRED: return "EXPIRED";
        case errors::IDENTICAL_ASSETS: return "IDENTICAL_ASSETS";
        case errors::ZERO_ADDRESS: return "ZERO_ADDRESS";
        case errors::NULL_IDENTITY: return "NULL_IDENTITY";
        case errors::INSUFFICIENT_AMOUNT: return "INSUFFICIENT_AMOUNT";
        case errors::INSUFFICIENT_MIN_AMOUNT: return "INSUFFICIENT_MIN_AMOUNT";
        case errors::INSUFFICIENT_A_AMOUNT: return "INSUFFICIENT_A_AMOUNT";
        case errors::INSUFFICIENT_B_AMOUNT: return "INSUFFICIENT_B_AMOUNT";
        case errors::PAIR_NOT_FOUND: return "PAIR_NOT_FOUND";
        case errors::INSUFFICIENT_SHARE_BALANCE: return "INSUFFICIENT_SHARE_BALANCE";
        case errors::INSUFFICIENT_OUTPUT_AMOUNT: return "INSUFFICIENT_OUTPUT_AMOUNT";
        case errors::INVALID_PATH: return "INVALID_PATH";
        case errors::EMPTY_RESERVES: return "EMPTY_RESERVES";
        case errors::EMPTY_POOL: return "EMPTY_POOL";
        case errors::INSUFFICIENT_LIQUIDITY_MINTED: return "INSUFFICIENT_LIQUIDITY_MINTED";
        case errors::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case errors::EXCESSIVE_INPUT_AMOUNT: return "EXCESSIVE_INPUT_AMOUNT";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case errors::INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
    }
    return "UNKNOWN";
}

} // namespace cpmm
