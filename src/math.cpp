// =============================================================================
// math.cpp - Wide integer arithmetic and constant-product pricing
// =============================================================================

#include "cpmm/math.hpp"

namespace cpmm {

namespace {

int bit_length(U128 v) {
    int n = 0;
    while (v != 0) {
        v >>= 1;
        ++n;
    }
    return n;
}

int bit_length(const U256& v) {
    return v.hi != 0 ? 128 + bit_length(v.hi) : bit_length(v.lo);
}

bool in_domain(I128 v) {
    return v >= 0 && v <= MAX_RESERVE;
}

} // anonymous namespace

// =============================================================================
// 256-bit Helpers
// =============================================================================

namespace wide {

U256 mul(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

bool div(const U256& num, U128 denom, U128& quotient, U128* remainder) {
    if (denom == 0) return false;

    if (num.hi == 0) {
        quotient = num.lo / denom;
        if (remainder) *remainder = num.lo % denom;
        return true;
    }

    // Quotient >= 2^128
    if (num.hi >= denom) return false;

    // Restoring long division, one bit at a time. When the top bit of the
    // running remainder is shifted out the true value exceeds denom, and the
    // wrapping subtraction below still yields the correct remainder.
    U128 rem = 0;
    U128 quot = 0;
    for (int i = bit_length(num) - 1; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        U128 bit = i >= 128 ? (num.hi >> (i - 128)) & 1 : (num.lo >> i) & 1;
        rem = (rem << 1) | bit;
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }

    quotient = quot;
    if (remainder) *remainder = rem;
    return true;
}

U128 isqrt(const U256& x) {
    if (x.is_zero()) return 0;

    // Start at 2^ceil(bits/2), which is never below sqrt(x)
    int shift = (bit_length(x) + 1) / 2;
    U128 z = shift >= 128 ? ~U128(0) : (U128(1) << shift);

    while (true) {
        U128 q = 0;
        // z >= sqrt(x) keeps x / z within 128 bits
        div(x, z, q);
        U128 y = z / 2 + q / 2 + (z & q & 1);
        if (y >= z) return z;
        z = y;
    }
}

} // namespace wide

// =============================================================================
// Pricing
// =============================================================================

namespace amm_math {

std::optional<I128> mul_div(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom <= 0) return std::nullopt;

    U256 product = wide::mul(static_cast<U128>(a), static_cast<U128>(b));
    U128 quot = 0;
    if (!wide::div(product, static_cast<U128>(denom), quot)) return std::nullopt;

    constexpr U128 I128_MAX = ~U128(0) >> 1;
    if (quot > I128_MAX) return std::nullopt;
    return static_cast<I128>(quot);
}

U256 product(I128 x, I128 y) {
    if (x <= 0 || y <= 0) return U256{};
    return wide::mul(static_cast<U128>(x), static_cast<U128>(y));
}

I128 sqrt_product(I128 a, I128 b) {
    return static_cast<I128>(wide::isqrt(product(a, b)));
}

QuoteResult get_amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out) {
    if (amount_in < 0) {
        return {errors::INSUFFICIENT_AMOUNT, 0};
    }
    if (reserve_in <= 0 || reserve_out <= 0) {
        return {errors::EMPTY_RESERVES, 0};
    }
    if (!in_domain(amount_in) || !in_domain(reserve_in) || !in_domain(reserve_out)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }

    // All three terms stay below 2^123
    U128 in_with_fee = static_cast<U128>(amount_in) * static_cast<U128>(FEE_NUMERATOR);
    U256 numerator = wide::mul(in_with_fee, static_cast<U128>(reserve_out));
    U128 denominator = static_cast<U128>(reserve_in) * static_cast<U128>(FEE_DENOMINATOR)
                     + in_with_fee;

    U128 out = 0;
    if (!wide::div(numerator, denominator, out)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, static_cast<I128>(out)};
}

QuoteResult get_amount_in(I128 amount_out, I128 reserve_in, I128 reserve_out) {
    if (amount_out <= 0) {
        return {errors::INSUFFICIENT_OUTPUT_AMOUNT, 0};
    }
    if (reserve_in <= 0 || reserve_out <= 0) {
        return {errors::EMPTY_RESERVES, 0};
    }
    if (!in_domain(reserve_in) || !in_domain(reserve_out)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    if (amount_out >= reserve_out) {
        return {errors::INSUFFICIENT_LIQUIDITY, 0};
    }

    U256 numerator = wide::mul(
        static_cast<U128>(reserve_in) * static_cast<U128>(FEE_DENOMINATOR),
        static_cast<U128>(amount_out));
    U128 denominator = static_cast<U128>(reserve_out - amount_out)
                     * static_cast<U128>(FEE_NUMERATOR);

    U128 in = 0;
    if (!wide::div(numerator, denominator, in) || in >= static_cast<U128>(MAX_RESERVE)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, static_cast<I128>(in) + 1};
}

QuoteResult quote(I128 amount_a, I128 reserve_a, I128 reserve_b) {
    if (amount_a <= 0) {
        return {errors::INSUFFICIENT_AMOUNT, 0};
    }
    if (reserve_a <= 0 || reserve_b <= 0) {
        return {errors::EMPTY_RESERVES, 0};
    }

    auto amount_b = mul_div(amount_a, reserve_b, reserve_a);
    if (!amount_b) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, *amount_b};
}

} // namespace amm_math

} // namespace cpmm
