#ifndef CPMM_MATH_HPP
#define CPMM_MATH_HPP

#include <optional>

#include "types.hpp"

namespace cpmm {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const {
        return !(*this == other);
    }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator<=(const U256& other) const {
        return !(other < *this);
    }
    bool operator>=(const U256& other) const {
        return !(*this < other);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

namespace wide {

// Full 256-bit product of two U128 values
U256 mul(U128 a, U128 b);

// num / denom. Returns false if denom is zero or the quotient does not fit
// in 128 bits. remainder is optional.
bool div(const U256& num, U128 denom, U128& quotient, U128* remainder = nullptr);

// floor(sqrt(x)), Babylonian iteration
U128 isqrt(const U256& x);

} // namespace wide

// =============================================================================
// Constant-Product Pricing
// =============================================================================

namespace amm_math {

struct QuoteResult {
    int32_t error_code;
    I128 amount;
};

// floor(a * b / denom) for non-negative a, b and positive denom.
// nullopt if the inputs are out of domain or the result exceeds I128.
std::optional<I128> mul_div(I128 a, I128 b, I128 denom);

// reserve_x * reserve_y as an exact 256-bit value (non-negative inputs)
U256 product(I128 x, I128 y);

// floor(sqrt(a * b)): initial share supply of a freshly funded pair
I128 sqrt_product(I128 a, I128 b);

// Exact-input output amount with the 0.3% fee retained by the pool:
//   in_fee = amount_in * 997
//   out    = in_fee * reserve_out / (reserve_in * 1000 + in_fee)
QuoteResult get_amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out);

// Minimum input that yields amount_out (inverse of get_amount_out, rounded up)
QuoteResult get_amount_in(I128 amount_out, I128 reserve_in, I128 reserve_out);

// Amount of B matching amount_a at the current reserve ratio (no fee)
QuoteResult quote(I128 amount_a, I128 reserve_a, I128 reserve_b);

} // namespace amm_math

} // namespace cpmm

#endif // CPMM_MATH_HPP
