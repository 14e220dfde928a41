// CPMM - Math Tests

#include <catch2/catch_test_macros.hpp>
#include <cpmm/math.hpp>

using namespace cpmm;
using namespace cpmm::amm_math;

TEST_CASE("Wide arithmetic", "[math]") {
    SECTION("Product above 128 bits") {
        U128 big = ~U128(0);
        U256 p = wide::mul(big, 2);
        REQUIRE(p.hi == 1);
        REQUIRE(p.lo == big - 1);
    }

    SECTION("Division with remainder") {
        U128 q = 0;
        U128 r = 0;
        REQUIRE(wide::div(U256{U128(398800000)}, 1099700, q, &r));
        REQUIRE(q == 362);
        REQUIRE(r == 398800000 - 362 * U128(1099700));
    }

    SECTION("Division by zero") {
        U128 q = 0;
        REQUIRE_FALSE(wide::div(U256{U128(10)}, 0, q));
    }

    SECTION("Quotient too wide") {
        U128 q = 0;
        REQUIRE_FALSE(wide::div(U256{0, 1}, 1, q));
    }

    SECTION("Integer square root") {
        REQUIRE(wide::isqrt(U256{}) == 0);
        REQUIRE(wide::isqrt(U256{U128(1)}) == 1);
        REQUIRE(wide::isqrt(U256{U128(15)}) == 3);
        REQUIRE(wide::isqrt(U256{U128(16)}) == 4);
        REQUIRE(wide::isqrt(U256{U128(4000000)}) == 2000);

        // sqrt(2^224) = 2^112
        U256 x = wide::mul(U128(1) << 112, U128(1) << 112);
        REQUIRE(wide::isqrt(x) == (U128(1) << 112));
    }
}

TEST_CASE("mul_div", "[math]") {
    REQUIRE(mul_div(4000, PRICE_SCALE, 1000).value() == 4 * PRICE_SCALE);
    REQUIRE(mul_div(7, 3, 2).value() == 10);
    REQUIRE(mul_div(0, 5, 3).value() == 0);

    SECTION("Intermediate product wider than 128 bits") {
        REQUIRE(mul_div(MAX_RESERVE, MAX_RESERVE, MAX_RESERVE).value() == MAX_RESERVE);
    }

    SECTION("Out of domain") {
        REQUIRE_FALSE(mul_div(1, 1, 0).has_value());
        REQUIRE_FALSE(mul_div(-1, 1, 1).has_value());
        REQUIRE_FALSE(mul_div(MAX_RESERVE, MAX_RESERVE, 1).has_value());
    }
}

TEST_CASE("Initial share supply", "[math]") {
    REQUIRE(sqrt_product(1000, 4000) == 2000);
    REQUIRE(sqrt_product(1, 1) == 1);
    REQUIRE(sqrt_product(2, 3) == 2);
    REQUIRE(sqrt_product(MAX_RESERVE, MAX_RESERVE) == MAX_RESERVE);
}

TEST_CASE("get_amount_out", "[math]") {
    SECTION("Fee-adjusted constant product") {
        auto r = get_amount_out(100, 1000, 4000);
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amount == 362);
    }

    SECTION("Zero input quotes zero") {
        auto r = get_amount_out(0, 1000, 4000);
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amount == 0);
    }

    SECTION("Output stays below the reserve") {
        auto r = get_amount_out(MAX_RESERVE, 1000, 4000);
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amount < 4000);
        REQUIRE(r.amount == 3999);
    }

    SECTION("Negative input") {
        REQUIRE(get_amount_out(-1, 1000, 4000).error_code == errors::INSUFFICIENT_AMOUNT);
    }

    SECTION("Empty reserves") {
        REQUIRE(get_amount_out(100, 0, 4000).error_code == errors::EMPTY_RESERVES);
        REQUIRE(get_amount_out(100, 1000, 0).error_code == errors::EMPTY_RESERVES);
    }

    SECTION("Monotonic in amount_in") {
        I128 prev = 0;
        for (I128 in = 1; in <= 2000; in += 37) {
            auto r = get_amount_out(in, 1000, 4000);
            REQUIRE(r.amount >= prev);
            prev = r.amount;
        }
    }
}

TEST_CASE("get_amount_in", "[math]") {
    SECTION("Inverse of get_amount_out") {
        auto r = get_amount_in(362, 1000, 4000);
        REQUIRE(r.error_code == errors::OK);
        REQUIRE(r.amount == 100);
        REQUIRE(get_amount_out(r.amount, 1000, 4000).amount >= 362);
    }

    SECTION("Rejections") {
        REQUIRE(get_amount_in(0, 1000, 4000).error_code == errors::INSUFFICIENT_OUTPUT_AMOUNT);
        REQUIRE(get_amount_in(10, 0, 4000).error_code == errors::EMPTY_RESERVES);
        REQUIRE(get_amount_in(4000, 1000, 4000).error_code == errors::INSUFFICIENT_LIQUIDITY);
    }
}

TEST_CASE("quote", "[math]") {
    auto r = quote(500, 1000, 4000);
    REQUIRE(r.error_code == errors::OK);
    REQUIRE(r.amount == 2000);

    REQUIRE(quote(0, 1000, 4000).error_code == errors::INSUFFICIENT_AMOUNT);
    REQUIRE(quote(10, 0, 4000).error_code == errors::EMPTY_RESERVES);
}

TEST_CASE("Amount and address text", "[types]") {
    REQUIRE(amount_to_string(0) == "0");
    REQUIRE(amount_to_string(-362) == "-362");
    REQUIRE(amount_to_string(4 * PRICE_SCALE) == "4000000000000000000");
    REQUIRE(amount_from_string("5192296858534827628530496329220095").value() == MAX_RESERVE);
    REQUIRE_FALSE(amount_from_string("12a").has_value());
    REQUIRE_FALSE(amount_from_string("").has_value());

    REQUIRE(addresses::to_hex(addresses::POOL_CUSTODY) ==
            "0x0000000000000000000000000000000000009010");
    REQUIRE(addresses::from_hex("0x9010").value() == addresses::POOL_CUSTODY);
    REQUIRE_FALSE(addresses::from_hex("0xzz").has_value());

    REQUIRE(std::string(error_string(errors::PAIR_NOT_FOUND)) == "PAIR_NOT_FOUND");
    REQUIRE(std::string(error_string(12345)) == "UNKNOWN");
}
