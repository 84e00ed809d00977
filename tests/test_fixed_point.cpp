// Lev - Fixed-point and accounting formula tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>

#include "fixtures.hpp"
#include <lev/accounting.hpp>

using namespace lev;
using namespace lev::test;
using Catch::Approx;

TEST_CASE("x18 string conversion", "[x18]") {
    SECTION("Parse decimals") {
        REQUIRE(x18::from_string("1") == X18_ONE);
        REQUIRE(x18::from_string("0.5") == X18_ONE / 2);
        REQUIRE(x18::from_string("-0.15") == -(X18_ONE * 15 / 100));
        REQUIRE(x18::from_string("2.0000000000000000019") == 2 * X18_ONE + 1);
    }

    SECTION("Render trims trailing zeros") {
        REQUIRE(x18::to_string(3 * X18_ONE) == "3");
        REQUIRE(x18::to_string(X18_ONE * 7 / 10) == "0.7");
        REQUIRE(x18::to_string(-(X18_ONE / 4)) == "-0.25");
        REQUIRE(x18::to_string(0) == "0");
        REQUIRE(x18::to_int_string(-1234) == "-1234");
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(x18::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::from_string("1.2.3"), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::from_string("abc"), std::invalid_argument);
    }
}

TEST_CASE("x18 mul_div", "[x18]") {
    SECTION("Wide intermediate product") {
        I128 big = X18_ONE * X18_ONE;   // 1e36
        REQUIRE(x18::mul_div(big, 1000, 1000) == big);
        REQUIRE(x18::mul_div(big, X18_ONE, X18_ONE) == big);
    }

    SECTION("Truncates toward zero") {
        REQUIRE(x18::mul_div(10, 1, 3) == 3);
        REQUIRE(x18::mul_div(-10, 1, 3) == -3);
    }

    SECTION("Errors") {
        REQUIRE(error_code([] { x18::mul_div(1, 1, 0); }) == errors::DIVIDE_BY_ZERO);
        I128 huge = static_cast<I128>(1) << 125;
        REQUIRE(error_code([&] { x18::mul_div(huge, 16, 1); }) == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("sub_floor clamps") {
        REQUIRE(x18::sub_floor(5, 7) == 0);
        REQUIRE(x18::sub_floor(7, 5) == 2);
    }
}

TEST_CASE("Share and ratio formulas", "[accounting]") {
    SECTION("value_to_shares bootstraps 1:1") {
        REQUIRE(accounting::value_to_shares(100 * X18_ONE, 0, 0) == 100 * X18_ONE);
        REQUIRE(accounting::value_to_shares(100 * X18_ONE, 0, 50 * X18_ONE) == 100 * X18_ONE);
    }

    SECTION("value_to_shares is pro rata") {
        // Equity 2000 over 1000 shares: 500 of value buys 250 shares
        REQUIRE(accounting::value_to_shares(500 * X18_ONE, 2000 * X18_ONE, 1000 * X18_ONE) ==
                250 * X18_ONE);
    }

    SECTION("pending_fee") {
        I128 fee_per_second = X18_ONE / 1000000;   // 0.0001% per second
        REQUIRE(accounting::pending_fee(1000 * X18_ONE, fee_per_second, 1000) == X18_ONE);
        REQUIRE(accounting::pending_fee(0, fee_per_second, 1000) == 0);
        REQUIRE(accounting::pending_fee(1000 * X18_ONE, 0, 1000) == 0);
    }

    SECTION("sv_token_value needs shares") {
        REQUIRE(accounting::sv_token_value(1000 * X18_ONE, 500 * X18_ONE, 0) == 2 * X18_ONE);
        REQUIRE(error_code([] { accounting::sv_token_value(1, 0, 0); }) == errors::DIVIDE_BY_ZERO);
    }

    SECTION("debt ratio and leverage guard zero denominators") {
        REQUIRE(accounting::debt_ratio(2000 * X18_ONE, 3000 * X18_ONE) == X18_ONE * 2 / 3);
        REQUIRE(accounting::debt_ratio(5, 0) == 0);
        REQUIRE(accounting::leverage(3000 * X18_ONE, 1000 * X18_ONE) == 3 * X18_ONE);
        REQUIRE(accounting::leverage(5, 0) == 0);
        REQUIRE(accounting::equity(1, 5) == 0);
    }
}

TEST_CASE("Step change and slippage", "[accounting]") {
    SECTION("Relative threshold") {
        I128 before = X18_ONE * 60 / 100;
        REQUIRE(accounting::is_within_step_change(500, before, X18_ONE * 62 / 100));
        REQUIRE_FALSE(accounting::is_within_step_change(500, before, X18_ONE * 64 / 100));
        REQUIRE_FALSE(accounting::is_within_step_change(500, before, X18_ONE * 56 / 100));
    }

    SECTION("Zero prior value always passes") {
        REQUIRE(accounting::is_within_step_change(500, 0, X18_ONE));
    }

    SECTION("Floor and ceiling") {
        REQUIRE(accounting::slippage_floor(10000, 100) == 9900);
        REQUIRE(accounting::slippage_ceiling(10000, 100) == 10100);
    }
}

TEST_CASE("Oracle backed conversions", "[accounting]") {
    Market m;

    SECTION("USD value honours token decimals") {
        REQUIRE(accounting::convert_to_usd_value(m.oracle, m.ledger, USDC, usdc("1500")) ==
                1500 * X18_ONE);
        REQUIRE(accounting::convert_to_usd_value(m.oracle, m.ledger, WETH, eth("0.75")) ==
                1500 * X18_ONE);
        REQUIRE(accounting::convert_usd_to_token_amt(m.oracle, m.ledger, USDC, 500 * X18_ONE) ==
                usdc("500"));
        REQUIRE(accounting::convert_usd_to_token_amt(m.oracle, m.ledger, WETH, 1500 * X18_ONE) ==
                eth("0.75"));
    }

    SECTION("Signed delta") {
        // 1 WETH held, 0.5 WETH owed, equity $2000: +50% exposure
        I128 d = accounting::signed_delta(m.oracle, m.ledger, WETH, eth("1"), eth("0.5"), 2000 * X18_ONE);
        REQUIRE(d == X18_ONE / 2);
        I128 neg = accounting::signed_delta(m.oracle, m.ledger, WETH, eth("0.5"), eth("1"), 2000 * X18_ONE);
        REQUIRE(neg == -(X18_ONE / 2));
        REQUIRE(accounting::signed_delta(m.oracle, m.ledger, WETH, eth("1"), 0, 0) == 0);
    }

    SECTION("Amount in maximum adds the swap slippage") {
        // 1 WETH costs 2000 USDC, plus 1%
        I128 max_in = accounting::calc_amount_in_maximum(m.oracle, m.ledger, USDC, WETH, eth("1"), 100);
        REQUIRE(max_in == usdc("2020"));
    }
}
