// Lev - Price oracle tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;
using Catch::Approx;

TEST_CASE("PriceOracle answers", "[oracle]") {
    Environment env;
    PriceOracle oracle(env);
    oracle.register_feed(FeedConfig{WETH, 8, 3600});
    oracle.register_feed(FeedConfig{USDC, 18, 3600});

    SECTION("Scaled to 18 decimals") {
        oracle.update_price_usd(WETH, 2000.5);
        REQUIRE(oracle.consult(WETH).price == 200050000000);
        REQUIRE(oracle.consult(WETH).decimals == 8);
        REQUIRE(oracle.consult_in_18_decimals(WETH) == x18::from_string("2000.5"));

        oracle.update_price(USDC, X18_ONE);
        REQUIRE(oracle.consult_in_18_decimals(USDC) == X18_ONE);
    }

    SECTION("Missing feed") {
        REQUIRE(error_code([&] { oracle.consult(ARB); }) == errors::NO_PRICE_FEED);
        REQUIRE(error_code([&] { oracle.update_price_usd(ARB, 1.0); }) == errors::NO_PRICE_FEED);
        REQUIRE_FALSE(oracle.has_feed(ARB));
    }

    SECTION("Non positive answer is broken") {
        REQUIRE(error_code([&] { oracle.consult(WETH); }) == errors::BROKEN_PRICE_FEED);
        oracle.update_price(WETH, -1);
        REQUIRE(error_code([&] { oracle.consult(WETH); }) == errors::BROKEN_PRICE_FEED);
    }

    SECTION("Heartbeat") {
        oracle.update_price_usd(WETH, 2000.0);
        env.advance(3600);
        REQUIRE_NOTHROW(oracle.consult(WETH));
        REQUIRE(oracle.price_age(WETH) == 3600);

        env.advance(1);
        REQUIRE(error_code([&] { oracle.consult(WETH); }) == errors::STALE_PRICE_FEED);

        oracle.update_price_usd(WETH, 2100.0);
        REQUIRE(x18::to_double(oracle.consult_in_18_decimals(WETH)) == Approx(2100.0));
    }

    SECTION("Explicit timestamp") {
        oracle.update_price_usd(WETH, 2000.0, env.now() - 7200);
        REQUIRE(error_code([&] { oracle.consult(WETH); }) == errors::STALE_PRICE_FEED);
    }
}
