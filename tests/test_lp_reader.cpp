// Lev - LP vault accounting views

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;
using Catch::Approx;

TEST_CASE("LP vault before the first deposit", "[lp][reader]") {
    LpWorld w;
    lp::Vault& v = *w.vault;

    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.lp_amt() == 0);
    REQUIRE(v.asset_value() == 0);
    REQUIRE(v.debt_value() == 0);
    REQUIRE(v.equity_value() == 0);
    REQUIRE(v.debt_ratio() == 0);
    REQUIRE(v.leverage() == 0);
    REQUIRE(v.delta() == 0);
    REQUIRE(v.pending_fee() == 0);
    REQUIRE(error_code([&] { v.sv_token_value(); }) == errors::DIVIDE_BY_ZERO);

    SECTION("Pool pricing") {
        REQUIRE(v.lp_token_value() == X18_ONE);
        lp::TokenAmounts weights = v.token_weights();
        REQUIRE(weights.token_a_amt == X18_ONE / 2);
        REQUIRE(weights.token_b_amt == X18_ONE / 2);
    }

    SECTION("Neutral capacity is bounded by the token A pool") {
        // $2M of WETH to lend, 3x at 50% weight: 2M / 1.5
        REQUIRE(x18::to_double(v.additional_capacity()) == Approx(1333333.333).margin(0.01));
        REQUIRE(v.capacity() == v.additional_capacity());
    }
}

TEST_CASE("LP vault capacity by strategy", "[lp][reader]") {
    SECTION("Long borrows token B only") {
        VaultConfig config = quiet_config(Delta::Long);
        LpWorld w(config);
        // $2M of USDC / (3 - 1)
        REQUIRE(x18::to_double(w.vault->additional_capacity()) == Approx(1000000.0));
    }

    SECTION("Token B fully covered by the deposit") {
        VaultConfig config = quiet_config(Delta::Neutral);
        config.leverage = 2 * X18_ONE;
        LpWorld w(config);
        // leverage * weight B == 1: only the token A bound applies
        REQUIRE(x18::to_double(w.vault->additional_capacity()) == Approx(2000000.0));
    }

    SECTION("Leverage too low for the pool weights") {
        VaultConfig config = quiet_config(Delta::Neutral);
        config.leverage = x18::from_string("1.5");
        LpWorld w(config);
        REQUIRE(error_code([&] { w.vault->additional_capacity(); }) == errors::ARITHMETIC_UNDERFLOW);
        REQUIRE(error_code([&] { w.deposit_usdc(ALICE, "1000"); }) == errors::ARITHMETIC_UNDERFLOW);
        REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("100000"));
    }
}

TEST_CASE("LP vault after a settled deposit", "[lp][reader]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));
    REQUIRE(v.status() == Status::Open);

    SECTION("Position and debt") {
        REQUIRE(v.lp_amt() == eth("3000"));
        lp::TokenAmounts assets = v.asset_amt();
        REQUIRE(assets.token_a_amt == eth("0.75"));
        REQUIRE(assets.token_b_amt == usdc("1500"));

        lp::TokenAmounts debt = v.debt_amt();
        REQUIRE(debt.token_a_amt == eth("0.75"));
        REQUIRE(debt.token_b_amt == usdc("500"));
    }

    SECTION("Health metrics") {
        REQUIRE(x18::to_double(v.asset_value()) == Approx(3000.0));
        REQUIRE(x18::to_double(v.debt_value()) == Approx(2000.0));
        REQUIRE(x18::to_double(v.equity_value()) == Approx(1000.0));
        REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2.0 / 3.0));
        REQUIRE(x18::to_double(v.leverage()) == Approx(3.0));
        REQUIRE(v.delta() == 0);
        REQUIRE(x18::to_double(v.sv_token_value()) == Approx(1.0));

        HealthParams h = v.health();
        REQUIRE(h.position_amt_before == eth("3000"));
        REQUIRE(h.equity_before == v.equity_value());
    }

    SECTION("Price move shows up as delta and debt ratio") {
        w.set_prices(3000.0, 2100.0);
        // Asset 0.75 WETH + 1500 USDC = $3750, debt 0.75 WETH + 500 USDC = $2750
        REQUIRE(x18::to_double(v.asset_value()) == Approx(3750.0));
        REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2750.0 / 3750.0));
        REQUIRE(v.delta() == 0);
    }

    SECTION("Capacity includes equity") {
        REQUIRE(v.capacity() == v.additional_capacity() + v.equity_value());
    }
}
