// Lev - LP vault keeper rebalancing

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;
using Catch::Approx;

TEST_CASE("LP rebalance preconditions", "[lp][rebalance]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    SECTION("In band") {
        REQUIRE(error_code([&] {
            v.rebalance_add(KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {0, usdc("100")}, 100});
        }) == errors::INVALID_REBALANCE_PRECONDITIONS);
        REQUIRE(error_code([&] {
            v.rebalance_remove(KEEPER, lp::RebalanceRemoveParams{RebalanceType::Delta, eth("100"), {}, 100});
        }) == errors::INVALID_REBALANCE_PRECONDITIONS);
    }

    SECTION("Keeper only") {
        REQUIRE(error_code([&] {
            v.rebalance_add(ALICE, lp::RebalanceAddParams{RebalanceType::Debt, {0, usdc("100")}, 100});
        }) == errors::UNAUTHORIZED);
        REQUIRE(error_code([&] { v.rebalance_close(ALICE); }) == errors::UNAUTHORIZED);
    }

    SECTION("Close needs Rebalance_Open") {
        REQUIRE(error_code([&] { v.rebalance_close(KEEPER); }) ==
                errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS);
    }

    SECTION("Bad parameters") {
        w.set_prices(3000.0, 2100.0);
        REQUIRE(error_code([&] {
            v.rebalance_remove(KEEPER, lp::RebalanceRemoveParams{RebalanceType::Debt, eth("5000"), {}, 100});
        }) == errors::INVALID_REBALANCE_PARAMETERS);
        REQUIRE(error_code([&] {
            v.rebalance_add(KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {}, 100});
        }) == errors::INVALID_REBALANCE_PARAMETERS);
        REQUIRE(v.status() == Status::Open);
    }
}

TEST_CASE("LP delta rebalance requires a Neutral vault", "[lp][rebalance]") {
    LpWorld w(quiet_config(Delta::Long));
    lp::Vault& v = *w.vault;

    REQUIRE(error_code([&] {
        v.rebalance_add(KEEPER, lp::RebalanceAddParams{RebalanceType::Delta, {0, usdc("100")}, 100});
    }) == errors::INVALID_REBALANCE_PARAMETERS);
}

TEST_CASE("LP rebalance remove after token A rallies", "[lp][rebalance]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    // Assets $3750, debt $2750
    w.set_prices(3000.0, 2100.0);
    REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2750.0 / 3750.0));
    REQUIRE(x18::to_double(v.lp_token_value()) == Approx(1.25));

    EventLog log;
    log.attach(v);

    lp::RebalanceRemoveParams params{RebalanceType::Debt, eth("600"), {eth("0.15"), usdc("300")}, 100};
    uint64_t key = v.rebalance_remove(KEEPER, params);
    REQUIRE(v.status() == Status::Rebalance_Remove);
    REQUIRE(v.lp_amt() == eth("2400"));

    SECTION("Settles back into the band") {
        auto s = w.venue.execute(key);
        REQUIRE(s.token_a_out == eth("0.15"));
        REQUIRE(s.token_b_out == usdc("300"));

        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.6"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("200"));
        REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2.0 / 3.0));
        REQUIRE(v.delta() == 0);
        REQUIRE(log.contains(EventKind::RebalanceSuccess));
    }

    SECTION("Cancellation restores the position") {
        w.venue.cancel(key);
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.lp_amt() == eth("3000"));
        REQUIRE(log.contains(EventKind::RebalanceCancelled));
    }

    SECTION("Refused repay holds the proceeds in Rebalance_Open") {
        w.weth_pool.set_repay_frozen(true);
        auto s = w.venue.execute(key);

        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(v.status() == Status::Rebalance_Open);
        REQUIRE(log.last(EventKind::RebalanceOpen)->code == errors::UNAUTHORIZED);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
        REQUIRE(w.ledger.balance_of(WETH, VAULT) == eth("0.15"));
        REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("300"));

        REQUIRE(v.after_withdrawal_execution(key, eth("0.15"), usdc("300")) == CallbackResult::Rejected);

        v.rebalance_close(KEEPER);
        REQUIRE(v.status() == Status::Open);
    }

    SECTION("Repay larger than the proceeds") {
        w.venue.cancel(key);
        params.repay = {eth("0.3"), usdc("300")};
        auto s = w.venue.execute(v.rebalance_remove(KEEPER, params));

        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(log.last(EventKind::RebalanceOpen)->code == errors::INSUFFICIENT_REPAY_AMOUNT);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
    }
}

TEST_CASE("LP rebalance add after token A drops", "[lp][rebalance]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    // Assets $2250, debt $1250
    w.set_prices(1000.0, 2100.0);
    REQUIRE(x18::to_double(v.debt_ratio()) == Approx(1250.0 / 2250.0));

    EventLog log;
    log.attach(v);

    SECTION("Borrow in pool weights lands in the band") {
        uint64_t key = v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {eth("0.25"), usdc("500")}, 100});
        REQUIRE(v.status() == Status::Rebalance_Add);
        REQUIRE(v.debt_amt().token_a_amt == eth("1"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("1000"));

        auto s = w.venue.execute(key);
        REQUIRE(s.lp_out == eth("1000"));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.lp_amt() == eth("4000"));
        REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2.0 / 3.0));
        REQUIRE(log.contains(EventKind::RebalanceSuccess));
    }

    SECTION("Too small a borrow leaves Rebalance_Open") {
        uint64_t key = v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {0, usdc("100")}, 100});
        auto s = w.venue.execute(key);
        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(v.status() == Status::Rebalance_Open);
        REQUIRE(log.contains(EventKind::RebalanceOpen));

        // Users wait, the keeper may try again or close
        REQUIRE(error_code([&] { w.deposit_usdc(BOB, "100"); }) ==
                errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS);

        v.rebalance_close(KEEPER);
        REQUIRE(v.status() == Status::Open);
        REQUIRE(log.contains(EventKind::RebalanceClosed));
    }

    SECTION("Keeper retries from Rebalance_Open") {
        w.venue.execute(v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {0, usdc("100")}, 100}));
        REQUIRE(v.status() == Status::Rebalance_Open);

        w.venue.execute(v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {eth("0.25"), usdc("400")}, 100}));
        REQUIRE(v.status() == Status::Open);
    }

    SECTION("Cancellation repays the borrow") {
        uint64_t key = v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {eth("0.25"), usdc("500")}, 100});
        w.venue.cancel(key);

        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
        REQUIRE(v.lp_amt() == eth("3000"));
    }

    SECTION("Cancellation with repayments refused") {
        uint64_t key = v.rebalance_add(
            KEEPER, lp::RebalanceAddParams{RebalanceType::Debt, {eth("0.25"), usdc("500")}, 100});
        w.usdc_pool.set_repay_frozen(true);
        auto s = w.venue.cancel(key);

        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(v.status() == Status::Rebalance_Open);
        REQUIRE(v.debt_amt().token_a_amt == eth("1"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("1000"));
        REQUIRE(w.ledger.balance_of(WETH, VAULT) == eth("0.25"));
        REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("500"));
        REQUIRE(log.last(EventKind::RebalanceOpen)->code == errors::UNAUTHORIZED);
    }
}
