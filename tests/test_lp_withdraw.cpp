// Lev - LP vault withdraw saga

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;
using Catch::Approx;

namespace {

// Alice holds 1000 shares over 3000 LP, 0.75 WETH + 500 USDC of debt
void seed_position(LpWorld& w) {
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));
    REQUIRE(w.vault->status() == Status::Open);
}

} // namespace

TEST_CASE("LP full withdraw", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);
    EventLog log;
    log.attach(v);

    SECTION("Paid in token B") {
        uint64_t key = w.withdraw_all(ALICE, USDC);
        REQUIRE(v.status() == Status::Withdraw);
        REQUIRE(v.balance_of(ALICE) == 0);
        REQUIRE(v.lp_amt() == 0);
        REQUIRE(v.store().withdraw_cache.lp_amt == eth("3000"));
        REQUIRE(log.contains(EventKind::WithdrawCreated));

        auto s = w.venue.execute(key);
        REQUIRE(s.token_a_out == eth("0.75"));
        REQUIRE(s.token_b_out == usdc("1500"));
        REQUIRE(s.callback_result == CallbackResult::Committed);

        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.total_supply() == 0);
        REQUIRE(v.debt_amt().token_a_amt == 0);
        REQUIRE(v.debt_amt().token_b_amt == 0);
        REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("100000"));

        const VaultEvent* done = log.last(EventKind::WithdrawCompleted);
        REQUIRE(done != nullptr);
        REQUIRE(done->amount == usdc("1000"));
    }

    SECTION("Paid in the wrapped native token as native") {
        w.venue.execute(w.withdraw_all(ALICE, WETH));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(w.ledger.balance_of(NATIVE, ALICE) == eth("0.5"));
        REQUIRE(w.ledger.balance_of(WETH, ALICE) == 0);
    }

    SECTION("Recipient refusing native gets the wrapped token") {
        w.ledger.set_rejects_native(ALICE, true);
        w.venue.execute(w.withdraw_all(ALICE, WETH));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(w.ledger.balance_of(NATIVE, ALICE) == 0);
        REQUIRE(w.ledger.balance_of(WETH, ALICE) == eth("0.5"));
    }
}

TEST_CASE("LP partial withdraw keeps the debt ratio", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);

    uint64_t key = v.withdraw(ALICE, lp::WithdrawParams{eth("500"), USDC, usdc("490"), 100});
    w.venue.execute(key);

    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.balance_of(ALICE) == eth("500"));
    REQUIRE(v.lp_amt() == eth("1500"));
    REQUIRE(v.debt_amt().token_a_amt == eth("0.375"));
    REQUIRE(v.debt_amt().token_b_amt == usdc("250"));
    REQUIRE(x18::to_double(v.debt_ratio()) == Approx(2.0 / 3.0));
    REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("99500"));
}

TEST_CASE("LP withdraw cancellation restores shares", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);
    I128 shares = v.balance_of(ALICE);

    uint64_t key = w.withdraw_all(ALICE, USDC);
    auto s = w.venue.cancel(key);

    REQUIRE(s.callback_result == CallbackResult::Cancelled);
    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.balance_of(ALICE) == shares);
    REQUIRE(v.lp_amt() == eth("3000"));
    REQUIRE(w.ledger.balance_of(GM, VAULT) == eth("3000"));
}

TEST_CASE("LP withdraw failure and re-add", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);
    EventLog log;
    log.attach(v);
    I128 shares = v.balance_of(ALICE);

    // Only 1000 USDC can come back
    uint64_t key = v.withdraw(ALICE, lp::WithdrawParams{shares, USDC, usdc("2000"), 100});
    auto s = w.venue.execute(key);

    REQUIRE(s.callback_result == CallbackResult::Failed);
    REQUIRE(v.status() == Status::Withdraw_Failed);
    REQUIRE(log.last(EventKind::WithdrawFailed)->code == errors::INSUFFICIENT_ASSETS_RECEIVED);

    // Repayment was rolled back, proceeds wait in custody
    REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
    REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
    REQUIRE(w.ledger.balance_of(WETH, VAULT) == eth("0.75"));
    REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("1500"));
    REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("99000"));

    SECTION("Keeper re-adds the liquidity and restores the shares") {
        uint64_t readd = v.process_withdraw_failure(KEEPER, 100);
        REQUIRE(readd != 0);
        REQUIRE(error_code([&] { v.process_withdraw_failure(KEEPER, 100); }) ==
                errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS);

        w.venue.execute(readd);
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.balance_of(ALICE) == shares);
        REQUIRE(v.lp_amt() == eth("3000"));
        REQUIRE(log.contains(EventKind::WithdrawFailureLiquidityAdded));
    }

    SECTION("Slippage below the vault minimum") {
        REQUIRE(error_code([&] { v.process_withdraw_failure(KEEPER, 10); }) ==
                errors::INSUFFICIENT_SLIPPAGE_AMOUNT);
    }

    SECTION("A cancelled re-add can be retried") {
        w.venue.cancel(v.process_withdraw_failure(KEEPER, 100));
        REQUIRE(v.status() == Status::Withdraw_Failed);
        REQUIRE(v.store().withdraw_cache.deposit_key == 0);

        w.venue.execute(v.process_withdraw_failure(KEEPER, 100));
        REQUIRE(v.status() == Status::Open);
    }
}

TEST_CASE("LP withdraw settlement that cannot complete", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);
    EventLog log;
    log.attach(v);
    I128 shares = v.balance_of(ALICE);

    SECTION("Stale feed after the repay") {
        uint64_t key = w.withdraw_all(ALICE, USDC);
        w.env.advance(2 * 86400);

        auto s = w.venue.execute(key);
        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(v.status() == Status::Withdraw_Failed);
        REQUIRE(log.last(EventKind::WithdrawFailed)->code == errors::STALE_PRICE_FEED);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
        REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("1500"));

        REQUIRE(error_code([&] { v.process_withdraw_failure(KEEPER, 100); }) == errors::STALE_PRICE_FEED);
        w.reprice();
        w.venue.execute(v.process_withdraw_failure(KEEPER, 100));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.balance_of(ALICE) == shares);
        REQUIRE(v.lp_amt() == eth("3000"));
    }

    SECTION("Proceeds short of the debt share repay nothing") {
        uint64_t key = w.withdraw_all(ALICE, USDC, 6000);
        w.venue.set_haircut_bps(5000);

        auto s = w.venue.execute(key);
        REQUIRE(s.token_a_out == eth("0.375"));
        REQUIRE(s.token_b_out == usdc("750"));
        REQUIRE(s.callback_result == CallbackResult::Failed);
        REQUIRE(log.last(EventKind::WithdrawFailed)->code == errors::INSUFFICIENT_REPAY_AMOUNT);

        REQUIRE(v.status() == Status::Withdraw_Failed);
        REQUIRE(v.debt_amt().token_a_amt == eth("0.75"));
        REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
        REQUIRE(w.ledger.balance_of(WETH, VAULT) == eth("0.375"));
        REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("750"));
        REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("99000"));

        w.venue.set_haircut_bps(0);
        w.venue.execute(v.process_withdraw_failure(KEEPER, 100));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.balance_of(ALICE) == shares);
    }
}

TEST_CASE("LP withdraw guards", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);

    REQUIRE(error_code([&] { v.withdraw(ALICE, lp::WithdrawParams{0, USDC, 0, 100}); }) ==
            errors::EMPTY_WITHDRAW_AMOUNT);
    REQUIRE(error_code([&] { v.withdraw(ALICE, lp::WithdrawParams{eth("1"), ARB, 0, 100}); }) ==
            errors::INVALID_WITHDRAW_TOKEN);
    REQUIRE(error_code([&] { v.withdraw(BOB, lp::WithdrawParams{eth("1"), USDC, 0, 100}); }) ==
            errors::INSUFFICIENT_SHARES_BALANCE);
    REQUIRE(error_code([&] { v.withdraw(ALICE, lp::WithdrawParams{eth("1"), USDC, 0, 10}); }) ==
            errors::INSUFFICIENT_SLIPPAGE_AMOUNT);
    REQUIRE(error_code([&] { v.withdraw(ALICE, lp::WithdrawParams{eth("0.1"), USDC, 0, 100}); }) ==
            errors::INSUFFICIENT_WITHDRAW_VALUE);

    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.lp_amt() == eth("3000"));
}

TEST_CASE("LP withdraw collects the management fee first", "[lp][withdraw]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    seed_position(w);

    v.update_fee_per_second(OWNER, X18_ONE / 1000000);
    w.advance(1000);
    REQUIRE(x18::to_double(v.pending_fee()) == Approx(1.0));

    w.venue.execute(w.withdraw_all(ALICE, USDC));
    REQUIRE(v.status() == Status::Open);
    REQUIRE(x18::to_double(v.balance_of(TREASURY)) == Approx(1.0));
    REQUIRE(v.total_supply() == v.balance_of(TREASURY));

    // Alice's 1000 of 1001 shares: about $999
    REQUIRE(units(w.ledger.balance_of(USDC, ALICE), 6) == Approx(99999.0).margin(0.01));
}
