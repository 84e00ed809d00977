// Lev - LP vault roles, fees, configuration and call discipline

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;
using Catch::Approx;

namespace {

// Calls back into the vault from inside a swap
class ReentrantRouter : public ISwapRouter {
public:
    lp::Vault* target = nullptr;

    I128 swap_exact_in(const SwapParams&) override {
        return target->deposit(ALICE, lp::DepositParams{USDC, usdc("100"), 100});
    }

    I128 swap_exact_out(const SwapParams&) override {
        return target->deposit(ALICE, lp::DepositParams{USDC, usdc("100"), 100});
    }
};

} // namespace

TEST_CASE("LP vault construction", "[lp][vault]") {
    LpWorld w;

    SECTION("Short strategy is refused") {
        REQUIRE(error_code([&] {
            lp::Vault bad(lp::VaultDeps{w.env, w.ledger, w.oracle, w.router, w.weth_pool, w.usdc_pool,
                                        w.venue, addresses::from_id(150), OWNER, TREASURY,
                                        quiet_config(Delta::Short)});
        }) == errors::INVALID_CONFIG);
    }

    SECTION("Lending pools must match the venue tokens") {
        REQUIRE(error_code([&] {
            lp::Vault bad(lp::VaultDeps{w.env, w.ledger, w.oracle, w.router, w.usdc_pool, w.weth_pool,
                                        w.venue, addresses::from_id(150), OWNER, TREASURY,
                                        quiet_config(Delta::Neutral)});
        }) == errors::INVALID_CONFIG);
    }

    SECTION("Starts Open and empty") {
        REQUIRE(w.vault->status() == Status::Open);
        REQUIRE(w.vault->owner() == OWNER);
        REQUIRE(w.vault->treasury() == TREASURY);
        REQUIRE(w.vault->is_keeper(KEEPER));
        REQUIRE(w.vault->total_supply() == 0);
    }
}

TEST_CASE("LP vault roles", "[lp][vault]") {
    LpWorld w;
    lp::Vault& v = *w.vault;

    REQUIRE(error_code([&] { v.set_keeper(KEEPER, ALICE, true); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { v.set_treasury(KEEPER, ALICE); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { v.update_fee_per_second(KEEPER, 1); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { v.update_config(ALICE, v.config()); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { v.emergency_pause(ALICE); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { v.process_deposit_failure(ALICE, 100); }) == errors::UNAUTHORIZED);

    SECTION("Revoked keepers lose access") {
        v.set_keeper(OWNER, KEEPER, false);
        REQUIRE_FALSE(v.is_keeper(KEEPER));
        REQUIRE(error_code([&] { v.emergency_pause(KEEPER); }) == errors::UNAUTHORIZED);

        // The owner is always a keeper
        v.emergency_pause(OWNER);
        REQUIRE(v.status() == Status::Paused);
    }
}

TEST_CASE("LP vault keeper checks while the owner edits the set", "[lp][vault]") {
    LpWorld w;
    lp::Vault& v = *w.vault;

    std::atomic<bool> done{false};
    std::thread owner([&] {
        for (uint32_t i = 0; i < 2000; ++i) {
            v.set_keeper(OWNER, addresses::from_id(500 + i % 64), i % 2 == 0);
        }
        done = true;
    });

    size_t misses = 0;
    while (!done) {
        if (!v.is_keeper(KEEPER)) ++misses;
    }
    owner.join();

    REQUIRE(misses == 0);
    REQUIRE(v.is_keeper(KEEPER));
    REQUIRE_FALSE(v.is_keeper(ALICE));
}

TEST_CASE("LP vault management fee", "[lp][vault][fee]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    REQUIRE(error_code([&] { v.update_fee_per_second(OWNER, -1); }) == errors::INVALID_CONFIG);

    // 1e-6 of supply per second
    v.update_fee_per_second(OWNER, X18_ONE / 1000000);
    w.advance(1000);
    REQUIRE(v.pending_fee() == X18_ONE);
    REQUIRE(x18::to_double(v.sv_token_value()) == Approx(1000.0 / 1001.0));

    SECTION("Anyone can mint it to the treasury") {
        EventLog log;
        log.attach(v);
        v.mint_fee();
        REQUIRE(v.balance_of(TREASURY) == X18_ONE);
        REQUIRE(v.pending_fee() == 0);
        REQUIRE(log.last(EventKind::FeeMinted)->shares == X18_ONE);
    }

    SECTION("Treasury change settles the old treasury first") {
        v.set_treasury(OWNER, BOB);
        REQUIRE(v.balance_of(TREASURY) == X18_ONE);
        REQUIRE(v.treasury() == BOB);

        w.advance(1000);
        v.mint_fee();
        REQUIRE(x18::to_double(v.balance_of(BOB)) == Approx(1.001));
    }

    SECTION("Fee rate change charges the old rate first") {
        v.update_fee_per_second(OWNER, 0);
        REQUIRE(v.balance_of(TREASURY) == X18_ONE);
        w.advance(1000);
        REQUIRE(v.pending_fee() == 0);
    }
}

TEST_CASE("LP vault config update", "[lp][vault]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    EventLog log;
    log.attach(v);

    VaultConfig config = v.config();
    config.debt_ratio_step_threshold = 300;
    v.update_config(OWNER, config);
    REQUIRE(v.config().debt_ratio_step_threshold == 300);
    REQUIRE(log.contains(EventKind::ConfigUpdated));

    config.delta = Delta::Short;
    REQUIRE(error_code([&] { v.update_config(OWNER, config); }) == errors::INVALID_CONFIG);

    config.delta = Delta::Neutral;
    config.leverage = X18_ONE / 2;
    REQUIRE(error_code([&] { v.update_config(OWNER, config); }) == errors::INVALID_CONFIG);
    REQUIRE(v.config().leverage == 3 * X18_ONE);
}

TEST_CASE("LP vault callbacks outside a pending operation", "[lp][vault]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));
    EventLog log;
    log.attach(v);

    REQUIRE(v.after_deposit_execution(99, eth("1")) == CallbackResult::Rejected);
    REQUIRE(v.after_deposit_cancellation(0) == CallbackResult::Rejected);
    REQUIRE(v.after_withdrawal_execution(99, eth("1"), usdc("1")) == CallbackResult::Rejected);
    REQUIRE(v.after_withdrawal_cancellation(99) == CallbackResult::Rejected);

    REQUIRE(log.last(EventKind::CallbackRejected)->key == 99);
    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.lp_amt() == eth("3000"));
}

TEST_CASE("LP vault event delivery", "[lp][vault]") {
    LpWorld w;
    lp::Vault& v = *w.vault;

    SECTION("Subscribers see committed state and may call back in") {
        Status seen = Status::Closed;
        v.subscribe([&](const VaultEvent& e) {
            if (e.kind == EventKind::DepositCreated) {
                seen = v.status();
                v.mint_fee();
            }
        });
        w.deposit_usdc(ALICE, "1000");
        REQUIRE(seen == Status::Deposit);
    }

    SECTION("A failing subscriber does not fail the call") {
        v.subscribe([](const VaultEvent&) { throw std::runtime_error("subscriber down"); });
        EventLog log;
        log.attach(v);

        uint64_t key = w.deposit_usdc(ALICE, "1000");
        REQUIRE(key != 0);
        REQUIRE(log.contains(EventKind::DepositCreated));
    }

    SECTION("Rolled back calls publish nothing") {
        EventLog log;
        log.attach(v);
        REQUIRE(error_code([&] { w.deposit_usdc(ALICE, "1000", 10); }) ==
                errors::INSUFFICIENT_SLIPPAGE_AMOUNT);
        REQUIRE(log.events.empty());
    }
}

TEST_CASE("LP vault rejects reentrant calls", "[lp][vault]") {
    LpWorld w;
    ReentrantRouter router;
    const Address vault_addr = addresses::from_id(150);
    w.weth_pool.approve_borrower(vault_addr);
    w.usdc_pool.approve_borrower(vault_addr);

    lp::Vault v(lp::VaultDeps{w.env, w.ledger, w.oracle, router, w.weth_pool, w.usdc_pool,
                              w.venue, vault_addr, OWNER, TREASURY, quiet_config(Delta::Neutral)});
    router.target = &v;
    w.ledger.mint(ARB, vault_addr, eth("10"));

    REQUIRE(error_code([&] { v.compound(OWNER, lp::CompoundParams{ARB, USDC, eth("10"), 100, 0}); }) ==
            errors::REENTRANCY);
    REQUIRE(v.status() == Status::Open);
    REQUIRE(v.total_supply() == 0);
    REQUIRE(w.ledger.balance_of(ARB, vault_addr) == eth("10"));
    REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("100000"));

    // The lock is released after the failed call
    REQUIRE(error_code([&] { v.mint_fee(); }) == errors::OK);
}

TEST_CASE("LP vault refuses stale prices", "[lp][vault]") {
    LpWorld w;
    w.env.advance(2 * 86400);

    REQUIRE(error_code([&] { w.deposit_usdc(ALICE, "1000"); }) == errors::STALE_PRICE_FEED);
    REQUIRE(w.vault->status() == Status::Open);
    REQUIRE(w.ledger.balance_of(USDC, ALICE) == usdc("100000"));
}
