// Lev - Ledger, transactions and share token tests

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <thread>

#include "fixtures.hpp"
#include <lev/shares.hpp>

using namespace lev;
using namespace lev::test;

TEST_CASE("Ledger registry", "[ledger]") {
    Ledger ledger;
    ledger.register_token(USDC, "USDC", 6);
    ledger.register_wrapped_native(WETH, "WETH");

    SECTION("Native is implicit") {
        REQUIRE(ledger.is_registered(NATIVE));
        REQUIRE(ledger.decimals(NATIVE) == 18);
        REQUIRE(error_code([&] { ledger.register_token(NATIVE, "ETH", 18); }) == errors::INVALID_CONFIG);
    }

    SECTION("Metadata") {
        REQUIRE(ledger.decimals(USDC) == 6);
        REQUIRE(ledger.symbol(WETH) == "WETH");
        REQUIRE(ledger.wrapped_native().has_value());
        REQUIRE(*ledger.wrapped_native() == WETH);
    }

    SECTION("Rejects more than 18 decimals") {
        REQUIRE(error_code([&] { ledger.register_token(ARB, "ARB", 24); }) == errors::INVALID_CONFIG);
    }

    SECTION("Unknown token") {
        REQUIRE(error_code([&] { ledger.decimals(ARB); }) == errors::UNKNOWN_TOKEN);
        REQUIRE(error_code([&] { ledger.mint(ARB, ALICE, 1); }) == errors::UNKNOWN_TOKEN);
    }
}

TEST_CASE("Ledger balances", "[ledger]") {
    Ledger ledger;
    ledger.register_token(USDC, "USDC", 6);
    ledger.register_wrapped_native(WETH, "WETH");
    ledger.mint(USDC, ALICE, usdc("100"));

    SECTION("Transfer moves balance") {
        ledger.transfer(USDC, ALICE, BOB, usdc("40"));
        REQUIRE(ledger.balance_of(USDC, ALICE) == usdc("60"));
        REQUIRE(ledger.balance_of(USDC, BOB) == usdc("40"));
        REQUIRE(ledger.total_supply(USDC) == usdc("100"));
    }

    SECTION("Overdraft is refused") {
        REQUIRE(error_code([&] { ledger.transfer(USDC, ALICE, BOB, usdc("101")); }) ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.balance_of(USDC, ALICE) == usdc("100"));
    }

    SECTION("Burn reduces supply") {
        ledger.burn(USDC, ALICE, usdc("10"));
        REQUIRE(ledger.total_supply(USDC) == usdc("90"));
    }

    SECTION("Wrap and unwrap are 1:1") {
        ledger.mint(NATIVE, ALICE, eth("2"));
        ledger.wrap(ALICE, eth("1.5"));
        REQUIRE(ledger.balance_of(NATIVE, ALICE) == eth("0.5"));
        REQUIRE(ledger.balance_of(WETH, ALICE) == eth("1.5"));

        ledger.unwrap(ALICE, eth("1"));
        REQUIRE(ledger.balance_of(NATIVE, ALICE) == eth("1.5"));
        REQUIRE(ledger.balance_of(WETH, ALICE) == eth("0.5"));
    }

    SECTION("Native refusal") {
        ledger.mint(NATIVE, ALICE, eth("1"));
        ledger.set_rejects_native(BOB, true);
        REQUIRE_FALSE(ledger.try_send_native(ALICE, BOB, eth("1")));
        REQUIRE(ledger.balance_of(NATIVE, ALICE) == eth("1"));

        ledger.set_rejects_native(BOB, false);
        REQUIRE(ledger.try_send_native(ALICE, BOB, eth("1")));
        REQUIRE(ledger.balance_of(NATIVE, BOB) == eth("1"));
    }
}

TEST_CASE("Accounts with the same bucket hash stay apart", "[ledger]") {
    const Address a = addresses::from_id(31);
    const Address b = addresses::from_id(256);
    REQUIRE(addresses::hash(a) == addresses::hash(b));
    REQUIRE(a != b);

    SECTION("Ledger") {
        Ledger ledger;
        ledger.register_token(USDC, "USDC", 6);
        ledger.mint(USDC, a, usdc("10"));
        REQUIRE(ledger.balance_of(USDC, a) == usdc("10"));
        REQUIRE(ledger.balance_of(USDC, b) == 0);
        REQUIRE(error_code([&] { ledger.transfer(USDC, b, ALICE, 1); }) == errors::INSUFFICIENT_BALANCE);
    }

    SECTION("ShareToken") {
        ShareToken shares;
        shares.mint(a, 100);
        REQUIRE(shares.balance_of(b) == 0);
        shares.mint(b, 5);
        REQUIRE(shares.balance_of(a) == 100);
        REQUIRE(shares.holders() == 2);
    }
}

TEST_CASE("Transactions restore participants", "[environment]") {
    Environment env;
    Ledger ledger;
    ledger.register_token(USDC, "USDC", 6);
    ledger.mint(USDC, ALICE, usdc("100"));
    env.attach(&ledger);
    env.attach(&ledger);   // idempotent

    struct Local {
        int counter = 0;
    } local;

    SECTION("Destructor rolls back") {
        {
            Transaction<Local> txn(env, local);
            ledger.transfer(USDC, ALICE, BOB, usdc("30"));
            local.counter = 7;
        }
        REQUIRE(ledger.balance_of(USDC, ALICE) == usdc("100"));
        REQUIRE(local.counter == 0);
        REQUIRE(env.depth() == 0);
    }

    SECTION("Commit keeps changes") {
        {
            Transaction<Local> txn(env, local);
            ledger.transfer(USDC, ALICE, BOB, usdc("30"));
            local.counter = 7;
            txn.commit();
        }
        REQUIRE(ledger.balance_of(USDC, BOB) == usdc("30"));
        REQUIRE(local.counter == 7);
    }

    SECTION("Inner rollback leaves the outer transaction intact") {
        {
            Transaction<Local> outer(env, local);
            ledger.transfer(USDC, ALICE, BOB, usdc("10"));
            {
                Transaction<Local> inner(env, local);
                ledger.transfer(USDC, ALICE, BOB, usdc("20"));
            }
            REQUIRE(ledger.balance_of(USDC, BOB) == usdc("10"));
            outer.commit();
        }
        REQUIRE(ledger.balance_of(USDC, BOB) == usdc("10"));
    }

    SECTION("Exception unwinds") {
        try {
            Transaction<Local> txn(env, local);
            ledger.transfer(USDC, ALICE, BOB, usdc("30"));
            ledger.transfer(USDC, ALICE, BOB, usdc("300"));
            txn.commit();
        } catch (const VaultError& e) {
            REQUIRE(e.code() == errors::INSUFFICIENT_BALANCE);
        }
        REQUIRE(ledger.balance_of(USDC, BOB) == 0);
    }
}

TEST_CASE("ReentrancyLock", "[environment]") {
    ReentrancyLock lock;

    SECTION("Same thread re-entry is rejected") {
        ReentrancyLock::Guard guard(lock);
        REQUIRE(lock.entered());
        REQUIRE(error_code([&] { ReentrancyLock::Guard again(lock); }) == errors::REENTRANCY);
    }

    SECTION("Released after scope") {
        { ReentrancyLock::Guard guard(lock); }
        REQUIRE_FALSE(lock.entered());
        REQUIRE_NOTHROW(ReentrancyLock::Guard(lock));
    }

    SECTION("Other threads are not treated as re-entry") {
        int32_t code = errors::REENTRANCY;
        std::thread worker([&] { code = error_code([&] { ReentrancyLock::Guard g(lock); }); });
        worker.join();
        REQUIRE(code == errors::OK);
        REQUIRE_FALSE(lock.entered());
    }
}

TEST_CASE("ShareToken", "[shares]") {
    ShareToken shares;
    shares.mint(ALICE, 100);
    shares.mint(BOB, 50);

    REQUIRE(shares.total_supply() == 150);
    REQUIRE(shares.balance_of(ALICE) == 100);

    shares.burn(ALICE, 100);
    REQUIRE(shares.total_supply() == 50);
    REQUIRE(shares.holders() == 1);

    REQUIRE(error_code([&] { shares.burn(ALICE, 1); }) == errors::INSUFFICIENT_SHARES_BALANCE);
}
