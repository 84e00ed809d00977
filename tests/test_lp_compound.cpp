// Lev - LP vault compounding

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace lev;
using namespace lev::test;

TEST_CASE("LP compound reinvests rewards", "[lp][compound]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));
    REQUIRE(w.ledger.balance_of(WETH, VAULT) == 0);
    REQUIRE(w.ledger.balance_of(USDC, VAULT) == 0);

    w.ledger.mint(ARB, VAULT, eth("100"));
    EventLog log;
    log.attach(v);

    SECTION("Swap then add") {
        uint64_t key = v.compound(KEEPER, lp::CompoundParams{ARB, USDC, eth("100"), 100, 0});
        REQUIRE(key != 0);
        REQUIRE(v.status() == Status::Compound);
        REQUIRE(w.ledger.balance_of(ARB, VAULT) == 0);
        REQUIRE(v.store().compound_cache.added.token_b_amt == usdc("100"));

        w.venue.execute(key);
        REQUIRE(v.status() == Status::Open);
        REQUIRE(v.lp_amt() == eth("3100"));
        REQUIRE(log.last(EventKind::CompoundCompleted)->amount == eth("100"));

        // Debt unchanged, shares unchanged: holders gain
        REQUIRE(v.debt_amt().token_b_amt == usdc("500"));
        REQUIRE(v.total_supply() == eth("1000"));
    }

    SECTION("Cancelled compound keeps tokens in custody") {
        w.venue.cancel(v.compound(KEEPER, lp::CompoundParams{ARB, USDC, eth("100"), 100, 0}));
        REQUIRE(v.status() == Status::Open);
        REQUIRE(w.ledger.balance_of(USDC, VAULT) == usdc("100"));
        REQUIRE(log.contains(EventKind::CompoundCancelled));

        // The next compound picks them up without a swap
        w.venue.execute(v.compound(KEEPER, lp::CompoundParams{ARB, USDC, 0, 100, 0}));
        REQUIRE(v.lp_amt() == eth("3100"));
    }

    SECTION("Expired deadline") {
        uint64_t past = w.env.now() - 1;
        REQUIRE(error_code([&] {
            v.compound(KEEPER, lp::CompoundParams{ARB, USDC, eth("100"), 100, past});
        }) == errors::DEADLINE_EXPIRED);
        REQUIRE(w.ledger.balance_of(ARB, VAULT) == eth("100"));
        REQUIRE(v.status() == Status::Open);
    }
}

TEST_CASE("LP compound guards", "[lp][compound]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    REQUIRE(error_code([&] { v.compound(KEEPER, lp::CompoundParams{ARB, USDC, 0, 100, 0}); }) ==
            errors::EMPTY_COMPOUND_AMOUNT);
    REQUIRE(error_code([&] { v.compound(KEEPER, lp::CompoundParams{ARB, ARB, eth("1"), 100, 0}); }) ==
            errors::INVALID_COMPOUND_TOKEN);
    REQUIRE(error_code([&] { v.compound(KEEPER, lp::CompoundParams{GM, USDC, eth("1"), 100, 0}); }) ==
            errors::INVALID_COMPOUND_TOKEN);
    REQUIRE(error_code([&] { v.compound(ALICE, lp::CompoundParams{ARB, USDC, eth("1"), 100, 0}); }) ==
            errors::UNAUTHORIZED);
}

TEST_CASE("LP compound_lp syncs LP sent to the vault", "[lp][compound]") {
    LpWorld w;
    lp::Vault& v = *w.vault;
    w.venue.execute(w.deposit_usdc(ALICE, "1000"));

    REQUIRE(error_code([&] { v.compound_lp(KEEPER); }) == errors::NOTHING_TO_SYNC);

    w.ledger.mint(GM, VAULT, eth("10"));
    EventLog log;
    log.attach(v);
    v.compound_lp(KEEPER);

    REQUIRE(v.lp_amt() == eth("3010"));
    REQUIRE(log.last(EventKind::PositionUnitSynced)->amount == eth("10"));
    REQUIRE(error_code([&] { v.compound_lp(KEEPER); }) == errors::NOTHING_TO_SYNC);
}
