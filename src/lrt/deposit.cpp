// =============================================================================
// lrt/deposit.cpp - Synchronous leveraged restaking deposit
// =============================================================================

#include "lev/lrt/deposit.hpp"

#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/manager.hpp"
#include "lev/lrt/reader.hpp"

namespace lev {
namespace lrt {
namespace deposit {

I128 deposit(Store& store, const Address& user, const DepositParams& params, bool native) {
    DepositParams dp = params;
    if (native) {
        if (!store.base_is_wnt) throw VaultError(errors::INVALID_NATIVE_DEPOSIT);
        dp.token = store.base;
    }
    require(checks::before_deposit_checks(store, dp));

    DepositCache dc;
    dc.user = user;
    dc.health = reader::health(store);

    if (native) {
        store.ledger->transfer(NATIVE, user, store.vault, dp.amt);
        store.ledger->wrap(store.vault, dp.amt);
    } else {
        store.ledger->transfer(dp.token, user, store.vault, dp.amt);
    }

    I128 lrt_in = 0;
    I128 base_in = 0;
    if (dp.token == store.lrt) {
        lrt_in = dp.amt;
        dc.deposit_value = reader::convert_to_usd_value(store, store.lrt, lrt_in);
    } else {
        if (dp.token != store.base) {
            dp.amt = manager::swap_exact_tokens_for_tokens(store, dp.token, store.base, dp.amt,
                                                           store.config.swap_slippage);
            dp.token = store.base;
        }
        base_in = dp.amt;
        dc.deposit_value = reader::convert_to_usd_value(store, store.base, base_in);
    }
    dc.params = dp;

    require(checks::before_deposit_value_checks(store, dc.deposit_value));

    dc.min_shares_amt = accounting::slippage_floor(
        reader::value_to_shares(store, dc.deposit_value, dc.health.equity_before), dp.slippage);

    dc.borrow_amt = manager::calc_borrow(store, dc.deposit_value);
    manager::borrow(store, dc.borrow_amt);

    I128 lrt_out = manager::swap_exact_tokens_for_tokens(store, store.base, store.lrt,
                                                         base_in + dc.borrow_amt, dp.slippage);
    store.lrt_amt += lrt_in + lrt_out;

    reader::health_after(store, dc.health);
    dc.shares_to_user = reader::value_to_shares(
        store, x18::sub_floor(dc.health.equity_after, dc.health.equity_before), dc.health.equity_before);

    store.deposit_cache = dc;
    require(checks::after_deposit_checks(store));

    manager::mint_fee(store);
    store.shares.mint(user, dc.shares_to_user);
    emit(store, VaultEvent{.kind = EventKind::DepositCompleted, .user = user, .token = params.token,
                           .amount = params.amt, .shares = dc.shares_to_user});

    log::logger()->info("deposit user={} value={} borrow={} lrt+={} shares={}", addresses::to_hex(user),
                        x18::to_string(dc.deposit_value), x18::to_int_string(dc.borrow_amt),
                        x18::to_int_string(lrt_in + lrt_out), x18::to_string(dc.shares_to_user));
    return dc.shares_to_user;
}

} // namespace deposit
} // namespace lrt
} // namespace lev
