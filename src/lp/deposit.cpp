// =============================================================================
// lp/deposit.cpp - Asynchronous deposit saga
// =============================================================================

#include "lev/lp/deposit.hpp"

#include "lev/checks.hpp"
#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lp/checks.hpp"
#include "lev/lp/emergency.hpp"
#include "lev/lp/manager.hpp"
#include "lev/lp/reader.hpp"

namespace lev {
namespace lp {
namespace deposit {

namespace {

I128 tokens_value(const Store& store, const TokenAmounts& amounts) {
    return reader::convert_to_usd_value(store, store.token_a, amounts.token_a_amt) +
           reader::convert_to_usd_value(store, store.token_b, amounts.token_b_amt);
}

// Pay back what is left after the borrow to the depositor
void refund(Store& store, const DepositCache& dc, const TokenAmounts& left) {
    manager::transfer_out(store, dc.user, store.token_a, left.token_a_amt, dc.native);
    manager::transfer_out(store, dc.user, store.token_b, left.token_b_amt, dc.native);
    if (dc.lp_deposit_amt > 0) {
        store.ledger->transfer(store.lp_token, store.vault, dc.user, dc.lp_deposit_amt);
    }
}

// The borrow must be repaid whole before anything goes back to the depositor
void settle_unwind(Store& store, const DepositCache& dc, const TokenAmounts& available) {
    TokenAmounts left = manager::repay_in_full(store, dc.borrow, available);
    refund(store, dc, left);
}

int32_t try_settle_unwind(Store& store, const DepositCache& dc, const TokenAmounts& available) {
    Transaction<Store> txn(*store.env, store);
    try {
        settle_unwind(store, dc, available);
        txn.commit();
    } catch (const VaultError& e) {
        return e.code();
    }
    return errors::OK;
}

// Settlement of the unwind failed: the tokens stay in custody and the
// keeper settles them through process_deposit_failure
CallbackResult hold_unwound(Store& store, uint64_t key, const TokenAmounts& held, int32_t code) {
    DepositCache& dc = store.deposit_cache;
    dc.lp_received = 0;
    dc.withdraw_key = 0;
    dc.unwound = held;
    store.status = Status::Deposit_Failed;
    emit(store, VaultEvent{.kind = EventKind::DepositFailed, .key = key, .user = dc.user, .code = code});
    log::logger()->error("deposit key={} unwind not settled: {}, holding a={} b={}", dc.deposit_key,
                         errors::to_string(code), x18::to_int_string(held.token_a_amt),
                         x18::to_int_string(held.token_b_amt));
    return CallbackResult::Failed;
}

CallbackResult unwound(Store& store, uint64_t key) {
    const DepositCache& dc = store.deposit_cache;
    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::DepositFailureLiquidityWithdrawn, .key = key,
                           .user = dc.user});
    log::logger()->info("deposit key={} unwound, refunded {}", dc.deposit_key, addresses::to_hex(dc.user));

    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

}  // namespace

uint64_t deposit(Store& store, const Address& user, const DepositParams& params, bool native) {
    DepositParams dp = params;
    if (native) {
        if (!store.wnt || (*store.wnt != store.token_a && *store.wnt != store.token_b)) {
            throw VaultError(errors::INVALID_NATIVE_DEPOSIT);
        }
        dp.token = *store.wnt;
    }
    require(checks::before_deposit_checks(store, dp));

    DepositCache dc;
    dc.user = user;
    dc.native = native;
    dc.health = reader::health(store);

    if (native) {
        store.ledger->transfer(NATIVE, user, store.vault, dp.amt);
        store.ledger->wrap(store.vault, dp.amt);
    } else {
        store.ledger->transfer(dp.token, user, store.vault, dp.amt);
    }

    TokenAmounts deposited;
    if (dp.token == store.lp_token) {
        dc.lp_deposit_amt = dp.amt;
        dc.deposit_value = x18::mul_div(dp.amt, reader::lp_token_value(store), SAFE_MULTIPLIER);
    } else {
        if (dp.token != store.token_a && dp.token != store.token_b) {
            // Any other priced token enters as token B
            dp.amt = manager::swap_exact_tokens_for_tokens(store, dp.token, store.token_b, dp.amt,
                                                           store.config.swap_slippage);
            dp.token = store.token_b;
        }
        if (dp.token == store.token_a) {
            deposited.token_a_amt = dp.amt;
        } else {
            deposited.token_b_amt = dp.amt;
        }
        dc.deposit_value = reader::convert_to_usd_value(store, dp.token, dp.amt);
    }
    dc.params = dp;

    require(checks::before_deposit_value_checks(store, dc.deposit_value));

    dc.min_shares_amt = accounting::slippage_floor(
        reader::value_to_shares(store, dc.deposit_value, dc.health.equity_before), dp.slippage);

    dc.borrow = manager::calc_borrow(store, dc.deposit_value);
    manager::borrow(store, dc.borrow);

    dc.added = TokenAmounts{deposited.token_a_amt + dc.borrow.token_a_amt,
                            deposited.token_b_amt + dc.borrow.token_b_amt};
    I128 min_lp = manager::calc_min_market_slippage_amt(store, tokens_value(store, dc.added), dp.slippage);
    dc.deposit_key = manager::add_liquidity(store, dc.added, min_lp);

    store.deposit_cache = dc;
    store.status = Status::Deposit;
    emit(store, VaultEvent{.kind = EventKind::DepositCreated, .key = dc.deposit_key, .user = user,
                           .token = params.token, .amount = params.amt});

    log::logger()->info("deposit requested key={} user={} value={}", dc.deposit_key,
                        addresses::to_hex(user), x18::to_string(dc.deposit_value));
    return dc.deposit_key;
}

CallbackResult process_deposit(Store& store, uint64_t key, I128 lp_received) {
    DepositCache& dc = store.deposit_cache;
    dc.lp_received = lp_received;

    int32_t code = errors::OK;
    HealthParams health = dc.health;
    {
        Transaction<Store> txn(*store.env, store);
        try {
            store.lp_amt += lp_received + dc.lp_deposit_amt;
            reader::health_after(store, dc.health);
            health = dc.health;
            dc.shares_to_user = reader::value_to_shares(
                store, x18::sub_floor(dc.health.equity_after, dc.health.equity_before),
                dc.health.equity_before);

            code = checks::after_deposit_checks(store);
            if (code == errors::OK) {
                manager::mint_fee(store);
                store.shares.mint(dc.user, dc.shares_to_user);
                store.status = Status::Open;
                emit(store, VaultEvent{.kind = EventKind::DepositCompleted, .key = key, .user = dc.user,
                                       .amount = lp_received, .shares = dc.shares_to_user});
                txn.commit();
            }
        } catch (const VaultError& e) {
            code = e.code();
        }
    }

    if (code != errors::OK) {
        dc.health = health;
        store.status = Status::Deposit_Failed;
        emit(store, VaultEvent{.kind = EventKind::DepositFailed, .key = key, .user = dc.user,
                               .amount = lp_received, .code = code, .equity_after = health.equity_after,
                               .debt_ratio_after = health.debt_ratio_after});
        log::logger()->error("deposit key={} failed: {} (debt_ratio_after={})", key, errors::to_string(code),
                             x18::to_string(health.debt_ratio_after));
        return CallbackResult::Failed;
    }

    log::logger()->info("deposit key={} completed, shares={}", key, x18::to_string(dc.shares_to_user));
    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

CallbackResult process_deposit_cancellation(Store& store, uint64_t key) {
    const DepositCache dc = store.deposit_cache;

    // The venue returned the escrow: the borrow is repaid from it
    if (int32_t code = try_settle_unwind(store, dc, dc.added); code != errors::OK) {
        return hold_unwound(store, key, dc.added, code);
    }

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::DepositCancelled, .key = key, .user = dc.user,
                           .token = dc.params.token, .amount = dc.params.amt});
    log::logger()->info("deposit key={} cancelled, refunded {}", key, addresses::to_hex(dc.user));

    emergency::apply_deferred_pause(store);
    return CallbackResult::Cancelled;
}

uint64_t process_deposit_failure(Store& store, I128 slippage) {
    require(checks::before_process_deposit_failure_checks(store));
    require(::lev::checks::slippage(store.config, slippage));

    DepositCache& dc = store.deposit_cache;
    if (dc.lp_received == 0) {
        // Nothing left at the venue: settle from the tokens held in custody
        settle_unwind(store, dc, dc.unwound);
        unwound(store, dc.deposit_key);
        return 0;
    }

    TokenAmounts min_out = manager::calc_min_tokens_slippage_amt(store, dc.lp_received, slippage);
    dc.withdraw_key = manager::remove_liquidity(store, dc.lp_received, min_out);

    log::logger()->info("deposit key={} failure unwind requested key={}", dc.deposit_key, dc.withdraw_key);
    return dc.withdraw_key;
}

CallbackResult process_deposit_failure_liquidity_withdrawal(Store& store, uint64_t key,
                                                            I128 token_a_received,
                                                            I128 token_b_received) {
    const DepositCache dc = store.deposit_cache;
    const TokenAmounts received{token_a_received, token_b_received};

    if (int32_t code = try_settle_unwind(store, dc, received); code != errors::OK) {
        return hold_unwound(store, key, received, code);
    }
    return unwound(store, key);
}

CallbackResult process_deposit_failure_cancellation(Store& store, uint64_t key) {
    store.deposit_cache.withdraw_key = 0;
    log::logger()->warn("deposit failure unwind key={} cancelled, awaiting retry", key);
    return CallbackResult::Cancelled;
}

} // namespace deposit
} // namespace lp
} // namespace lev
