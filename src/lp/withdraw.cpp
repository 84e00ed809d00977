// =============================================================================
// lp/withdraw.cpp - Asynchronous withdraw saga
// =============================================================================

#include "lev/lp/withdraw.hpp"

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
namespace withdraw {

uint64_t withdraw(Store& store, const Address& user, const WithdrawParams& params) {
    require(checks::before_withdraw_checks(store, params, user));

    // Share ratio must see the fee shares
    manager::mint_fee(store);

    WithdrawCache wc;
    wc.user = user;
    wc.params = params;
    wc.health = reader::health(store);
    wc.share_ratio = x18::mul_div(params.shares_amt, SAFE_MULTIPLIER, store.shares.total_supply());
    wc.lp_amt = x18::mul_div(store.lp_amt, wc.share_ratio, SAFE_MULTIPLIER);
    wc.withdraw_value = x18::mul_div(wc.lp_amt, reader::lp_token_value(store), SAFE_MULTIPLIER);

    require(checks::before_withdraw_value_checks(store, wc.withdraw_value));

    store.shares.burn(user, params.shares_amt);
    store.lp_amt -= wc.lp_amt;

    TokenAmounts min_out = manager::calc_min_tokens_slippage_amt(store, wc.lp_amt, params.slippage);
    wc.withdraw_key = manager::remove_liquidity(store, wc.lp_amt, min_out);

    store.withdraw_cache = wc;
    store.status = Status::Withdraw;
    emit(store, VaultEvent{.kind = EventKind::WithdrawCreated, .key = wc.withdraw_key, .user = user,
                           .token = params.token, .amount = wc.lp_amt, .shares = params.shares_amt});

    log::logger()->info("withdraw requested key={} user={} shares={} lp={}", wc.withdraw_key,
                        addresses::to_hex(user), x18::to_string(params.shares_amt),
                        x18::to_string(wc.lp_amt));
    return wc.withdraw_key;
}

CallbackResult process_withdraw(Store& store, uint64_t key, I128 token_a_received,
                                I128 token_b_received) {
    WithdrawCache& wc = store.withdraw_cache;
    wc.received = TokenAmounts{token_a_received, token_b_received};

    int32_t code = errors::OK;
    HealthParams health = wc.health;
    {
        Transaction<Store> txn(*store.env, store);
        try {
            wc.repay = manager::calc_repay(store, wc.share_ratio);
            TokenAmounts left = manager::repay_in_full(store, wc.repay, wc.received);

            // Remainder of the other token is swapped into the requested one
            if (wc.params.token == store.token_a) {
                wc.assets_to_user = left.token_a_amt + manager::swap_exact_tokens_for_tokens(
                    store, store.token_b, store.token_a, left.token_b_amt, store.config.swap_slippage);
            } else {
                wc.assets_to_user = left.token_b_amt + manager::swap_exact_tokens_for_tokens(
                    store, store.token_a, store.token_b, left.token_a_amt, store.config.swap_slippage);
            }

            reader::health_after(store, wc.health);
            health = wc.health;
            code = checks::after_withdraw_checks(store);
            if (code == errors::OK) {
                manager::transfer_out(store, wc.user, wc.params.token, wc.assets_to_user, true);
                store.status = Status::Open;
                emit(store, VaultEvent{.kind = EventKind::WithdrawCompleted, .key = key, .user = wc.user,
                                       .token = wc.params.token, .amount = wc.assets_to_user,
                                       .shares = wc.params.shares_amt});
                txn.commit();
            }
        } catch (const VaultError& e) {
            code = e.code();
        }
    }

    if (code != errors::OK) {
        wc.health = health;
        store.status = Status::Withdraw_Failed;
        emit(store, VaultEvent{.kind = EventKind::WithdrawFailed, .key = key, .user = wc.user,
                               .code = code, .equity_after = health.equity_after,
                               .debt_ratio_after = health.debt_ratio_after});
        log::logger()->error("withdraw key={} failed: {}", key, errors::to_string(code));
        return CallbackResult::Failed;
    }

    log::logger()->info("withdraw key={} completed, paid {} {}", key,
                        x18::to_int_string(wc.assets_to_user), addresses::to_hex(wc.params.token.addr));
    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

CallbackResult process_withdraw_cancellation(Store& store, uint64_t key) {
    const WithdrawCache& wc = store.withdraw_cache;

    store.lp_amt += wc.lp_amt;
    store.shares.mint(wc.user, wc.params.shares_amt);
    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::WithdrawCancelled, .key = key, .user = wc.user,
                           .shares = wc.params.shares_amt});
    log::logger()->info("withdraw key={} cancelled, shares restored", key);

    emergency::apply_deferred_pause(store);
    return CallbackResult::Cancelled;
}

uint64_t process_withdraw_failure(Store& store, I128 slippage) {
    require(checks::before_process_withdraw_failure_checks(store));
    require(::lev::checks::slippage(store.config, slippage));

    WithdrawCache& wc = store.withdraw_cache;
    I128 value = reader::convert_to_usd_value(store, store.token_a, wc.received.token_a_amt) +
                 reader::convert_to_usd_value(store, store.token_b, wc.received.token_b_amt);

    wc.deposit_key = manager::add_liquidity(
        store, wc.received, manager::calc_min_market_slippage_amt(store, value, slippage));

    log::logger()->info("withdraw key={} failure re-add requested key={}", wc.withdraw_key, wc.deposit_key);
    return wc.deposit_key;
}

CallbackResult process_withdraw_failure_liquidity_added(Store& store, uint64_t key, I128 lp_received) {
    const WithdrawCache& wc = store.withdraw_cache;

    store.lp_amt += lp_received;
    store.shares.mint(wc.user, wc.params.shares_amt);
    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::WithdrawFailureLiquidityAdded, .key = key, .user = wc.user,
                           .amount = lp_received, .shares = wc.params.shares_amt});
    log::logger()->info("withdraw key={} reverted, lp={} re-added", wc.withdraw_key,
                        x18::to_string(lp_received));

    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

CallbackResult process_withdraw_failure_cancellation(Store& store, uint64_t key) {
    store.withdraw_cache.deposit_key = 0;
    log::logger()->warn("withdraw failure re-add key={} cancelled, awaiting retry", key);
    return CallbackResult::Cancelled;
}

} // namespace withdraw
} // namespace lp
} // namespace lev
