// =============================================================================
// lp/rebalance.cpp - Keeper rebalancing of the LP vault
// =============================================================================

#include "lev/lp/rebalance.hpp"

#include "lev/checks.hpp"
#include "lev/environment.hpp"
#include "lev/log.hpp"
#include "lev/lp/checks.hpp"
#include "lev/lp/emergency.hpp"
#include "lev/lp/manager.hpp"
#include "lev/lp/reader.hpp"

namespace lev {
namespace lp {
namespace rebalance {

namespace {

// Settle against the band: Open when back inside, Rebalance_Open otherwise
CallbackResult finish(Store& store, uint64_t key) {
    RebalanceCache& rc = store.rebalance_cache;

    int32_t code = errors::OK;
    try {
        reader::health_after(store, rc.health);
        code = checks::after_rebalance_checks(store);
    } catch (const VaultError& e) {
        code = e.code();
    }

    if (code != errors::OK) {
        store.status = Status::Rebalance_Open;
        emit(store, VaultEvent{.kind = EventKind::RebalanceOpen, .key = key, .code = code});
        log::logger()->warn("rebalance key={} still out of band: {}", key, errors::to_string(code));
        emergency::apply_deferred_pause(store);
        return CallbackResult::Failed;
    }

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceSuccess, .key = key});
    log::logger()->info("rebalance key={} back in band, debt_ratio={} delta={}", key,
                        x18::to_string(rc.health.debt_ratio_after), x18::to_string(rc.health.delta_after));
    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

int32_t try_repay(Store& store, const RepayParams& repay, const TokenAmounts& available) {
    Transaction<Store> txn(*store.env, store);
    try {
        manager::repay_in_full(store, repay, available);
        txn.commit();
    } catch (const VaultError& e) {
        return e.code();
    }
    return errors::OK;
}

// Repay failed: the tokens stay in custody and the keeper takes over
CallbackResult hold(Store& store, uint64_t key, int32_t code) {
    store.status = Status::Rebalance_Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceOpen, .key = key, .code = code});
    log::logger()->error("rebalance key={} repay not settled: {}", key, errors::to_string(code));
    emergency::apply_deferred_pause(store);
    return CallbackResult::Failed;
}

}  // namespace

uint64_t rebalance_add(Store& store, const RebalanceAddParams& params) {
    require(checks::before_rebalance_checks(store, params.type));
    require(::lev::checks::slippage(store.config, params.slippage));
    if (params.borrow.token_a_amt < 0 || params.borrow.token_b_amt < 0 ||
        params.borrow.token_a_amt + params.borrow.token_b_amt == 0) {
        throw VaultError(errors::INVALID_REBALANCE_PARAMETERS, "empty rebalance borrow");
    }

    RebalanceCache rc;
    rc.type = params.type;
    rc.borrow = params.borrow;
    rc.health = reader::health(store);

    manager::borrow(store, rc.borrow);

    I128 value = reader::convert_to_usd_value(store, store.token_a, rc.borrow.token_a_amt) +
                 reader::convert_to_usd_value(store, store.token_b, rc.borrow.token_b_amt);
    rc.deposit_key = manager::add_liquidity(
        store, rc.borrow, manager::calc_min_market_slippage_amt(store, value, params.slippage));

    store.rebalance_cache = rc;
    store.status = Status::Rebalance_Add;
    emit(store, VaultEvent{.kind = EventKind::RebalanceAdded, .key = rc.deposit_key});

    log::logger()->info("rebalance add requested key={} debt_ratio={} delta={}", rc.deposit_key,
                        x18::to_string(rc.health.debt_ratio_before), x18::to_string(rc.health.delta_before));
    return rc.deposit_key;
}

CallbackResult process_rebalance_add(Store& store, uint64_t key, I128 lp_received) {
    store.lp_amt += lp_received;
    return finish(store, key);
}

CallbackResult process_rebalance_add_cancellation(Store& store, uint64_t key) {
    const RebalanceCache& rc = store.rebalance_cache;
    if (int32_t code = try_repay(store, rc.borrow, rc.borrow); code != errors::OK) {
        return hold(store, key, code);
    }

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceCancelled, .key = key});
    log::logger()->info("rebalance add key={} cancelled, borrow repaid", key);

    emergency::apply_deferred_pause(store);
    return CallbackResult::Cancelled;
}

uint64_t rebalance_remove(Store& store, const RebalanceRemoveParams& params) {
    require(checks::before_rebalance_checks(store, params.type));
    require(::lev::checks::slippage(store.config, params.slippage));
    if (params.lp_amt_to_remove <= 0 || params.lp_amt_to_remove > store.lp_amt) {
        throw VaultError(errors::INVALID_REBALANCE_PARAMETERS,
            "lp to remove " + x18::to_string(params.lp_amt_to_remove));
    }

    RebalanceCache rc;
    rc.type = params.type;
    rc.repay = params.repay;
    rc.lp_amt_to_remove = params.lp_amt_to_remove;
    rc.health = reader::health(store);

    store.lp_amt -= rc.lp_amt_to_remove;
    TokenAmounts min_out = manager::calc_min_tokens_slippage_amt(store, rc.lp_amt_to_remove, params.slippage);
    rc.withdraw_key = manager::remove_liquidity(store, rc.lp_amt_to_remove, min_out);

    store.rebalance_cache = rc;
    store.status = Status::Rebalance_Remove;
    emit(store, VaultEvent{.kind = EventKind::RebalanceRemoved, .key = rc.withdraw_key,
                           .amount = rc.lp_amt_to_remove});

    log::logger()->info("rebalance remove requested key={} lp={}", rc.withdraw_key,
                        x18::to_string(rc.lp_amt_to_remove));
    return rc.withdraw_key;
}

CallbackResult process_rebalance_remove(Store& store, uint64_t key, I128 token_a_received,
                                        I128 token_b_received) {
    // Whatever the repay leaves stays in custody for the next compound
    if (int32_t code = try_repay(store, store.rebalance_cache.repay,
                                 TokenAmounts{token_a_received, token_b_received});
        code != errors::OK) {
        return hold(store, key, code);
    }
    return finish(store, key);
}

CallbackResult process_rebalance_remove_cancellation(Store& store, uint64_t key) {
    store.lp_amt += store.rebalance_cache.lp_amt_to_remove;

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceCancelled, .key = key});
    log::logger()->info("rebalance remove key={} cancelled, lp restored", key);

    emergency::apply_deferred_pause(store);
    return CallbackResult::Cancelled;
}

void rebalance_close(Store& store) {
    require(checks::before_rebalance_close_checks(store));

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceClosed});
    log::logger()->info("rebalance closed, status Open");

    emergency::apply_deferred_pause(store);
}

} // namespace rebalance
} // namespace lp
} // namespace lev
