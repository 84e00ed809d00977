// =============================================================================
// lrt/rebalance.cpp - Keeper rebalancing of the LRT vault
// =============================================================================

#include "lev/lrt/rebalance.hpp"

#include "lev/checks.hpp"
#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/manager.hpp"
#include "lev/lrt/reader.hpp"

namespace lev {
namespace lrt {
namespace rebalance {

namespace {

Status finish(Store& store) {
    RebalanceCache& rc = store.rebalance_cache;
    reader::health_after(store, rc.health);

    if (int32_t code = checks::after_rebalance_checks(store); code != errors::OK) {
        store.status = Status::Rebalance_Open;
        emit(store, VaultEvent{.kind = EventKind::RebalanceOpen, .code = code});
        log::logger()->warn("rebalance left debt_ratio={} out of band: {}",
                            x18::to_string(rc.health.debt_ratio_after), errors::to_string(code));
        return store.status;
    }

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceSuccess});
    log::logger()->info("rebalance done, debt_ratio {} -> {}", x18::to_string(rc.health.debt_ratio_before),
                        x18::to_string(rc.health.debt_ratio_after));
    return store.status;
}

}  // namespace

Status rebalance_add(Store& store, const RebalanceAddParams& params) {
    require(checks::before_rebalance_checks(store, params.type));
    require(::lev::checks::slippage(store.config, params.slippage));
    if (params.borrow_amt <= 0) {
        throw VaultError(errors::INVALID_REBALANCE_PARAMETERS, "empty rebalance borrow");
    }

    RebalanceCache rc;
    rc.type = params.type;
    rc.borrow_amt = params.borrow_amt;
    rc.health = reader::health(store);
    store.rebalance_cache = rc;

    manager::borrow(store, params.borrow_amt);
    I128 lrt_out = manager::swap_exact_tokens_for_tokens(store, store.base, store.lrt, params.borrow_amt,
                                                         params.slippage);
    store.lrt_amt += lrt_out;
    emit(store, VaultEvent{.kind = EventKind::RebalanceAdded, .token = store.lrt, .amount = lrt_out});

    return finish(store);
}

Status rebalance_remove(Store& store, const RebalanceRemoveParams& params) {
    require(checks::before_rebalance_checks(store, params.type));
    require(::lev::checks::slippage(store.config, params.slippage));
    if (params.lrt_amt_to_remove <= 0 || params.lrt_amt_to_remove > store.lrt_amt) {
        throw VaultError(errors::INVALID_REBALANCE_PARAMETERS,
            "lrt to remove " + x18::to_string(params.lrt_amt_to_remove));
    }

    RebalanceCache rc;
    rc.type = params.type;
    rc.lrt_amt_to_remove = params.lrt_amt_to_remove;
    rc.health = reader::health(store);
    store.rebalance_cache = rc;

    store.lrt_amt -= params.lrt_amt_to_remove;
    I128 base_out = manager::swap_exact_tokens_for_tokens(store, store.lrt, store.base,
                                                          params.lrt_amt_to_remove, params.slippage);
    // Proceeds above the debt stay in custody
    manager::repay_up_to(store, base_out);
    emit(store, VaultEvent{.kind = EventKind::RebalanceRemoved, .token = store.lrt,
                           .amount = params.lrt_amt_to_remove});

    return finish(store);
}

void rebalance_close(Store& store) {
    require(checks::before_rebalance_close_checks(store));

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::RebalanceClosed});
    log::logger()->info("rebalance closed, status Open");
}

} // namespace rebalance
} // namespace lrt
} // namespace lev
