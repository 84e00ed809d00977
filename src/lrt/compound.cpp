// =============================================================================
// lrt/compound.cpp - Reward reinvestment into the LRT position
// =============================================================================

#include "lev/lrt/compound.hpp"

#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/manager.hpp"

namespace lev {
namespace lrt {
namespace compound {

I128 compound(Store& store, const CompoundParams& params) {
    require(checks::before_compound_checks(store, params));

    CompoundCache cc;
    cc.params = params;
    cc.amt_out = manager::swap_exact_tokens_for_tokens(store, params.token_in, params.token_out,
                                                       params.amt_in, params.slippage, params.deadline);
    store.compound_cache = cc;

    if (params.token_out == store.lrt) {
        store.lrt_amt += cc.amt_out;
    }

    emit(store, VaultEvent{.kind = EventKind::CompoundCompleted, .token = params.token_out,
                           .amount = cc.amt_out});
    log::logger()->info("compound {} -> {} out={}", addresses::to_hex(params.token_in.addr),
                        addresses::to_hex(params.token_out.addr), x18::to_int_string(cc.amt_out));
    return cc.amt_out;
}

void compound_lrt(Store& store) {
    require(checks::before_compound_lrt_checks(store));

    I128 held = store.ledger->balance_of(store.lrt, store.vault);
    I128 synced = held - store.lrt_amt;
    store.lrt_amt = held;

    emit(store, VaultEvent{.kind = EventKind::PositionUnitSynced, .token = store.lrt, .amount = synced});
    log::logger()->info("lrt position synced +{}", x18::to_int_string(synced));
}

} // namespace compound
} // namespace lrt
} // namespace lev
