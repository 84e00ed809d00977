// =============================================================================
// lp/compound.cpp - Reward reinvestment into the LP position
// =============================================================================

#include "lev/lp/compound.hpp"

#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lp/checks.hpp"
#include "lev/lp/emergency.hpp"
#include "lev/lp/manager.hpp"
#include "lev/lp/reader.hpp"

namespace lev {
namespace lp {
namespace compound {

uint64_t compound(Store& store, const CompoundParams& params) {
    require(checks::before_compound_checks(store, params));

    CompoundCache cc;
    cc.params = params;
    cc.health = reader::health(store);

    if (params.amt_in > 0) {
        manager::swap_exact_tokens_for_tokens(store, params.token_in, params.token_out, params.amt_in,
                                              params.slippage, params.deadline);
    }

    cc.added = TokenAmounts{store.ledger->balance_of(store.token_a, store.vault),
                            store.ledger->balance_of(store.token_b, store.vault)};
    if (cc.added.token_a_amt == 0 && cc.added.token_b_amt == 0) {
        log::logger()->debug("compound: nothing to add");
        return 0;
    }

    I128 value = reader::convert_to_usd_value(store, store.token_a, cc.added.token_a_amt) +
                 reader::convert_to_usd_value(store, store.token_b, cc.added.token_b_amt);
    cc.deposit_key = manager::add_liquidity(
        store, cc.added, manager::calc_min_market_slippage_amt(store, value, params.slippage));

    store.compound_cache = cc;
    store.status = Status::Compound;

    log::logger()->info("compound requested key={} value={}", cc.deposit_key, x18::to_string(value));
    return cc.deposit_key;
}

CallbackResult process_compound(Store& store, uint64_t key, I128 lp_received) {
    store.compound_cache.lp_received = lp_received;
    store.lp_amt += lp_received;

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::CompoundCompleted, .key = key, .amount = lp_received});
    log::logger()->info("compound key={} completed, lp={}", key, x18::to_string(lp_received));

    emergency::apply_deferred_pause(store);
    return CallbackResult::Committed;
}

CallbackResult process_compound_cancellation(Store& store, uint64_t key) {
    // Refunded tokens stay in custody for the next compound
    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::CompoundCancelled, .key = key});
    log::logger()->info("compound key={} cancelled", key);

    emergency::apply_deferred_pause(store);
    return CallbackResult::Cancelled;
}

void compound_lp(Store& store) {
    require(checks::before_compound_lp_checks(store));

    I128 held = store.ledger->balance_of(store.lp_token, store.vault);
    I128 synced = held - store.lp_amt;
    store.lp_amt = held;

    emit(store, VaultEvent{.kind = EventKind::PositionUnitSynced, .token = store.lp_token, .amount = synced});
    log::logger()->info("lp position synced +{}", x18::to_string(synced));
}

} // namespace compound
} // namespace lp
} // namespace lev
