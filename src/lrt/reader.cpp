// =============================================================================
// lrt/reader.cpp - LRT vault accounting
// =============================================================================

#include "lev/lrt/reader.hpp"

#include "lev/environment.hpp"
#include "lev/lending.hpp"
#include "lev/oracle.hpp"

namespace lev {
namespace lrt {
namespace reader {

I128 convert_to_usd_value(const Store& store, const Currency& token, I128 amount) {
    return accounting::convert_to_usd_value(*store.oracle, *store.ledger, token, amount);
}

I128 convert_usd_to_token_amt(const Store& store, const Currency& token, I128 value) {
    return accounting::convert_usd_to_token_amt(*store.oracle, *store.ledger, token, value);
}

I128 lrt_value(const Store& store) {
    return store.oracle->consult_in_18_decimals(store.lrt);
}

I128 asset_value(const Store& store) {
    return convert_to_usd_value(store, store.lrt, store.lrt_amt);
}

I128 debt_amt(const Store& store) {
    return store.lending->max_repay(store.vault);
}

I128 debt_value(const Store& store) {
    return convert_to_usd_value(store, store.base, debt_amt(store));
}

I128 equity_value(const Store& store) {
    return accounting::equity(asset_value(store), debt_value(store));
}

I128 debt_ratio(const Store& store) {
    return accounting::debt_ratio(debt_value(store), asset_value(store));
}

I128 leverage(const Store& store) {
    return accounting::leverage(asset_value(store), equity_value(store));
}

I128 delta(const Store& store) {
    I128 asset_in_base = convert_usd_to_token_amt(store, store.base, asset_value(store));
    return accounting::signed_delta(*store.oracle, *store.ledger, store.base, asset_in_base,
                                    debt_amt(store), equity_value(store));
}

// =============================================================================
// Shares
// =============================================================================

I128 pending_fee(const Store& store) {
    uint64_t now = store.env->now();
    uint64_t elapsed = now > store.last_fee_collected ? now - store.last_fee_collected : 0;
    return accounting::pending_fee(store.shares.total_supply(), store.config.fee_per_second, elapsed);
}

I128 sv_token_value(const Store& store) {
    return accounting::sv_token_value(equity_value(store), store.shares.total_supply(),
                                      pending_fee(store));
}

I128 value_to_shares(const Store& store, I128 value, I128 current_equity) {
    return accounting::value_to_shares(value, current_equity,
                                       store.shares.total_supply() + pending_fee(store));
}

// =============================================================================
// Capacity
// =============================================================================

I128 additional_capacity(const Store& store) {
    I128 available = convert_to_usd_value(store, store.base, store.lending->total_available_asset());
    return x18::mul_div(available, SAFE_MULTIPLIER, store.config.leverage - SAFE_MULTIPLIER);
}

I128 capacity(const Store& store) {
    return additional_capacity(store) + equity_value(store);
}

// =============================================================================
// Health
// =============================================================================

HealthParams health(const Store& store) {
    HealthParams h;
    h.equity_before = equity_value(store);
    h.debt_ratio_before = debt_ratio(store);
    h.delta_before = delta(store);
    h.position_amt_before = store.lrt_amt;

    I128 fee = pending_fee(store);
    if (store.shares.total_supply() + fee > 0) {
        h.sv_token_value_before = accounting::sv_token_value(h.equity_before,
                                                             store.shares.total_supply(), fee);
    }
    return h;
}

void health_after(const Store& store, HealthParams& health) {
    health.equity_after = equity_value(store);
    health.debt_ratio_after = debt_ratio(store);
    health.delta_after = delta(store);
    health.position_amt_after = store.lrt_amt;

    I128 fee = pending_fee(store);
    health.sv_token_value_after = store.shares.total_supply() + fee > 0
        ? accounting::sv_token_value(health.equity_after, store.shares.total_supply(), fee)
        : 0;
}

} // namespace reader
} // namespace lrt
} // namespace lev
