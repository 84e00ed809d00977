// =============================================================================
// lp/reader.cpp - LP vault accounting
// =============================================================================

#include "lev/lp/reader.hpp"

#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/lending.hpp"
#include "lev/oracle.hpp"
#include "lev/venue.hpp"

namespace lev {
namespace lp {
namespace reader {

I128 convert_to_usd_value(const Store& store, const Currency& token, I128 amount) {
    return accounting::convert_to_usd_value(*store.oracle, *store.ledger, token, amount);
}

I128 convert_usd_to_token_amt(const Store& store, const Currency& token, I128 value) {
    return accounting::convert_usd_to_token_amt(*store.oracle, *store.ledger, token, value);
}

// =============================================================================
// Pool
// =============================================================================

I128 lp_token_value(const Store& store) {
    PoolReserves r = store.venue->reserves();
    if (r.lp_supply == 0) return 0;

    I128 pool_value = convert_to_usd_value(store, store.token_a, r.token_a_amt) +
                      convert_to_usd_value(store, store.token_b, r.token_b_amt);
    return x18::mul_div(pool_value, SAFE_MULTIPLIER, r.lp_supply);
}

TokenAmounts token_weights(const Store& store) {
    PoolReserves r = store.venue->reserves();
    I128 value_a = convert_to_usd_value(store, store.token_a, r.token_a_amt);
    I128 value_b = convert_to_usd_value(store, store.token_b, r.token_b_amt);
    I128 total = value_a + value_b;
    if (total == 0) return TokenAmounts{};

    return TokenAmounts{
        x18::mul_div(value_a, SAFE_MULTIPLIER, total),
        x18::mul_div(value_b, SAFE_MULTIPLIER, total)
    };
}

// =============================================================================
// Position
// =============================================================================

TokenAmounts asset_amt(const Store& store) {
    PoolReserves r = store.venue->reserves();
    if (r.lp_supply == 0 || store.lp_amt == 0) return TokenAmounts{};

    return TokenAmounts{
        x18::mul_div(r.token_a_amt, store.lp_amt, r.lp_supply),
        x18::mul_div(r.token_b_amt, store.lp_amt, r.lp_supply)
    };
}

TokenAmounts debt_amt(const Store& store) {
    return TokenAmounts{
        store.token_a_lending->max_repay(store.vault),
        store.token_b_lending->max_repay(store.vault)
    };
}

I128 asset_value(const Store& store) {
    return x18::mul_div(store.lp_amt, lp_token_value(store), SAFE_MULTIPLIER);
}

I128 debt_value(const Store& store) {
    TokenAmounts debt = debt_amt(store);
    return convert_to_usd_value(store, store.token_a, debt.token_a_amt) +
           convert_to_usd_value(store, store.token_b, debt.token_b_amt);
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
    return accounting::signed_delta(*store.oracle, *store.ledger, store.token_a,
                                    asset_amt(store).token_a_amt, debt_amt(store).token_a_amt,
                                    equity_value(store));
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
    const I128 lev = store.config.leverage;
    I128 available_b = convert_to_usd_value(store, store.token_b,
                                            store.token_b_lending->total_available_asset());

    if (store.config.delta == Delta::Long) {
        return x18::mul_div(available_b, SAFE_MULTIPLIER, lev - SAFE_MULTIPLIER);
    }
    if (store.config.delta != Delta::Neutral) {
        throw VaultError(errors::INVALID_CONFIG, "LP vault supports Neutral and Long only");
    }

    TokenAmounts weights = token_weights(store);
    I128 available_a = convert_to_usd_value(store, store.token_a,
                                            store.token_a_lending->total_available_asset());

    I128 max_a = x18::mul_div(available_a, SAFE_MULTIPLIER,
                              x18::mul_div(lev, weights.token_a_amt, SAFE_MULTIPLIER));

    I128 denominator_b = x18::mul_div(lev, weights.token_b_amt, SAFE_MULTIPLIER) - SAFE_MULTIPLIER;
    if (denominator_b < 0) {
        throw VaultError(errors::ARITHMETIC_UNDERFLOW,
            "leverage * token B weight below 1 (" + x18::to_string(denominator_b + SAFE_MULTIPLIER) + ")");
    }
    // Deposit alone covers token B, nothing to borrow
    if (denominator_b == 0) return max_a;

    I128 max_b = x18::mul_div(available_b, SAFE_MULTIPLIER, denominator_b);
    return x18::min(max_a, max_b);
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
    h.position_amt_before = store.lp_amt;

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
    health.position_amt_after = store.lp_amt;

    I128 fee = pending_fee(store);
    health.sv_token_value_after = store.shares.total_supply() + fee > 0
        ? accounting::sv_token_value(health.equity_after, store.shares.total_supply(), fee)
        : 0;
}

} // namespace reader
} // namespace lp
} // namespace lev
