#ifndef LEV_ACCOUNTING_HPP
#define LEV_ACCOUNTING_HPP

#include "types.hpp"

namespace lev {

class IOracle;
class Ledger;

// =============================================================================
// Health Snapshot
// =============================================================================

// Captured once at operation start ("before") and again on settlement
// ("after"). The before half is never recomputed mid-flow.
struct HealthParams {
    I128 equity_before = 0;
    I128 debt_ratio_before = 0;
    I128 delta_before = 0;
    I128 position_amt_before = 0;   // lp_amt or lrt_amt
    I128 sv_token_value_before = 0;

    I128 equity_after = 0;
    I128 debt_ratio_after = 0;
    I128 delta_after = 0;
    I128 position_amt_after = 0;
    I128 sv_token_value_after = 0;
};

// =============================================================================
// Accounting Formulas (variant independent)
// =============================================================================

namespace accounting {

// USD value (1e18) of `amount` native units of `token`
I128 convert_to_usd_value(const IOracle& oracle, const Ledger& ledger,
                          const Currency& token, I128 amount);

// Native units of `token` worth `value` USD (1e18)
I128 convert_usd_to_token_amt(const IOracle& oracle, const Ledger& ledger,
                              const Currency& token, I128 value);

// totalShares * feePerSecond * elapsed / 1e18
I128 pending_fee(I128 total_shares, I128 fee_per_second, uint64_t elapsed_seconds);

// equity * 1e18 / (totalShares + pendingFee). Throws DIVIDE_BY_ZERO on an
// empty denominator; callers handle the pre-first-deposit state.
I128 sv_token_value(I128 equity, I128 total_shares, I128 pending_fee);

// value * (totalShares + pendingFee) / equity, or `value` unchanged when
// either the denominator or the equity is zero (bootstrap)
I128 value_to_shares(I128 value, I128 current_equity, I128 total_shares_with_fee);

// max(0, asset - debt)
inline I128 equity(I128 asset_value, I128 debt_value) {
    return x18::sub_floor(asset_value, debt_value);
}

// debt * 1e18 / asset, 0 when asset value is 0
I128 debt_ratio(I128 debt_value, I128 asset_value);

// asset * 1e18 / equity, 0 when equity is 0
I128 leverage(I128 asset_value, I128 equity_value);

// sign(asset - debt) * |asset - debt| in USD * 1e18 / equity. 0 when equity
// is 0 or both amounts are 0.
I128 signed_delta(const IOracle& oracle, const Ledger& ledger, const Currency& token,
                  I128 asset_amt, I128 debt_amt, I128 equity_value);

// Relative move of a metric within +/- threshold_bps of its prior value.
// Always true when the prior value is 0.
bool is_within_step_change(I128 threshold_bps, I128 before, I128 after);

// amount * (10000 - slippage) / 10000
I128 slippage_floor(I128 amount, I128 slippage_bps);

// amount * (10000 + slippage) / 10000
I128 slippage_ceiling(I128 amount, I128 slippage_bps);

// Upper bound of token_in needed to buy exactly amount_out of token_out
I128 calc_amount_in_maximum(const IOracle& oracle, const Ledger& ledger,
                            const Currency& token_in, const Currency& token_out,
                            I128 amount_out, I128 slippage_bps);

} // namespace accounting

} // namespace lev

#endif // LEV_ACCOUNTING_HPP
