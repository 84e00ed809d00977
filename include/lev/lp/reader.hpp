#ifndef LEV_LP_READER_HPP
#define LEV_LP_READER_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Reader - derived accounting of the LP vault (no side effects)
// =============================================================================

namespace reader {

I128 convert_to_usd_value(const Store& store, const Currency& token, I128 amount);
I128 convert_usd_to_token_amt(const Store& store, const Currency& token, I128 value);

// USD value of one LP unit (1e18), 0 for an empty pool
I128 lp_token_value(const Store& store);

// Share of pool value held in token A and token B (1e18 = 100%)
TokenAmounts token_weights(const Store& store);

// Token A and token B underlying the vault's lp_amt
TokenAmounts asset_amt(const Store& store);

// Outstanding debt in token A and token B
TokenAmounts debt_amt(const Store& store);

I128 asset_value(const Store& store);
I128 debt_value(const Store& store);
I128 equity_value(const Store& store);
I128 debt_ratio(const Store& store);
I128 leverage(const Store& store);

// Exposure to token A relative to equity, signed
I128 delta(const Store& store);

I128 pending_fee(const Store& store);

// Throws DIVIDE_BY_ZERO before the first deposit
I128 sv_token_value(const Store& store);

I128 value_to_shares(const Store& store, I128 value, I128 current_equity);

// USD a new deposit may add before a lending pool runs dry.
// Neutral: min over both tokens of available / (leverage * weight - share
// funded by the deposit). Throws ARITHMETIC_UNDERFLOW when the token B term
// goes negative (leverage * weight_b < 1).
I128 additional_capacity(const Store& store);

I128 capacity(const Store& store);

// Snapshot of the "before" half; sv_token_value_before is 0 at bootstrap
HealthParams health(const Store& store);

// Fill the "after" half of an existing snapshot
void health_after(const Store& store, HealthParams& health);

} // namespace reader
} // namespace lp
} // namespace lev

#endif // LEV_LP_READER_HPP
