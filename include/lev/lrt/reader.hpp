#ifndef LEV_LRT_READER_HPP
#define LEV_LRT_READER_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

// =============================================================================
// Reader - derived accounting of the LRT vault
// =============================================================================

namespace reader {

I128 convert_to_usd_value(const Store& store, const Currency& token, I128 amount);
I128 convert_usd_to_token_amt(const Store& store, const Currency& token, I128 value);

I128 lrt_value(const Store& store);          // USD value of one whole LRT
I128 asset_value(const Store& store);        // lrt_amt * price
I128 debt_amt(const Store& store);           // base token owed
I128 debt_value(const Store& store);
I128 equity_value(const Store& store);
I128 debt_ratio(const Store& store);
I128 leverage(const Store& store);

// Exposure to the base token per unit of equity, LRT counted at its base
// token value
I128 delta(const Store& store);

I128 pending_fee(const Store& store);
I128 sv_token_value(const Store& store);
I128 value_to_shares(const Store& store, I128 value, I128 current_equity);

// available_base_value / (leverage - 1)
I128 additional_capacity(const Store& store);
I128 capacity(const Store& store);

HealthParams health(const Store& store);
void health_after(const Store& store, HealthParams& health);

} // namespace reader
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_READER_HPP
