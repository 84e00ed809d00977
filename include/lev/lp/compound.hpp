#ifndef LEV_LP_COMPOUND_HPP
#define LEV_LP_COMPOUND_HPP

#include "types.hpp"

namespace lev {
namespace lp {

namespace compound {

// Swap the reward into token A or B and add every custody A/B balance as
// liquidity. Returns the request key, 0 when nothing was added.
uint64_t compound(Store& store, const CompoundParams& params);
CallbackResult process_compound(Store& store, uint64_t key, I128 lp_received);
CallbackResult process_compound_cancellation(Store& store, uint64_t key);

// Raise lp_amt to the LP actually held in custody
void compound_lp(Store& store);

} // namespace compound
} // namespace lp
} // namespace lev

#endif // LEV_LP_COMPOUND_HPP
