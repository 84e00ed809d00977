#ifndef LEV_LP_REBALANCE_HPP
#define LEV_LP_REBALANCE_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Rebalance - keeper-sized exposure changes while out of band
// =============================================================================

namespace rebalance {

uint64_t rebalance_add(Store& store, const RebalanceAddParams& params);
CallbackResult process_rebalance_add(Store& store, uint64_t key, I128 lp_received);
CallbackResult process_rebalance_add_cancellation(Store& store, uint64_t key);

uint64_t rebalance_remove(Store& store, const RebalanceRemoveParams& params);
CallbackResult process_rebalance_remove(Store& store, uint64_t key, I128 token_a_received,
                                        I128 token_b_received);
CallbackResult process_rebalance_remove_cancellation(Store& store, uint64_t key);

// Rebalance_Open -> Open
void rebalance_close(Store& store);

} // namespace rebalance
} // namespace lp
} // namespace lev

#endif // LEV_LP_REBALANCE_HPP
