#ifndef LEV_LRT_REBALANCE_HPP
#define LEV_LRT_REBALANCE_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

// =============================================================================
// Rebalance - debt ratio back into band, settled in the same call
// =============================================================================

namespace rebalance {

// Both return Open when the debt ratio is back in band, Rebalance_Open
// otherwise
Status rebalance_add(Store& store, const RebalanceAddParams& params);
Status rebalance_remove(Store& store, const RebalanceRemoveParams& params);

// Rebalance_Open -> Open
void rebalance_close(Store& store);

} // namespace rebalance
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_REBALANCE_HPP
