#ifndef LEV_LRT_COMPOUND_HPP
#define LEV_LRT_COMPOUND_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

namespace compound {

// Swap the reward. LRT output is credited to the position, base token
// output stays in custody. Returns the amount out.
I128 compound(Store& store, const CompoundParams& params);

// Raise lrt_amt to the LRT actually held in custody
void compound_lrt(Store& store);

} // namespace compound
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_COMPOUND_HPP
