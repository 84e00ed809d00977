#ifndef LEV_LRT_DEPOSIT_HPP
#define LEV_LRT_DEPOSIT_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

namespace deposit {

// Pull the user's tokens, borrow, restake everything into the LRT and mint
// shares in one call. `native` pulls the native asset and wraps it first.
// Returns the shares minted.
I128 deposit(Store& store, const Address& user, const DepositParams& params, bool native);

} // namespace deposit
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_DEPOSIT_HPP
