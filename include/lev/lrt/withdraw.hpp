#ifndef LEV_LRT_WITHDRAW_HPP
#define LEV_LRT_WITHDRAW_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

namespace withdraw {

// Burn the shares, sell the proportional LRT, repay the proportional debt
// and pay the rest in the base token. Returns the amount paid.
I128 withdraw(Store& store, const Address& user, const WithdrawParams& params);

} // namespace withdraw
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_WITHDRAW_HPP
