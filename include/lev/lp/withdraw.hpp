#ifndef LEV_LP_WITHDRAW_HPP
#define LEV_LP_WITHDRAW_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Withdraw - request / settle / cancel / fail-and-re-add
// =============================================================================

namespace withdraw {

// Mint the pending fee, burn the shares and request removal of the
// proportional LP. Status -> Withdraw.
uint64_t withdraw(Store& store, const Address& user, const WithdrawParams& params);

// Settlement: repay the proportional debt, pay the user in the requested
// token. Withdraw_Failed when the post-checks fail.
CallbackResult process_withdraw(Store& store, uint64_t key, I128 token_a_received,
                                I128 token_b_received);

// LP returned: restore the position and the burnt shares
CallbackResult process_withdraw_cancellation(Store& store, uint64_t key);

// Withdraw_Failed: add the received tokens back as liquidity
uint64_t process_withdraw_failure(Store& store, I128 slippage);

// Liquidity restored: re-mint the burnt shares. -> Open
CallbackResult process_withdraw_failure_liquidity_added(Store& store, uint64_t key, I128 lp_received);

// Re-add request refunded; stays Withdraw_Failed for another attempt
CallbackResult process_withdraw_failure_cancellation(Store& store, uint64_t key);

} // namespace withdraw
} // namespace lp
} // namespace lev

#endif // LEV_LP_WITHDRAW_HPP
