#ifndef LEV_LP_DEPOSIT_HPP
#define LEV_LP_DEPOSIT_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Deposit - request / settle / cancel / fail-and-unwind
// =============================================================================

namespace deposit {

// Pull the user's tokens, borrow, and request liquidity. Status -> Deposit.
// `native` pulls the native asset and wraps it first.
uint64_t deposit(Store& store, const Address& user, const DepositParams& params, bool native);

// Settlement: mint shares and return to Open, or move to Deposit_Failed
// when the post-checks fail
CallbackResult process_deposit(Store& store, uint64_t key, I128 lp_received);

// Venue refunded the request: repay the borrow, refund the user. When the
// borrow cannot be repaid whole the tokens are held and the status moves to
// Deposit_Failed.
CallbackResult process_deposit_cancellation(Store& store, uint64_t key);

// Deposit_Failed: request removal of the liquidity received, or settle the
// held tokens at once (returns 0) when none is left at the venue.
// Throws INSUFFICIENT_REPAY_AMOUNT when they still cannot repay the borrow.
uint64_t process_deposit_failure(Store& store, I128 slippage);

// Repay the borrow from the withdrawn tokens, refund the rest. -> Open.
// On failure the tokens are held and the status stays Deposit_Failed.
CallbackResult process_deposit_failure_liquidity_withdrawal(Store& store, uint64_t key,
                                                            I128 token_a_received,
                                                            I128 token_b_received);

// Unwind request refunded; stays Deposit_Failed for another attempt
CallbackResult process_deposit_failure_cancellation(Store& store, uint64_t key);

} // namespace deposit
} // namespace lp
} // namespace lev

#endif // LEV_LP_DEPOSIT_HPP
