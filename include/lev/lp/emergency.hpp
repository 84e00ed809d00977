#ifndef LEV_LP_EMERGENCY_HPP
#define LEV_LP_EMERGENCY_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Emergency - Paused -> Repay -> Repaid -> {Paused | Closed}
// =============================================================================

namespace emergency {

// Paused now when idle, otherwise queued until the in-flight operation ends
void emergency_pause(Store& store);

// Queued pause takes effect once the vault is idle again
void apply_deferred_pause(Store& store);

// Remove all liquidity. Returns the request key, 0 when no LP was held.
// Also retries from Repay once a failed settlement cleared the key.
uint64_t emergency_repay(Store& store);

// A failed repay keeps the status Repay with no key outstanding
CallbackResult process_emergency_repay(Store& store, uint64_t key, I128 token_a_received,
                                       I128 token_b_received);
CallbackResult process_emergency_repay_cancellation(Store& store, uint64_t key);

// Borrow back what the emergency repay paid off. Repaid -> Paused
void emergency_borrow(Store& store);

// Redeploy custody tokens. Returns the request key, 0 when resumed at once.
uint64_t emergency_resume(Store& store);
CallbackResult process_emergency_resume(Store& store, uint64_t key, I128 lp_received);
CallbackResult process_emergency_resume_cancellation(Store& store, uint64_t key);

// Final fee, Repaid -> Closed
void emergency_close(Store& store);

// Pro-rata share of raw custody balances for burnt shares
void emergency_withdraw(Store& store, const Address& user, I128 shares_amt);

void emergency_status_change(Store& store, Status target);

} // namespace emergency
} // namespace lp
} // namespace lev

#endif // LEV_LP_EMERGENCY_HPP
