#ifndef LEV_LRT_EMERGENCY_HPP
#define LEV_LRT_EMERGENCY_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

// =============================================================================
// Emergency - Paused -> Repaid -> {Paused | Closed}, each step in one call
// =============================================================================

namespace emergency {

void emergency_pause(Store& store);

// Sell all LRT and repay as much debt as the proceeds cover. -> Repaid
void emergency_repay(Store& store);

// Borrow back what the emergency repay paid off. Repaid -> Paused
void emergency_borrow(Store& store);

// Restake custody base tokens. Paused -> Open
void emergency_resume(Store& store);

// Final fee, Repaid -> Closed
void emergency_close(Store& store);

void emergency_withdraw(Store& store, const Address& user, I128 shares_amt);

void emergency_status_change(Store& store, Status target);

} // namespace emergency
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_EMERGENCY_HPP
