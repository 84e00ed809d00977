#ifndef LEV_CHECKS_HPP
#define LEV_CHECKS_HPP

#include <initializer_list>

#include "accounting.hpp"
#include "config.hpp"
#include "types.hpp"

namespace lev {

// =============================================================================
// Guards shared by both vault variants
// =============================================================================

// Every guard returns errors::OK or the code of the first violated rule.
namespace checks {

int32_t status_in(Status current, std::initializer_list<Status> allowed);

// slippage within [min_vault_slippage, 10000]
int32_t slippage(const VaultConfig& config, I128 slippage_bps);

// value within [min_asset_value, max_asset_value] and below capacity
int32_t deposit_value(const VaultConfig& config, I128 value, I128 additional_capacity);

int32_t withdraw_value(const VaultConfig& config, I128 value);

// Position strictly up, debt ratio within step, shares at least the minimum
int32_t after_deposit(const VaultConfig& config, const HealthParams& health,
                      I128 shares_to_user, I128 min_shares_amt);

// Position and equity strictly down, debt ratio within step, assets at
// least the minimum
int32_t after_withdraw(const VaultConfig& config, const HealthParams& health,
                       I128 assets_to_user, I128 min_assets_amt);

// Rebalancing is legal only while the targeted metric is out of band
int32_t rebalance_preconditions(const VaultConfig& config, RebalanceType type,
                                I128 delta, I128 debt_ratio);

// Delta in band (Neutral only) and debt ratio in band
int32_t rebalance_postconditions(const VaultConfig& config, I128 delta, I128 debt_ratio);

// =============================================================================
// Status gates
// =============================================================================

int32_t new_operation(Status status);                    // Open
int32_t rebalance(Status status);                        // Open, Rebalance_Open
int32_t rebalance_close(Status status);                  // Rebalance_Open
int32_t mint_fee(Status status);                         // anything but Paused, Closed
int32_t emergency_pause(Status status);
int32_t emergency_repay(Status status);                  // Paused
int32_t emergency_borrow(Status status);                 // Repaid
int32_t emergency_resume(Status status);                 // Paused
int32_t emergency_close(Status status);                  // Repaid
int32_t emergency_withdraw(Status status);               // Closed
int32_t emergency_status_change(Status status, Status target);

} // namespace checks
} // namespace lev

#endif // LEV_CHECKS_HPP
