#ifndef LEV_CONFIG_HPP
#define LEV_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace lev {

// =============================================================================
// Vault Configuration (risk limits and fee)
// =============================================================================

// JSON layout: fixed-point values are decimal strings ("3", "0.70"),
// basis-point values are integers, delta is "Neutral" | "Long" | "Short".
struct VaultConfig {
    I128 leverage = 3 * X18_ONE;
    Delta delta = Delta::Neutral;

    I128 debt_ratio_step_threshold = 500;            // bps, relative move
    I128 debt_ratio_upper_limit = X18_ONE * 70 / 100;
    I128 debt_ratio_lower_limit = X18_ONE * 60 / 100;
    I128 delta_upper_limit = X18_ONE * 15 / 100;
    I128 delta_lower_limit = -(X18_ONE * 15 / 100);

    I128 min_vault_slippage = 50;                    // bps
    I128 swap_slippage = 100;                        // bps

    I128 min_asset_value = X18_ONE;                  // USD
    I128 max_asset_value = 1000000 * X18_ONE;        // USD

    I128 fee_per_second = 0;                         // share fraction per second, 1e18 base

    std::string log_level = "info";

    // OK or INVALID_CONFIG
    int32_t validate() const;

    static VaultConfig from_json(const nlohmann::json& j);
    static VaultConfig from_string(std::string_view content);
    static VaultConfig from_file(std::string_view path);

    nlohmann::json to_json() const;
};

} // namespace lev

#endif // LEV_CONFIG_HPP
