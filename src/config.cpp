// =============================================================================
// config.cpp - Vault configuration loading and validation
// =============================================================================

#include "lev/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace lev {

using json = nlohmann::json;

namespace {

void read_x18(const json& j, const char* key, I128& out) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (v.is_string()) {
        out = x18::from_string(v.get<std::string>());
    } else if (v.is_number_integer()) {
        out = x18::from_int(v.get<int64_t>());
    } else {
        throw std::invalid_argument(std::string("expected decimal string for ") + key);
    }
}

void read_bps(const json& j, const char* key, I128& out) {
    if (!j.contains(key)) return;
    out = j.at(key).get<int64_t>();
}

}  // namespace

int32_t VaultConfig::validate() const {
    if (leverage <= X18_ONE) return errors::INVALID_CONFIG;
    if (debt_ratio_upper_limit < debt_ratio_lower_limit) return errors::INVALID_CONFIG;
    if (delta_upper_limit < delta_lower_limit) return errors::INVALID_CONFIG;
    if (min_asset_value > max_asset_value) return errors::INVALID_CONFIG;
    if (debt_ratio_step_threshold < 0 || debt_ratio_step_threshold > BPS_DENOMINATOR) {
        return errors::INVALID_CONFIG;
    }
    if (min_vault_slippage < 0 || min_vault_slippage > BPS_DENOMINATOR) return errors::INVALID_CONFIG;
    if (swap_slippage < 0 || swap_slippage > BPS_DENOMINATOR) return errors::INVALID_CONFIG;
    if (fee_per_second < 0) return errors::INVALID_CONFIG;
    return errors::OK;
}

VaultConfig VaultConfig::from_json(const json& j) {
    VaultConfig config;

    read_x18(j, "leverage", config.leverage);
    if (j.contains("delta")) {
        config.delta = delta_from_string(j.at("delta").get<std::string>());
    }

    read_bps(j, "debt_ratio_step_threshold", config.debt_ratio_step_threshold);
    read_x18(j, "debt_ratio_upper_limit", config.debt_ratio_upper_limit);
    read_x18(j, "debt_ratio_lower_limit", config.debt_ratio_lower_limit);
    read_x18(j, "delta_upper_limit", config.delta_upper_limit);
    read_x18(j, "delta_lower_limit", config.delta_lower_limit);

    read_bps(j, "min_vault_slippage", config.min_vault_slippage);
    read_bps(j, "swap_slippage", config.swap_slippage);

    read_x18(j, "min_asset_value", config.min_asset_value);
    read_x18(j, "max_asset_value", config.max_asset_value);
    read_x18(j, "fee_per_second", config.fee_per_second);

    config.log_level = j.value("log_level", config.log_level);
    return config;
}

VaultConfig VaultConfig::from_string(std::string_view content) {
    return from_json(json::parse(content));
}

VaultConfig VaultConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

json VaultConfig::to_json() const {
    return json{
        {"leverage", x18::to_string(leverage)},
        {"delta", to_string(delta)},
        {"debt_ratio_step_threshold", static_cast<int64_t>(debt_ratio_step_threshold)},
        {"debt_ratio_upper_limit", x18::to_string(debt_ratio_upper_limit)},
        {"debt_ratio_lower_limit", x18::to_string(debt_ratio_lower_limit)},
        {"delta_upper_limit", x18::to_string(delta_upper_limit)},
        {"delta_lower_limit", x18::to_string(delta_lower_limit)},
        {"min_vault_slippage", static_cast<int64_t>(min_vault_slippage)},
        {"swap_slippage", static_cast<int64_t>(swap_slippage)},
        {"min_asset_value", x18::to_string(min_asset_value)},
        {"max_asset_value", x18::to_string(max_asset_value)},
        {"fee_per_second", x18::to_string(fee_per_second)},
        {"log_level", log_level}
    };
}

} // namespace lev
