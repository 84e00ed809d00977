// =============================================================================
// accounting.cpp - Shared fixed-point accounting formulas
// =============================================================================

#include "lev/accounting.hpp"

#include "lev/ledger.hpp"
#include "lev/oracle.hpp"

namespace lev {
namespace accounting {

I128 convert_to_usd_value(const IOracle& oracle, const Ledger& ledger,
                          const Currency& token, I128 amount) {
    if (amount == 0) return 0;
    uint8_t decimals = ledger.decimals(token);
    I128 normalized = amount * x18::pow10(18 - decimals);
    return x18::mul_div(normalized, oracle.consult_in_18_decimals(token), SAFE_MULTIPLIER);
}

I128 convert_usd_to_token_amt(const IOracle& oracle, const Ledger& ledger,
                              const Currency& token, I128 value) {
    if (value == 0) return 0;
    uint8_t decimals = ledger.decimals(token);
    I128 amount18 = x18::mul_div(value, SAFE_MULTIPLIER, oracle.consult_in_18_decimals(token));
    return amount18 / x18::pow10(18 - decimals);
}

I128 pending_fee(I128 total_shares, I128 fee_per_second, uint64_t elapsed_seconds) {
    if (total_shares == 0 || fee_per_second == 0 || elapsed_seconds == 0) return 0;
    return x18::mul_div(total_shares, fee_per_second * static_cast<I128>(elapsed_seconds),
                        SAFE_MULTIPLIER);
}

I128 sv_token_value(I128 equity, I128 total_shares, I128 pending_fee) {
    I128 denominator = total_shares + pending_fee;
    if (denominator == 0) {
        throw VaultError(errors::DIVIDE_BY_ZERO, "sv_token_value with zero shares");
    }
    return x18::mul_div(equity, SAFE_MULTIPLIER, denominator);
}

I128 value_to_shares(I128 value, I128 current_equity, I128 total_shares_with_fee) {
    if (total_shares_with_fee == 0 || current_equity == 0) {
        return value;
    }
    return x18::mul_div(value, total_shares_with_fee, current_equity);
}

I128 debt_ratio(I128 debt_value, I128 asset_value) {
    if (asset_value == 0) return 0;
    return x18::mul_div(debt_value, SAFE_MULTIPLIER, asset_value);
}

I128 leverage(I128 asset_value, I128 equity_value) {
    if (equity_value == 0) return 0;
    return x18::mul_div(asset_value, SAFE_MULTIPLIER, equity_value);
}

I128 signed_delta(const IOracle& oracle, const Ledger& ledger, const Currency& token,
                  I128 asset_amt, I128 debt_amt, I128 equity_value) {
    if (asset_amt == 0 && debt_amt == 0) return 0;
    if (equity_value == 0) return 0;

    bool positive = asset_amt >= debt_amt;
    I128 unsigned_amt = positive ? asset_amt - debt_amt : debt_amt - asset_amt;
    I128 unsigned_delta = x18::mul_div(
        convert_to_usd_value(oracle, ledger, token, unsigned_amt), SAFE_MULTIPLIER, equity_value);

    return positive ? unsigned_delta : -unsigned_delta;
}

bool is_within_step_change(I128 threshold_bps, I128 before, I128 after) {
    if (before == 0) return true;
    I128 diff = before > after ? before - after : after - before;
    return x18::mul_div(diff, BPS_DENOMINATOR, before) <= threshold_bps;
}

I128 slippage_floor(I128 amount, I128 slippage_bps) {
    return x18::mul_div(amount, BPS_DENOMINATOR - slippage_bps, BPS_DENOMINATOR);
}

I128 slippage_ceiling(I128 amount, I128 slippage_bps) {
    return x18::mul_div(amount, BPS_DENOMINATOR + slippage_bps, BPS_DENOMINATOR);
}

I128 calc_amount_in_maximum(const IOracle& oracle, const Ledger& ledger,
                            const Currency& token_in, const Currency& token_out,
                            I128 amount_out, I128 slippage_bps) {
    if (amount_out == 0) return 0;

    I128 amount_out_value = convert_to_usd_value(oracle, ledger, token_out, amount_out);

    // USD -> token_in at 18 decimals, then down to native decimals
    I128 amount_in18 = x18::mul_div(amount_out_value, SAFE_MULTIPLIER,
                                    oracle.consult_in_18_decimals(token_in));
    uint8_t decimals_in = ledger.decimals(token_in);
    I128 amount_in = amount_in18;
    if (decimals_in < 18) {
        amount_in = amount_in18 / x18::pow10(18 - decimals_in);
    }

    return slippage_ceiling(amount_in, slippage_bps);
}

} // namespace accounting
} // namespace lev
