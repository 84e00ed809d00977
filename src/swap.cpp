// =============================================================================
// swap.cpp - Oracle-priced swap gateway
// =============================================================================

#include "lev/swap.hpp"

#include "lev/accounting.hpp"
#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/oracle.hpp"

namespace lev {

OracleSwapRouter::OracleSwapRouter(Ledger& ledger, const IOracle& oracle, const Environment& env,
                                   const Address& address, I128 fee_bps)
    : ledger_(ledger), oracle_(oracle), env_(env), address_(address), fee_bps_(fee_bps) {}

void OracleSwapRouter::check_deadline(uint64_t deadline) const {
    if (deadline != 0 && deadline < env_.now()) {
        throw VaultError(errors::DEADLINE_EXPIRED);
    }
}

I128 OracleSwapRouter::cost_bps() const {
    return fee_bps_ + impact_bps_.load();
}

I128 OracleSwapRouter::swap_exact_in(const SwapParams& params) {
    check_deadline(params.deadline);
    if (params.amount_in <= 0) return 0;

    I128 value_in = accounting::convert_to_usd_value(oracle_, ledger_, params.token_in, params.amount_in);
    I128 value_out = accounting::slippage_floor(value_in, cost_bps());
    I128 amount_out = accounting::convert_usd_to_token_amt(oracle_, ledger_, params.token_out, value_out);

    if (amount_out < params.amount_out) {
        throw VaultError(errors::SWAP_SLIPPAGE_EXCEEDED,
            "out " + x18::to_int_string(amount_out) + " < min " + x18::to_int_string(params.amount_out));
    }
    if (ledger_.balance_of(params.token_out, address_) < amount_out) {
        throw VaultError(errors::INSUFFICIENT_LIQUIDITY, ledger_.symbol(params.token_out));
    }

    ledger_.transfer(params.token_in, params.sender, address_, params.amount_in);
    ledger_.transfer(params.token_out, address_, params.sender, amount_out);
    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    return amount_out;
}

I128 OracleSwapRouter::swap_exact_out(const SwapParams& params) {
    check_deadline(params.deadline);
    if (params.amount_out <= 0) return 0;

    I128 value_out = accounting::convert_to_usd_value(oracle_, ledger_, params.token_out, params.amount_out);
    // Gross up so that value_in * (1 - cost) == value_out, rounding up
    I128 denominator = BPS_DENOMINATOR - cost_bps();
    I128 value_in = x18::mul_div(value_out, BPS_DENOMINATOR, denominator) + 1;
    I128 amount_in = accounting::convert_usd_to_token_amt(oracle_, ledger_, params.token_in, value_in) + 1;

    if (amount_in > params.amount_in) {
        throw VaultError(errors::EXCESSIVE_SWAP_INPUT,
            "in " + x18::to_int_string(amount_in) + " > max " + x18::to_int_string(params.amount_in));
    }
    if (ledger_.balance_of(params.token_out, address_) < params.amount_out) {
        throw VaultError(errors::INSUFFICIENT_LIQUIDITY, ledger_.symbol(params.token_out));
    }

    ledger_.transfer(params.token_in, params.sender, address_, amount_in);
    ledger_.transfer(params.token_out, address_, params.sender, params.amount_out);
    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    return amount_in;
}

OracleSwapRouter::Stats OracleSwapRouter::get_stats() const {
    return Stats{total_swaps_.load(std::memory_order_relaxed)};
}

} // namespace lev
