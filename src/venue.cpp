// =============================================================================
// venue.cpp - Escrowing liquidity venue with deferred settlement
// =============================================================================

#include "lev/venue.hpp"

#include <mutex>

#include "lev/accounting.hpp"
#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/oracle.hpp"

namespace lev {

PendingLiquidityVenue::PendingLiquidityVenue(Ledger& ledger, const IOracle& oracle,
                                             const Currency& token_a, const Currency& token_b,
                                             const Currency& lp_token, const Address& address)
    : ledger_(ledger), oracle_(oracle), token_a_(token_a), token_b_(token_b),
      lp_token_(lp_token), address_(address) {}

PoolReserves PendingLiquidityVenue::reserves() const {
    I128 lp_supply = ledger_.total_supply(lp_token_);
    std::shared_lock lock(mutex_);
    return PoolReserves{state_.reserve_a, state_.reserve_b, lp_supply};
}

I128 PendingLiquidityVenue::pool_value(I128 reserve_a, I128 reserve_b) const {
    return accounting::convert_to_usd_value(oracle_, ledger_, token_a_, reserve_a) +
           accounting::convert_to_usd_value(oracle_, ledger_, token_b_, reserve_b);
}

void PendingLiquidityVenue::seed(const Address& provider, I128 token_a_amt, I128 token_b_amt) {
    ledger_.transfer(token_a_, provider, address_, token_a_amt);
    ledger_.transfer(token_b_, provider, address_, token_b_amt);
    ledger_.mint(lp_token_, provider, pool_value(token_a_amt, token_b_amt));

    std::unique_lock lock(mutex_);
    state_.reserve_a += token_a_amt;
    state_.reserve_b += token_b_amt;
}

// =============================================================================
// Requests
// =============================================================================

uint64_t PendingLiquidityVenue::request_add_liquidity(const AddLiquidityParams& params) {
    if (params.token_a_amt < 0 || params.token_b_amt < 0 ||
        params.token_a_amt + params.token_b_amt == 0) {
        throw VaultError(errors::INSUFFICIENT_BALANCE, "empty add liquidity request");
    }

    ledger_.transfer(token_a_, params.sender, address_, params.token_a_amt);
    ledger_.transfer(token_b_, params.sender, address_, params.token_b_amt);

    std::unique_lock lock(mutex_);
    uint64_t key = state_.next_key++;
    state_.pending[key] = Request{
        .is_add = true,
        .sender = params.sender,
        .token_a_amt = params.token_a_amt,
        .token_b_amt = params.token_b_amt,
        .lp_amt = 0,
        .min_lp_out = params.min_lp_out,
        .min_token_a_out = 0,
        .min_token_b_out = 0,
        .callback = params.callback
    };
    return key;
}

uint64_t PendingLiquidityVenue::request_remove_liquidity(const RemoveLiquidityParams& params) {
    if (params.lp_amt <= 0) {
        throw VaultError(errors::INSUFFICIENT_BALANCE, "empty remove liquidity request");
    }

    ledger_.transfer(lp_token_, params.sender, address_, params.lp_amt);

    std::unique_lock lock(mutex_);
    uint64_t key = state_.next_key++;
    state_.pending[key] = Request{
        .is_add = false,
        .sender = params.sender,
        .token_a_amt = 0,
        .token_b_amt = 0,
        .lp_amt = params.lp_amt,
        .min_lp_out = 0,
        .min_token_a_out = params.min_token_a_out,
        .min_token_b_out = params.min_token_b_out,
        .callback = params.callback
    };
    return key;
}

PendingLiquidityVenue::Request PendingLiquidityVenue::take(uint64_t key) {
    std::unique_lock lock(mutex_);
    auto it = state_.pending.find(key);
    if (it == state_.pending.end()) {
        throw VaultError(errors::UNKNOWN_REQUEST, "request key " + std::to_string(key));
    }
    Request request = it->second;
    state_.pending.erase(it);
    return request;
}

bool PendingLiquidityVenue::is_pending(uint64_t key) const {
    std::shared_lock lock(mutex_);
    return state_.pending.count(key) > 0;
}

size_t PendingLiquidityVenue::pending_count() const {
    std::shared_lock lock(mutex_);
    return state_.pending.size();
}

// =============================================================================
// Settlement
// =============================================================================

PendingLiquidityVenue::Settlement PendingLiquidityVenue::execute(uint64_t key) {
    Request request = take(key);
    I128 haircut = haircut_bps_.load();
    PoolReserves current = reserves();

    Settlement settlement{key, true, 0, 0, 0, CallbackResult::Committed, errors::OK};

    if (request.is_add) {
        I128 value_in = pool_value(request.token_a_amt, request.token_b_amt);
        I128 value_pool = pool_value(current.token_a_amt, current.token_b_amt);
        I128 lp_out = (current.lp_supply == 0 || value_pool == 0)
            ? value_in
            : x18::mul_div(value_in, current.lp_supply, value_pool);
        lp_out = accounting::slippage_floor(lp_out, haircut);

        if (lp_out <= 0 || lp_out < request.min_lp_out) {
            log::logger()->warn("venue: add request {} below min lp out, cancelling", key);
            return refund(key, request);
        }

        {
            std::unique_lock lock(mutex_);
            state_.reserve_a += request.token_a_amt;
            state_.reserve_b += request.token_b_amt;
        }
        ledger_.mint(lp_token_, request.sender, lp_out);
        settlement.lp_out = lp_out;
    } else {
        if (current.lp_supply == 0) {
            return refund(key, request);
        }
        I128 a_out = x18::mul_div(current.token_a_amt, request.lp_amt, current.lp_supply);
        I128 b_out = x18::mul_div(current.token_b_amt, request.lp_amt, current.lp_supply);
        a_out = accounting::slippage_floor(a_out, haircut);
        b_out = accounting::slippage_floor(b_out, haircut);

        if (a_out < request.min_token_a_out || b_out < request.min_token_b_out) {
            log::logger()->warn("venue: remove request {} below min tokens out, cancelling", key);
            return refund(key, request);
        }

        ledger_.burn(lp_token_, address_, request.lp_amt);
        {
            std::unique_lock lock(mutex_);
            state_.reserve_a -= a_out;
            state_.reserve_b -= b_out;
        }
        ledger_.transfer(token_a_, address_, request.sender, a_out);
        ledger_.transfer(token_b_, address_, request.sender, b_out);
        settlement.token_a_out = a_out;
        settlement.token_b_out = b_out;
    }

    notify(settlement, request);
    return settlement;
}

PendingLiquidityVenue::Settlement PendingLiquidityVenue::cancel(uint64_t key) {
    Request request = take(key);
    return refund(key, request);
}

PendingLiquidityVenue::Settlement PendingLiquidityVenue::refund(uint64_t key, const Request& request) {
    if (request.is_add) {
        ledger_.transfer(token_a_, address_, request.sender, request.token_a_amt);
        ledger_.transfer(token_b_, address_, request.sender, request.token_b_amt);
    } else {
        ledger_.transfer(lp_token_, address_, request.sender, request.lp_amt);
    }

    Settlement settlement{key, false, 0, 0, 0, CallbackResult::Cancelled, errors::OK};
    notify(settlement, request);
    return settlement;
}

// The settlement stands even when the receiver's callback fails; the
// receiver is expected to be driven again by its keeper.
void PendingLiquidityVenue::notify(Settlement& settlement, const Request& request) {
    if (request.callback == nullptr) return;

    try {
        if (request.is_add) {
            settlement.callback_result = settlement.executed
                ? request.callback->after_deposit_execution(settlement.key, settlement.lp_out)
                : request.callback->after_deposit_cancellation(settlement.key);
        } else {
            settlement.callback_result = settlement.executed
                ? request.callback->after_withdrawal_execution(settlement.key, settlement.token_a_out,
                                                               settlement.token_b_out)
                : request.callback->after_withdrawal_cancellation(settlement.key);
        }
    } catch (const VaultError& e) {
        log::logger()->warn("venue: callback for request {} failed: {}", settlement.key, e.what());
        settlement.callback_result = CallbackResult::Rejected;
        settlement.callback_error = e.code();
    }
}

// =============================================================================
// ITransactional
// =============================================================================

void PendingLiquidityVenue::checkpoint() {
    std::unique_lock lock(mutex_);
    snapshots_.push(state_);
}

void PendingLiquidityVenue::commit() {
    std::unique_lock lock(mutex_);
    snapshots_.drop();
}

void PendingLiquidityVenue::rollback() {
    std::unique_lock lock(mutex_);
    snapshots_.restore(state_);
}

} // namespace lev
