// =============================================================================
// lp/vault.cpp - LP vault entry points, roles and settlement routing
// =============================================================================

#include "lev/lp/vault.hpp"

#include <mutex>
#include <type_traits>

#include "lev/lending.hpp"
#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lp/checks.hpp"
#include "lev/lp/compound.hpp"
#include "lev/lp/deposit.hpp"
#include "lev/lp/emergency.hpp"
#include "lev/lp/manager.hpp"
#include "lev/lp/reader.hpp"
#include "lev/lp/rebalance.hpp"
#include "lev/lp/withdraw.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Constructor
// =============================================================================

Vault::Vault(const VaultDeps& deps) : owner_(deps.owner) {
    if (int32_t code = checks::validate_config(deps.config); code != errors::OK) {
        throw VaultError(code, "rejected vault config");
    }
    if (deps.token_a_lending.asset() != deps.venue.token_a() ||
        deps.token_b_lending.asset() != deps.venue.token_b()) {
        throw VaultError(errors::INVALID_CONFIG, "lending pools do not match the venue tokens");
    }

    store_.config = deps.config;
    store_.token_a = deps.venue.token_a();
    store_.token_b = deps.venue.token_b();
    store_.lp_token = deps.venue.lp_token();
    store_.wnt = deps.ledger.wrapped_native();

    store_.env = &deps.env;
    store_.ledger = &deps.ledger;
    store_.oracle = &deps.oracle;
    store_.swap_router = &deps.swap_router;
    store_.token_a_lending = &deps.token_a_lending;
    store_.token_b_lending = &deps.token_b_lending;
    store_.venue = &deps.venue;
    store_.callback = this;

    store_.vault = deps.vault;
    store_.treasury = deps.treasury;
    store_.last_fee_collected = deps.env.now();

    // Collaborators with state of their own roll back with the vault
    deps.env.attach(&deps.ledger);
    deps.env.attach(dynamic_cast<ITransactional*>(&deps.token_a_lending));
    deps.env.attach(dynamic_cast<ITransactional*>(&deps.token_b_lending));
    deps.env.attach(dynamic_cast<ITransactional*>(&deps.venue));

    log::set_level(store_.config.log_level);
    log::logger()->info("lp vault {} ready: leverage={} delta={}", addresses::to_hex(store_.vault),
                        x18::to_string(store_.config.leverage), to_string(store_.config.delta));
}

// =============================================================================
// Call Wrapper
// =============================================================================

template <typename Fn>
auto Vault::run(Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    std::vector<VaultEvent> events;

    if constexpr (std::is_void_v<Result>) {
        {
            ReentrancyLock::Guard guard(lock_);
            Transaction<Store> txn(*store_.env, store_);
            fn();
            txn.commit();
            events.swap(store_.events);
        }
        publish(events);
    } else {
        Result result{};
        {
            ReentrancyLock::Guard guard(lock_);
            Transaction<Store> txn(*store_.env, store_);
            result = fn();
            txn.commit();
            events.swap(store_.events);
        }
        publish(events);
        return result;
    }
}

void Vault::publish(const std::vector<VaultEvent>& events) {
    if (events.empty()) return;

    std::vector<EventCallback> subscribers;
    {
        std::shared_lock lock(subscribers_mutex_);
        subscribers = subscribers_;
    }
    for (const auto& event : events) {
        for (const auto& callback : subscribers) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                log::logger()->error("event subscriber failed on {}: {}", to_string(event.kind), e.what());
            }
        }
    }
}

void Vault::subscribe(EventCallback callback) {
    std::unique_lock lock(subscribers_mutex_);
    subscribers_.push_back(std::move(callback));
}

// =============================================================================
// Roles
// =============================================================================

bool Vault::is_keeper(const Address& account) const {
    std::shared_lock lock(keepers_mutex_);
    return keepers_.count(account) > 0;
}

void Vault::only_keeper(const Address& caller) const {
    if (caller != owner_ && !is_keeper(caller)) {
        throw VaultError(errors::UNAUTHORIZED, "keeper only: " + addresses::to_hex(caller));
    }
}

void Vault::only_owner(const Address& caller) const {
    if (caller != owner_) {
        throw VaultError(errors::UNAUTHORIZED, "owner only: " + addresses::to_hex(caller));
    }
}

// =============================================================================
// User Operations
// =============================================================================

uint64_t Vault::deposit(const Address& user, const DepositParams& params) {
    return run([&] { return deposit::deposit(store_, user, params, false); });
}

uint64_t Vault::deposit_native(const Address& user, const DepositParams& params) {
    return run([&] { return deposit::deposit(store_, user, params, true); });
}

uint64_t Vault::withdraw(const Address& user, const WithdrawParams& params) {
    return run([&] { return withdraw::withdraw(store_, user, params); });
}

void Vault::emergency_withdraw(const Address& user, I128 shares_amt) {
    run([&] { emergency::emergency_withdraw(store_, user, shares_amt); });
}

void Vault::mint_fee() {
    run([&] {
        require(checks::before_mint_fee_checks(store_));
        manager::mint_fee(store_);
    });
}

// =============================================================================
// Keeper Operations
// =============================================================================

uint64_t Vault::process_deposit_failure(const Address& caller, I128 slippage) {
    only_keeper(caller);
    return run([&] { return deposit::process_deposit_failure(store_, slippage); });
}

uint64_t Vault::process_withdraw_failure(const Address& caller, I128 slippage) {
    only_keeper(caller);
    return run([&] { return withdraw::process_withdraw_failure(store_, slippage); });
}

uint64_t Vault::rebalance_add(const Address& caller, const RebalanceAddParams& params) {
    only_keeper(caller);
    return run([&] { return rebalance::rebalance_add(store_, params); });
}

uint64_t Vault::rebalance_remove(const Address& caller, const RebalanceRemoveParams& params) {
    only_keeper(caller);
    return run([&] { return rebalance::rebalance_remove(store_, params); });
}

void Vault::rebalance_close(const Address& caller) {
    only_keeper(caller);
    run([&] { rebalance::rebalance_close(store_); });
}

uint64_t Vault::compound(const Address& caller, const CompoundParams& params) {
    only_keeper(caller);
    return run([&] { return compound::compound(store_, params); });
}

void Vault::compound_lp(const Address& caller) {
    only_keeper(caller);
    run([&] { compound::compound_lp(store_); });
}

void Vault::emergency_pause(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_pause(store_); });
}

uint64_t Vault::emergency_repay(const Address& caller) {
    only_keeper(caller);
    return run([&] { return emergency::emergency_repay(store_); });
}

void Vault::emergency_borrow(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_borrow(store_); });
}

uint64_t Vault::emergency_resume(const Address& caller) {
    only_keeper(caller);
    return run([&] { return emergency::emergency_resume(store_); });
}

// =============================================================================
// Owner Operations
// =============================================================================

void Vault::emergency_close(const Address& caller) {
    only_owner(caller);
    run([&] { emergency::emergency_close(store_); });
}

void Vault::emergency_status_change(const Address& caller, Status target) {
    only_owner(caller);
    run([&] { emergency::emergency_status_change(store_, target); });
}

void Vault::update_config(const Address& caller, const VaultConfig& config) {
    only_owner(caller);
    run([&] {
        if (int32_t code = checks::validate_config(config); code != errors::OK) {
            throw VaultError(code, "rejected vault config");
        }
        // Fee accrued so far is charged at the old rate
        manager::mint_fee(store_);
        store_.config = config;
        emit(store_, VaultEvent{.kind = EventKind::ConfigUpdated});
    });
    log::set_level(config.log_level);
    log::logger()->info("config updated: leverage={} delta={}", x18::to_string(config.leverage),
                        to_string(config.delta));
}

void Vault::update_fee_per_second(const Address& caller, I128 fee_per_second) {
    only_owner(caller);
    run([&] {
        if (fee_per_second < 0) {
            throw VaultError(errors::INVALID_CONFIG, "negative fee_per_second");
        }
        manager::mint_fee(store_);
        store_.config.fee_per_second = fee_per_second;
        emit(store_, VaultEvent{.kind = EventKind::ConfigUpdated, .amount = fee_per_second});
    });
}

void Vault::set_keeper(const Address& caller, const Address& keeper, bool approved) {
    only_owner(caller);
    {
        std::unique_lock lock(keepers_mutex_);
        if (approved) {
            keepers_.insert(keeper);
        } else {
            keepers_.erase(keeper);
        }
    }
    log::logger()->info("keeper {} {}", addresses::to_hex(keeper), approved ? "approved" : "revoked");
}

void Vault::set_treasury(const Address& caller, const Address& treasury) {
    only_owner(caller);
    run([&] {
        // Fee accrued so far belongs to the old treasury
        manager::mint_fee(store_);
        store_.treasury = treasury;
    });
}

// =============================================================================
// ILiquidityCallback
// =============================================================================

namespace {

bool matches(uint64_t key, uint64_t expected) {
    return key != 0 && key == expected;
}

}  // namespace

CallbackResult Vault::reject(uint64_t key, const char* notification) {
    emit(store_, VaultEvent{.kind = EventKind::CallbackRejected, .key = key});
    log::logger()->warn("{} key={} rejected in status {}", notification, key, to_string(store_.status));
    return CallbackResult::Rejected;
}

CallbackResult Vault::after_deposit_execution(uint64_t key, I128 lp_received) {
    return run([&] {
        switch (store_.status) {
            case Status::Deposit:
                if (matches(key, store_.deposit_cache.deposit_key)) {
                    return deposit::process_deposit(store_, key, lp_received);
                }
                break;
            case Status::Rebalance_Add:
                if (matches(key, store_.rebalance_cache.deposit_key)) {
                    return rebalance::process_rebalance_add(store_, key, lp_received);
                }
                break;
            case Status::Compound:
                if (matches(key, store_.compound_cache.deposit_key)) {
                    return compound::process_compound(store_, key, lp_received);
                }
                break;
            case Status::Withdraw_Failed:
                if (matches(key, store_.withdraw_cache.deposit_key)) {
                    return withdraw::process_withdraw_failure_liquidity_added(store_, key, lp_received);
                }
                break;
            case Status::Resume:
                if (matches(key, store_.emergency_key)) {
                    return emergency::process_emergency_resume(store_, key, lp_received);
                }
                break;
            default:
                break;
        }
        return reject(key, "deposit execution");
    });
}

CallbackResult Vault::after_deposit_cancellation(uint64_t key) {
    return run([&] {
        switch (store_.status) {
            case Status::Deposit:
                if (matches(key, store_.deposit_cache.deposit_key)) {
                    return deposit::process_deposit_cancellation(store_, key);
                }
                break;
            case Status::Rebalance_Add:
                if (matches(key, store_.rebalance_cache.deposit_key)) {
                    return rebalance::process_rebalance_add_cancellation(store_, key);
                }
                break;
            case Status::Compound:
                if (matches(key, store_.compound_cache.deposit_key)) {
                    return compound::process_compound_cancellation(store_, key);
                }
                break;
            case Status::Withdraw_Failed:
                if (matches(key, store_.withdraw_cache.deposit_key)) {
                    return withdraw::process_withdraw_failure_cancellation(store_, key);
                }
                break;
            case Status::Resume:
                if (matches(key, store_.emergency_key)) {
                    return emergency::process_emergency_resume_cancellation(store_, key);
                }
                break;
            default:
                break;
        }
        return reject(key, "deposit cancellation");
    });
}

CallbackResult Vault::after_withdrawal_execution(uint64_t key, I128 token_a_received,
                                                 I128 token_b_received) {
    return run([&] {
        switch (store_.status) {
            case Status::Withdraw:
                if (matches(key, store_.withdraw_cache.withdraw_key)) {
                    return withdraw::process_withdraw(store_, key, token_a_received, token_b_received);
                }
                break;
            case Status::Rebalance_Remove:
                if (matches(key, store_.rebalance_cache.withdraw_key)) {
                    return rebalance::process_rebalance_remove(store_, key, token_a_received,
                                                               token_b_received);
                }
                break;
            case Status::Deposit_Failed:
                if (matches(key, store_.deposit_cache.withdraw_key)) {
                    return deposit::process_deposit_failure_liquidity_withdrawal(
                        store_, key, token_a_received, token_b_received);
                }
                break;
            case Status::Repay:
                if (matches(key, store_.emergency_key)) {
                    return emergency::process_emergency_repay(store_, key, token_a_received,
                                                              token_b_received);
                }
                break;
            default:
                break;
        }
        return reject(key, "withdrawal execution");
    });
}

CallbackResult Vault::after_withdrawal_cancellation(uint64_t key) {
    return run([&] {
        switch (store_.status) {
            case Status::Withdraw:
                if (matches(key, store_.withdraw_cache.withdraw_key)) {
                    return withdraw::process_withdraw_cancellation(store_, key);
                }
                break;
            case Status::Rebalance_Remove:
                if (matches(key, store_.rebalance_cache.withdraw_key)) {
                    return rebalance::process_rebalance_remove_cancellation(store_, key);
                }
                break;
            case Status::Deposit_Failed:
                if (matches(key, store_.deposit_cache.withdraw_key)) {
                    return deposit::process_deposit_failure_cancellation(store_, key);
                }
                break;
            case Status::Repay:
                if (matches(key, store_.emergency_key)) {
                    return emergency::process_emergency_repay_cancellation(store_, key);
                }
                break;
            default:
                break;
        }
        return reject(key, "withdrawal cancellation");
    });
}

// =============================================================================
// Views
// =============================================================================

HealthParams Vault::health() const { return reader::health(store_); }
I128 Vault::lp_token_value() const { return reader::lp_token_value(store_); }
TokenAmounts Vault::token_weights() const { return reader::token_weights(store_); }
TokenAmounts Vault::asset_amt() const { return reader::asset_amt(store_); }
TokenAmounts Vault::debt_amt() const { return reader::debt_amt(store_); }
I128 Vault::asset_value() const { return reader::asset_value(store_); }
I128 Vault::debt_value() const { return reader::debt_value(store_); }
I128 Vault::equity_value() const { return reader::equity_value(store_); }
I128 Vault::debt_ratio() const { return reader::debt_ratio(store_); }
I128 Vault::leverage() const { return reader::leverage(store_); }
I128 Vault::delta() const { return reader::delta(store_); }
I128 Vault::pending_fee() const { return reader::pending_fee(store_); }
I128 Vault::sv_token_value() const { return reader::sv_token_value(store_); }
I128 Vault::additional_capacity() const { return reader::additional_capacity(store_); }
I128 Vault::capacity() const { return reader::capacity(store_); }

} // namespace lp
} // namespace lev
