// =============================================================================
// lrt/vault.cpp - LRT vault entry points and roles
// =============================================================================

#include "lev/lrt/vault.hpp"

#include <mutex>
#include <type_traits>

#include "lev/lending.hpp"
#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/compound.hpp"
#include "lev/lrt/deposit.hpp"
#include "lev/lrt/emergency.hpp"
#include "lev/lrt/manager.hpp"
#include "lev/lrt/reader.hpp"
#include "lev/lrt/rebalance.hpp"
#include "lev/lrt/withdraw.hpp"

namespace lev {
namespace lrt {

Vault::Vault(const VaultDeps& deps) : owner_(deps.owner) {
    if (int32_t code = checks::validate_config(deps.config); code != errors::OK) {
        throw VaultError(code, "rejected vault config");
    }
    if (!deps.ledger.is_registered(deps.lrt)) {
        throw VaultError(errors::UNKNOWN_TOKEN, "lrt not registered");
    }

    store_.config = deps.config;
    store_.base = deps.lending.asset();
    store_.lrt = deps.lrt;
    auto wnt = deps.ledger.wrapped_native();
    store_.base_is_wnt = wnt && *wnt == store_.base;

    store_.env = &deps.env;
    store_.ledger = &deps.ledger;
    store_.oracle = &deps.oracle;
    store_.swap_router = &deps.swap_router;
    store_.lending = &deps.lending;

    store_.vault = deps.vault;
    store_.treasury = deps.treasury;
    store_.last_fee_collected = deps.env.now();

    deps.env.attach(&deps.ledger);
    deps.env.attach(dynamic_cast<ITransactional*>(&deps.lending));

    log::set_level(store_.config.log_level);
    log::logger()->info("lrt vault {} ready: leverage={}", addresses::to_hex(store_.vault),
                        x18::to_string(store_.config.leverage));
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
// Operations
// =============================================================================

I128 Vault::deposit(const Address& user, const DepositParams& params) {
    return run([&] { return deposit::deposit(store_, user, params, false); });
}

I128 Vault::deposit_native(const Address& user, const DepositParams& params) {
    return run([&] { return deposit::deposit(store_, user, params, true); });
}

I128 Vault::withdraw(const Address& user, const WithdrawParams& params) {
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

Status Vault::rebalance_add(const Address& caller, const RebalanceAddParams& params) {
    only_keeper(caller);
    return run([&] { return rebalance::rebalance_add(store_, params); });
}

Status Vault::rebalance_remove(const Address& caller, const RebalanceRemoveParams& params) {
    only_keeper(caller);
    return run([&] { return rebalance::rebalance_remove(store_, params); });
}

void Vault::rebalance_close(const Address& caller) {
    only_keeper(caller);
    run([&] { rebalance::rebalance_close(store_); });
}

I128 Vault::compound(const Address& caller, const CompoundParams& params) {
    only_keeper(caller);
    return run([&] { return compound::compound(store_, params); });
}

void Vault::compound_lrt(const Address& caller) {
    only_keeper(caller);
    run([&] { compound::compound_lrt(store_); });
}

void Vault::emergency_pause(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_pause(store_); });
}

void Vault::emergency_repay(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_repay(store_); });
}

void Vault::emergency_borrow(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_borrow(store_); });
}

void Vault::emergency_resume(const Address& caller) {
    only_keeper(caller);
    run([&] { emergency::emergency_resume(store_); });
}

void Vault::emergency_close(const Address& caller) {
    only_owner(caller);
    run([&] { emergency::emergency_close(store_); });
}

void Vault::emergency_status_change(const Address& caller, Status target) {
    only_owner(caller);
    run([&] { emergency::emergency_status_change(store_, target); });
}

// =============================================================================
// Administration
// =============================================================================

void Vault::update_config(const Address& caller, const VaultConfig& config) {
    only_owner(caller);
    run([&] {
        if (int32_t code = checks::validate_config(config); code != errors::OK) {
            throw VaultError(code, "rejected vault config");
        }
        manager::mint_fee(store_);
        store_.config = config;
        emit(store_, VaultEvent{.kind = EventKind::ConfigUpdated});
    });
    log::set_level(config.log_level);
    log::logger()->info("config updated: leverage={}", x18::to_string(config.leverage));
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
        manager::mint_fee(store_);
        store_.treasury = treasury;
    });
}

// =============================================================================
// Views
// =============================================================================

HealthParams Vault::health() const { return reader::health(store_); }
I128 Vault::lrt_value() const { return reader::lrt_value(store_); }
I128 Vault::asset_value() const { return reader::asset_value(store_); }
I128 Vault::debt_amt() const { return reader::debt_amt(store_); }
I128 Vault::debt_value() const { return reader::debt_value(store_); }
I128 Vault::equity_value() const { return reader::equity_value(store_); }
I128 Vault::debt_ratio() const { return reader::debt_ratio(store_); }
I128 Vault::leverage() const { return reader::leverage(store_); }
I128 Vault::delta() const { return reader::delta(store_); }
I128 Vault::pending_fee() const { return reader::pending_fee(store_); }
I128 Vault::sv_token_value() const { return reader::sv_token_value(store_); }
I128 Vault::additional_capacity() const { return reader::additional_capacity(store_); }
I128 Vault::capacity() const { return reader::capacity(store_); }

} // namespace lrt
} // namespace lev
