// =============================================================================
// ledger.cpp - Multi-token custody book
// =============================================================================

#include "lev/ledger.hpp"

#include <mutex>

namespace lev {

Ledger::Ledger() {
    tokens_[NATIVE] = TokenInfo{NATIVE, "NATIVE", 18, Currency{}, false};
}

// =============================================================================
// Token Registry
// =============================================================================

void Ledger::register_token(const Currency& token, const std::string& symbol, uint8_t decimals) {
    if (token.is_native()) {
        throw VaultError(errors::INVALID_CONFIG, "native asset is implicit");
    }
    if (decimals > 18) {
        throw VaultError(errors::INVALID_CONFIG, "token decimals above 18: " + symbol);
    }
    std::unique_lock lock(mutex_);
    tokens_[token] = TokenInfo{token, symbol, decimals, Currency{}, false};
}

void Ledger::register_wrapped_native(const Currency& token, const std::string& symbol) {
    if (token.is_native()) {
        throw VaultError(errors::INVALID_CONFIG, "native asset is implicit");
    }
    std::unique_lock lock(mutex_);
    tokens_[token] = TokenInfo{token, symbol, 18, NATIVE, true};
    wrapped_native_ = token;
}

bool Ledger::is_registered(const Currency& token) const {
    std::shared_lock lock(mutex_);
    return tokens_.find(token) != tokens_.end();
}

const TokenInfo& Ledger::info(const Currency& token) const {
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        throw VaultError(errors::UNKNOWN_TOKEN, addresses::to_hex(token.addr));
    }
    return it->second;
}

void Ledger::require_known(const Currency& token) const {
    info(token);
}

uint8_t Ledger::decimals(const Currency& token) const {
    std::shared_lock lock(mutex_);
    return info(token).decimals;
}

std::string Ledger::symbol(const Currency& token) const {
    std::shared_lock lock(mutex_);
    return info(token).symbol;
}

std::optional<Currency> Ledger::wrapped_native() const {
    std::shared_lock lock(mutex_);
    return wrapped_native_;
}

// =============================================================================
// Balances
// =============================================================================

I128 Ledger::balance_of(const Currency& token, const Address& holder) const {
    std::shared_lock lock(mutex_);
    auto it = state_.balances.find(token);
    if (it == state_.balances.end()) return 0;
    auto hit = it->second.find(holder);
    return hit != it->second.end() ? hit->second : 0;
}

I128 Ledger::total_supply(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = state_.supplies.find(token);
    return it != state_.supplies.end() ? it->second : 0;
}

void Ledger::transfer(const Currency& token, const Address& from, const Address& to, I128 amount) {
    if (amount < 0) {
        throw VaultError(errors::INSUFFICIENT_BALANCE, "negative transfer");
    }
    if (amount == 0 || from == to) return;

    std::unique_lock lock(mutex_);
    require_known(token);

    auto& book = state_.balances[token];
    I128& from_balance = book[from];
    if (from_balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE,
            info(token).symbol + " held by " + addresses::to_hex(from));
    }
    from_balance -= amount;
    book[to] += amount;
}

void Ledger::mint(const Currency& token, const Address& to, I128 amount) {
    if (amount <= 0) return;
    std::unique_lock lock(mutex_);
    require_known(token);
    state_.balances[token][to] += amount;
    state_.supplies[token] += amount;
}

void Ledger::burn(const Currency& token, const Address& from, I128 amount) {
    if (amount <= 0) return;
    std::unique_lock lock(mutex_);
    require_known(token);
    I128& balance = state_.balances[token][from];
    if (balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE,
            "burn " + info(token).symbol + " from " + addresses::to_hex(from));
    }
    balance -= amount;
    state_.supplies[token] -= amount;
}

void Ledger::wrap(const Address& holder, I128 amount) {
    auto wnt = wrapped_native();
    if (!wnt) {
        throw VaultError(errors::UNKNOWN_TOKEN, "no wrapped native token registered");
    }
    burn(NATIVE, holder, amount);
    mint(*wnt, holder, amount);
}

void Ledger::unwrap(const Address& holder, I128 amount) {
    auto wnt = wrapped_native();
    if (!wnt) {
        throw VaultError(errors::UNKNOWN_TOKEN, "no wrapped native token registered");
    }
    burn(*wnt, holder, amount);
    mint(NATIVE, holder, amount);
}

void Ledger::set_rejects_native(const Address& holder, bool rejects) {
    std::unique_lock lock(mutex_);
    if (rejects) {
        rejects_native_.insert(holder);
    } else {
        rejects_native_.erase(holder);
    }
}

bool Ledger::rejects_native(const Address& holder) const {
    std::shared_lock lock(mutex_);
    return rejects_native_.count(holder) > 0;
}

bool Ledger::try_send_native(const Address& from, const Address& to, I128 amount) {
    if (rejects_native(to)) return false;
    transfer(NATIVE, from, to, amount);
    return true;
}

// =============================================================================
// ITransactional
// =============================================================================

void Ledger::checkpoint() {
    std::unique_lock lock(mutex_);
    snapshots_.push(state_);
}

void Ledger::commit() {
    std::unique_lock lock(mutex_);
    snapshots_.drop();
}

void Ledger::rollback() {
    std::unique_lock lock(mutex_);
    snapshots_.restore(state_);
}

} // namespace lev
