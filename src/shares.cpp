// =============================================================================
// shares.cpp - Vault share token
// =============================================================================

#include "lev/shares.hpp"

namespace lev {

I128 ShareToken::balance_of(const Address& holder) const {
    auto it = balances_.find(holder);
    return it != balances_.end() ? it->second : 0;
}

void ShareToken::mint(const Address& to, I128 amount) {
    if (amount <= 0) return;
    balances_[to] += amount;
    total_supply_ += amount;
}

void ShareToken::burn(const Address& from, I128 amount) {
    if (amount <= 0) return;
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        throw VaultError(errors::INSUFFICIENT_SHARES_BALANCE, addresses::to_hex(from));
    }
    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    total_supply_ -= amount;
}

} // namespace lev
