#ifndef LEV_SHARES_HPP
#define LEV_SHARES_HPP

#include <unordered_map>

#include "types.hpp"

namespace lev {

// =============================================================================
// ShareToken - the vault's own fungible claim on equity
// =============================================================================

// Plain value type: it lives inside the vault store and is restored with
// it when a call aborts.
class ShareToken {
public:
    I128 total_supply() const { return total_supply_; }
    I128 balance_of(const Address& holder) const;

    void mint(const Address& to, I128 amount);

    // Throws INSUFFICIENT_SHARES_BALANCE
    void burn(const Address& from, I128 amount);

    size_t holders() const { return balances_.size(); }

private:
    std::unordered_map<Address, I128, AddressHash> balances_;  // holder -> shares
    I128 total_supply_ = 0;
};

} // namespace lev

#endif // LEV_SHARES_HPP
