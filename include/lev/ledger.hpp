#ifndef LEV_LEDGER_HPP
#define LEV_LEDGER_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "environment.hpp"
#include "types.hpp"

namespace lev {

// =============================================================================
// Token Metadata
// =============================================================================

struct TokenInfo {
    Currency token;
    std::string symbol;
    uint8_t decimals;
    Currency wraps;          // For a wrapped-native token: NATIVE, else unused
    bool is_wrapped_native;
};

// =============================================================================
// Ledger - multi-token custody book
// =============================================================================

class Ledger : public ITransactional {
public:
    Ledger();
    ~Ledger() override = default;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // =========================================================================
    // Token Registry
    // =========================================================================

    void register_token(const Currency& token, const std::string& symbol, uint8_t decimals);
    void register_wrapped_native(const Currency& token, const std::string& symbol);

    bool is_registered(const Currency& token) const;
    uint8_t decimals(const Currency& token) const;       // Throws UNKNOWN_TOKEN
    std::string symbol(const Currency& token) const;
    std::optional<Currency> wrapped_native() const;

    // =========================================================================
    // Balances
    // =========================================================================

    I128 balance_of(const Currency& token, const Address& holder) const;
    I128 total_supply(const Currency& token) const;

    // Throws INSUFFICIENT_BALANCE
    void transfer(const Currency& token, const Address& from, const Address& to, I128 amount);

    void mint(const Currency& token, const Address& to, I128 amount);
    void burn(const Currency& token, const Address& from, I128 amount);

    // Native <-> wrapped native, 1:1
    void wrap(const Address& holder, I128 amount);
    void unwrap(const Address& holder, I128 amount);

    // Model a recipient that refuses plain native transfers
    void set_rejects_native(const Address& holder, bool rejects);
    bool rejects_native(const Address& holder) const;

    // Native transfer honouring set_rejects_native; returns false instead of
    // moving funds when the recipient refuses
    bool try_send_native(const Address& from, const Address& to, I128 amount);

    // =========================================================================
    // ITransactional
    // =========================================================================

    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    struct State {
        // currency -> holder -> balance
        std::unordered_map<Currency, std::unordered_map<Address, I128, AddressHash>, CurrencyHash> balances;
        std::unordered_map<Currency, I128, CurrencyHash> supplies;
    };

    std::unordered_map<Currency, TokenInfo, CurrencyHash> tokens_;
    std::unordered_set<Address, AddressHash> rejects_native_;
    std::optional<Currency> wrapped_native_;

    State state_;
    SnapshotStack<State> snapshots_;
    mutable std::shared_mutex mutex_;

    const TokenInfo& info(const Currency& token) const;
    void require_known(const Currency& token) const;
};

} // namespace lev

#endif // LEV_LEDGER_HPP
