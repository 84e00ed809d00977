#ifndef LEV_VENUE_HPP
#define LEV_VENUE_HPP

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>

#include "environment.hpp"
#include "types.hpp"

namespace lev {

class IOracle;
class Ledger;

// =============================================================================
// Settlement Callback
// =============================================================================

// Out-of-band settlement notifications. The receiver correlates them by key
// and answers Rejected for anything it is not waiting for.
class ILiquidityCallback {
public:
    virtual ~ILiquidityCallback() = default;

    virtual CallbackResult after_deposit_execution(uint64_t key, I128 lp_received) = 0;
    virtual CallbackResult after_deposit_cancellation(uint64_t key) = 0;
    virtual CallbackResult after_withdrawal_execution(uint64_t key, I128 token_a_received,
                                                      I128 token_b_received) = 0;
    virtual CallbackResult after_withdrawal_cancellation(uint64_t key) = 0;
};

// =============================================================================
// Request Parameters
// =============================================================================

struct AddLiquidityParams {
    Address sender;                  // Pays the tokens, receives the LP
    I128 token_a_amt;
    I128 token_b_amt;
    I128 min_lp_out;
    ILiquidityCallback* callback = nullptr;
};

struct RemoveLiquidityParams {
    Address sender;                  // Pays the LP, receives the tokens
    I128 lp_amt;
    I128 min_token_a_out;
    I128 min_token_b_out;
    ILiquidityCallback* callback = nullptr;
};

struct PoolReserves {
    I128 token_a_amt;
    I128 token_b_amt;
    I128 lp_supply;
};

// =============================================================================
// Liquidity Venue Interface
// =============================================================================

// Two-token pool whose add/remove requests settle asynchronously.
// Request keys start at 1; 0 means "no request".
class ILiquidityVenue {
public:
    virtual ~ILiquidityVenue() = default;

    virtual Currency token_a() const = 0;
    virtual Currency token_b() const = 0;
    virtual Currency lp_token() const = 0;

    virtual PoolReserves reserves() const = 0;

    // Escrows the tokens and returns the request key
    virtual uint64_t request_add_liquidity(const AddLiquidityParams& params) = 0;

    // Escrows the LP and returns the request key
    virtual uint64_t request_remove_liquidity(const RemoveLiquidityParams& params) = 0;
};

// =============================================================================
// PendingLiquidityVenue - escrowing venue settled by an external driver
// =============================================================================

class PendingLiquidityVenue : public ILiquidityVenue, public ITransactional {
public:
    PendingLiquidityVenue(Ledger& ledger, const IOracle& oracle,
                          const Currency& token_a, const Currency& token_b,
                          const Currency& lp_token, const Address& address);
    ~PendingLiquidityVenue() override = default;

    // Non-copyable
    PendingLiquidityVenue(const PendingLiquidityVenue&) = delete;
    PendingLiquidityVenue& operator=(const PendingLiquidityVenue&) = delete;

    // =========================================================================
    // ILiquidityVenue
    // =========================================================================

    Currency token_a() const override { return token_a_; }
    Currency token_b() const override { return token_b_; }
    Currency lp_token() const override { return lp_token_; }

    PoolReserves reserves() const override;

    uint64_t request_add_liquidity(const AddLiquidityParams& params) override;
    uint64_t request_remove_liquidity(const RemoveLiquidityParams& params) override;

    // =========================================================================
    // Settlement
    // =========================================================================

    struct Settlement {
        uint64_t key;
        bool executed;               // false when cancelled
        I128 lp_out;
        I128 token_a_out;
        I128 token_b_out;
        CallbackResult callback_result;
        int32_t callback_error;      // VaultError code raised by the callback
    };

    // Initial liquidity; LP minted at 1 LP per USD of value
    void seed(const Address& provider, I128 token_a_amt, I128 token_b_amt);

    // Settle a request at current reserves. A request whose output would be
    // below its minimum is cancelled instead. Throws UNKNOWN_REQUEST
    Settlement execute(uint64_t key);

    // Return the escrow to the sender. Throws UNKNOWN_REQUEST
    Settlement cancel(uint64_t key);

    bool is_pending(uint64_t key) const;
    size_t pending_count() const;

    // Fraction of every settlement output withheld, to model adverse execution
    void set_haircut_bps(int64_t haircut_bps) { haircut_bps_.store(haircut_bps); }

    const Address& address() const { return address_; }

    // =========================================================================
    // ITransactional
    // =========================================================================

    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    struct Request {
        bool is_add;
        Address sender;
        I128 token_a_amt;
        I128 token_b_amt;
        I128 lp_amt;
        I128 min_lp_out;
        I128 min_token_a_out;
        I128 min_token_b_out;
        ILiquidityCallback* callback;
    };

    struct State {
        I128 reserve_a = 0;
        I128 reserve_b = 0;
        uint64_t next_key = 1;
        std::map<uint64_t, Request> pending;
    };

    Ledger& ledger_;
    const IOracle& oracle_;
    Currency token_a_;
    Currency token_b_;
    Currency lp_token_;
    Address address_;
    std::atomic<int64_t> haircut_bps_{0};

    State state_;
    SnapshotStack<State> snapshots_;
    mutable std::shared_mutex mutex_;

    Request take(uint64_t key);
    I128 pool_value(I128 reserve_a, I128 reserve_b) const;
    Settlement refund(uint64_t key, const Request& request);
    void notify(Settlement& settlement, const Request& request);
};

} // namespace lev

#endif // LEV_VENUE_HPP
