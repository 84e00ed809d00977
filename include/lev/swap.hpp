#ifndef LEV_SWAP_HPP
#define LEV_SWAP_HPP

#include <atomic>

#include "types.hpp"

namespace lev {

class Environment;
class IOracle;
class Ledger;

// =============================================================================
// Swap Parameters
// =============================================================================

// Exact-in: amount_in is spent, amount_out is the minimum accepted output.
// Exact-out: amount_out is bought, amount_in is the maximum accepted input.
struct SwapParams {
    Currency token_in;
    Currency token_out;
    I128 amount_in;
    I128 amount_out;
    uint64_t deadline;
    Address sender;          // Pays token_in and receives token_out
};

// =============================================================================
// Swap Gateway Interface
// =============================================================================

// Only the input actually consumed is pulled from the sender.
class ISwapRouter {
public:
    virtual ~ISwapRouter() = default;

    // Returns amount out. Throws SWAP_SLIPPAGE_EXCEEDED, DEADLINE_EXPIRED,
    // INSUFFICIENT_LIQUIDITY
    virtual I128 swap_exact_in(const SwapParams& params) = 0;

    // Returns amount in. Throws EXCESSIVE_SWAP_INPUT, DEADLINE_EXPIRED,
    // INSUFFICIENT_LIQUIDITY
    virtual I128 swap_exact_out(const SwapParams& params) = 0;
};

// =============================================================================
// OracleSwapRouter - fills at oracle value less a fee, from its own inventory
// =============================================================================

class OracleSwapRouter : public ISwapRouter {
public:
    OracleSwapRouter(Ledger& ledger, const IOracle& oracle, const Environment& env,
                     const Address& address, I128 fee_bps);

    // Non-copyable
    OracleSwapRouter(const OracleSwapRouter&) = delete;
    OracleSwapRouter& operator=(const OracleSwapRouter&) = delete;

    I128 swap_exact_in(const SwapParams& params) override;
    I128 swap_exact_out(const SwapParams& params) override;

    const Address& address() const { return address_; }

    // Extra execution cost on top of the fee, to model price impact
    void set_price_impact_bps(int64_t impact_bps) { impact_bps_.store(impact_bps); }
    I128 fee_bps() const { return fee_bps_; }

    struct Stats {
        uint64_t total_swaps;
    };
    Stats get_stats() const;

private:
    Ledger& ledger_;
    const IOracle& oracle_;
    const Environment& env_;
    Address address_;
    I128 fee_bps_;
    std::atomic<int64_t> impact_bps_{0};
    std::atomic<uint64_t> total_swaps_{0};

    void check_deadline(uint64_t deadline) const;
    I128 cost_bps() const;
};

} // namespace lev

#endif // LEV_SWAP_HPP
