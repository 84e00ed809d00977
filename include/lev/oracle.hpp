#ifndef LEV_ORACLE_HPP
#define LEV_ORACLE_HPP

#include <shared_mutex>
#include <unordered_map>

#include "types.hpp"

namespace lev {

class Environment;

// =============================================================================
// Price Answer
// =============================================================================

struct PriceAnswer {
    I128 price;        // Scaled by 10^decimals
    uint8_t decimals;
};

// =============================================================================
// Oracle Interface
// =============================================================================

// USD price source for every token the vault accounts in.
// Implementations throw VaultError(NO_PRICE_FEED | STALE_PRICE_FEED |
// BROKEN_PRICE_FEED); callers propagate.
class IOracle {
public:
    virtual ~IOracle() = default;

    virtual PriceAnswer consult(const Currency& token) const = 0;

    // Price scaled to 18 decimals
    virtual I128 consult_in_18_decimals(const Currency& token) const;
};

// =============================================================================
// Feed Configuration
// =============================================================================

struct FeedConfig {
    Currency token;
    uint8_t decimals;         // Decimals of the feed answer
    uint64_t heartbeat;       // Maximum age in seconds
};

// =============================================================================
// PriceOracle - in-process feed store with staleness guard
// =============================================================================

class PriceOracle : public IOracle {
public:
    explicit PriceOracle(const Environment& env);

    // Non-copyable
    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    void register_feed(const FeedConfig& config);
    bool has_feed(const Currency& token) const;

    // timestamp == 0 stamps the current environment time
    void update_price(const Currency& token, I128 price, uint64_t timestamp = 0);

    // Price from a USD double, scaled to the feed's decimals
    void update_price_usd(const Currency& token, double usd, uint64_t timestamp = 0);

    PriceAnswer consult(const Currency& token) const override;

    uint64_t price_age(const Currency& token) const;

private:
    struct Feed {
        FeedConfig config;
        I128 price;
        uint64_t updated_at;
    };

    const Environment& env_;
    std::unordered_map<Currency, Feed, CurrencyHash> feeds_;
    mutable std::shared_mutex mutex_;
};

} // namespace lev

#endif // LEV_ORACLE_HPP
