// =============================================================================
// oracle.cpp - USD price feeds
// =============================================================================

#include "lev/oracle.hpp"

#include <cmath>
#include <mutex>

#include "lev/environment.hpp"

namespace lev {

I128 IOracle::consult_in_18_decimals(const Currency& token) const {
    PriceAnswer answer = consult(token);
    if (answer.decimals > 18) {
        return answer.price / x18::pow10(answer.decimals - 18);
    }
    return answer.price * x18::pow10(18 - answer.decimals);
}

// =============================================================================
// PriceOracle
// =============================================================================

PriceOracle::PriceOracle(const Environment& env) : env_(env) {}

void PriceOracle::register_feed(const FeedConfig& config) {
    std::unique_lock lock(mutex_);
    Feed feed;
    feed.config = config;
    feed.price = 0;
    feed.updated_at = 0;
    feeds_[config.token] = feed;
}

bool PriceOracle::has_feed(const Currency& token) const {
    std::shared_lock lock(mutex_);
    return feeds_.find(token) != feeds_.end();
}

void PriceOracle::update_price(const Currency& token, I128 price, uint64_t timestamp) {
    if (timestamp == 0) {
        timestamp = env_.now();
    }

    std::unique_lock lock(mutex_);
    auto it = feeds_.find(token);
    if (it == feeds_.end()) {
        throw VaultError(errors::NO_PRICE_FEED, addresses::to_hex(token.addr));
    }
    it->second.price = price;
    it->second.updated_at = timestamp;
}

void PriceOracle::update_price_usd(const Currency& token, double usd, uint64_t timestamp) {
    uint8_t decimals;
    {
        std::shared_lock lock(mutex_);
        auto it = feeds_.find(token);
        if (it == feeds_.end()) {
            throw VaultError(errors::NO_PRICE_FEED, addresses::to_hex(token.addr));
        }
        decimals = it->second.config.decimals;
    }
    double scaled = std::round(usd * std::pow(10.0, decimals));
    update_price(token, static_cast<I128>(scaled), timestamp);
}

PriceAnswer PriceOracle::consult(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = feeds_.find(token);
    if (it == feeds_.end()) {
        throw VaultError(errors::NO_PRICE_FEED, addresses::to_hex(token.addr));
    }

    const Feed& feed = it->second;
    if (feed.price <= 0) {
        throw VaultError(errors::BROKEN_PRICE_FEED, addresses::to_hex(token.addr));
    }

    uint64_t now = env_.now();
    if (now > feed.updated_at && now - feed.updated_at > feed.config.heartbeat) {
        throw VaultError(errors::STALE_PRICE_FEED, addresses::to_hex(token.addr));
    }

    return PriceAnswer{feed.price, feed.config.decimals};
}

uint64_t PriceOracle::price_age(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = feeds_.find(token);
    if (it == feeds_.end()) return 0;
    uint64_t now = env_.now();
    return now > it->second.updated_at ? now - it->second.updated_at : 0;
}

} // namespace lev
