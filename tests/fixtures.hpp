// Lev - Shared test worlds
//
// Prices: WETH $2000, USDC $1, ARB $1, ezETH $2100. The swap router fills
// at oracle value with no fee unless a test sets one.

#ifndef LEV_TESTS_FIXTURES_HPP
#define LEV_TESTS_FIXTURES_HPP

#include <memory>
#include <string_view>
#include <vector>

#include <lev/environment.hpp>
#include <lev/ledger.hpp>
#include <lev/lending.hpp>
#include <lev/lp/vault.hpp>
#include <lev/lrt/vault.hpp>
#include <lev/oracle.hpp>
#include <lev/swap.hpp>
#include <lev/venue.hpp>

namespace lev::test {

// =============================================================================
// Accounts and Tokens
// =============================================================================

inline const Address OWNER = addresses::from_id(1);
inline const Address KEEPER = addresses::from_id(2);
inline const Address TREASURY = addresses::from_id(3);
inline const Address ALICE = addresses::from_id(10);
inline const Address BOB = addresses::from_id(11);
inline const Address PROVIDER = addresses::from_id(20);
inline const Address LENDER = addresses::from_id(21);

inline const Address VAULT = addresses::from_id(100);
inline const Address ROUTER = addresses::from_id(101);
inline const Address VENUE = addresses::from_id(102);
inline const Address POOL_A = addresses::from_id(103);
inline const Address POOL_B = addresses::from_id(104);

inline const Currency WETH{addresses::from_id(1000)};
inline const Currency USDC{addresses::from_id(1001)};
inline const Currency GM{addresses::from_id(1002)};
inline const Currency ARB{addresses::from_id(1003)};
inline const Currency EZETH{addresses::from_id(1004)};

// "1.5" in a token with `decimals` decimals
inline I128 amount(std::string_view s, uint8_t decimals = 18) {
    return x18::from_string(s) / x18::pow10(18 - decimals);
}

inline I128 eth(std::string_view s) { return amount(s, 18); }
inline I128 usdc(std::string_view s) { return amount(s, 6); }

inline double units(I128 v, uint8_t decimals = 18) {
    return static_cast<double>(v) / static_cast<double>(x18::pow10(decimals));
}

// VaultError code raised by fn, OK when it returns normally
template <typename Fn>
int32_t error_code(Fn&& fn) {
    try {
        fn();
    } catch (const VaultError& e) {
        return e.code();
    }
    return errors::OK;
}

inline VaultConfig quiet_config(Delta delta) {
    VaultConfig config;
    config.delta = delta;
    config.log_level = "off";
    return config;
}

// =============================================================================
// Common market: ledger, oracle, router inventory
// =============================================================================

struct Market {
    Environment env;
    Ledger ledger;
    PriceOracle oracle{env};
    OracleSwapRouter router{ledger, oracle, env, ROUTER, 0};

    Market() {
        ledger.register_wrapped_native(WETH, "WETH");
        ledger.register_token(USDC, "USDC", 6);
        ledger.register_token(GM, "GM", 18);
        ledger.register_token(ARB, "ARB", 18);
        ledger.register_token(EZETH, "ezETH", 18);

        for (const Currency& token : {WETH, USDC, ARB, EZETH}) {
            oracle.register_feed(FeedConfig{token, 8, 86400});
        }
        reprice();

        ledger.mint(WETH, ROUTER, eth("100000"));
        ledger.mint(USDC, ROUTER, usdc("100000000"));
        ledger.mint(ARB, ROUTER, eth("1000000"));
        ledger.mint(EZETH, ROUTER, eth("100000"));
    }

    void set_prices(double weth, double ezeth) {
        oracle.update_price_usd(WETH, weth);
        oracle.update_price_usd(EZETH, ezeth);
    }

    // Stamp every feed at the current time
    void reprice(double weth = 2000.0, double ezeth = 2100.0) {
        set_prices(weth, ezeth);
        oracle.update_price_usd(USDC, 1.0);
        oracle.update_price_usd(ARB, 1.0);
    }

    // Advance the clock and restamp every feed
    void advance(uint64_t seconds) {
        std::vector<I128> prices;
        for (const Currency& token : {WETH, USDC, ARB, EZETH}) {
            prices.push_back(oracle.consult(token).price);
        }
        env.advance(seconds);
        size_t i = 0;
        for (const Currency& token : {WETH, USDC, ARB, EZETH}) {
            oracle.update_price(token, prices[i++]);
        }
    }
};

// Lending pool whose market can stop taking repayments
class FreezableLendingPool : public LendingPool {
public:
    using LendingPool::LendingPool;

    void set_repay_frozen(bool frozen) { repay_frozen_ = frozen; }

    void repay(const Address& borrower, I128 amount) override {
        if (repay_frozen_) {
            throw VaultError(errors::UNAUTHORIZED, "repayments frozen");
        }
        LendingPool::repay(borrower, amount);
    }

private:
    bool repay_frozen_ = false;
};

// =============================================================================
// LP world: WETH/USDC venue, two lending pools, Neutral 3x vault
// =============================================================================

struct LpWorld : Market {
    FreezableLendingPool weth_pool{ledger, WETH, POOL_A};
    FreezableLendingPool usdc_pool{ledger, USDC, POOL_B};
    PendingLiquidityVenue venue{ledger, oracle, WETH, USDC, GM, VENUE};
    std::unique_ptr<lp::Vault> vault;

    explicit LpWorld(VaultConfig config = quiet_config(Delta::Neutral)) {
        ledger.mint(WETH, LENDER, eth("1000"));
        ledger.mint(USDC, LENDER, usdc("2000000"));
        weth_pool.supply(LENDER, eth("1000"));
        usdc_pool.supply(LENDER, usdc("2000000"));
        weth_pool.approve_borrower(VAULT);
        usdc_pool.approve_borrower(VAULT);

        // $1M a side, 2M LP at $1
        ledger.mint(WETH, PROVIDER, eth("500"));
        ledger.mint(USDC, PROVIDER, usdc("1000000"));
        venue.seed(PROVIDER, eth("500"), usdc("1000000"));

        vault = std::make_unique<lp::Vault>(lp::VaultDeps{
            .env = env,
            .ledger = ledger,
            .oracle = oracle,
            .swap_router = router,
            .token_a_lending = weth_pool,
            .token_b_lending = usdc_pool,
            .venue = venue,
            .vault = VAULT,
            .owner = OWNER,
            .treasury = TREASURY,
            .config = config
        });
        vault->set_keeper(OWNER, KEEPER, true);

        ledger.mint(USDC, ALICE, usdc("100000"));
        ledger.mint(USDC, BOB, usdc("100000"));
    }

    uint64_t deposit_usdc(const Address& user, std::string_view amt, I128 slippage = 100) {
        return vault->deposit(user, lp::DepositParams{USDC, usdc(amt), slippage});
    }

    uint64_t withdraw_all(const Address& user, const Currency& token, I128 slippage = 100) {
        return vault->withdraw(user, lp::WithdrawParams{vault->balance_of(user), token, 0, slippage});
    }
};

// =============================================================================
// LRT world: WETH lending pool, ezETH position, Long 3x vault
// =============================================================================

struct LrtWorld : Market {
    LendingPool weth_pool{ledger, WETH, POOL_A};
    std::unique_ptr<lrt::Vault> vault;

    explicit LrtWorld(VaultConfig config = quiet_config(Delta::Long)) {
        ledger.mint(WETH, LENDER, eth("1000"));
        weth_pool.supply(LENDER, eth("1000"));
        weth_pool.approve_borrower(VAULT);

        vault = std::make_unique<lrt::Vault>(lrt::VaultDeps{
            .env = env,
            .ledger = ledger,
            .oracle = oracle,
            .swap_router = router,
            .lending = weth_pool,
            .lrt = EZETH,
            .vault = VAULT,
            .owner = OWNER,
            .treasury = TREASURY,
            .config = config
        });
        vault->set_keeper(OWNER, KEEPER, true);

        ledger.mint(WETH, ALICE, eth("100"));
        ledger.mint(NATIVE, ALICE, eth("100"));
    }
};

// Collects every event a vault publishes
struct EventLog {
    std::vector<VaultEvent> events;

    template <typename V>
    void attach(V& vault) {
        vault.subscribe([this](const VaultEvent& e) { events.push_back(e); });
    }

    bool contains(EventKind kind) const {
        for (const auto& e : events) {
            if (e.kind == kind) return true;
        }
        return false;
    }

    const VaultEvent* last(EventKind kind) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->kind == kind) return &*it;
        }
        return nullptr;
    }
};

} // namespace lev::test

#endif // LEV_TESTS_FIXTURES_HPP
