// Lev vault simulator
//
// Runs an LP vault (WETH/USDC over a pending-settlement venue) or an LRT
// vault (WETH into ezETH) in-process, driven from the command line or an
// interactive prompt. Venue requests stay pending until `execute` or `cancel`.

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <lev/config.hpp>
#include <lev/environment.hpp>
#include <lev/ledger.hpp>
#include <lev/lending.hpp>
#include <lev/log.hpp>
#include <lev/lp/vault.hpp>
#include <lev/lrt/vault.hpp>
#include <lev/oracle.hpp>
#include <lev/swap.hpp>
#include <lev/venue.hpp>

using namespace lev;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string variant = "lp";
    std::string log_level;
    bool interactive = true;
    std::vector<std::string> command_args;
};

namespace {

const Address OWNER = addresses::from_id(1);
const Address USER = addresses::from_id(10);
const Address TREASURY = addresses::from_id(3);
const Address PROVIDER = addresses::from_id(20);
const Address LENDER = addresses::from_id(21);
const Address VAULT = addresses::from_id(100);
const Address ROUTER = addresses::from_id(101);
const Address VENUE = addresses::from_id(102);
const Address POOL_A = addresses::from_id(103);
const Address POOL_B = addresses::from_id(104);

const Currency WETH{addresses::from_id(1000)};
const Currency USDC{addresses::from_id(1001)};
const Currency GM{addresses::from_id(1002)};
const Currency EZETH{addresses::from_id(1004)};

I128 parse_amount(const std::string& s, uint8_t decimals) {
    return x18::from_string(s) / x18::pow10(18 - decimals);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

//------------------------------------------------------------------------------
// Market shared by both variants
//------------------------------------------------------------------------------

class Market {
public:
    Market() {
        ledger_.register_wrapped_native(WETH, "WETH");
        ledger_.register_token(USDC, "USDC", 6);
        ledger_.register_token(GM, "GM", 18);
        ledger_.register_token(EZETH, "ezETH", 18);

        for (const Currency& token : {WETH, USDC, EZETH}) {
            oracle_.register_feed(FeedConfig{token, 8, 86400});
        }
        oracle_.update_price_usd(WETH, 2000.0);
        oracle_.update_price_usd(USDC, 1.0);
        oracle_.update_price_usd(EZETH, 2100.0);

        ledger_.mint(WETH, ROUTER, parse_amount("100000", 18));
        ledger_.mint(USDC, ROUTER, parse_amount("100000000", 6));
        ledger_.mint(EZETH, ROUTER, parse_amount("100000", 18));

        ledger_.mint(USDC, USER, parse_amount("100000", 6));
        ledger_.mint(WETH, USER, parse_amount("100", 18));
        ledger_.mint(NATIVE, USER, parse_amount("100", 18));
    }

    virtual ~Market() = default;

    void set_price(const std::string& symbol, double price) {
        oracle_.update_price_usd(token(symbol), price);
    }

    // Advance the clock, keeping feeds fresh
    void advance(uint64_t seconds) {
        std::vector<std::pair<Currency, I128>> prices;
        for (const Currency& t : {WETH, USDC, EZETH}) {
            prices.emplace_back(t, oracle_.consult(t).price);
        }
        env_.advance(seconds);
        for (const auto& [t, price] : prices) {
            oracle_.update_price(t, price);
        }
    }

    Currency token(const std::string& symbol) const {
        if (symbol == "WETH") return WETH;
        if (symbol == "USDC") return USDC;
        if (symbol == "GM") return GM;
        if (symbol == "ezETH") return EZETH;
        throw VaultError(errors::UNKNOWN_TOKEN, symbol);
    }

    uint8_t decimals(const Currency& t) const { return ledger_.decimals(t); }

    void print_balances() const {
        std::cout << "user  native=" << x18::to_string(ledger_.balance_of(NATIVE, USER))
                  << " WETH=" << x18::to_string(ledger_.balance_of(WETH, USER))
                  << " USDC=" << x18::to_int_string(ledger_.balance_of(USDC, USER)) << "\n";
    }

    virtual void status() const = 0;
    virtual bool dispatch(const std::vector<std::string>& parts) = 0;

protected:
    Environment env_;
    Ledger ledger_;
    PriceOracle oracle_{env_};
    OracleSwapRouter router_{ledger_, oracle_, env_, ROUTER, 10};
};

//------------------------------------------------------------------------------
// LP variant
//------------------------------------------------------------------------------

class LpSim : public Market {
public:
    explicit LpSim(const VaultConfig& config) {
        ledger_.mint(WETH, LENDER, parse_amount("1000", 18));
        ledger_.mint(USDC, LENDER, parse_amount("2000000", 6));
        weth_pool_.supply(LENDER, parse_amount("1000", 18));
        usdc_pool_.supply(LENDER, parse_amount("2000000", 6));
        weth_pool_.approve_borrower(VAULT);
        usdc_pool_.approve_borrower(VAULT);

        ledger_.mint(WETH, PROVIDER, parse_amount("500", 18));
        ledger_.mint(USDC, PROVIDER, parse_amount("1000000", 6));
        venue_.seed(PROVIDER, parse_amount("500", 18), parse_amount("1000000", 6));

        vault_ = std::make_unique<lp::Vault>(lp::VaultDeps{
            .env = env_,
            .ledger = ledger_,
            .oracle = oracle_,
            .swap_router = router_,
            .token_a_lending = weth_pool_,
            .token_b_lending = usdc_pool_,
            .venue = venue_,
            .vault = VAULT,
            .owner = OWNER,
            .treasury = TREASURY,
            .config = config
        });
        vault_->subscribe([](const VaultEvent& e) {
            std::cout << "  event " << to_string(e.kind);
            if (e.key != 0) std::cout << " key=" << e.key;
            if (e.code != errors::OK) std::cout << " code=" << errors::to_string(e.code);
            std::cout << "\n";
        });
    }

    void status() const override {
        const lp::Vault& v = *vault_;
        std::cout << "status=" << to_string(v.status())
                  << " lp=" << x18::to_string(v.lp_amt())
                  << " shares=" << x18::to_string(v.total_supply())
                  << " pending=" << venue_.pending_count() << "\n";
        if (v.lp_amt() > 0) {
            std::cout << "equity=" << x18::to_string(v.equity_value())
                      << " debt_ratio=" << x18::to_string(v.debt_ratio())
                      << " delta=" << x18::to_string(v.delta())
                      << " leverage=" << x18::to_string(v.leverage()) << "\n";
        }
        print_balances();
    }

    bool dispatch(const std::vector<std::string>& parts) override {
        const std::string& cmd = parts[0];
        if (cmd == "deposit" && parts.size() >= 3) {
            Currency t = token(parts[1]);
            I128 slippage = parts.size() >= 4 ? std::stoll(parts[3]) : 100;
            uint64_t key = vault_->deposit(USER, lp::DepositParams{t, parse_amount(parts[2], decimals(t)), slippage});
            std::cout << "deposit pending key=" << key << "\n";
        } else if (cmd == "withdraw" && parts.size() >= 3) {
            Currency t = token(parts[1]);
            I128 shares = parts[2] == "all" ? vault_->balance_of(USER) : x18::from_string(parts[2]);
            uint64_t key = vault_->withdraw(USER, lp::WithdrawParams{shares, t, 0, 100});
            std::cout << "withdraw pending key=" << key << "\n";
        } else if (cmd == "execute" && parts.size() >= 2) {
            auto s = venue_.execute(std::stoull(parts[1]));
            std::cout << (s.executed ? "executed" : "cancelled") << " key=" << s.key
                      << " callback=" << to_string(s.callback_result) << "\n";
        } else if (cmd == "cancel" && parts.size() >= 2) {
            auto s = venue_.cancel(std::stoull(parts[1]));
            std::cout << "cancelled key=" << s.key << " callback=" << to_string(s.callback_result) << "\n";
        } else if (cmd == "pause") {
            vault_->emergency_pause(OWNER);
        } else if (cmd == "repay") {
            std::cout << "repay key=" << vault_->emergency_repay(OWNER) << "\n";
        } else if (cmd == "resume") {
            std::cout << "resume key=" << vault_->emergency_resume(OWNER) << "\n";
        } else if (cmd == "retry") {
            if (vault_->status() == Status::Deposit_Failed) {
                std::cout << "unwind key=" << vault_->process_deposit_failure(OWNER, 100) << "\n";
            } else {
                std::cout << "re-add key=" << vault_->process_withdraw_failure(OWNER, 100) << "\n";
            }
        } else if (cmd == "config") {
            std::cout << vault_->config().to_json().dump(2) << "\n";
        } else {
            return false;
        }
        return true;
    }

private:
    LendingPool weth_pool_{ledger_, WETH, POOL_A};
    LendingPool usdc_pool_{ledger_, USDC, POOL_B};
    PendingLiquidityVenue venue_{ledger_, oracle_, WETH, USDC, GM, VENUE};
    std::unique_ptr<lp::Vault> vault_;
};

//------------------------------------------------------------------------------
// LRT variant
//------------------------------------------------------------------------------

class LrtSim : public Market {
public:
    explicit LrtSim(const VaultConfig& config) {
        ledger_.mint(WETH, LENDER, parse_amount("1000", 18));
        weth_pool_.supply(LENDER, parse_amount("1000", 18));
        weth_pool_.approve_borrower(VAULT);

        vault_ = std::make_unique<lrt::Vault>(lrt::VaultDeps{
            .env = env_,
            .ledger = ledger_,
            .oracle = oracle_,
            .swap_router = router_,
            .lending = weth_pool_,
            .lrt = EZETH,
            .vault = VAULT,
            .owner = OWNER,
            .treasury = TREASURY,
            .config = config
        });
    }

    void status() const override {
        const lrt::Vault& v = *vault_;
        std::cout << "status=" << to_string(v.status())
                  << " lrt=" << x18::to_string(v.lrt_amt())
                  << " debt=" << x18::to_string(v.debt_amt())
                  << " shares=" << x18::to_string(v.total_supply()) << "\n";
        if (v.lrt_amt() > 0) {
            std::cout << "equity=" << x18::to_string(v.equity_value())
                      << " debt_ratio=" << x18::to_string(v.debt_ratio())
                      << " leverage=" << x18::to_string(v.leverage()) << "\n";
        }
        print_balances();
    }

    bool dispatch(const std::vector<std::string>& parts) override {
        const std::string& cmd = parts[0];
        if (cmd == "deposit" && parts.size() >= 3) {
            I128 shares = 0;
            if (parts[1] == "ETH") {
                shares = vault_->deposit_native(USER, lrt::DepositParams{NATIVE, parse_amount(parts[2], 18), 100});
            } else {
                Currency t = token(parts[1]);
                shares = vault_->deposit(USER, lrt::DepositParams{t, parse_amount(parts[2], decimals(t)), 100});
            }
            std::cout << "minted shares=" << x18::to_string(shares) << "\n";
        } else if (cmd == "withdraw" && parts.size() >= 2) {
            I128 shares = parts[1] == "all" ? vault_->balance_of(USER) : x18::from_string(parts[1]);
            I128 paid = vault_->withdraw(USER, lrt::WithdrawParams{shares, WETH, 0, 100});
            std::cout << "paid WETH=" << x18::to_string(paid) << "\n";
        } else if (cmd == "rebalance" && parts.size() >= 3) {
            Status s = parts[1] == "add"
                ? vault_->rebalance_add(OWNER, lrt::RebalanceAddParams{RebalanceType::Debt,
                                                                       x18::from_string(parts[2]), 100})
                : vault_->rebalance_remove(OWNER, lrt::RebalanceRemoveParams{RebalanceType::Debt,
                                                                             x18::from_string(parts[2]), 100});
            std::cout << "rebalance -> " << to_string(s) << "\n";
        } else if (cmd == "pause") {
            vault_->emergency_pause(OWNER);
        } else if (cmd == "repay") {
            vault_->emergency_repay(OWNER);
        } else if (cmd == "config") {
            std::cout << vault_->config().to_json().dump(2) << "\n";
        } else {
            return false;
        }
        return true;
    }

private:
    LendingPool weth_pool_{ledger_, WETH, POOL_A};
    std::unique_ptr<lrt::Vault> vault_;
};

//------------------------------------------------------------------------------
// Command loop
//------------------------------------------------------------------------------

void print_help() {
    std::cout << "Commands:\n"
              << "  deposit <token> <amount> [slippage_bps]\n"
              << "  withdraw <token> <shares|all>      (lp)\n"
              << "  withdraw <shares|all>              (lrt)\n"
              << "  execute <key> | cancel <key>       (lp venue)\n"
              << "  rebalance add|remove <amount>      (lrt)\n"
              << "  price <token> <usd>\n"
              << "  advance <seconds>\n"
              << "  pause | repay | resume | retry\n"
              << "  status | config | help | quit\n";
}

bool run_line(Market& sim, const std::vector<std::string>& parts) {
    std::string cmd = parts[0];
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (cmd == "help") {
        print_help();
    } else if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "status") {
        sim.status();
    } else if (cmd == "price" && parts.size() >= 3) {
        sim.set_price(parts[1], std::stod(parts[2]));
    } else if (cmd == "advance" && parts.size() >= 2) {
        sim.advance(std::stoull(parts[1]));
    } else {
        std::vector<std::string> normalized = parts;
        normalized[0] = cmd;
        if (!sim.dispatch(normalized)) {
            std::cout << "Unknown command: " << parts[0] << ". Type 'help' for commands.\n";
        }
    }
    return true;
}

// VaultError and bad numbers are reported, the session goes on
bool run_guarded(Market& sim, const std::vector<std::string>& parts) {
    try {
        return run_line(sim, parts);
    } catch (const VaultError& e) {
        std::cout << "error: " << errors::to_string(e.code()) << " (" << e.what() << ")\n";
    } catch (const std::invalid_argument& e) {
        std::cout << "invalid argument: " << e.what() << "\n";
    } catch (const std::out_of_range& e) {
        std::cout << "out of range: " << e.what() << "\n";
    }
    return true;
}

void run_interactive(Market& sim) {
    std::cout << "lev-sim - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        auto parts = split(trim(line));
        if (!parts.empty() && !run_guarded(sim, parts)) {
            break;
        }
        std::cout << "> ";
    }
}

void print_usage(const char* prog) {
    std::cout << "Lev vault simulator\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Vault config JSON\n"
              << "  -V, --variant <lp|lrt> Vault variant (default: lp)\n"
              << "  -l, --log <level>    Log level override\n"
              << "  -h, --help           Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << "                             # Interactive LP vault\n"
              << "  " << prog << " -V lrt deposit ETH 1\n"
              << "  " << prog << " -c vault.json status\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if ((arg == "-V" || arg == "--variant") && i + 1 < argc) {
            options.variant = argv[++i];
        } else if ((arg == "-l" || arg == "--log") && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if (arg[0] != '-') {
            options.interactive = false;
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
        ++i;
    }

    return options;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    VaultConfig config;
    try {
        if (!options.config_path.empty()) {
            config = VaultConfig::from_file(options.config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }

    std::unique_ptr<Market> sim;
    try {
        if (options.variant == "lrt") {
            if (options.config_path.empty()) config.delta = Delta::Long;
            sim = std::make_unique<LrtSim>(config);
        } else if (options.variant == "lp") {
            sim = std::make_unique<LpSim>(config);
        } else {
            std::cerr << "Unknown variant: " << options.variant << "\n";
            return 1;
        }
    } catch (const VaultError& e) {
        log::logger()->critical("vault setup failed: {}", e.what());
        return 1;
    }

    if (options.interactive) {
        run_interactive(*sim);
    } else {
        run_guarded(*sim, options.command_args);
        sim->status();
    }

    return 0;
}
