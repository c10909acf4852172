// cpswap CLI
//
// Drives a persisted constant-product pool from the command line. Every
// mutating command loads the state file, applies one pool operation and
// writes the state back only when the operation succeeded.

#include <cpswap/config.hpp>
#include <cpswap/errors.hpp>
#include <cpswap/events.hpp>
#include <cpswap/exchange.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace cpswap;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> state_path;
    bool verbose = false;
    std::vector<std::string> command_args;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

//------------------------------------------------------------------------------
// Event printing
//------------------------------------------------------------------------------

class EventPrinter : public IPoolListener {
public:
    void on_liquidity_added(const LiquidityAdded& e) override {
        std::cerr << "[event] LiquidityAdded provider=" << to_hex(e.provider)
                  << " amount_a=" << to_string(e.amount_a)
                  << " amount_b=" << to_string(e.amount_b)
                  << " shares=" << to_string(e.shares_minted) << "\n";
    }

    void on_liquidity_removed(const LiquidityRemoved& e) override {
        std::cerr << "[event] LiquidityRemoved provider=" << to_hex(e.provider)
                  << " shares=" << to_string(e.shares_burned)
                  << " amount_a=" << to_string(e.amount_a)
                  << " amount_b=" << to_string(e.amount_b) << "\n";
    }

    void on_swap(const SwapEvent& e) override {
        std::cerr << "[event] Swap caller=" << to_hex(e.caller)
                  << " direction=" << to_string(e.direction)
                  << " amount_in=" << to_string(e.amount_in)
                  << " amount_out=" << to_string(e.amount_out) << "\n";
    }
};

//------------------------------------------------------------------------------
// Argument helpers
//------------------------------------------------------------------------------

Address arg_address(const std::string& text) {
    auto addr = address_from_hex(text);
    if (!addr) throw UsageError("Invalid address: " + text);
    return *addr;
}

U128 arg_amount(const std::string& text) {
    auto amount = parse_u128(text);
    if (!amount) throw UsageError("Invalid amount: " + text);
    return *amount;
}

Asset arg_asset(const std::string& text) {
    if (text == "a" || text == "A") return Asset::A;
    if (text == "b" || text == "B") return Asset::B;
    throw UsageError("Asset must be 'a' or 'b': " + text);
}

SwapDirection arg_direction(const std::string& text) {
    if (text == "a2b") return SwapDirection::A_TO_B;
    if (text == "b2a") return SwapDirection::B_TO_A;
    throw UsageError("Direction must be 'a2b' or 'b2a': " + text);
}

void require_args(const std::vector<std::string>& args, size_t n, const char* usage) {
    if (args.size() < n) throw UsageError(std::string("Usage: cpswap-cli ") + usage);
}

json reserves_json(const Reserves& r) {
    return json{{"reserve_a", to_string(r.reserve_a)}, {"reserve_b", to_string(r.reserve_b)}};
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int run_command(const Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        throw UsageError("No command specified. Use -h for help.");
    }

    std::string cmd = args[0];
    // Convert to lowercase
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    const std::string& path = config.general.state_file;

    // Stateless
    if (cmd == "quote") {
        require_args(args, 4, "quote <amount_in> <reserve_in> <reserve_out>");
        U128 out = Pool::quote_out(arg_amount(args[1]), arg_amount(args[2]), arg_amount(args[3]));
        std::cout << json{{"amount_out", to_string(out)}}.dump(2) << "\n";
        return 0;
    }

    if (cmd == "init") {
        if (std::filesystem::exists(path)) {
            throw UsageError("State file already exists: " + path);
        }
        Exchange exchange(config.pool.token_a, config.pool.token_b);
        for (const auto& [addr, amount] : config.faucet) {
            if (!exchange.token(Asset::A).mint(addr, amount) ||
                !exchange.token(Asset::B).mint(addr, amount)) {
                throw UsageError("Faucet amount overflows token supply: " + to_hex(addr));
            }
        }
        exchange.save(path);
        std::cout << exchange.to_json().dump(2) << "\n";
        return 0;
    }

    std::unique_ptr<Exchange> exchange = Exchange::load(path);
    Pool& pool = exchange->pool();

    EventPrinter printer;
    if (config.info_enabled()) pool.add_listener(&printer);

    if (config.debug_enabled()) {
        std::cerr << "[debug] before " << reserves_json(pool.get_reserves()).dump() << "\n";
    }

    json result;
    bool mutated = true;

    if (cmd == "mint") {
        require_args(args, 4, "mint <address> <a|b> <amount>");
        Address who = arg_address(args[1]);
        Asset asset = arg_asset(args[2]);
        if (!exchange->token(asset).mint(who, arg_amount(args[3]))) {
            throw UsageError("Mint overflows token supply");
        }
        result = {{"balance", to_string(exchange->token(asset).balance_of(who))}};
    } else if (cmd == "add") {
        require_args(args, 4, "add <address> <amount_a> <amount_b>");
        U128 shares = pool.provide_liquidity(arg_address(args[1]), arg_amount(args[2]),
                                             arg_amount(args[3]));
        result = {{"shares_minted", to_string(shares)}};
    } else if (cmd == "remove") {
        require_args(args, 3, "remove <address> <shares>");
        WithdrawResult out = pool.remove_liquidity(arg_address(args[1]), arg_amount(args[2]));
        result = {{"amount_a", to_string(out.amount_a)}, {"amount_b", to_string(out.amount_b)}};
    } else if (cmd == "swap") {
        require_args(args, 4, "swap <address> <a2b|b2a> <amount_in>");
        SwapResult out = pool.swap(arg_address(args[1]), arg_direction(args[2]),
                                   arg_amount(args[3]));
        result = {{"amount_in", to_string(out.amount_in)}, {"amount_out", to_string(out.amount_out)}};
    } else {
        mutated = false;
        if (cmd == "reserves") {
            result = reserves_json(pool.get_reserves());
        } else if (cmd == "price") {
            result = {{"price", to_string(pool.get_price())},
                      {"price_x18", to_string(pool.get_price_x18())}};
        } else if (cmd == "share") {
            require_args(args, 2, "share <address>");
            Address who = arg_address(args[1]);
            result = {{"shares", to_string(pool.share_of(who))},
                      {"total_shares", to_string(pool.total_shares())}};
        } else if (cmd == "balance") {
            require_args(args, 2, "balance <address>");
            Address who = arg_address(args[1]);
            result = {{exchange->token(Asset::A).symbol(), to_string(exchange->token(Asset::A).balance_of(who))},
                      {exchange->token(Asset::B).symbol(), to_string(exchange->token(Asset::B).balance_of(who))}};
        } else if (cmd == "stats") {
            Pool::Stats stats = pool.get_stats();
            result = {{"total_swaps", stats.total_swaps},
                      {"total_liquidity_ops", stats.total_liquidity_ops},
                      {"volume_a_in", to_string(stats.volume_a_in)},
                      {"volume_b_in", to_string(stats.volume_b_in)},
                      {"providers", stats.providers}};
        } else {
            throw UsageError("Unknown command: " + cmd);
        }
    }

    pool.remove_listener(&printer);

    if (config.debug_enabled()) {
        std::cerr << "[debug] after " << reserves_json(pool.get_reserves()).dump() << "\n";
    }

    if (mutated) exchange->save(path);
    std::cout << result.dump(2) << "\n";
    return 0;
}

void print_usage(const char* prog) {
    std::cout << "cpswap constant-product pool CLI\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  TOML configuration file\n"
              << "  -s, --state <file>   State file (overrides [general] state_file)\n"
              << "  -v, --verbose        Print pool events and reserves (log_level = debug)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  init                                  Create state, mint faucet balances\n"
              << "  mint <address> <a|b> <amount>\n"
              << "  add <address> <amount_a> <amount_b>\n"
              << "  remove <address> <shares>\n"
              << "  swap <address> <a2b|b2a> <amount_in>\n"
              << "  quote <amount_in> <reserve_in> <reserve_out>\n"
              << "  reserves | price | stats\n"
              << "  share <address>\n"
              << "  balance <address>\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) throw UsageError("Missing config file argument");
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--state") {
            if (i + 1 >= argc) throw UsageError("Missing state file argument");
            options.state_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            throw UsageError("Unknown option: " + arg);
        }
        ++i;
    }

    return options;
}

int main(int argc, char* argv[]) {
    try {
        Options options = parse_args(argc, argv);

        Config config = options.config_path ? Config::from_file(*options.config_path) : Config{};
        if (options.state_path) config.with_state_file(*options.state_path);
        if (options.verbose) config.with_log_level("debug");

        return run_command(config, options.command_args);
    } catch (const PoolError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
