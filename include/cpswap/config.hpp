#ifndef CPSWAP_CONFIG_HPP
#define CPSWAP_CONFIG_HPP

// Host configuration (builder pattern for fluent configuration)

#include <map>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cpswap {

// General host settings
struct GeneralConfig {
    std::string log_level = "info";   // "error" | "info" | "debug"
    std::string state_file = "cpswap-state.json";
};

// Pooled token symbols
struct PoolConfig {
    std::string token_a = "TKA";
    std::string token_b = "TKB";
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    PoolConfig pool;

    // Genesis balances minted by `init`: address -> amount of each token
    std::map<Address, U128> faucet;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& with_tokens(std::string_view a, std::string_view b) {
        pool.token_a = std::string(a);
        pool.token_b = std::string(b);
        return *this;
    }

    Config& with_state_file(std::string_view path) {
        general.state_file = std::string(path);
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_faucet(const Address& who, U128 amount) {
        faucet[who] = amount;
        return *this;
    }

    [[nodiscard]] bool info_enabled() const {
        return general.log_level == "info" || general.log_level == "debug";
    }
    [[nodiscard]] bool debug_enabled() const { return general.log_level == "debug"; }
};

} // namespace cpswap

#endif // CPSWAP_CONFIG_HPP
