// =============================================================================
// config.cpp - Host configuration loader
// =============================================================================

#include "cpswap/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpswap {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& line) {
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') quoted = !quoted;
        else if (line[i] == '#' && !quoted) return line.substr(0, i);
    }
    return line;
}

U128 parse_amount(const std::string& key, const std::string& value) {
    auto amount = parse_u128(value);
    if (!amount) {
        throw std::runtime_error("Invalid amount for " + key + ": " + value);
    }
    return *amount;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = unquote(trim(line.substr(0, eq)));
        std::string value = unquote(trim(line.substr(eq + 1)));

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") {
                if (value != "error" && value != "info" && value != "debug") {
                    throw std::runtime_error("Unknown log_level: " + value);
                }
                config.general.log_level = value;
            }
            else if (key == "state_file") config.general.state_file = value;
        }
        else if (current_section == "pool") {
            if (key == "token_a") config.pool.token_a = value;
            else if (key == "token_b") config.pool.token_b = value;
        }
        else if (current_section == "faucet") {
            auto addr = address_from_hex(key);
            if (!addr) {
                throw std::runtime_error("Invalid faucet address: " + key);
            }
            config.faucet[*addr] = parse_amount(key, value);
        }
    }

    if (config.pool.token_a.empty() || config.pool.token_b.empty() ||
        config.pool.token_a == config.pool.token_b) {
        throw std::runtime_error("Pool needs two distinct token symbols");
    }

    return config;
}

}  // namespace cpswap
