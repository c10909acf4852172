#ifndef CPSWAP_TYPES_HPP
#define CPSWAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace cpswap {

// =============================================================================
// Account Address (EVM-style 20-byte address)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// Helper to create an address whose last two bytes hold `id`
constexpr Address make_address(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// "0x" + 40 lowercase hex digits
inline std::string to_hex(const Address& a) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : a) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

inline std::optional<Address> address_from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = nibble(text[2 * i]);
        int lo = nibble(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// Integer Amounts
// =============================================================================

using U128 = unsigned __int128;

// Reserves and amounts are bounded to 112 bits so that every product of two
// of them, and amount_in * 997 * reserve_out, fits in 256 bits.
constexpr U128 MAX_RESERVE = (U128(1) << 112) - 1;

constexpr U128 X18_ONE = 1000000000000000000ULL;  // 1e18

// Decimal rendering of a U128
inline std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return std::string(out.rbegin(), out.rend());
}

// Parse a decimal U128; rejects empty input, non-digits and overflow
inline std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;
    constexpr U128 U128_MAX = ~U128(0);
    U128 v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 d = static_cast<U128>(c - '0');
        if (v > (U128_MAX - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}

// =============================================================================
// Fee Parameters (0.3%, fixed)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_NUMERATOR = 997;     // amount_in retained after fee
constexpr uint32_t FEE_DENOMINATOR = 1000;
}

// =============================================================================
// Pool Assets
// =============================================================================

enum class Asset : uint8_t {
    A = 0,
    B = 1
};

enum class SwapDirection : uint8_t {
    A_TO_B = 0,
    B_TO_A = 1
};

inline Asset input_asset(SwapDirection dir) {
    return dir == SwapDirection::A_TO_B ? Asset::A : Asset::B;
}

inline Asset output_asset(SwapDirection dir) {
    return dir == SwapDirection::A_TO_B ? Asset::B : Asset::A;
}

inline const char* to_string(SwapDirection dir) {
    return dir == SwapDirection::A_TO_B ? "a2b" : "b2a";
}

inline const char* to_string(Asset asset) {
    return asset == Asset::A ? "a" : "b";
}

// =============================================================================
// Reserve Pair
// =============================================================================

struct Reserves {
    U128 reserve_a;
    U128 reserve_b;

    bool operator==(const Reserves& other) const {
        return reserve_a == other.reserve_a && reserve_b == other.reserve_b;
    }
    bool operator!=(const Reserves& other) const { return !(*this == other); }
};

} // namespace cpswap

#endif // CPSWAP_TYPES_HPP
