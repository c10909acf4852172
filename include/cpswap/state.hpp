#ifndef CPSWAP_STATE_HPP
#define CPSWAP_STATE_HPP

#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "pool.hpp"
#include "custody.hpp"

namespace cpswap {
namespace state {

// Format version written by encode_exchange
constexpr int STATE_VERSION = 1;

// U128 values travel as decimal strings, addresses as 0x-prefixed hex.
// Decoders throw PoolError(INVALID_STATE) on malformed input.

nlohmann::json encode_amount(U128 value);
U128 decode_amount(const nlohmann::json& j, const char* field);

nlohmann::json encode_pool(const PoolSnapshot& snapshot);
PoolSnapshot decode_pool(const nlohmann::json& j);

nlohmann::json encode_ledger(const TokenLedger& ledger);

struct LedgerImage {
    std::string symbol;
    U128 custody;
    std::map<Address, U128> balances;
};
LedgerImage decode_ledger(const nlohmann::json& j);

} // namespace state
} // namespace cpswap

#endif // CPSWAP_STATE_HPP
