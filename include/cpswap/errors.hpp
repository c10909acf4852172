#ifndef CPSWAP_ERRORS_HPP
#define CPSWAP_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpswap {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    ZERO_AMOUNT = -1,
    ZERO_SWAP_AMOUNT = -2,
    RATIO_MISMATCH = -3,
    INSUFFICIENT_INITIAL_LIQUIDITY = -4,
    INSUFFICIENT_SHARES = -5,
    NO_LIQUIDITY = -6,
    INSUFFICIENT_OUTPUT = -7,
    CUSTODY_TRANSFER_FAILED = -8,
    RESERVE_OVERFLOW = -9,
    INVARIANT_VIOLATION = -10,
    INVALID_STATE = -11
};

inline const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::ZERO_AMOUNT: return "ZeroAmount";
        case ErrorCode::ZERO_SWAP_AMOUNT: return "ZeroSwapAmount";
        case ErrorCode::RATIO_MISMATCH: return "RatioMismatch";
        case ErrorCode::INSUFFICIENT_INITIAL_LIQUIDITY: return "InsufficientInitialLiquidity";
        case ErrorCode::INSUFFICIENT_SHARES: return "InsufficientShares";
        case ErrorCode::NO_LIQUIDITY: return "NoLiquidity";
        case ErrorCode::INSUFFICIENT_OUTPUT: return "InsufficientOutput";
        case ErrorCode::CUSTODY_TRANSFER_FAILED: return "CustodyTransferFailed";
        case ErrorCode::RESERVE_OVERFLOW: return "ReserveOverflow";
        case ErrorCode::INVARIANT_VIOLATION: return "InvariantViolation";
        case ErrorCode::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

// Pool operation failure. The pool state is unchanged when this is thrown.
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(error_name(code)) + ": " + msg), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace cpswap

#endif // CPSWAP_ERRORS_HPP
