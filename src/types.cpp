// =============================================================================
// types.cpp - Fixed-point helpers, enum names, error codes
// =============================================================================

#include "lev/types.hpp"

#include <algorithm>

namespace lev {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Restoring long division of a 256-bit numerator by a 128-bit divisor.
// Returns false when the quotient needs more than 127 bits.
bool div_u256_u128(const U256& num, U128 denom, U128& quotient) {
    if (num.hi == 0) {
        quotient = num.lo / denom;
        return (quotient >> 127) == 0;
    }
    if (num.hi >= denom) {
        return false;  // Quotient >= 2^128
    }

    U128 rem = 0;
    U128 quot = 0;
    for (int i = 255; i >= 0; --i) {
        U128 bit = (i >= 128) ? ((num.hi >> (i - 128)) & 1) : ((num.lo >> i) & 1);
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | bit;
        if (carry || rem >= denom) {
            rem -= denom;
            if (i >= 128) return false;
            quot |= (U128(1) << i);
        }
    }
    quotient = quot;
    return (quotient >> 127) == 0;
}

inline U128 magnitude(I128 v) {
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

std::string addresses::to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[(b >> 4) & 0xF]);
        out.push_back(digits[b & 0xF]);
    }
    return out;
}

// =============================================================================
// X18 helpers
// =============================================================================

I128 x18::mul_div(I128 a, I128 b, I128 denominator) {
    if (denominator == 0) {
        throw VaultError(errors::DIVIDE_BY_ZERO, "mul_div");
    }
    if (a == 0 || b == 0) return 0;

    bool neg = (a < 0) ^ (b < 0) ^ (denominator < 0);
    U256 product = mul_u128(magnitude(a), magnitude(b));

    U128 result = 0;
    if (!div_u256_u128(product, magnitude(denominator), result)) {
        throw VaultError(errors::ARITHMETIC_OVERFLOW, "mul_div");
    }
    return neg ? -static_cast<I128>(result) : static_cast<I128>(result);
}

I128 x18::pow10(uint8_t exp) {
    if (exp > 38) {
        throw VaultError(errors::ARITHMETIC_OVERFLOW, "pow10");
    }
    I128 v = 1;
    for (uint8_t i = 0; i < exp; ++i) v *= 10;
    return v;
}

I128 x18::from_string(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty decimal string");
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = (dot == std::string_view::npos) ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("malformed decimal string");
    }

    I128 int_val = 0;
    for (char c : int_part) {
        if (c < '0' || c > '9') throw std::invalid_argument("malformed decimal string");
        int_val = int_val * 10 + (c - '0');
    }

    // Pad or truncate to 18 digits
    I128 frac_val = 0;
    int digits = 0;
    for (char c : frac_part) {
        if (c < '0' || c > '9') throw std::invalid_argument("malformed decimal string");
        if (digits < 18) {
            frac_val = frac_val * 10 + (c - '0');
            ++digits;
        }
    }
    for (; digits < 18; ++digits) frac_val *= 10;

    I128 result = int_val * X18_ONE + frac_val;
    return negative ? -result : result;
}

std::string x18::to_int_string(I128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    U128 u = magnitude(v);
    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string x18::to_string(I128 v) {
    bool negative = v < 0;
    U128 u = magnitude(v);
    U128 one = static_cast<U128>(X18_ONE);

    std::string result = negative ? "-" : "";
    result += to_int_string(static_cast<I128>(u / one));

    std::string frac = to_int_string(static_cast<I128>(u % one));
    frac.insert(0, 18 - frac.size(), '0');
    size_t last = frac.find_last_not_of('0');
    if (last != std::string::npos) {
        result += "." + frac.substr(0, last + 1);
    }
    return result;
}

// =============================================================================
// Enum names
// =============================================================================

const char* to_string(Status status) {
    switch (status) {
        case Status::Open: return "Open";
        case Status::Deposit: return "Deposit";
        case Status::Deposit_Failed: return "Deposit_Failed";
        case Status::Withdraw: return "Withdraw";
        case Status::Withdraw_Failed: return "Withdraw_Failed";
        case Status::Rebalance_Add: return "Rebalance_Add";
        case Status::Rebalance_Remove: return "Rebalance_Remove";
        case Status::Rebalance_Open: return "Rebalance_Open";
        case Status::Compound: return "Compound";
        case Status::Paused: return "Paused";
        case Status::Repay: return "Repay";
        case Status::Repaid: return "Repaid";
        case Status::Resume: return "Resume";
        case Status::Closed: return "Closed";
    }
    return "Unknown";
}

const char* to_string(Delta delta) {
    switch (delta) {
        case Delta::Neutral: return "neutral";
        case Delta::Long: return "long";
        case Delta::Short: return "short";
    }
    return "unknown";
}

Delta delta_from_string(std::string_view s) {
    if (s == "neutral" || s == "Neutral") return Delta::Neutral;
    if (s == "long" || s == "Long") return Delta::Long;
    if (s == "short" || s == "Short") return Delta::Short;
    throw std::invalid_argument("unknown delta strategy: " + std::string(s));
}

const char* to_string(CallbackResult result) {
    switch (result) {
        case CallbackResult::Committed: return "Committed";
        case CallbackResult::Failed: return "Failed";
        case CallbackResult::Cancelled: return "Cancelled";
        case CallbackResult::Rejected: return "Rejected";
        case CallbackResult::Pending: return "Pending";
    }
    return "Unknown";
}

// =============================================================================
// Errors
// =============================================================================

const char* errors::to_string(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case NOT_ALLOWED_IN_CURRENT_VAULT_STATUS: return "NotAllowedInCurrentVaultStatus";
        case REENTRANCY: return "Reentrancy";
        case UNAUTHORIZED: return "Unauthorized";
        case INVALID_CONFIG: return "InvalidConfig";
        case EMPTY_DEPOSIT_AMOUNT: return "EmptyDepositAmount";
        case INVALID_DEPOSIT_TOKEN: return "InvalidDepositToken";
        case INSUFFICIENT_DEPOSIT_VALUE: return "InsufficientDepositValue";
        case EXCESSIVE_DEPOSIT_VALUE: return "ExcessiveDepositValue";
        case INSUFFICIENT_CAPACITY: return "InsufficientCapacity";
        case INSUFFICIENT_SLIPPAGE_AMOUNT: return "InsufficientSlippageAmount";
        case INVALID_NATIVE_DEPOSIT: return "InvalidNativeDeposit";
        case EMPTY_WITHDRAW_AMOUNT: return "EmptyWithdrawAmount";
        case INVALID_WITHDRAW_TOKEN: return "InvalidWithdrawToken";
        case INSUFFICIENT_WITHDRAW_VALUE: return "InsufficientWithdrawValue";
        case EXCESSIVE_WITHDRAW_VALUE: return "ExcessiveWithdrawValue";
        case INSUFFICIENT_SHARES_BALANCE: return "InsufficientSharesBalance";
        case POSITION_NOT_INCREASED: return "PositionNotIncreased";
        case POSITION_NOT_DECREASED: return "PositionNotDecreased";
        case EQUITY_NOT_DECREASED: return "EquityNotDecreased";
        case DEBT_RATIO_STEP_EXCEEDED: return "DebtRatioStepExceeded";
        case INSUFFICIENT_SHARES_MINTED: return "InsufficientSharesMinted";
        case INSUFFICIENT_ASSETS_RECEIVED: return "InsufficientAssetsReceived";
        case INVALID_REBALANCE_PRECONDITIONS: return "InvalidRebalancePreConditions";
        case INVALID_REBALANCE_DEBT_RATIO: return "InvalidRebalanceDebtRatio";
        case INVALID_REBALANCE_DELTA: return "InvalidRebalanceDelta";
        case INVALID_REBALANCE_PARAMETERS: return "InvalidRebalanceParameters";
        case EMPTY_COMPOUND_AMOUNT: return "EmptyCompoundAmount";
        case INVALID_COMPOUND_TOKEN: return "InvalidCompoundToken";
        case NOTHING_TO_SYNC: return "NothingToSync";
        case EMPTY_SHARES_AMOUNT: return "EmptySharesAmount";
        case INVALID_STATUS_TARGET: return "InvalidStatusTarget";
        case NO_PRICE_FEED: return "NoPriceFeed";
        case STALE_PRICE_FEED: return "StaleFeed";
        case BROKEN_PRICE_FEED: return "BrokenFeed";
        case SWAP_SLIPPAGE_EXCEEDED: return "SwapSlippageExceeded";
        case EXCESSIVE_SWAP_INPUT: return "ExcessiveSwapInput";
        case DEADLINE_EXPIRED: return "DeadlineExpired";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case INSUFFICIENT_LENDING_LIQUIDITY: return "InsufficientLendingLiquidity";
        case REPAY_EXCEEDS_DEBT: return "RepayExceedsDebt";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case UNKNOWN_TOKEN: return "UnknownToken";
        case NATIVE_TRANSFER_REJECTED: return "NativeTransferRejected";
        case UNKNOWN_REQUEST: return "UnknownRequest";
        case INSUFFICIENT_LP_OUTPUT: return "InsufficientLpOutput";
        case INSUFFICIENT_TOKENS_OUTPUT: return "InsufficientTokensOutput";
        case INSUFFICIENT_REPAY_AMOUNT: return "InsufficientRepayAmount";
        case DIVIDE_BY_ZERO: return "DivideByZero";
        case ARITHMETIC_UNDERFLOW: return "ArithmeticUnderflow";
        case ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        default: return "UnknownError";
    }
}

VaultError::VaultError(int32_t code)
    : std::runtime_error(errors::to_string(code)), code_(code) {}

VaultError::VaultError(int32_t code, const std::string& detail)
    : std::runtime_error(std::string(errors::to_string(code)) + ": " + detail), code_(code) {}

} // namespace lev
