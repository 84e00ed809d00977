#ifndef LEV_TYPES_HPP
#define LEV_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>

namespace lev {

// =============================================================================
// Addresses (EVM-style 20-byte account identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Build a deterministic address from a small numeric label
constexpr Address from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

inline uint64_t hash(const Address& addr) {
    uint64_t h = 0;
    for (auto b : addr) h = h * 31 + b;
    return h;
}

std::string to_hex(const Address& addr);

} // namespace addresses

// Maps are keyed by the full address; the hash only picks the bucket
struct AddressHash {
    size_t operator()(const Address& addr) const { return static_cast<size_t>(addresses::hash(addr)); }
};

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;   // 1e18
constexpr I128 SAFE_MULTIPLIER = X18_ONE;
constexpr I128 BPS_DENOMINATOR = 10000;

namespace x18 {

inline I128 mul(I128 a, I128 b) {
    return (a * b) / X18_ONE;
}

inline I128 div(I128 a, I128 b) {
    return (a * X18_ONE) / b;
}

// a * b / denominator with a 256-bit intermediate product.
// Truncates toward zero. Throws VaultError(DIVIDE_BY_ZERO) when
// denominator is 0 and VaultError(ARITHMETIC_OVERFLOW) when the quotient
// does not fit in 127 bits.
I128 mul_div(I128 a, I128 b, I128 denominator);

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

// 10^exp for exp in [0, 38]
I128 pow10(uint8_t exp);

// Parse "1234.5678" into an X18 value (extra fractional digits truncate).
// Throws std::invalid_argument on malformed input.
I128 from_string(std::string_view s);

// Render an X18 value as a decimal string with trailing zeros trimmed
std::string to_string(I128 v);

// Plain integer rendering of a 128-bit value
std::string to_int_string(I128 v);

inline I128 abs(I128 v) { return v < 0 ? -v : v; }

inline I128 min(I128 a, I128 b) { return a < b ? a : b; }

inline I128 max(I128 a, I128 b) { return a > b ? a : b; }

// a - b clamped at zero
inline I128 sub_floor(I128 a, I128 b) { return a < b ? 0 : a - b; }

} // namespace x18

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return addresses::is_zero(addr); }

    uint64_t hash() const { return addresses::hash(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const { return static_cast<size_t>(c.hash()); }
};

// Native asset (address(0))
inline const Currency NATIVE{};

// =============================================================================
// Vault Lifecycle
// =============================================================================

enum class Status : uint8_t {
    Open = 0,
    Deposit = 1,
    Deposit_Failed = 2,
    Withdraw = 3,
    Withdraw_Failed = 4,
    Rebalance_Add = 5,
    Rebalance_Remove = 6,
    Rebalance_Open = 7,
    Compound = 8,
    Paused = 9,
    Repay = 10,
    Repaid = 11,
    Resume = 12,
    Closed = 13
};

const char* to_string(Status status);

// Delta strategy of the vault
enum class Delta : uint8_t {
    Neutral = 0,
    Long = 1,
    Short = 2
};

const char* to_string(Delta delta);
Delta delta_from_string(std::string_view s);

enum class RebalanceType : uint8_t {
    Delta = 0,
    Debt = 1
};

// Outcome of a venue settlement continuation
enum class CallbackResult : uint8_t {
    Committed = 0,   // Settlement accepted, operation finished
    Failed = 1,      // Post-checks failed, vault moved to a *_Failed / *_Open status
    Cancelled = 2,   // Request reversed
    Rejected = 3,    // Status or key did not match, nothing changed
    Pending = 4      // Accepted, a further settlement is still awaited
};

const char* to_string(CallbackResult result);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Access & lifecycle
constexpr int32_t NOT_ALLOWED_IN_CURRENT_VAULT_STATUS = -1;
constexpr int32_t REENTRANCY = -2;
constexpr int32_t UNAUTHORIZED = -3;
constexpr int32_t INVALID_CONFIG = -4;

// Deposit
constexpr int32_t EMPTY_DEPOSIT_AMOUNT = -10;
constexpr int32_t INVALID_DEPOSIT_TOKEN = -11;
constexpr int32_t INSUFFICIENT_DEPOSIT_VALUE = -12;
constexpr int32_t EXCESSIVE_DEPOSIT_VALUE = -13;
constexpr int32_t INSUFFICIENT_CAPACITY = -14;
constexpr int32_t INSUFFICIENT_SLIPPAGE_AMOUNT = -15;
constexpr int32_t INVALID_NATIVE_DEPOSIT = -16;

// Withdraw
constexpr int32_t EMPTY_WITHDRAW_AMOUNT = -20;
constexpr int32_t INVALID_WITHDRAW_TOKEN = -21;
constexpr int32_t INSUFFICIENT_WITHDRAW_VALUE = -22;
constexpr int32_t EXCESSIVE_WITHDRAW_VALUE = -23;
constexpr int32_t INSUFFICIENT_SHARES_BALANCE = -24;

// Post-conditions
constexpr int32_t POSITION_NOT_INCREASED = -30;
constexpr int32_t POSITION_NOT_DECREASED = -31;
constexpr int32_t EQUITY_NOT_DECREASED = -32;
constexpr int32_t DEBT_RATIO_STEP_EXCEEDED = -33;
constexpr int32_t INSUFFICIENT_SHARES_MINTED = -34;
constexpr int32_t INSUFFICIENT_ASSETS_RECEIVED = -35;

// Rebalance
constexpr int32_t INVALID_REBALANCE_PRECONDITIONS = -40;
constexpr int32_t INVALID_REBALANCE_DEBT_RATIO = -41;
constexpr int32_t INVALID_REBALANCE_DELTA = -42;
constexpr int32_t INVALID_REBALANCE_PARAMETERS = -43;

// Compound / emergency
constexpr int32_t EMPTY_COMPOUND_AMOUNT = -50;
constexpr int32_t INVALID_COMPOUND_TOKEN = -51;
constexpr int32_t NOTHING_TO_SYNC = -52;
constexpr int32_t EMPTY_SHARES_AMOUNT = -53;
constexpr int32_t INVALID_STATUS_TARGET = -54;

// External collaborators
constexpr int32_t NO_PRICE_FEED = -60;
constexpr int32_t STALE_PRICE_FEED = -61;
constexpr int32_t BROKEN_PRICE_FEED = -62;
constexpr int32_t SWAP_SLIPPAGE_EXCEEDED = -63;
constexpr int32_t EXCESSIVE_SWAP_INPUT = -64;
constexpr int32_t DEADLINE_EXPIRED = -65;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -66;
constexpr int32_t INSUFFICIENT_LENDING_LIQUIDITY = -67;
constexpr int32_t REPAY_EXCEEDS_DEBT = -68;
constexpr int32_t INSUFFICIENT_BALANCE = -69;
constexpr int32_t UNKNOWN_TOKEN = -70;
constexpr int32_t NATIVE_TRANSFER_REJECTED = -71;
constexpr int32_t UNKNOWN_REQUEST = -72;
constexpr int32_t INSUFFICIENT_LP_OUTPUT = -73;
constexpr int32_t INSUFFICIENT_TOKENS_OUTPUT = -74;
constexpr int32_t INSUFFICIENT_REPAY_AMOUNT = -75;

// Arithmetic
constexpr int32_t DIVIDE_BY_ZERO = -80;
constexpr int32_t ARITHMETIC_UNDERFLOW = -81;
constexpr int32_t ARITHMETIC_OVERFLOW = -82;

const char* to_string(int32_t code);
} // namespace errors

// Hard failure: aborts the enclosing call
class VaultError : public std::runtime_error {
public:
    explicit VaultError(int32_t code);
    VaultError(int32_t code, const std::string& detail);

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// Throw VaultError when code is not OK
inline void require(int32_t code) {
    if (code != errors::OK) throw VaultError(code);
}

} // namespace lev

#endif // LEV_TYPES_HPP
