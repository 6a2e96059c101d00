#ifndef LEVER_TYPES_HPP
#define LEVER_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <limits>

namespace lever {

// =============================================================================
// Addresses (EVM-style 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Build an address whose low 8 bytes carry `id` (big-endian)
constexpr Address make(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

inline std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 PRECISION = X18_ONE;
constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

constexpr I128 BIPS_DENOMINATOR = 10000;
constexpr I128 PERCENT_DENOMINATOR = 100;

namespace x18 {

namespace detail {

struct U256 {
    U128 hi;
    U128 lo;
};

// Full 128x128 -> 256 bit product
inline U256 mul_wide(U128 a, U128 b) {
    const U128 mask = static_cast<U128>(std::numeric_limits<uint64_t>::max());
    U128 a0 = a & mask, a1 = a >> 64;
    U128 b0 = b & mask, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & mask) + (p10 & mask);
    U128 lo = (p00 & mask) | (mid << 64);
    U128 hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
    return {hi, lo};
}

} // namespace detail

// floor(a * b / d) with a 256-bit intermediate.
// Saturates at the U128 maximum when the quotient does not fit; d must be > 0.
inline U128 mul_div(U128 a, U128 b, U128 d) {
    detail::U256 p = detail::mul_wide(a, b);
    if (p.hi == 0) return p.lo / d;
    if (p.hi >= d) return ~static_cast<U128>(0);

    // Restoring long division of (hi:lo) by d, remainder kept below d
    U128 rem = p.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((p.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= d) {
            rem -= d;
            quot |= 1;
        }
    }
    return quot;
}

// Signed front-end for non-negative operands; saturates at I128_MAX
inline I128 mul_div(I128 a, I128 b, I128 d) {
    if (a <= 0 || b <= 0) return 0;
    U128 r = mul_div(static_cast<U128>(a), static_cast<U128>(b), static_cast<U128>(d));
    return r > static_cast<U128>(I128_MAX) ? I128_MAX : static_cast<I128>(r);
}

inline I128 mul(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE);
}

inline I128 div(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// 10^n for n <= 38
inline I128 pow10(uint32_t n) {
    I128 r = 1;
    for (uint32_t i = 0; i < n; ++i) r *= 10;
    return r;
}

// Decimal rendering (JSON payloads cannot hold 128-bit integers)
inline std::string to_string(I128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    U128 u = negative ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
    std::string digits;
    while (u > 0) {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) digits.insert(digits.begin(), '-');
    return digits;
}

} // namespace x18

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_zero() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t INVALID_COLLATERAL_AMOUNT = -1;
constexpr int32_t INVALID_AMOUNT = -2;
constexpr int32_t INVALID_ASSET = -3;
constexpr int32_t INVALID_ADDRESS = -4;
constexpr int32_t INVALID_LEVERAGE = -5;
constexpr int32_t INVALID_CONFIG = -6;
constexpr int32_t INVALID_RATE = -7;
constexpr int32_t INVALID_PERIOD = -8;

// Ledger invariants
constexpr int32_t POSITION_NOT_FOUND = -10;
constexpr int32_t LOAN_EXCEEDS_LTV_LIMIT = -11;
constexpr int32_t INSUFFICIENT_COLLATERAL_AFTER_WITHDRAWAL = -12;
constexpr int32_t AMOUNT_EXCEEDS_LOAN = -13;
constexpr int32_t AMOUNT_EXCEEDS_COLLATERAL = -14;
constexpr int32_t POSITION_HEALTHY = -15;

// Oracle
constexpr int32_t PRICE_STALE = -20;
constexpr int32_t INVALID_PRICE = -21;
constexpr int32_t PRICE_FEED_NOT_SET = -22;

// Token / exchange
constexpr int32_t INSUFFICIENT_BALANCE = -30;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -31;
constexpr int32_t SLIPPAGE_EXCEEDED = -32;
constexpr int32_t POOL_NOT_FOUND = -33;
constexpr int32_t POOL_ALREADY_INITIALIZED = -34;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -35;
constexpr int32_t HOOK_FAILED = -36;

// Interest
constexpr int32_t VAULT_NOT_CALLER = -40;
constexpr int32_t VAULT_ALREADY_REGISTERED = -41;
constexpr int32_t VAULT_NOT_REGISTERED = -42;
constexpr int32_t NO_INTEREST_TO_COLLECT = -43;

// Authorization / concurrency
constexpr int32_t UNAUTHORIZED = -50;
constexpr int32_t NOT_POSITION_OWNER = -51;
constexpr int32_t REENTRANCY = -52;

// Leverage capacity
constexpr int32_t LEVERAGE_EXCEEDS_MAX = -60;
constexpr int32_t NO_BORROW_CAPACITY = -61;

inline const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case INVALID_COLLATERAL_AMOUNT: return "InvalidCollateralAmount";
        case INVALID_AMOUNT: return "InvalidAmount";
        case INVALID_ASSET: return "InvalidAsset";
        case INVALID_ADDRESS: return "InvalidAddress";
        case INVALID_LEVERAGE: return "InvalidLeverage";
        case INVALID_CONFIG: return "InvalidConfig";
        case INVALID_RATE: return "InvalidRate";
        case INVALID_PERIOD: return "InvalidPeriod";
        case POSITION_NOT_FOUND: return "PositionNotFound";
        case LOAN_EXCEEDS_LTV_LIMIT: return "LoanExceedsLTVLimit";
        case INSUFFICIENT_COLLATERAL_AFTER_WITHDRAWAL: return "InsufficientCollateralAfterWithdrawal";
        case AMOUNT_EXCEEDS_LOAN: return "AmountExceedsLoan";
        case AMOUNT_EXCEEDS_COLLATERAL: return "AmountExceedsCollateral";
        case POSITION_HEALTHY: return "PositionHealthy";
        case PRICE_STALE: return "StalePrice";
        case INVALID_PRICE: return "InvalidPrice";
        case PRICE_FEED_NOT_SET: return "PriceFeedNotSet";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case SLIPPAGE_EXCEEDED: return "SlippageExceeded";
        case POOL_NOT_FOUND: return "PoolNotFound";
        case POOL_ALREADY_INITIALIZED: return "PoolAlreadyInitialized";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case HOOK_FAILED: return "HookFailed";
        case VAULT_NOT_CALLER: return "VaultNotCaller";
        case VAULT_ALREADY_REGISTERED: return "VaultAlreadyRegistered";
        case VAULT_NOT_REGISTERED: return "VaultNotRegistered";
        case NO_INTEREST_TO_COLLECT: return "NoInterestToCollect";
        case UNAUTHORIZED: return "Unauthorized";
        case NOT_POSITION_OWNER: return "NotPositionOwner";
        case REENTRANCY: return "Reentrancy";
        case LEVERAGE_EXCEEDS_MAX: return "LeverageExceedsMax";
        case NO_BORROW_CAPACITY: return "NoBorrowCapacity";
        default: return "Unknown";
    }
}
} // namespace errors

} // namespace lever

#endif // LEVER_TYPES_HPP
