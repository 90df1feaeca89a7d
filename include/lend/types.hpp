#ifndef LEND_TYPES_HPP
#define LEND_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace lend {

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;  // 0.5e18

// Saturation value for unbounded results (health factor with zero debt)
constexpr I128 X18_INFINITY = static_cast<I128>(1) << 126;

constexpr uint64_t SECONDS_PER_YEAR = 31536000;

namespace x18 {

// (a * b) / d with a 256-bit intermediate. Truncates toward zero unless
// round_up is set. Results that do not fit saturate to X18_INFINITY.
inline I128 mul_div(I128 a, I128 b, I128 d, bool round_up = false) {
    if (d == 0) return X18_INFINITY;
    if (a == 0 || b == 0) return 0;

    bool negative = (a < 0) != (b < 0);
    if (d < 0) negative = !negative;
    U128 ua = static_cast<U128>(a < 0 ? -a : a);
    U128 ub = static_cast<U128>(b < 0 ? -b : b);
    U128 ud = static_cast<U128>(d < 0 ? -d : d);

    // 256-bit product as (hi, lo) from 64-bit limbs
    uint64_t a0 = static_cast<uint64_t>(ua), a1 = static_cast<uint64_t>(ua >> 64);
    uint64_t b0 = static_cast<uint64_t>(ub), b1 = static_cast<uint64_t>(ub >> 64);
    U128 p00 = static_cast<U128>(a0) * b0;
    U128 p01 = static_cast<U128>(a0) * b1;
    U128 p10 = static_cast<U128>(a1) * b0;
    U128 p11 = static_cast<U128>(a1) * b1;
    U128 mid = (p00 >> 64) + static_cast<uint64_t>(p01) + static_cast<uint64_t>(p10);
    U128 lo = (mid << 64) | static_cast<uint64_t>(p00);
    U128 hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);

    U128 q = 0;
    U128 rem = 0;
    if (hi == 0) {
        q = lo / ud;
        rem = lo % ud;
    } else {
        if (hi >= ud) return negative ? -X18_INFINITY : X18_INFINITY;
        // Restoring division of (hi:lo) by ud; hi < ud keeps the quotient in 128 bits
        rem = hi;
        for (int i = 127; i >= 0; --i) {
            bool carry = (rem >> 127) != 0;
            rem = (rem << 1) | ((lo >> i) & 1);
            if (carry || rem >= ud) {
                rem -= ud;
                q |= static_cast<U128>(1) << i;
            }
        }
    }

    if (round_up && rem != 0) ++q;
    if (q >= static_cast<U128>(X18_INFINITY)) {
        return negative ? -X18_INFINITY : X18_INFINITY;
    }
    I128 result = static_cast<I128>(q);
    return negative ? -result : result;
}

inline I128 mul(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE);
}

inline I128 mul_up(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE, true);
}

inline I128 div(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b);
}

inline I128 div_up(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b, true);
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 min(I128 a, I128 b) { return a < b ? a : b; }
inline I128 max(I128 a, I128 b) { return a > b ? a : b; }

// Exact decimal parsing ("1234.5678", "-0.05", "7500"). Digits past the
// 18th decimal place are truncated. Returns false on malformed input.
bool parse(std::string_view text, I128& out);

// Throws std::invalid_argument on malformed input
I128 from_string(std::string_view text);

// Shortest exact decimal representation ("0.75", "7500", "-1.000001")
std::string to_string(I128 v);

} // namespace x18

// =============================================================================
// Identifiers
// =============================================================================

using AssetId = uint64_t;
using UserId = uint64_t;
using LoanId = uint64_t;

// Decimal digits only: no sign, no trailing text, no overflow
bool parse_id(std::string_view text, uint64_t& out);

// Counterparty for every custody transfer into or out of the protocol
constexpr UserId PROTOCOL_ACCOUNT = 0;

// =============================================================================
// Loan Status
// =============================================================================

enum class LoanStatus : uint8_t {
    OPEN = 0,
    PARTIALLY_LIQUIDATED = 1,
    CLOSED = 2
};

const char* to_string(LoanStatus status);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t ASSET_ALREADY_LISTED = -2;
constexpr int32_t USER_ALREADY_REGISTERED = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t EXCEEDS_MAX_BORROW = -11;
constexpr int32_t UNKNOWN_ASSET = -12;
constexpr int32_t UNKNOWN_LOAN = -13;
constexpr int32_t UNKNOWN_USER = -14;
constexpr int32_t NOT_LIQUIDATABLE = -15;
constexpr int32_t EXCEEDS_LIQUIDATION_LIMIT = -16;
constexpr int32_t LIQUIDATION_WORSENS_HEALTH = -17;
constexpr int32_t PARTIAL_SEIZURE_SHORTFALL = -18;
constexpr int32_t LOAN_CLOSED = -19;
constexpr int32_t PRICE_UNAVAILABLE = -21;
constexpr int32_t INVALID_PRICE = -22;
constexpr int32_t CUSTODY_REJECTED = -30;
constexpr int32_t UNAUTHORIZED = -40;

const char* to_string(int32_t code);
}

} // namespace lend

#endif // LEND_TYPES_HPP
