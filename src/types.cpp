// =============================================================================
// types.cpp - Fixed-Point Formatting and Error Names
// =============================================================================

#include "lend/types.hpp"
#include <stdexcept>

namespace lend {

// =============================================================================
// Decimal Conversion
// =============================================================================

namespace x18 {

bool parse(std::string_view text, I128& out) {
    size_t pos = 0;
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (pos >= text.size()) return false;

    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    I128 whole = 0;
    I128 frac = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) return false;
            seen_point = true;
            continue;
        }
        if (c == '_') continue;  // digit separator
        if (c < '0' || c > '9') return false;
        seen_digit = true;

        if (!seen_point) {
            whole = whole * 10 + (c - '0');
            if (whole >= X18_INFINITY / X18_ONE) return false;
        } else if (frac_digits < 18) {
            frac = frac * 10 + (c - '0');
            ++frac_digits;
        }
    }
    if (!seen_digit) return false;

    for (int i = frac_digits; i < 18; ++i) frac *= 10;

    I128 value = whole * X18_ONE + frac;
    out = negative ? -value : value;
    return true;
}

I128 from_string(std::string_view text) {
    I128 value = 0;
    if (!parse(text, value)) {
        throw std::invalid_argument("Invalid decimal: " + std::string(text));
    }
    return value;
}

std::string to_string(I128 v) {
    bool negative = v < 0;
    U128 mag = static_cast<U128>(negative ? -v : v);
    U128 whole = mag / static_cast<U128>(X18_ONE);
    U128 frac = mag % static_cast<U128>(X18_ONE);

    std::string digits;
    if (whole == 0) {
        digits = "0";
    } else {
        while (whole > 0) {
            digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(whole % 10)));
            whole /= 10;
        }
    }

    if (frac != 0) {
        std::string fd(18, '0');
        for (int i = 17; i >= 0; --i) {
            fd[i] = static_cast<char>('0' + static_cast<int>(frac % 10));
            frac /= 10;
        }
        while (!fd.empty() && fd.back() == '0') fd.pop_back();
        digits += '.';
        digits += fd;
    }

    return negative ? "-" + digits : digits;
}

} // namespace x18

bool parse_id(std::string_view text, uint64_t& out) {
    if (text.empty()) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(LoanStatus status) {
    switch (status) {
        case LoanStatus::OPEN: return "open";
        case LoanStatus::PARTIALLY_LIQUIDATED: return "partially_liquidated";
        case LoanStatus::CLOSED: return "closed";
    }
    return "unknown";
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_AMOUNT: return "invalid_amount";
        case ASSET_ALREADY_LISTED: return "asset_already_listed";
        case USER_ALREADY_REGISTERED: return "user_already_registered";
        case INSUFFICIENT_LIQUIDITY: return "insufficient_liquidity";
        case INSUFFICIENT_BALANCE: return "insufficient_balance";
        case EXCEEDS_MAX_BORROW: return "exceeds_max_borrow";
        case UNKNOWN_ASSET: return "unknown_asset";
        case UNKNOWN_LOAN: return "unknown_loan";
        case UNKNOWN_USER: return "unknown_user";
        case NOT_LIQUIDATABLE: return "not_liquidatable";
        case EXCEEDS_LIQUIDATION_LIMIT: return "exceeds_liquidation_limit";
        case LIQUIDATION_WORSENS_HEALTH: return "liquidation_worsens_health";
        case PARTIAL_SEIZURE_SHORTFALL: return "partial_seizure_shortfall";
        case LOAN_CLOSED: return "loan_closed";
        case PRICE_UNAVAILABLE: return "price_unavailable";
        case INVALID_PRICE: return "invalid_price";
        case CUSTODY_REJECTED: return "custody_rejected";
        case UNAUTHORIZED: return "unauthorized";
        default: return "unknown_error";
    }
}

} // namespace errors

} // namespace lend
