#ifndef LEND_RISK_HPP
#define LEND_RISK_HPP

#include <vector>

#include "types.hpp"
#include "loan.hpp"

namespace lend {

// =============================================================================
// Credit Discount Tiers
// =============================================================================

struct CreditDiscount {
    uint32_t min_score;
    I128 collateral_discount_x18;  // relaxes threshold and max LTV
    I128 interest_discount_x18;    // subtracted from the pool borrow rate
};

// =============================================================================
// Risk Parameters
// =============================================================================

struct RiskParams {
    I128 liquidation_threshold_x18 = X18_ONE * 4 / 5;    // 80%
    I128 max_loan_to_value_x18 = X18_ONE * 3 / 4;        // 75%
    I128 liquidation_bonus_x18 = X18_ONE / 20;           // 5%
    I128 close_factor_x18 = X18_HALF;                    // 50% of debt per call
    I128 full_liquidation_health_x18 = X18_HALF;         // HF <= 0.5 opens 100%

    // Ascending by min_score
    std::vector<CreditDiscount> credit_discounts = {
        {100, X18_ONE / 20, X18_ONE / 100},
        {200, X18_ONE / 10, X18_ONE / 50},
        {300, X18_ONE * 3 / 20, X18_ONE * 3 / 100},
    };

    // Rejects parameter sets where liquidating at HF = 1 cannot improve health
    bool validate() const;
};

// =============================================================================
// Loan Risk Assessment
// =============================================================================

struct LoanRisk {
    I128 collateral_value_x18;
    I128 debt_value_x18;
    I128 liquidation_threshold_x18;
    I128 health_factor_x18;          // X18_INFINITY with zero debt
    bool liquidatable;
    I128 max_liquidatable_x18;       // in debt units
};

// =============================================================================
// RiskEngine - Health, Borrow Gating, Liquidation Caps
// =============================================================================
//
// Pure functions of the loan, the prices and the borrower's score.

class RiskEngine {
public:
    RiskEngine() = default;
    explicit RiskEngine(const RiskParams& params);

    const RiskParams& params() const { return params_; }

    // =========================================================================
    // Credit-Adjusted Parameters
    // =========================================================================

    CreditDiscount discount_for(uint32_t credit_score) const;
    I128 liquidation_threshold_x18(uint32_t credit_score) const;
    I128 max_loan_to_value_x18(uint32_t credit_score) const;

    // max(0, pool_rate - interest discount)
    I128 loan_rate_x18(I128 pool_borrow_rate_x18, uint32_t credit_score) const;

    // =========================================================================
    // Health
    // =========================================================================

    static I128 value_x18(I128 amount_x18, I128 price_x18);
    static I128 health_factor_x18(I128 collateral_value_x18, I128 debt_value_x18,
                                  I128 liquidation_threshold_x18);

    LoanRisk assess(const Loan& loan, I128 collateral_price_x18, I128 debt_price_x18,
                    uint32_t credit_score) const;

    // =========================================================================
    // Borrow Gating
    // =========================================================================

    // OK when debt_value <= collateral_value * max_ltv, else EXCEEDS_MAX_BORROW
    int32_t check_borrow(I128 collateral_amount_x18, I128 collateral_price_x18,
                         I128 debt_amount_x18, I128 debt_price_x18,
                         uint32_t credit_score) const;

    // Additional debt (in debt units) the gating rule still allows
    I128 max_borrow_x18(I128 collateral_amount_x18, I128 collateral_price_x18,
                        I128 current_debt_x18, I128 debt_price_x18,
                        uint32_t credit_score) const;

    // =========================================================================
    // Liquidation Caps
    // =========================================================================

    bool is_liquidatable(I128 health_factor_x18) const { return health_factor_x18 <= X18_ONE; }

    // 0 when healthy; close_factor of debt in (0.5, 1]; all of it at <= 0.5
    I128 max_liquidatable_x18(I128 health_factor_x18, I128 debt_x18) const;

    // repay * debt_price / collateral_price * (1 + bonus)
    I128 collateral_to_seize_x18(I128 repay_x18, I128 debt_price_x18,
                                 I128 collateral_price_x18) const;

private:
    RiskParams params_;
};

} // namespace lend

#endif // LEND_RISK_HPP
