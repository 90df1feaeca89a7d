// =============================================================================
// risk.cpp - Health Factor and Borrow Gating
// =============================================================================

#include "lend/risk.hpp"

namespace lend {

bool RiskParams::validate() const {
    if (liquidation_threshold_x18 <= 0 || liquidation_threshold_x18 > X18_ONE) return false;
    if (max_loan_to_value_x18 <= 0 || max_loan_to_value_x18 > liquidation_threshold_x18) {
        return false;
    }
    if (liquidation_bonus_x18 < 0) return false;
    if (close_factor_x18 <= 0 || close_factor_x18 > X18_ONE) return false;
    if (full_liquidation_health_x18 < 0 || full_liquidation_health_x18 >= X18_ONE) return false;

    // At HF = 1 a liquidation improves health iff (1 + bonus) * threshold < 1
    auto improves_at_boundary = [this](I128 threshold) {
        return x18::mul(X18_ONE + liquidation_bonus_x18, threshold) < X18_ONE;
    };
    if (!improves_at_boundary(liquidation_threshold_x18)) return false;

    uint32_t prev_score = 0;
    for (size_t i = 0; i < credit_discounts.size(); ++i) {
        const auto& d = credit_discounts[i];
        if (i > 0 && d.min_score <= prev_score) return false;
        if (d.collateral_discount_x18 < 0 || d.interest_discount_x18 < 0) return false;
        I128 relaxed = x18::min(X18_ONE, liquidation_threshold_x18 + d.collateral_discount_x18);
        if (!improves_at_boundary(relaxed)) return false;
        prev_score = d.min_score;
    }
    return true;
}

RiskEngine::RiskEngine(const RiskParams& params)
    : params_(params) {}

// =============================================================================
// Credit-Adjusted Parameters
// =============================================================================

CreditDiscount RiskEngine::discount_for(uint32_t credit_score) const {
    CreditDiscount best{0, 0, 0};
    for (const auto& d : params_.credit_discounts) {
        if (credit_score >= d.min_score) best = d;
    }
    return best;
}

I128 RiskEngine::liquidation_threshold_x18(uint32_t credit_score) const {
    I128 relaxed = params_.liquidation_threshold_x18 + discount_for(credit_score).collateral_discount_x18;
    return x18::min(relaxed, X18_ONE);
}

I128 RiskEngine::max_loan_to_value_x18(uint32_t credit_score) const {
    I128 relaxed = params_.max_loan_to_value_x18 + discount_for(credit_score).collateral_discount_x18;
    return x18::min(relaxed, liquidation_threshold_x18(credit_score));
}

I128 RiskEngine::loan_rate_x18(I128 pool_borrow_rate_x18, uint32_t credit_score) const {
    return x18::max(0, pool_borrow_rate_x18 - discount_for(credit_score).interest_discount_x18);
}

// =============================================================================
// Health
// =============================================================================

I128 RiskEngine::value_x18(I128 amount_x18, I128 price_x18) {
    return x18::mul(amount_x18, price_x18);
}

I128 RiskEngine::health_factor_x18(I128 collateral_value_x18, I128 debt_value_x18,
                                   I128 liquidation_threshold_x18) {
    if (debt_value_x18 <= 0) return X18_INFINITY;
    // collateral * threshold / debt in one step
    return x18::mul_div(collateral_value_x18, liquidation_threshold_x18, debt_value_x18);
}

LoanRisk RiskEngine::assess(const Loan& loan, I128 collateral_price_x18, I128 debt_price_x18,
                            uint32_t credit_score) const {
    LoanRisk risk;
    risk.collateral_value_x18 = value_x18(loan.collateral_amount_x18, collateral_price_x18);
    risk.debt_value_x18 = value_x18(loan.debt_x18(), debt_price_x18);
    risk.liquidation_threshold_x18 = liquidation_threshold_x18(credit_score);
    risk.health_factor_x18 = health_factor_x18(risk.collateral_value_x18, risk.debt_value_x18,
                                               risk.liquidation_threshold_x18);
    risk.liquidatable = loan.is_active() && loan.debt_x18() > 0 &&
                        is_liquidatable(risk.health_factor_x18);
    risk.max_liquidatable_x18 = risk.liquidatable
        ? max_liquidatable_x18(risk.health_factor_x18, loan.debt_x18())
        : 0;
    return risk;
}

// =============================================================================
// Borrow Gating
// =============================================================================

int32_t RiskEngine::check_borrow(I128 collateral_amount_x18, I128 collateral_price_x18,
                                 I128 debt_amount_x18, I128 debt_price_x18,
                                 uint32_t credit_score) const {
    I128 collateral_value = value_x18(collateral_amount_x18, collateral_price_x18);
    I128 debt_value = value_x18(debt_amount_x18, debt_price_x18);
    I128 limit = x18::mul(collateral_value, max_loan_to_value_x18(credit_score));
    return debt_value <= limit ? errors::OK : errors::EXCEEDS_MAX_BORROW;
}

I128 RiskEngine::max_borrow_x18(I128 collateral_amount_x18, I128 collateral_price_x18,
                                I128 current_debt_x18, I128 debt_price_x18,
                                uint32_t credit_score) const {
    if (debt_price_x18 <= 0) return 0;
    I128 collateral_value = value_x18(collateral_amount_x18, collateral_price_x18);
    I128 limit = x18::mul(collateral_value, max_loan_to_value_x18(credit_score));
    I128 headroom = limit - value_x18(current_debt_x18, debt_price_x18);
    if (headroom <= 0) return 0;
    return x18::div(headroom, debt_price_x18);
}

// =============================================================================
// Liquidation Caps
// =============================================================================

I128 RiskEngine::max_liquidatable_x18(I128 health_factor_x18, I128 debt_x18) const {
    if (!is_liquidatable(health_factor_x18)) return 0;
    if (health_factor_x18 <= params_.full_liquidation_health_x18) return debt_x18;
    return x18::mul(debt_x18, params_.close_factor_x18);
}

I128 RiskEngine::collateral_to_seize_x18(I128 repay_x18, I128 debt_price_x18,
                                         I128 collateral_price_x18) const {
    I128 base = x18::mul_div(repay_x18, debt_price_x18, collateral_price_x18);
    return x18::mul(base, X18_ONE + params_.liquidation_bonus_x18);
}

} // namespace lend
