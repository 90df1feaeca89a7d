// =============================================================================
// liquidation.cpp - Loan Liquidation
// =============================================================================

#include "lend/liquidation.hpp"

namespace lend {

LiquidationEngine::LiquidationEngine(const RiskEngine& risk, const CreditScorer& scorer)
    : risk_(risk)
    , scorer_(scorer) {}

LiquidationResult LiquidationEngine::liquidate(LiquidationContext& ctx, I128 repay_amount_x18,
                                               UserId liquidator_id) const {
    Loan& loan = ctx.loan;

    LiquidationResult result;
    result.loan_id = loan.loan_id;
    result.borrower_id = loan.borrower_id;
    result.liquidator_id = liquidator_id;
    result.debt_asset_id = loan.debt_asset_id;
    result.collateral_asset_id = loan.collateral_asset_id;
    result.status_after = loan.status;

    // =========================================================================
    // Preconditions: status, health, amount
    // =========================================================================

    if (!loan.is_active()) {
        result.code = errors::NOT_LIQUIDATABLE;
        return result;
    }

    const uint32_t score = ctx.borrower.credit_score();
    LoanRisk before = risk_.assess(loan, ctx.collateral_price_x18, ctx.debt_price_x18, score);
    result.health_before_x18 = before.health_factor_x18;
    result.health_after_x18 = before.health_factor_x18;

    if (!before.liquidatable) {
        result.code = errors::NOT_LIQUIDATABLE;
        return result;
    }
    if (repay_amount_x18 <= 0) {
        result.code = errors::INVALID_AMOUNT;
        return result;
    }
    if (repay_amount_x18 > before.max_liquidatable_x18) {
        result.code = errors::EXCEEDS_LIQUIDATION_LIMIT;
        return result;
    }

    // =========================================================================
    // Repay debt (interest first) and seize collateral
    // =========================================================================

    I128 interest_paid = 0;
    I128 principal_paid = 0;
    I128 repaid = loan.apply_repayment(repay_amount_x18, interest_paid, principal_paid);
    ctx.debt_pool.repay(repaid, ctx.now);

    I128 seized = risk_.collateral_to_seize_x18(repaid, ctx.debt_price_x18, ctx.collateral_price_x18);
    if (seized > loan.collateral_amount_x18) {
        result.shortfall_x18 = seized - loan.collateral_amount_x18;
        seized = loan.collateral_amount_x18;
    }

    int32_t err = ctx.collateral_pool.release_collateral(seized);
    if (err != errors::OK) {
        result.code = err;
        return result;
    }
    loan.collateral_amount_x18 -= seized;
    ctx.borrower.seize_collateral(loan.collateral_asset_id, seized);

    if (loan.debt_x18() == 0) {
        result.collateral_released_x18 = loan.collateral_amount_x18;
        ctx.borrower.unlock_collateral(loan.collateral_asset_id, loan.collateral_amount_x18);
        loan.collateral_amount_x18 = 0;
        loan.status = LoanStatus::CLOSED;
        ctx.borrower.close_loan(loan.loan_id);
    } else {
        loan.status = LoanStatus::PARTIALLY_LIQUIDATED;
    }

    LoanRisk after = risk_.assess(loan, ctx.collateral_price_x18, ctx.debt_price_x18, score);
    result.health_after_x18 = after.health_factor_x18;

    result.repaid_x18 = repaid;
    result.interest_repaid_x18 = interest_paid;
    result.principal_repaid_x18 = principal_paid;
    result.collateral_seized_x18 = seized;
    result.status_after = loan.status;

    if (result.shortfall_x18 > 0) {
        // Collateral exhausted: bad debt, health comparison no longer meaningful
        result.code = errors::PARTIAL_SEIZURE_SHORTFALL;
    } else if (result.health_after_x18 <= result.health_before_x18) {
        result.code = errors::LIQUIDATION_WORSENS_HEALTH;
        return result;
    }

    // =========================================================================
    // Credit record
    // =========================================================================

    ctx.borrower.record_default();
    result.score_awarded = scorer_.on_repayment(ctx.borrower, loan);
    ctx.borrower.record_repayment(RepaymentEvent{
        loan.loan_id, loan.debt_asset_id, repaid, loan.debt_x18(), ctx.now, true,
        result.score_awarded});

    return result;
}

} // namespace lend
