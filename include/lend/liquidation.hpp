#ifndef LEND_LIQUIDATION_HPP
#define LEND_LIQUIDATION_HPP

#include "types.hpp"
#include "loan.hpp"
#include "pool.hpp"
#include "credit.hpp"
#include "risk.hpp"

namespace lend {

// =============================================================================
// Liquidation Result
// =============================================================================

struct LiquidationResult {
    int32_t code = errors::OK;
    LoanId loan_id = 0;
    UserId borrower_id = 0;
    UserId liquidator_id = 0;
    AssetId debt_asset_id = 0;
    AssetId collateral_asset_id = 0;
    I128 repaid_x18 = 0;
    I128 interest_repaid_x18 = 0;
    I128 principal_repaid_x18 = 0;
    I128 collateral_seized_x18 = 0;
    I128 shortfall_x18 = 0;             // collateral owed to the liquidator but absent
    I128 collateral_released_x18 = 0;   // unlocked back to the borrower on close
    I128 health_before_x18 = 0;
    I128 health_after_x18 = 0;
    LoanStatus status_after = LoanStatus::OPEN;
    uint32_t score_awarded = 0;

    // PARTIAL_SEIZURE_SHORTFALL commits as well
    bool committed() const {
        return code == errors::OK || code == errors::PARTIAL_SEIZURE_SHORTFALL;
    }
};

// =============================================================================
// Liquidation Context (staged entities)
// =============================================================================
//
// debt_pool and collateral_pool may refer to the same Pool when both sides
// of the loan are in one asset.

struct LiquidationContext {
    Loan& loan;
    CreditRecord& borrower;
    Pool& debt_pool;
    Pool& collateral_pool;
    I128 debt_price_x18;
    I128 collateral_price_x18;
    uint64_t now;
};

// =============================================================================
// LiquidationEngine
// =============================================================================

class LiquidationEngine {
public:
    LiquidationEngine(const RiskEngine& risk, const CreditScorer& scorer);

    // Executes against the staged entities in ctx. The loan must already be
    // accrued to ctx.now. When the result does not commit, the caller
    // discards the staged copies.
    LiquidationResult liquidate(LiquidationContext& ctx, I128 repay_amount_x18,
                                UserId liquidator_id) const;

private:
    const RiskEngine& risk_;
    const CreditScorer& scorer_;
};

} // namespace lend

#endif // LEND_LIQUIDATION_HPP
