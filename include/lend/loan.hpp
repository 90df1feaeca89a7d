#ifndef LEND_LOAN_HPP
#define LEND_LOAN_HPP

#include "types.hpp"

namespace lend {

// =============================================================================
// Loan - Single Collateralized Borrow Position
// =============================================================================

struct Loan {
    LoanId loan_id = 0;
    UserId borrower_id = 0;          // fixed owner; the record listing this loan
    UserId holder_id = 0;            // current operator; reassignable
    AssetId collateral_asset_id = 0;
    I128 collateral_amount_x18 = 0;
    AssetId debt_asset_id = 0;
    I128 principal_x18 = 0;
    I128 accrued_interest_x18 = 0;
    I128 interest_rate_at_origination_x18 = 0;
    I128 origination_balance_x18 = 0;  // all principal ever borrowed on the loan
    LoanStatus status = LoanStatus::OPEN;
    uint64_t opened_at = 0;
    uint64_t last_update_timestamp = 0;
    uint32_t credit_tiers_awarded = 0;  // bit i set once tier i has scored

    I128 debt_x18() const { return principal_x18 + accrued_interest_x18; }
    bool is_active() const { return status != LoanStatus::CLOSED; }

    // Interest owed for (now - last_update) at an annual rate, without mutating
    I128 projected_interest_x18(I128 annual_rate_x18, uint64_t now) const;

    // Folds projected interest into accrued_interest; returns the amount added
    I128 accrue(I128 annual_rate_x18, uint64_t now);

    // Applies a payment to interest first, then principal.
    // Returns the amount consumed (never more than debt).
    I128 apply_repayment(I128 amount_x18, I128& interest_paid_x18, I128& principal_paid_x18);

    // Remaining debt as a fraction of origination_balance
    I128 remaining_fraction_x18() const;
};

} // namespace lend

#endif // LEND_LOAN_HPP
