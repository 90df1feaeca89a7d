// =============================================================================
// loan.cpp - Loan Accrual and Repayment
// =============================================================================

#include "lend/loan.hpp"

namespace lend {

I128 Loan::projected_interest_x18(I128 annual_rate_x18, uint64_t now) const {
    if (!is_active() || now <= last_update_timestamp || annual_rate_x18 <= 0) return 0;

    const I128 owed = debt_x18();
    if (owed <= 0) return 0;

    const uint64_t dt = now - last_update_timestamp;
    I128 period_rate = x18::mul_div(annual_rate_x18, static_cast<I128>(dt), SECONDS_PER_YEAR);
    return x18::mul(owed, period_rate);
}

I128 Loan::accrue(I128 annual_rate_x18, uint64_t now) {
    I128 interest = projected_interest_x18(annual_rate_x18, now);
    accrued_interest_x18 += interest;
    if (now > last_update_timestamp) last_update_timestamp = now;
    return interest;
}

I128 Loan::apply_repayment(I128 amount_x18, I128& interest_paid_x18, I128& principal_paid_x18) {
    interest_paid_x18 = 0;
    principal_paid_x18 = 0;
    if (amount_x18 <= 0) return 0;

    interest_paid_x18 = x18::min(amount_x18, accrued_interest_x18);
    accrued_interest_x18 -= interest_paid_x18;

    principal_paid_x18 = x18::min(amount_x18 - interest_paid_x18, principal_x18);
    principal_x18 -= principal_paid_x18;

    return interest_paid_x18 + principal_paid_x18;
}

I128 Loan::remaining_fraction_x18() const {
    if (origination_balance_x18 <= 0) return 0;
    return x18::div(debt_x18(), origination_balance_x18);
}

} // namespace lend
