#ifndef LEND_INTEREST_HPP
#define LEND_INTEREST_HPP

#include "types.hpp"

namespace lend {

// =============================================================================
// Interest Rate Parameters
// =============================================================================

struct InterestRateParams {
    I128 base_rate_x18 = X18_ONE / 50;               // 2% at zero utilization
    I128 optimal_rate_x18 = X18_ONE / 10;            // 10% at the kink
    I128 max_rate_x18 = X18_ONE;                     // 100% at full utilization
    I128 optimal_utilization_x18 = X18_ONE * 4 / 5;  // kink at 80%
};

// =============================================================================
// InterestRateModel - Kinked Utilization Curve
// =============================================================================

class InterestRateModel {
public:
    InterestRateModel() = default;
    explicit InterestRateModel(const InterestRateParams& params);

    // Rejects a curve that is discontinuous or decreasing
    static bool validate(const InterestRateParams& params);

    // Annual borrow rate for a utilization in [0, 1]; out-of-range input is clamped
    I128 borrow_rate_x18(I128 utilization_x18) const;

    // borrow_rate * utilization * (1 - reserve_factor)
    I128 supply_rate_x18(I128 utilization_x18, I128 reserve_factor_x18) const;

    const InterestRateParams& params() const { return params_; }

private:
    InterestRateParams params_;
};

} // namespace lend

#endif // LEND_INTEREST_HPP
