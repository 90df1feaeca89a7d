// =============================================================================
// interest.cpp - Utilization-Based Interest Rate Curve
// =============================================================================

#include "lend/interest.hpp"

namespace lend {

InterestRateModel::InterestRateModel(const InterestRateParams& params)
    : params_(params) {}

bool InterestRateModel::validate(const InterestRateParams& params) {
    if (params.base_rate_x18 < 0) return false;
    if (params.optimal_rate_x18 < params.base_rate_x18) return false;
    if (params.max_rate_x18 < params.optimal_rate_x18) return false;
    if (params.optimal_utilization_x18 <= 0 || params.optimal_utilization_x18 > X18_ONE) {
        return false;
    }
    return true;
}

I128 InterestRateModel::borrow_rate_x18(I128 utilization_x18) const {
    I128 u = x18::max(0, x18::min(utilization_x18, X18_ONE));
    const I128 kink = params_.optimal_utilization_x18;

    if (u <= kink) {
        // base -> optimal over [0, kink]
        I128 slope = params_.optimal_rate_x18 - params_.base_rate_x18;
        return params_.base_rate_x18 + x18::mul_div(slope, u, kink);
    }

    // optimal -> max over (kink, 1]
    I128 span = X18_ONE - kink;
    I128 slope = params_.max_rate_x18 - params_.optimal_rate_x18;
    return params_.optimal_rate_x18 + x18::mul_div(slope, u - kink, span);
}

I128 InterestRateModel::supply_rate_x18(I128 utilization_x18, I128 reserve_factor_x18) const {
    I128 u = x18::max(0, x18::min(utilization_x18, X18_ONE));
    I128 gross = x18::mul(borrow_rate_x18(u), u);
    return x18::mul(gross, X18_ONE - reserve_factor_x18);
}

} // namespace lend
