// =============================================================================
// pool.cpp - Per-Asset Lending Ledger Implementation
// =============================================================================

#include "lend/pool.hpp"
#include <utility>

namespace lend {

Pool::Pool(AssetId asset_id, std::string symbol, I128 reserve_factor_x18,
           const InterestRateModel& model, uint64_t now)
    : asset_id_(asset_id)
    , symbol_(std::move(symbol))
    , model_(model)
    , reserve_factor_x18_(reserve_factor_x18)
    , last_update_timestamp_(now) {}

// =============================================================================
// Ledger Operations
// =============================================================================

int32_t Pool::deposit(I128 amount_x18, uint64_t now) {
    if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
    accrue_indices(now);

    total_supply_x18_ += amount_x18;
    total_scaled_x18_ += scale(amount_x18);
    return errors::OK;
}

int32_t Pool::withdraw(I128 amount_x18, uint64_t now) {
    if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
    accrue_indices(now);

    if (amount_x18 > available_liquidity()) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    const I128 scaled = scale_up(amount_x18);
    if (scaled > total_scaled_x18_) return errors::INSUFFICIENT_BALANCE;

    total_supply_x18_ -= amount_x18;
    total_scaled_x18_ -= scaled;
    return errors::OK;
}

int32_t Pool::borrow(I128 amount_x18, uint64_t now) {
    if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
    accrue_indices(now);

    if (amount_x18 > available_liquidity()) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    total_borrowed_x18_ += amount_x18;
    return errors::OK;
}

I128 Pool::repay(I128 amount_x18, uint64_t now) {
    if (amount_x18 <= 0) return 0;
    accrue_indices(now);

    I128 applied = x18::min(amount_x18, total_borrowed_x18_);
    total_borrowed_x18_ -= applied;
    return applied;
}

void Pool::realize_interest(I128 interest_x18) {
    if (interest_x18 <= 0) return;
    total_borrowed_x18_ += interest_x18;
    total_supply_x18_ += interest_x18;
    reserves_x18_ += x18::mul(interest_x18, reserve_factor_x18_);

    if (total_scaled_x18_ > 0) {
        I128 index = x18::div(total_supply_x18_ - reserves_x18_, total_scaled_x18_);
        liquidity_index_x18_ = x18::max(liquidity_index_x18_, index);
    }
}

void Pool::post_collateral(I128 amount_x18) {
    if (amount_x18 > 0) total_collateral_x18_ += amount_x18;
}

int32_t Pool::release_collateral(I128 amount_x18) {
    if (amount_x18 < 0) return errors::INVALID_AMOUNT;
    if (amount_x18 > total_collateral_x18_) return errors::INSUFFICIENT_BALANCE;
    total_collateral_x18_ -= amount_x18;
    return errors::OK;
}

// =============================================================================
// Index Accrual
// =============================================================================

void Pool::accrue_indices(uint64_t now) {
    if (now <= last_update_timestamp_) return;

    const uint64_t dt = now - last_update_timestamp_;
    const I128 borrow_rate = model_.borrow_rate_x18(utilization_x18());

    // index *= 1 + rate * dt / year
    I128 growth = x18::mul_div(borrow_rate, static_cast<I128>(dt), SECONDS_PER_YEAR);
    borrow_index_x18_ = x18::mul(borrow_index_x18_, X18_ONE + growth);

    last_update_timestamp_ = now;
}

I128 Pool::scale(I128 amount_x18) const {
    return x18::div(amount_x18, liquidity_index_x18_);
}

I128 Pool::scale_up(I128 amount_x18) const {
    return x18::div_up(amount_x18, liquidity_index_x18_);
}

I128 Pool::unscale(I128 scaled_x18) const {
    return x18::mul(scaled_x18, liquidity_index_x18_);
}

// =============================================================================
// Queries
// =============================================================================

I128 Pool::utilization_x18() const {
    if (total_supply_x18_ <= 0) return 0;
    return x18::div(total_borrowed_x18_, total_supply_x18_);
}

I128 Pool::borrow_rate_x18() const {
    return model_.borrow_rate_x18(utilization_x18());
}

I128 Pool::supply_rate_x18() const {
    return model_.supply_rate_x18(utilization_x18(), reserve_factor_x18_);
}

PoolState Pool::state() const {
    PoolState s;
    s.asset_id = asset_id_;
    s.symbol = symbol_;
    s.total_supply_x18 = total_supply_x18_;
    s.total_borrowed_x18 = total_borrowed_x18_;
    s.total_collateral_x18 = total_collateral_x18_;
    s.reserves_x18 = reserves_x18_;
    s.reserve_factor_x18 = reserve_factor_x18_;
    s.liquidity_index_x18 = liquidity_index_x18_;
    s.borrow_index_x18 = borrow_index_x18_;
    s.utilization_x18 = utilization_x18();
    s.borrow_rate_x18 = borrow_rate_x18();
    s.supply_rate_x18 = supply_rate_x18();
    s.last_update_timestamp = last_update_timestamp_;
    return s;
}

} // namespace lend
