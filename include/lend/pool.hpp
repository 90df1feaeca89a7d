#ifndef LEND_POOL_HPP
#define LEND_POOL_HPP

#include <string>

#include "types.hpp"
#include "interest.hpp"

namespace lend {

// =============================================================================
// Pool State (Snapshot)
// =============================================================================

struct PoolState {
    AssetId asset_id;
    std::string symbol;
    I128 total_supply_x18;        // principal + realized interest
    I128 total_borrowed_x18;      // principal + realized interest
    I128 total_collateral_x18;    // posted collateral, not lendable
    I128 reserves_x18;            // protocol share of realized interest
    I128 reserve_factor_x18;
    I128 liquidity_index_x18;
    I128 borrow_index_x18;
    I128 utilization_x18;
    I128 borrow_rate_x18;
    I128 supply_rate_x18;
    uint64_t last_update_timestamp;
};

// =============================================================================
// Pool - Per-Asset Lending Ledger
// =============================================================================
//
// Aggregate supply/borrow accounting for one asset. Every mutating call
// accrues the borrow index to `now` first. total_borrowed never exceeds
// total_supply.
//
// The liquidity index moves only when loan interest is realized, and is
// set from what the pool actually holds: depositor claims (the scaled
// total at the liquidity index) never exceed total_supply - reserves.
//
// Pool is a value type: operations stage changes on a copy and swap it in
// once every party to the operation has validated.

class Pool {
public:
    Pool() = default;
    Pool(AssetId asset_id, std::string symbol, I128 reserve_factor_x18,
         const InterestRateModel& model, uint64_t now);

    // =========================================================================
    // Ledger Operations
    // =========================================================================

    int32_t deposit(I128 amount_x18, uint64_t now);
    int32_t withdraw(I128 amount_x18, uint64_t now);
    int32_t borrow(I128 amount_x18, uint64_t now);

    // Returns the amount applied: min(amount, total_borrowed)
    I128 repay(I128 amount_x18, uint64_t now);

    // Loan interest realized on a touch; grows both sides of the ledger
    // and raises the liquidity index by the depositors' share
    void realize_interest(I128 interest_x18);

    void post_collateral(I128 amount_x18);
    int32_t release_collateral(I128 amount_x18);

    // =========================================================================
    // Index Accrual
    // =========================================================================

    // Reference borrow index at the undiscounted curve rate. Idempotent at a
    // fixed timestamp; timestamps in the past are ignored.
    void accrue_indices(uint64_t now);

    // Scaled deposit balances against the liquidity index
    I128 scale(I128 amount_x18) const;
    I128 scale_up(I128 amount_x18) const;
    I128 unscale(I128 scaled_x18) const;

    // =========================================================================
    // Queries
    // =========================================================================

    AssetId asset_id() const { return asset_id_; }
    const std::string& symbol() const { return symbol_; }
    I128 total_supply() const { return total_supply_x18_; }
    I128 total_borrowed() const { return total_borrowed_x18_; }
    I128 total_collateral() const { return total_collateral_x18_; }
    I128 reserves() const { return reserves_x18_; }
    I128 total_scaled() const { return total_scaled_x18_; }
    I128 reserve_factor() const { return reserve_factor_x18_; }
    I128 liquidity_index() const { return liquidity_index_x18_; }
    I128 borrow_index() const { return borrow_index_x18_; }
    uint64_t last_update_timestamp() const { return last_update_timestamp_; }

    I128 available_liquidity() const { return total_supply_x18_ - total_borrowed_x18_; }
    I128 utilization_x18() const;
    I128 borrow_rate_x18() const;
    I128 supply_rate_x18() const;

    PoolState state() const;

private:
    AssetId asset_id_ = 0;
    std::string symbol_;
    InterestRateModel model_;

    I128 total_supply_x18_ = 0;
    I128 total_borrowed_x18_ = 0;
    I128 total_collateral_x18_ = 0;
    I128 reserves_x18_ = 0;
    I128 total_scaled_x18_ = 0;
    I128 reserve_factor_x18_ = 0;
    I128 liquidity_index_x18_ = X18_ONE;
    I128 borrow_index_x18_ = X18_ONE;
    uint64_t last_update_timestamp_ = 0;
};

} // namespace lend

#endif // LEND_POOL_HPP
