// =============================================================================
// credit.cpp - Credit Record and Scoring
// =============================================================================

#include "lend/credit.hpp"
#include <utility>

namespace lend {

namespace {

I128 lookup(const std::map<AssetId, I128>& m, AssetId asset_id) {
    auto it = m.find(asset_id);
    return it == m.end() ? 0 : it->second;
}

void subtract(std::map<AssetId, I128>& m, AssetId asset_id, I128 amount_x18) {
    auto it = m.find(asset_id);
    if (it == m.end()) return;
    it->second -= amount_x18;
    if (it->second <= 0) m.erase(it);
}

} // namespace

CreditRecord::CreditRecord(UserId user_id, std::string account, uint64_t created_at)
    : user_id_(user_id)
    , account_(std::move(account))
    , created_at_(created_at) {}

// =============================================================================
// Balances
// =============================================================================

I128 CreditRecord::scaled_deposit(AssetId asset_id) const {
    return lookup(deposits_, asset_id);
}

I128 CreditRecord::posted_collateral(AssetId asset_id) const {
    return lookup(collateral_, asset_id);
}

I128 CreditRecord::locked(AssetId asset_id) const {
    return lookup(locked_collateral_, asset_id);
}

I128 CreditRecord::free_collateral(AssetId asset_id) const {
    return posted_collateral(asset_id) - locked(asset_id);
}

void CreditRecord::add_deposit(AssetId asset_id, I128 scaled_x18) {
    if (scaled_x18 > 0) deposits_[asset_id] += scaled_x18;
}

int32_t CreditRecord::remove_deposit(AssetId asset_id, I128 scaled_x18) {
    if (scaled_x18 > scaled_deposit(asset_id)) return errors::INSUFFICIENT_BALANCE;
    subtract(deposits_, asset_id, scaled_x18);
    return errors::OK;
}

void CreditRecord::add_collateral(AssetId asset_id, I128 amount_x18) {
    if (amount_x18 > 0) collateral_[asset_id] += amount_x18;
}

int32_t CreditRecord::remove_collateral(AssetId asset_id, I128 amount_x18) {
    if (amount_x18 > free_collateral(asset_id)) return errors::INSUFFICIENT_BALANCE;
    subtract(collateral_, asset_id, amount_x18);
    return errors::OK;
}

int32_t CreditRecord::lock_collateral(AssetId asset_id, I128 amount_x18) {
    if (amount_x18 > free_collateral(asset_id)) return errors::INSUFFICIENT_BALANCE;
    locked_collateral_[asset_id] += amount_x18;
    return errors::OK;
}

void CreditRecord::unlock_collateral(AssetId asset_id, I128 amount_x18) {
    subtract(locked_collateral_, asset_id, x18::min(amount_x18, locked(asset_id)));
}

void CreditRecord::seize_collateral(AssetId asset_id, I128 amount_x18) {
    I128 taken = x18::min(amount_x18, locked(asset_id));
    subtract(locked_collateral_, asset_id, taken);
    subtract(collateral_, asset_id, taken);
}

void CreditRecord::close_loan(LoanId loan_id) {
    if (loan_ids_.erase(loan_id) > 0) closed_loan_ids_.insert(loan_id);
}

// =============================================================================
// Credit Score Table
// =============================================================================

bool CreditScoreTable::validate() const {
    if (tiers.size() > MAX_TIERS) return false;
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (tiers[i].remaining_fraction_x18 < 0 || tiers[i].remaining_fraction_x18 > X18_ONE) {
            return false;
        }
        if (i > 0 && tiers[i].remaining_fraction_x18 >= tiers[i - 1].remaining_fraction_x18) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// CreditScorer
// =============================================================================

CreditScorer::CreditScorer(const CreditScoreTable& table)
    : table_(table) {}

uint32_t CreditScorer::on_repayment(CreditRecord& record, Loan& loan) const {
    const I128 remaining = loan.remaining_fraction_x18();
    uint32_t earned = 0;

    for (size_t i = 0; i < table_.tiers.size() && i < CreditScoreTable::MAX_TIERS; ++i) {
        const uint32_t bit = 1u << i;
        if (loan.credit_tiers_awarded & bit) continue;

        const CreditTier& tier = table_.tiers[i];
        bool crossed = tier.remaining_fraction_x18 == 0
            ? loan.debt_x18() == 0
            : remaining <= tier.remaining_fraction_x18;
        if (!crossed) continue;

        loan.credit_tiers_awarded |= bit;
        earned += tier.points;
    }

    if (earned == 0) return 0;

    // Monotone, clamped at the ceiling
    uint32_t before = record.credit_score_;
    uint64_t next = static_cast<uint64_t>(before) + earned;
    if (next > table_.score_ceiling) next = table_.score_ceiling;
    if (next < before) next = before;
    record.credit_score_ = static_cast<uint32_t>(next);
    return record.credit_score_ - before;
}

} // namespace lend
