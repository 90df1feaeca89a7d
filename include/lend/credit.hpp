#ifndef LEND_CREDIT_HPP
#define LEND_CREDIT_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "types.hpp"
#include "loan.hpp"

namespace lend {

// =============================================================================
// Repayment Event
// =============================================================================

struct RepaymentEvent {
    LoanId loan_id;
    AssetId asset_id;
    I128 amount_x18;
    I128 remaining_x18;      // loan debt after the payment
    uint64_t timestamp;
    bool via_liquidation;
    uint32_t score_awarded;
};

class CreditScorer;

// =============================================================================
// CreditRecord - Per-User Non-Transferable Credit Report
// =============================================================================
//
// One record per user, created at registration and never destroyed.
// deposits hold liquidity-index-scaled balances. collateral holds every
// posted unit; locked_collateral the part currently backing loans.
// The score is written only by CreditScorer.

class CreditRecord {
public:
    CreditRecord() = default;
    CreditRecord(UserId user_id, std::string account, uint64_t created_at);

    UserId user_id() const { return user_id_; }
    const std::string& account() const { return account_; }
    uint64_t created_at() const { return created_at_; }
    uint32_t credit_score() const { return credit_score_; }

    // =========================================================================
    // Balances
    // =========================================================================

    const std::map<AssetId, I128>& deposits() const { return deposits_; }
    const std::map<AssetId, I128>& collateral() const { return collateral_; }
    const std::map<AssetId, I128>& locked_collateral() const { return locked_collateral_; }

    I128 scaled_deposit(AssetId asset_id) const;
    I128 posted_collateral(AssetId asset_id) const;
    I128 locked(AssetId asset_id) const;
    I128 free_collateral(AssetId asset_id) const;

    void add_deposit(AssetId asset_id, I128 scaled_x18);
    int32_t remove_deposit(AssetId asset_id, I128 scaled_x18);

    void add_collateral(AssetId asset_id, I128 amount_x18);
    int32_t remove_collateral(AssetId asset_id, I128 amount_x18);  // free collateral only

    int32_t lock_collateral(AssetId asset_id, I128 amount_x18);
    void unlock_collateral(AssetId asset_id, I128 amount_x18);

    // Removes locked collateral outright (liquidation seizure)
    void seize_collateral(AssetId asset_id, I128 amount_x18);

    // =========================================================================
    // Loans
    // =========================================================================

    const std::set<LoanId>& loan_ids() const { return loan_ids_; }
    const std::set<LoanId>& closed_loan_ids() const { return closed_loan_ids_; }

    void open_loan(LoanId loan_id) { loan_ids_.insert(loan_id); }
    void close_loan(LoanId loan_id);

    // =========================================================================
    // History
    // =========================================================================

    const std::vector<RepaymentEvent>& repayment_history() const { return repayment_history_; }
    void record_repayment(const RepaymentEvent& event) { repayment_history_.push_back(event); }

    uint32_t paid_off() const { return paid_off_; }
    uint32_t defaults() const { return defaults_; }
    void record_paid_off() { ++paid_off_; }
    void record_default() { ++defaults_; }

private:
    friend class CreditScorer;

    UserId user_id_ = 0;
    std::string account_;
    uint64_t created_at_ = 0;
    uint32_t credit_score_ = 0;

    std::map<AssetId, I128> deposits_;
    std::map<AssetId, I128> collateral_;
    std::map<AssetId, I128> locked_collateral_;
    std::set<LoanId> loan_ids_;
    std::set<LoanId> closed_loan_ids_;
    std::vector<RepaymentEvent> repayment_history_;
    uint32_t paid_off_ = 0;
    uint32_t defaults_ = 0;
};

// =============================================================================
// Credit Score Table
// =============================================================================

struct CreditTier {
    I128 remaining_fraction_x18;  // awarded once remaining/origination <= this
    uint32_t points;
};

struct CreditScoreTable {
    static constexpr size_t MAX_TIERS = 32;

    // Thresholds strictly descending
    std::vector<CreditTier> tiers = {
        {X18_ONE * 3 / 4, 5},
        {X18_ONE / 2, 5},
        {X18_ONE / 4, 5},
        {0, 5},
    };
    uint32_t score_ceiling = 1000;

    bool validate() const;
};

// =============================================================================
// CreditScorer - Tiered Score Updates on Repayment
// =============================================================================

class CreditScorer {
public:
    CreditScorer() = default;
    explicit CreditScorer(const CreditScoreTable& table);

    // Awards every tier the loan has newly crossed, at most once per loan,
    // capped at the ceiling. Returns the points actually added.
    uint32_t on_repayment(CreditRecord& record, Loan& loan) const;

    const CreditScoreTable& table() const { return table_; }

private:
    CreditScoreTable table_;
};

} // namespace lend

#endif // LEND_CREDIT_HPP
