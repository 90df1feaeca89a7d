#ifndef LEND_PROTOCOL_HPP
#define LEND_PROTOCOL_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "interest.hpp"
#include "pool.hpp"
#include "loan.hpp"
#include "credit.hpp"
#include "risk.hpp"
#include "liquidation.hpp"
#include "feed.hpp"
#include "custody.hpp"
#include "listener.hpp"
#include "config.hpp"

namespace lend {

// =============================================================================
// Repayment Result
// =============================================================================

struct RepayResult {
    int32_t code = errors::OK;
    LoanId loan_id = 0;
    I128 repaid_x18 = 0;               // never more than the debt
    I128 interest_repaid_x18 = 0;
    I128 principal_repaid_x18 = 0;
    I128 remaining_x18 = 0;
    I128 collateral_released_x18 = 0;
    LoanStatus status_after = LoanStatus::OPEN;
    uint32_t score_awarded = 0;
};

// =============================================================================
// Protocol Statistics
// =============================================================================

struct ProtocolStats {
    uint64_t operations;
    uint64_t rejected;
    uint64_t users;
    uint64_t loans_opened;
    uint64_t loans_closed;
    uint64_t liquidations;
    uint64_t shortfalls;
};

class LendingProtocol;

// =============================================================================
// BadLoanRange - Lazy Scan for Liquidatable Loans
// =============================================================================
//
// Each begin() snapshots the loan ids and the clock, then evaluates health
// one loan at a time as the iterator advances. Nothing is cached between
// passes, so a second begin() reflects price moves and new loans.

class BadLoanRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = LoanId;
        using difference_type = std::ptrdiff_t;
        using pointer = const LoanId*;
        using reference = const LoanId&;

        iterator() = default;
        iterator(const LendingProtocol* protocol,
                 std::shared_ptr<const std::vector<LoanId>> ids, uint64_t now);

        reference operator*() const { return (*ids_)[pos_]; }
        pointer operator->() const { return &(*ids_)[pos_]; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void seek();
        bool at_end() const { return !ids_ || pos_ >= ids_->size(); }

        const LendingProtocol* protocol_ = nullptr;
        std::shared_ptr<const std::vector<LoanId>> ids_;
        size_t pos_ = 0;
        uint64_t now_ = 0;
    };

    explicit BadLoanRange(const LendingProtocol* protocol) : protocol_(protocol) {}

    iterator begin() const;
    iterator end() const { return iterator(); }

private:
    const LendingProtocol* protocol_;
};

// =============================================================================
// LendingProtocol - Operations and Queries
// =============================================================================
//
// Every operation is one atomic unit over the Pools, Loan and CreditRecords
// it touches: it validates, stages changes on copies, prepares the custody
// transfers, then swaps the copies in. A failing operation returns exactly
// one error code and changes nothing.

class LendingProtocol {
public:
    using Clock = std::function<uint64_t()>;

    // Throws ConfigError if config fails validation. An empty clock reads
    // the system clock.
    LendingProtocol(const ProtocolConfig& config, IPriceFeed& feed, IAssetCustody& custody,
                    Clock clock = Clock());
    ~LendingProtocol() = default;

    // Non-copyable
    LendingProtocol(const LendingProtocol&) = delete;
    LendingProtocol& operator=(const LendingProtocol&) = delete;

    // Set before concurrent use
    void set_listener(ProtocolListener* listener);
    uint64_t now() const { return clock_(); }

    // =========================================================================
    // Assets and Users
    // =========================================================================

    int32_t list_asset(const AssetConfig& asset);
    bool asset_listed(AssetId asset_id) const;

    // Returns the new user id, or a negative error code
    int64_t register_user(const std::string& account = {});

    // =========================================================================
    // Supply Side
    // =========================================================================

    int32_t deposit(UserId user_id, AssetId asset_id, I128 amount_x18);
    int32_t withdraw(UserId user_id, AssetId asset_id, I128 amount_x18);

    // =========================================================================
    // Collateral
    // =========================================================================

    int32_t deposit_collateral(UserId user_id, AssetId asset_id, I128 amount_x18);

    // Free (unlocked) collateral only
    int32_t redeem_collateral(UserId user_id, AssetId asset_id, I128 amount_x18);

    // Moves supplied liquidity into collateral without leaving the protocol
    int32_t convert_to_collateral(UserId user_id, AssetId asset_id, I128 amount_x18);

    // Free collateral back into supplied liquidity
    int32_t convert_to_deposit(UserId user_id, AssetId asset_id, I128 amount_x18);

    // =========================================================================
    // Borrowing
    // =========================================================================

    // Locks collateral_amount of the user's free collateral behind a new loan.
    // Returns the loan id, or a negative error code.
    int64_t borrow(UserId user_id, AssetId collateral_asset_id, I128 collateral_amount_x18,
                   AssetId debt_asset_id, I128 amount_x18);

    int32_t borrow_additional(UserId holder_id, LoanId loan_id, I128 amount_x18);
    int32_t add_collateral(UserId borrower_id, LoanId loan_id, I128 amount_x18);

    // Interest first, then principal; any excess over the debt is not taken
    RepayResult repay(UserId holder_id, LoanId loan_id, I128 amount_x18);

    int32_t transfer_loan(UserId holder_id, LoanId loan_id, UserId new_holder_id);

    // =========================================================================
    // Liquidation
    // =========================================================================

    LiquidationResult liquidate(LoanId loan_id, I128 repay_amount_x18, UserId liquidator_id);

    BadLoanRange find_bad_loans() const { return BadLoanRange(this); }

    // =========================================================================
    // Index Maintenance
    // =========================================================================

    int32_t accrue(AssetId asset_id);

    // =========================================================================
    // Queries (read-only, projected to now)
    // =========================================================================

    std::optional<I128> get_liquidity(AssetId asset_id) const;
    std::optional<I128> get_total_supply(AssetId asset_id) const;
    std::optional<I128> get_total_borrowed(AssetId asset_id) const;
    std::optional<I128> get_utilization(AssetId asset_id) const;
    std::optional<I128> get_borrow_rate(AssetId asset_id) const;
    std::optional<I128> get_supply_rate(AssetId asset_id) const;
    std::optional<PoolState> get_pool_state(AssetId asset_id) const;
    std::vector<AssetId> list_assets() const;

    std::optional<I128> get_health_factor(LoanId loan_id) const;
    std::optional<LoanRisk> get_loan_risk(LoanId loan_id) const;
    std::optional<Loan> get_loan(LoanId loan_id) const;
    std::optional<I128> get_max_borrow(LoanId loan_id) const;

    std::optional<CreditRecord> get_credit_record(UserId user_id) const;
    std::optional<I128> get_deposit_balance(UserId user_id, AssetId asset_id) const;

    ProtocolStats get_stats() const;

    const ProtocolConfig& config() const { return config_; }
    const RiskEngine& risk_engine() const { return risk_; }

private:
    friend class BadLoanRange;
    friend class BadLoanRange::iterator;

    struct PoolSlot {
        std::mutex mutex;
        Pool pool;
    };

    struct UserSlot {
        std::mutex mutex;
        CreditRecord record;
    };

    // Ids and assets never change after creation and are read without the lock
    struct LoanSlot {
        LoanSlot(LoanId id, UserId borrower, AssetId collateral_asset, AssetId debt_asset)
            : loan_id(id), borrower_id(borrower)
            , collateral_asset_id(collateral_asset), debt_asset_id(debt_asset) {}

        const LoanId loan_id;
        const UserId borrower_id;
        const AssetId collateral_asset_id;
        const AssetId debt_asset_id;
        std::mutex mutex;
        Loan loan;
    };

    PoolSlot* find_pool(AssetId asset_id) const;
    UserSlot* find_user(UserId user_id) const;
    LoanSlot* find_loan(LoanId loan_id) const;
    std::vector<LoanId> loan_ids_snapshot() const;

    // Brings the debt pool and loan to now; returns the interest realized
    I128 touch_loan(Loan& loan, Pool& debt_pool, uint32_t score, uint64_t now) const;

    // PARTIALLY_LIQUIDATED -> OPEN once health is back above 1
    void refresh_status(Loan& loan, std::optional<I128> collateral_price,
                        std::optional<I128> debt_price, uint32_t score) const;

    // Prepares transfers, runs apply(), commits; CUSTODY_REJECTED leaves state as is
    int32_t settle(const std::vector<TransferInstruction>& transfers,
                   const std::function<void()>& apply);

    // Projects a loan to `now` under its entity locks
    std::optional<LoanRisk> evaluate(LoanSlot* slot, uint64_t now, Loan* projected) const;

    int32_t finish(Operation op, UserId user_id, int32_t code,
                   const std::vector<ProtocolEvent>& events);

    ProtocolConfig config_;
    InterestRateModel model_;
    RiskEngine risk_;
    CreditScorer scorer_;
    LiquidationEngine liquidation_;

    IPriceFeed& feed_;
    IAssetCustody& custody_;
    Clock clock_;
    NullProtocolListener null_listener_;
    ProtocolListener* listener_;

    std::unordered_map<AssetId, std::unique_ptr<PoolSlot>> pools_;
    mutable std::shared_mutex pools_mutex_;

    std::unordered_map<UserId, std::unique_ptr<UserSlot>> users_;
    std::unordered_map<std::string, UserId> accounts_;
    mutable std::shared_mutex users_mutex_;

    std::map<LoanId, std::unique_ptr<LoanSlot>> loans_;
    mutable std::shared_mutex loans_mutex_;

    std::atomic<uint64_t> next_user_id_{1};
    std::atomic<uint64_t> next_loan_id_{1};
    std::atomic<uint64_t> next_op_id_{1};

    std::atomic<uint64_t> operations_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> loans_opened_{0};
    std::atomic<uint64_t> loans_closed_{0};
    std::atomic<uint64_t> liquidations_{0};
    std::atomic<uint64_t> shortfalls_{0};
};

} // namespace lend

#endif // LEND_PROTOCOL_HPP
