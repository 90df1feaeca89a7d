// =============================================================================
// protocol.cpp - LendingProtocol Implementation
// =============================================================================

#include "lend/protocol.hpp"
#include <algorithm>
#include <initializer_list>
#include <utility>

namespace lend {

namespace {

// Locks a set of entity mutexes in address order. Duplicates (same pool on
// both sides of a loan) are locked once.
class EntityLocks {
public:
    explicit EntityLocks(std::initializer_list<std::mutex*> mutexes)
        : held_(mutexes) {
        std::sort(held_.begin(), held_.end(), std::less<std::mutex*>());
        held_.erase(std::unique(held_.begin(), held_.end()), held_.end());
        for (std::mutex* m : held_) m->lock();
    }

    ~EntityLocks() {
        for (auto it = held_.rbegin(); it != held_.rend(); ++it) (*it)->unlock();
    }

    EntityLocks(const EntityLocks&) = delete;
    EntityLocks& operator=(const EntityLocks&) = delete;

private:
    std::vector<std::mutex*> held_;
};

// Staged copies of the debt and collateral pools of a loan; one copy when
// both sides are the same asset.
class StagedPools {
public:
    StagedPools(Pool& debt_live, Pool& collateral_live)
        : debt_live_(debt_live)
        , collateral_live_(collateral_live)
        , shared_(&debt_live == &collateral_live)
        , debt_(debt_live)
        , collateral_(shared_ ? Pool() : collateral_live) {}

    Pool& debt() { return debt_; }
    Pool& collateral() { return shared_ ? debt_ : collateral_; }

    void commit() {
        debt_live_ = debt_;
        if (!shared_) collateral_live_ = collateral_;
    }

private:
    Pool& debt_live_;
    Pool& collateral_live_;
    bool shared_;
    Pool debt_;
    Pool collateral_;
};

} // namespace

// =============================================================================
// BadLoanRange
// =============================================================================

BadLoanRange::iterator::iterator(const LendingProtocol* protocol,
                                 std::shared_ptr<const std::vector<LoanId>> ids, uint64_t now)
    : protocol_(protocol)
    , ids_(std::move(ids))
    , now_(now) {
    seek();
}

void BadLoanRange::iterator::seek() {
    while (!at_end()) {
        LendingProtocol::LoanSlot* slot = protocol_->find_loan((*ids_)[pos_]);
        if (slot) {
            auto risk = protocol_->evaluate(slot, now_, nullptr);
            if (risk && risk->liquidatable) return;
        }
        ++pos_;
    }
}

BadLoanRange::iterator& BadLoanRange::iterator::operator++() {
    ++pos_;
    seek();
    return *this;
}

BadLoanRange::iterator BadLoanRange::iterator::operator++(int) {
    iterator prev = *this;
    ++(*this);
    return prev;
}

bool BadLoanRange::iterator::operator==(const iterator& other) const {
    if (at_end() || other.at_end()) return at_end() == other.at_end();
    return ids_ == other.ids_ && pos_ == other.pos_;
}

BadLoanRange::iterator BadLoanRange::begin() const {
    auto ids = std::make_shared<const std::vector<LoanId>>(protocol_->loan_ids_snapshot());
    return iterator(protocol_, std::move(ids), protocol_->now());
}

// =============================================================================
// Constructor
// =============================================================================

LendingProtocol::LendingProtocol(const ProtocolConfig& config, IPriceFeed& feed,
                                 IAssetCustody& custody, Clock clock)
    : config_(config)
    , model_(config.interest)
    , risk_(config.risk)
    , scorer_(config.credit)
    , liquidation_(risk_, scorer_)
    , feed_(feed)
    , custody_(custody)
    , clock_(clock ? std::move(clock) : Clock(current_timestamp))
    , listener_(&null_listener_) {
    config_.validate();
    for (const auto& asset : config_.assets) {
        list_asset(asset);
    }
}

void LendingProtocol::set_listener(ProtocolListener* listener) {
    listener_ = listener ? listener : &null_listener_;
}

// =============================================================================
// Registry Lookups
// =============================================================================

LendingProtocol::PoolSlot* LendingProtocol::find_pool(AssetId asset_id) const {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(asset_id);
    return it == pools_.end() ? nullptr : it->second.get();
}

LendingProtocol::UserSlot* LendingProtocol::find_user(UserId user_id) const {
    std::shared_lock lock(users_mutex_);
    auto it = users_.find(user_id);
    return it == users_.end() ? nullptr : it->second.get();
}

LendingProtocol::LoanSlot* LendingProtocol::find_loan(LoanId loan_id) const {
    std::shared_lock lock(loans_mutex_);
    auto it = loans_.find(loan_id);
    return it == loans_.end() ? nullptr : it->second.get();
}

std::vector<LoanId> LendingProtocol::loan_ids_snapshot() const {
    std::shared_lock lock(loans_mutex_);
    std::vector<LoanId> ids;
    ids.reserve(loans_.size());
    for (const auto& [id, slot] : loans_) {
        (void)slot;
        ids.push_back(id);
    }
    return ids;
}

// =============================================================================
// Internal Helpers
// =============================================================================

I128 LendingProtocol::touch_loan(Loan& loan, Pool& debt_pool, uint32_t score, uint64_t now) const {
    debt_pool.accrue_indices(now);
    I128 rate = risk_.loan_rate_x18(debt_pool.borrow_rate_x18(), score);
    I128 interest = loan.accrue(rate, now);
    debt_pool.realize_interest(interest);
    return interest;
}

void LendingProtocol::refresh_status(Loan& loan, std::optional<I128> collateral_price,
                                     std::optional<I128> debt_price, uint32_t score) const {
    if (loan.status != LoanStatus::PARTIALLY_LIQUIDATED) return;
    if (!collateral_price || !debt_price) return;
    LoanRisk risk = risk_.assess(loan, *collateral_price, *debt_price, score);
    if (risk.health_factor_x18 > X18_ONE) loan.status = LoanStatus::OPEN;
}

int32_t LendingProtocol::settle(const std::vector<TransferInstruction>& transfers,
                                const std::function<void()>& apply) {
    if (transfers.empty()) {
        apply();
        return errors::OK;
    }

    const uint64_t op_id = next_op_id_.fetch_add(1);
    if (custody_.prepare(op_id, transfers) != errors::OK) {
        return errors::CUSTODY_REJECTED;
    }
    try {
        apply();
    } catch (...) {
        custody_.abort(op_id);
        throw;
    }
    custody_.commit(op_id);
    return errors::OK;
}

std::optional<LoanRisk> LendingProtocol::evaluate(LoanSlot* slot, uint64_t now, Loan* projected) const {
    UserSlot* borrower = find_user(slot->borrower_id);
    PoolSlot* debt_pool = find_pool(slot->debt_asset_id);
    if (!borrower || !debt_pool) return std::nullopt;

    auto collateral_price = feed_.get_price(slot->collateral_asset_id);
    auto debt_price = feed_.get_price(slot->debt_asset_id);

    Loan loan;
    Pool pool;
    uint32_t score = 0;
    {
        EntityLocks locks({&slot->mutex, &borrower->mutex, &debt_pool->mutex});
        loan = slot->loan;
        pool = debt_pool->pool;
        score = borrower->record.credit_score();
    }

    touch_loan(loan, pool, score, now);
    if (projected) *projected = loan;

    if (!collateral_price || !debt_price) return std::nullopt;
    return risk_.assess(loan, *collateral_price, *debt_price, score);
}

int32_t LendingProtocol::finish(Operation op, UserId user_id, int32_t code,
                                const std::vector<ProtocolEvent>& events) {
    operations_.fetch_add(1, std::memory_order_relaxed);

    if (code != errors::OK && code != errors::PARTIAL_SEIZURE_SHORTFALL) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        listener_->on_rejected(op, user_id, code);
        return code;
    }
    for (const auto& event : events) {
        listener_->on_event(event);
    }
    return code;
}

// =============================================================================
// Assets and Users
// =============================================================================

int32_t LendingProtocol::list_asset(const AssetConfig& asset) {
    if (asset.reserve_factor_x18 < 0 || asset.reserve_factor_x18 >= X18_ONE) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(pools_mutex_);
    if (pools_.count(asset.asset_id)) {
        return errors::ASSET_ALREADY_LISTED;
    }

    auto slot = std::make_unique<PoolSlot>();
    slot->pool = Pool(asset.asset_id, asset.symbol, asset.reserve_factor_x18, model_, clock_());
    pools_.emplace(asset.asset_id, std::move(slot));
    return errors::OK;
}

bool LendingProtocol::asset_listed(AssetId asset_id) const {
    return find_pool(asset_id) != nullptr;
}

int64_t LendingProtocol::register_user(const std::string& account) {
    int32_t rc = errors::OK;
    UserId user_id = 0;
    const uint64_t now = clock_();
    {
        std::unique_lock lock(users_mutex_);
        if (!account.empty() && accounts_.count(account)) {
            rc = errors::USER_ALREADY_REGISTERED;
        } else {
            user_id = next_user_id_.fetch_add(1);
            auto slot = std::make_unique<UserSlot>();
            slot->record = CreditRecord(user_id, account, now);
            users_.emplace(user_id, std::move(slot));
            if (!account.empty()) accounts_.emplace(account, user_id);
        }
    }

    std::vector<ProtocolEvent> events;
    if (rc == errors::OK) {
        events.push_back({Operation::REGISTER_USER, user_id, 0, 0, 0, now});
    }
    rc = finish(Operation::REGISTER_USER, user_id, rc, events);
    return rc == errors::OK ? static_cast<int64_t>(user_id) : rc;
}

// =============================================================================
// Supply Side
// =============================================================================

int32_t LendingProtocol::deposit(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        int32_t err = staged.deposit(amount_x18, now);
        if (err != errors::OK) return err;
        record.add_deposit(asset_id, staged.scale(amount_x18));

        err = settle({{asset_id, amount_x18, user_id, PROTOCOL_ACCOUNT}}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::DEPOSIT, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::DEPOSIT, user_id, rc, events);
}

int32_t LendingProtocol::withdraw(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        staged.accrue_indices(now);
        const I128 held = record.scaled_deposit(asset_id);
        if (held <= 0) return errors::INSUFFICIENT_BALANCE;

        const I128 scaled = staged.scale_up(amount_x18);
        if (scaled > held) return errors::INSUFFICIENT_BALANCE;

        int32_t err = staged.withdraw(amount_x18, now);
        if (err != errors::OK) return err;
        err = record.remove_deposit(asset_id, scaled);
        if (err != errors::OK) return err;

        err = settle({{asset_id, amount_x18, PROTOCOL_ACCOUNT, user_id}}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::WITHDRAW, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::WITHDRAW, user_id, rc, events);
}

// =============================================================================
// Collateral
// =============================================================================

int32_t LendingProtocol::deposit_collateral(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        staged.accrue_indices(now);
        staged.post_collateral(amount_x18);
        record.add_collateral(asset_id, amount_x18);

        int32_t err = settle({{asset_id, amount_x18, user_id, PROTOCOL_ACCOUNT}}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::DEPOSIT_COLLATERAL, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::DEPOSIT_COLLATERAL, user_id, rc, events);
}

int32_t LendingProtocol::redeem_collateral(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        int32_t err = record.remove_collateral(asset_id, amount_x18);
        if (err != errors::OK) return err;
        staged.accrue_indices(now);
        err = staged.release_collateral(amount_x18);
        if (err != errors::OK) return err;

        err = settle({{asset_id, amount_x18, PROTOCOL_ACCOUNT, user_id}}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::REDEEM_COLLATERAL, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::REDEEM_COLLATERAL, user_id, rc, events);
}

int32_t LendingProtocol::convert_to_collateral(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        staged.accrue_indices(now);
        const I128 held = record.scaled_deposit(asset_id);
        if (held <= 0) return errors::INSUFFICIENT_BALANCE;

        const I128 scaled = staged.scale_up(amount_x18);
        if (scaled > held) return errors::INSUFFICIENT_BALANCE;

        // Liquidity leaves the lendable supply and stays in custody as collateral
        int32_t err = staged.withdraw(amount_x18, now);
        if (err != errors::OK) return err;
        err = record.remove_deposit(asset_id, scaled);
        if (err != errors::OK) return err;
        staged.post_collateral(amount_x18);
        record.add_collateral(asset_id, amount_x18);

        err = settle({}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::CONVERT_TO_COLLATERAL, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::CONVERT_TO_COLLATERAL, user_id, rc, events);
}

int32_t LendingProtocol::convert_to_deposit(UserId user_id, AssetId asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* pool = find_pool(asset_id);
        if (!pool) return errors::UNKNOWN_ASSET;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &pool->mutex});
        Pool staged = pool->pool;
        CreditRecord record = user->record;

        // Free collateral rejoins the lendable supply without leaving custody
        int32_t err = record.remove_collateral(asset_id, amount_x18);
        if (err != errors::OK) return err;
        err = staged.release_collateral(amount_x18);
        if (err != errors::OK) return err;
        err = staged.deposit(amount_x18, now);
        if (err != errors::OK) return err;
        record.add_deposit(asset_id, staged.scale(amount_x18));

        err = settle({}, [&] {
            pool->pool = std::move(staged);
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::CONVERT_TO_DEPOSIT, user_id, 0, asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::CONVERT_TO_DEPOSIT, user_id, rc, events);
}

// =============================================================================
// Borrowing
// =============================================================================

int64_t LendingProtocol::borrow(UserId user_id, AssetId collateral_asset_id, I128 collateral_amount_x18,
                                AssetId debt_asset_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    LoanId created = 0;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0 || collateral_amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* user = find_user(user_id);
        if (!user) return errors::UNKNOWN_USER;
        PoolSlot* collateral_pool = find_pool(collateral_asset_id);
        PoolSlot* debt_pool = find_pool(debt_asset_id);
        if (!collateral_pool || !debt_pool) return errors::UNKNOWN_ASSET;

        auto collateral_price = feed_.get_price(collateral_asset_id);
        auto debt_price = feed_.get_price(debt_asset_id);
        if (!collateral_price || !debt_price) return errors::PRICE_UNAVAILABLE;
        const uint64_t now = clock_();

        EntityLocks locks({&user->mutex, &collateral_pool->mutex, &debt_pool->mutex});
        StagedPools pools(debt_pool->pool, collateral_pool->pool);
        CreditRecord record = user->record;

        pools.debt().accrue_indices(now);
        pools.collateral().accrue_indices(now);

        int32_t err = record.lock_collateral(collateral_asset_id, collateral_amount_x18);
        if (err != errors::OK) return err;

        const uint32_t score = record.credit_score();
        err = risk_.check_borrow(collateral_amount_x18, *collateral_price,
                                 amount_x18, *debt_price, score);
        if (err != errors::OK) return err;

        err = pools.debt().borrow(amount_x18, now);
        if (err != errors::OK) return err;

        Loan loan;
        loan.borrower_id = user_id;
        loan.holder_id = user_id;
        loan.collateral_asset_id = collateral_asset_id;
        loan.collateral_amount_x18 = collateral_amount_x18;
        loan.debt_asset_id = debt_asset_id;
        loan.principal_x18 = amount_x18;
        loan.interest_rate_at_origination_x18 = risk_.loan_rate_x18(pools.debt().borrow_rate_x18(), score);
        loan.origination_balance_x18 = amount_x18;
        loan.status = LoanStatus::OPEN;
        loan.opened_at = now;
        loan.last_update_timestamp = now;

        err = settle({{debt_asset_id, amount_x18, PROTOCOL_ACCOUNT, user_id}}, [&] {
            created = next_loan_id_.fetch_add(1);
            loan.loan_id = created;
            record.open_loan(created);

            auto slot = std::make_unique<LoanSlot>(created, user_id, collateral_asset_id, debt_asset_id);
            slot->loan = loan;
            {
                std::unique_lock lock(loans_mutex_);
                loans_.emplace(created, std::move(slot));
            }
            pools.commit();
            user->record = std::move(record);
        });
        if (err == errors::OK) {
            loans_opened_.fetch_add(1, std::memory_order_relaxed);
            events.push_back({Operation::BORROW, user_id, created, debt_asset_id, amount_x18, now});
        }
        return err;
    }();
    rc = finish(Operation::BORROW, user_id, rc, events);
    return rc == errors::OK ? static_cast<int64_t>(created) : rc;
}

int32_t LendingProtocol::borrow_additional(UserId holder_id, LoanId loan_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        if (!find_user(holder_id)) return errors::UNKNOWN_USER;
        LoanSlot* slot = find_loan(loan_id);
        if (!slot) return errors::UNKNOWN_LOAN;
        UserSlot* borrower = find_user(slot->borrower_id);
        PoolSlot* debt_pool = find_pool(slot->debt_asset_id);
        if (!borrower) return errors::UNKNOWN_USER;
        if (!debt_pool) return errors::UNKNOWN_ASSET;

        auto collateral_price = feed_.get_price(slot->collateral_asset_id);
        auto debt_price = feed_.get_price(slot->debt_asset_id);
        if (!collateral_price || !debt_price) return errors::PRICE_UNAVAILABLE;
        const uint64_t now = clock_();

        EntityLocks locks({&slot->mutex, &borrower->mutex, &debt_pool->mutex});
        Loan loan = slot->loan;
        Pool staged = debt_pool->pool;
        CreditRecord record = borrower->record;

        if (loan.holder_id != holder_id) return errors::UNAUTHORIZED;
        if (!loan.is_active()) return errors::LOAN_CLOSED;

        const uint32_t score = record.credit_score();
        touch_loan(loan, staged, score, now);

        int32_t err = risk_.check_borrow(loan.collateral_amount_x18, *collateral_price,
                                         loan.debt_x18() + amount_x18, *debt_price, score);
        if (err != errors::OK) return err;

        err = staged.borrow(amount_x18, now);
        if (err != errors::OK) return err;

        loan.principal_x18 += amount_x18;
        loan.origination_balance_x18 += amount_x18;
        refresh_status(loan, collateral_price, debt_price, score);

        err = settle({{loan.debt_asset_id, amount_x18, PROTOCOL_ACCOUNT, holder_id}}, [&] {
            slot->loan = loan;
            debt_pool->pool = std::move(staged);
        });
        if (err == errors::OK) {
            events.push_back({Operation::BORROW_ADDITIONAL, holder_id, loan_id,
                              loan.debt_asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::BORROW_ADDITIONAL, holder_id, rc, events);
}

int32_t LendingProtocol::add_collateral(UserId borrower_id, LoanId loan_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        UserSlot* borrower = find_user(borrower_id);
        if (!borrower) return errors::UNKNOWN_USER;
        LoanSlot* slot = find_loan(loan_id);
        if (!slot) return errors::UNKNOWN_LOAN;
        if (slot->borrower_id != borrower_id) return errors::UNAUTHORIZED;
        PoolSlot* debt_pool = find_pool(slot->debt_asset_id);
        if (!debt_pool) return errors::UNKNOWN_ASSET;

        auto collateral_price = feed_.get_price(slot->collateral_asset_id);
        auto debt_price = feed_.get_price(slot->debt_asset_id);
        const uint64_t now = clock_();

        EntityLocks locks({&slot->mutex, &borrower->mutex, &debt_pool->mutex});
        Loan loan = slot->loan;
        Pool staged = debt_pool->pool;
        CreditRecord record = borrower->record;

        if (!loan.is_active()) return errors::LOAN_CLOSED;

        int32_t err = record.lock_collateral(loan.collateral_asset_id, amount_x18);
        if (err != errors::OK) return err;

        const uint32_t score = record.credit_score();
        touch_loan(loan, staged, score, now);
        loan.collateral_amount_x18 += amount_x18;
        refresh_status(loan, collateral_price, debt_price, score);

        err = settle({}, [&] {
            slot->loan = loan;
            debt_pool->pool = std::move(staged);
            borrower->record = std::move(record);
        });
        if (err == errors::OK) {
            events.push_back({Operation::ADD_COLLATERAL, borrower_id, loan_id,
                              loan.collateral_asset_id, amount_x18, now});
        }
        return err;
    }();
    return finish(Operation::ADD_COLLATERAL, borrower_id, rc, events);
}

RepayResult LendingProtocol::repay(UserId holder_id, LoanId loan_id, I128 amount_x18) {
    std::vector<ProtocolEvent> events;
    RepayResult result;
    result.loan_id = loan_id;

    result.code = [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;
        if (!find_user(holder_id)) return errors::UNKNOWN_USER;
        LoanSlot* slot = find_loan(loan_id);
        if (!slot) return errors::UNKNOWN_LOAN;
        UserSlot* borrower = find_user(slot->borrower_id);
        PoolSlot* debt_pool = find_pool(slot->debt_asset_id);
        if (!borrower) return errors::UNKNOWN_USER;
        if (!debt_pool) return errors::UNKNOWN_ASSET;

        auto collateral_price = feed_.get_price(slot->collateral_asset_id);
        auto debt_price = feed_.get_price(slot->debt_asset_id);
        const uint64_t now = clock_();

        EntityLocks locks({&slot->mutex, &borrower->mutex, &debt_pool->mutex});
        Loan loan = slot->loan;
        Pool staged = debt_pool->pool;
        CreditRecord record = borrower->record;

        if (loan.holder_id != holder_id) return errors::UNAUTHORIZED;
        if (!loan.is_active()) return errors::LOAN_CLOSED;

        const uint32_t score = record.credit_score();
        touch_loan(loan, staged, score, now);

        I128 interest_paid = 0;
        I128 principal_paid = 0;
        I128 applied = loan.apply_repayment(amount_x18, interest_paid, principal_paid);
        staged.repay(applied, now);

        if (loan.debt_x18() == 0) {
            result.collateral_released_x18 = loan.collateral_amount_x18;
            record.unlock_collateral(loan.collateral_asset_id, loan.collateral_amount_x18);
            loan.collateral_amount_x18 = 0;
            loan.status = LoanStatus::CLOSED;
            record.close_loan(loan_id);
            record.record_paid_off();
        } else {
            refresh_status(loan, collateral_price, debt_price, score);
        }

        result.score_awarded = scorer_.on_repayment(record, loan);
        record.record_repayment(RepaymentEvent{
            loan_id, loan.debt_asset_id, applied, loan.debt_x18(), now, false, result.score_awarded});

        result.repaid_x18 = applied;
        result.interest_repaid_x18 = interest_paid;
        result.principal_repaid_x18 = principal_paid;
        result.remaining_x18 = loan.debt_x18();
        result.status_after = loan.status;

        int32_t err = settle({{loan.debt_asset_id, applied, holder_id, PROTOCOL_ACCOUNT}}, [&] {
            slot->loan = loan;
            debt_pool->pool = std::move(staged);
            borrower->record = std::move(record);
        });
        if (err != errors::OK) return err;

        events.push_back({Operation::REPAY, holder_id, loan_id, loan.debt_asset_id, applied, now});
        if (loan.status == LoanStatus::CLOSED) {
            loans_closed_.fetch_add(1, std::memory_order_relaxed);
            events.push_back({Operation::LOAN_CLOSED, loan.borrower_id, loan_id,
                              loan.collateral_asset_id, result.collateral_released_x18, now});
        }
        if (result.score_awarded > 0) {
            events.push_back({Operation::CREDIT_SCORE, loan.borrower_id, loan_id, 0,
                              x18::from_int(result.score_awarded), now});
        }
        return errors::OK;
    }();

    if (result.code != errors::OK) {
        RepayResult rejected;
        rejected.loan_id = loan_id;
        rejected.code = result.code;
        result = rejected;
    }
    finish(Operation::REPAY, holder_id, result.code, events);
    return result;
}

int32_t LendingProtocol::transfer_loan(UserId holder_id, LoanId loan_id, UserId new_holder_id) {
    std::vector<ProtocolEvent> events;
    int32_t rc = [&]() -> int32_t {
        if (!find_user(holder_id) || !find_user(new_holder_id)) return errors::UNKNOWN_USER;
        LoanSlot* slot = find_loan(loan_id);
        if (!slot) return errors::UNKNOWN_LOAN;

        std::lock_guard lock(slot->mutex);
        if (slot->loan.holder_id != holder_id) return errors::UNAUTHORIZED;
        if (!slot->loan.is_active()) return errors::LOAN_CLOSED;

        slot->loan.holder_id = new_holder_id;
        events.push_back({Operation::TRANSFER_LOAN, new_holder_id, loan_id, 0, 0, clock_()});
        return errors::OK;
    }();
    return finish(Operation::TRANSFER_LOAN, holder_id, rc, events);
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult LendingProtocol::liquidate(LoanId loan_id, I128 repay_amount_x18,
                                             UserId liquidator_id) {
    std::vector<ProtocolEvent> events;
    LiquidationResult result;
    result.loan_id = loan_id;
    result.liquidator_id = liquidator_id;

    auto rejected = [&](int32_t code) {
        LiquidationResult r = result;
        r.code = code;
        return r;
    };

    result = [&]() -> LiquidationResult {
        if (!find_user(liquidator_id)) return rejected(errors::UNKNOWN_USER);
        LoanSlot* slot = find_loan(loan_id);
        if (!slot) return rejected(errors::UNKNOWN_LOAN);
        UserSlot* borrower = find_user(slot->borrower_id);
        PoolSlot* debt_pool = find_pool(slot->debt_asset_id);
        PoolSlot* collateral_pool = find_pool(slot->collateral_asset_id);
        if (!borrower) return rejected(errors::UNKNOWN_USER);
        if (!debt_pool || !collateral_pool) return rejected(errors::UNKNOWN_ASSET);

        auto collateral_price = feed_.get_price(slot->collateral_asset_id);
        auto debt_price = feed_.get_price(slot->debt_asset_id);
        if (!collateral_price || !debt_price) return rejected(errors::PRICE_UNAVAILABLE);
        const uint64_t now = clock_();

        EntityLocks locks({&slot->mutex, &borrower->mutex, &debt_pool->mutex, &collateral_pool->mutex});
        Loan loan = slot->loan;
        StagedPools pools(debt_pool->pool, collateral_pool->pool);
        CreditRecord record = borrower->record;

        if (loan.is_active()) {
            touch_loan(loan, pools.debt(), record.credit_score(), now);
            pools.collateral().accrue_indices(now);
        }

        LiquidationContext ctx{loan, record, pools.debt(), pools.collateral(),
                               *debt_price, *collateral_price, now};
        LiquidationResult outcome = liquidation_.liquidate(ctx, repay_amount_x18, liquidator_id);
        if (!outcome.committed()) return outcome;

        std::vector<TransferInstruction> transfers;
        transfers.push_back({loan.debt_asset_id, outcome.repaid_x18, liquidator_id, PROTOCOL_ACCOUNT});
        if (outcome.collateral_seized_x18 > 0) {
            transfers.push_back({loan.collateral_asset_id, outcome.collateral_seized_x18,
                                 PROTOCOL_ACCOUNT, liquidator_id});
        }

        int32_t err = settle(transfers, [&] {
            slot->loan = loan;
            pools.commit();
            borrower->record = std::move(record);
        });
        if (err != errors::OK) return rejected(err);

        liquidations_.fetch_add(1, std::memory_order_relaxed);
        events.push_back({Operation::LIQUIDATE, liquidator_id, loan_id, loan.debt_asset_id,
                          outcome.repaid_x18, now});
        if (loan.status == LoanStatus::CLOSED) {
            loans_closed_.fetch_add(1, std::memory_order_relaxed);
            events.push_back({Operation::LOAN_CLOSED, loan.borrower_id, loan_id,
                              loan.collateral_asset_id, outcome.collateral_released_x18, now});
        }
        if (outcome.score_awarded > 0) {
            events.push_back({Operation::CREDIT_SCORE, loan.borrower_id, loan_id, 0,
                              x18::from_int(outcome.score_awarded), now});
        }
        return outcome;
    }();

    finish(Operation::LIQUIDATE, liquidator_id, result.code, events);
    if (result.code == errors::PARTIAL_SEIZURE_SHORTFALL) {
        shortfalls_.fetch_add(1, std::memory_order_relaxed);
        listener_->on_shortfall(result);
    }
    return result;
}

// =============================================================================
// Index Maintenance
// =============================================================================

int32_t LendingProtocol::accrue(AssetId asset_id) {
    PoolSlot* pool = find_pool(asset_id);
    if (!pool) return errors::UNKNOWN_ASSET;

    std::lock_guard lock(pool->mutex);
    pool->pool.accrue_indices(clock_());
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PoolState> LendingProtocol::get_pool_state(AssetId asset_id) const {
    PoolSlot* slot = find_pool(asset_id);
    if (!slot) return std::nullopt;

    Pool pool;
    {
        std::lock_guard lock(slot->mutex);
        pool = slot->pool;
    }
    pool.accrue_indices(clock_());
    return pool.state();
}

std::optional<I128> LendingProtocol::get_liquidity(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->total_supply_x18 - state->total_borrowed_x18;
}

std::optional<I128> LendingProtocol::get_total_supply(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->total_supply_x18;
}

std::optional<I128> LendingProtocol::get_total_borrowed(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->total_borrowed_x18;
}

std::optional<I128> LendingProtocol::get_utilization(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->utilization_x18;
}

std::optional<I128> LendingProtocol::get_borrow_rate(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->borrow_rate_x18;
}

std::optional<I128> LendingProtocol::get_supply_rate(AssetId asset_id) const {
    auto state = get_pool_state(asset_id);
    if (!state) return std::nullopt;
    return state->supply_rate_x18;
}

std::vector<AssetId> LendingProtocol::list_assets() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<AssetId> ids;
    ids.reserve(pools_.size());
    for (const auto& [id, slot] : pools_) {
        (void)slot;
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<LoanRisk> LendingProtocol::get_loan_risk(LoanId loan_id) const {
    LoanSlot* slot = find_loan(loan_id);
    if (!slot) return std::nullopt;
    return evaluate(slot, clock_(), nullptr);
}

std::optional<I128> LendingProtocol::get_health_factor(LoanId loan_id) const {
    auto risk = get_loan_risk(loan_id);
    if (!risk) return std::nullopt;
    return risk->health_factor_x18;
}

std::optional<Loan> LendingProtocol::get_loan(LoanId loan_id) const {
    LoanSlot* slot = find_loan(loan_id);
    if (!slot) return std::nullopt;

    Loan loan;
    evaluate(slot, clock_(), &loan);
    return loan;
}

std::optional<I128> LendingProtocol::get_max_borrow(LoanId loan_id) const {
    LoanSlot* slot = find_loan(loan_id);
    if (!slot) return std::nullopt;

    auto collateral_price = feed_.get_price(slot->collateral_asset_id);
    auto debt_price = feed_.get_price(slot->debt_asset_id);
    if (!collateral_price || !debt_price) return std::nullopt;

    Loan loan;
    evaluate(slot, clock_(), &loan);
    if (!loan.is_active()) return I128(0);

    auto record = get_credit_record(loan.borrower_id);
    uint32_t score = record ? record->credit_score() : 0;
    return risk_.max_borrow_x18(loan.collateral_amount_x18, *collateral_price,
                                loan.debt_x18(), *debt_price, score);
}

std::optional<CreditRecord> LendingProtocol::get_credit_record(UserId user_id) const {
    UserSlot* slot = find_user(user_id);
    if (!slot) return std::nullopt;

    std::lock_guard lock(slot->mutex);
    return slot->record;
}

std::optional<I128> LendingProtocol::get_deposit_balance(UserId user_id, AssetId asset_id) const {
    UserSlot* user = find_user(user_id);
    PoolSlot* pool_slot = find_pool(asset_id);
    if (!user || !pool_slot) return std::nullopt;

    I128 scaled = 0;
    Pool pool;
    {
        EntityLocks locks({&user->mutex, &pool_slot->mutex});
        scaled = user->record.scaled_deposit(asset_id);
        pool = pool_slot->pool;
    }
    pool.accrue_indices(clock_());
    return pool.unscale(scaled);
}

ProtocolStats LendingProtocol::get_stats() const {
    ProtocolStats stats;
    stats.operations = operations_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    {
        std::shared_lock lock(users_mutex_);
        stats.users = users_.size();
    }
    stats.loans_opened = loans_opened_.load(std::memory_order_relaxed);
    stats.loans_closed = loans_closed_.load(std::memory_order_relaxed);
    stats.liquidations = liquidations_.load(std::memory_order_relaxed);
    stats.shortfalls = shortfalls_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace lend
