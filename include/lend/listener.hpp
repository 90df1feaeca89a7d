#ifndef LEND_LISTENER_HPP
#define LEND_LISTENER_HPP

#include <iosfwd>
#include <mutex>

#include "types.hpp"
#include "liquidation.hpp"

namespace lend {

// =============================================================================
// Protocol Events
// =============================================================================

enum class Operation : uint8_t {
    LIST_ASSET = 0,
    REGISTER_USER = 1,
    DEPOSIT = 2,
    WITHDRAW = 3,
    DEPOSIT_COLLATERAL = 4,
    REDEEM_COLLATERAL = 5,
    CONVERT_TO_COLLATERAL = 6,
    BORROW = 7,
    BORROW_ADDITIONAL = 8,
    ADD_COLLATERAL = 9,
    REPAY = 10,
    LIQUIDATE = 11,
    TRANSFER_LOAN = 12,
    LOAN_CLOSED = 13,
    CREDIT_SCORE = 14,
    CONVERT_TO_DEPOSIT = 15
};

const char* to_string(Operation op);

struct ProtocolEvent {
    Operation op;
    UserId user_id;
    LoanId loan_id;     // 0 when not loan-related
    AssetId asset_id;
    I128 amount_x18;
    uint64_t timestamp;
};

// =============================================================================
// Protocol Listener
// =============================================================================
//
// Callbacks run after the operation's entity locks are released.

class ProtocolListener {
public:
    virtual ~ProtocolListener() = default;
    virtual void on_event(const ProtocolEvent& event) = 0;
    virtual void on_rejected(Operation op, UserId user_id, int32_t code) = 0;
    virtual void on_shortfall(const LiquidationResult& result) = 0;
};

// No-op listener for when notifications aren't needed
class NullProtocolListener : public ProtocolListener {
public:
    void on_event(const ProtocolEvent&) override {}
    void on_rejected(Operation, UserId, int32_t) override {}
    void on_shortfall(const LiquidationResult&) override {}
};

// One line per event to an output stream
class StreamListener : public ProtocolListener {
public:
    explicit StreamListener(std::ostream& out, bool verbose = true);

    void on_event(const ProtocolEvent& event) override;
    void on_rejected(Operation op, UserId user_id, int32_t code) override;
    void on_shortfall(const LiquidationResult& result) override;

private:
    std::ostream& out_;
    bool verbose_;
    std::mutex mutex_;
};

} // namespace lend

#endif // LEND_LISTENER_HPP
