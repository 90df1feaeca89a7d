// =============================================================================
// listener.cpp - Event Names and Stream Listener
// =============================================================================

#include "lend/listener.hpp"
#include <ostream>

namespace lend {

const char* to_string(Operation op) {
    switch (op) {
        case Operation::LIST_ASSET: return "list_asset";
        case Operation::REGISTER_USER: return "register_user";
        case Operation::DEPOSIT: return "deposit";
        case Operation::WITHDRAW: return "withdraw";
        case Operation::DEPOSIT_COLLATERAL: return "deposit_collateral";
        case Operation::REDEEM_COLLATERAL: return "redeem_collateral";
        case Operation::CONVERT_TO_COLLATERAL: return "convert_to_collateral";
        case Operation::BORROW: return "borrow";
        case Operation::BORROW_ADDITIONAL: return "borrow_additional";
        case Operation::ADD_COLLATERAL: return "add_collateral";
        case Operation::REPAY: return "repay";
        case Operation::LIQUIDATE: return "liquidate";
        case Operation::TRANSFER_LOAN: return "transfer_loan";
        case Operation::LOAN_CLOSED: return "loan_closed";
        case Operation::CREDIT_SCORE: return "credit_score";
        case Operation::CONVERT_TO_DEPOSIT: return "convert_to_deposit";
    }
    return "unknown";
}

StreamListener::StreamListener(std::ostream& out, bool verbose)
    : out_(out)
    , verbose_(verbose) {}

void StreamListener::on_event(const ProtocolEvent& event) {
    if (!verbose_) return;
    std::lock_guard lock(mutex_);
    out_ << "[lend] " << to_string(event.op)
         << " user=" << event.user_id;
    if (event.loan_id != 0) out_ << " loan=" << event.loan_id;
    out_ << " asset=" << event.asset_id
         << " amount=" << x18::to_string(event.amount_x18)
         << " ts=" << event.timestamp << '\n';
}

void StreamListener::on_rejected(Operation op, UserId user_id, int32_t code) {
    std::lock_guard lock(mutex_);
    out_ << "[lend] rejected " << to_string(op)
         << " user=" << user_id
         << " code=" << code << " (" << errors::to_string(code) << ")\n";
}

void StreamListener::on_shortfall(const LiquidationResult& result) {
    std::lock_guard lock(mutex_);
    out_ << "[lend] WARNING seizure shortfall loan=" << result.loan_id
         << " borrower=" << result.borrower_id
         << " liquidator=" << result.liquidator_id
         << " seized=" << x18::to_string(result.collateral_seized_x18)
         << " shortfall=" << x18::to_string(result.shortfall_x18) << '\n';
}

} // namespace lend
