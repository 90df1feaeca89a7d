// =============================================================================
// json.cpp - JSON Views of Protocol State
// =============================================================================

#include "lend/json.hpp"

namespace lend {

using json = nlohmann::json;

namespace {

json balances(const std::map<AssetId, I128>& m) {
    json out = json::object();
    for (const auto& [asset_id, amount] : m) {
        out[std::to_string(asset_id)] = x18::to_string(amount);
    }
    return out;
}

json ids(const std::set<LoanId>& s) {
    json out = json::array();
    for (LoanId id : s) out.push_back(id);
    return out;
}

} // namespace

std::string health_to_string(I128 health_factor_x18) {
    if (health_factor_x18 >= X18_INFINITY) return "inf";
    return x18::to_string(health_factor_x18);
}

json as_json(const PoolState& state) {
    return {
        {"asset_id", state.asset_id},
        {"symbol", state.symbol},
        {"total_supply", x18::to_string(state.total_supply_x18)},
        {"total_borrowed", x18::to_string(state.total_borrowed_x18)},
        {"available_liquidity", x18::to_string(state.total_supply_x18 - state.total_borrowed_x18)},
        {"total_collateral", x18::to_string(state.total_collateral_x18)},
        {"reserves", x18::to_string(state.reserves_x18)},
        {"reserve_factor", x18::to_string(state.reserve_factor_x18)},
        {"liquidity_index", x18::to_string(state.liquidity_index_x18)},
        {"borrow_index", x18::to_string(state.borrow_index_x18)},
        {"utilization", x18::to_string(state.utilization_x18)},
        {"borrow_rate", x18::to_string(state.borrow_rate_x18)},
        {"supply_rate", x18::to_string(state.supply_rate_x18)},
        {"last_update_timestamp", state.last_update_timestamp},
    };
}

json as_json(const Loan& loan) {
    return {
        {"loan_id", loan.loan_id},
        {"borrower_id", loan.borrower_id},
        {"holder_id", loan.holder_id},
        {"status", to_string(loan.status)},
        {"collateral_asset_id", loan.collateral_asset_id},
        {"collateral_amount", x18::to_string(loan.collateral_amount_x18)},
        {"debt_asset_id", loan.debt_asset_id},
        {"principal", x18::to_string(loan.principal_x18)},
        {"accrued_interest", x18::to_string(loan.accrued_interest_x18)},
        {"debt", x18::to_string(loan.debt_x18())},
        {"interest_rate_at_origination", x18::to_string(loan.interest_rate_at_origination_x18)},
        {"origination_balance", x18::to_string(loan.origination_balance_x18)},
        {"opened_at", loan.opened_at},
        {"last_update_timestamp", loan.last_update_timestamp},
    };
}

json as_json(const LoanRisk& risk) {
    return {
        {"collateral_value", x18::to_string(risk.collateral_value_x18)},
        {"debt_value", x18::to_string(risk.debt_value_x18)},
        {"liquidation_threshold", x18::to_string(risk.liquidation_threshold_x18)},
        {"health_factor", health_to_string(risk.health_factor_x18)},
        {"liquidatable", risk.liquidatable},
        {"max_liquidatable", x18::to_string(risk.max_liquidatable_x18)},
    };
}

json as_json(const CreditRecord& record) {
    json history = json::array();
    for (const auto& e : record.repayment_history()) {
        history.push_back({
            {"loan_id", e.loan_id},
            {"asset_id", e.asset_id},
            {"amount", x18::to_string(e.amount_x18)},
            {"remaining", x18::to_string(e.remaining_x18)},
            {"timestamp", e.timestamp},
            {"via_liquidation", e.via_liquidation},
            {"score_awarded", e.score_awarded},
        });
    }

    return {
        {"user_id", record.user_id()},
        {"account", record.account()},
        {"credit_score", record.credit_score()},
        {"deposits_scaled", balances(record.deposits())},
        {"collateral", balances(record.collateral())},
        {"locked_collateral", balances(record.locked_collateral())},
        {"open_loans", ids(record.loan_ids())},
        {"closed_loans", ids(record.closed_loan_ids())},
        {"paid_off", record.paid_off()},
        {"defaults", record.defaults()},
        {"repayment_history", history},
    };
}

json as_json(const RepayResult& result) {
    return {
        {"code", result.code},
        {"error", errors::to_string(result.code)},
        {"loan_id", result.loan_id},
        {"repaid", x18::to_string(result.repaid_x18)},
        {"interest_repaid", x18::to_string(result.interest_repaid_x18)},
        {"principal_repaid", x18::to_string(result.principal_repaid_x18)},
        {"remaining", x18::to_string(result.remaining_x18)},
        {"collateral_released", x18::to_string(result.collateral_released_x18)},
        {"status", to_string(result.status_after)},
        {"score_awarded", result.score_awarded},
    };
}

json as_json(const LiquidationResult& result) {
    return {
        {"code", result.code},
        {"error", errors::to_string(result.code)},
        {"loan_id", result.loan_id},
        {"borrower_id", result.borrower_id},
        {"liquidator_id", result.liquidator_id},
        {"repaid", x18::to_string(result.repaid_x18)},
        {"interest_repaid", x18::to_string(result.interest_repaid_x18)},
        {"principal_repaid", x18::to_string(result.principal_repaid_x18)},
        {"collateral_seized", x18::to_string(result.collateral_seized_x18)},
        {"shortfall", x18::to_string(result.shortfall_x18)},
        {"collateral_released", x18::to_string(result.collateral_released_x18)},
        {"health_before", health_to_string(result.health_before_x18)},
        {"health_after", health_to_string(result.health_after_x18)},
        {"status", to_string(result.status_after)},
        {"score_awarded", result.score_awarded},
    };
}

json as_json(const ProtocolStats& stats) {
    return {
        {"operations", stats.operations},
        {"rejected", stats.rejected},
        {"users", stats.users},
        {"loans_opened", stats.loans_opened},
        {"loans_closed", stats.loans_closed},
        {"liquidations", stats.liquidations},
        {"shortfalls", stats.shortfalls},
    };
}

} // namespace lend
