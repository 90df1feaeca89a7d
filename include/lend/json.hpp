#ifndef LEND_JSON_HPP
#define LEND_JSON_HPP

#include <nlohmann/json.hpp>

#include "protocol.hpp"

namespace lend {

// JSON views of query results. X18 values are rendered as exact decimal strings.

nlohmann::json as_json(const PoolState& state);
nlohmann::json as_json(const Loan& loan);
nlohmann::json as_json(const LoanRisk& risk);
nlohmann::json as_json(const CreditRecord& record);
nlohmann::json as_json(const RepayResult& result);
nlohmann::json as_json(const LiquidationResult& result);
nlohmann::json as_json(const ProtocolStats& stats);

// Health factors render "inf" when debt is zero
std::string health_to_string(I128 health_factor_x18);

} // namespace lend

#endif // LEND_JSON_HPP
