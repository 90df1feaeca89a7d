#ifndef LEND_CONFIG_HPP
#define LEND_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "interest.hpp"
#include "risk.hpp"
#include "credit.hpp"

namespace lend {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Asset Listing
// =============================================================================

struct AssetConfig {
    AssetId asset_id = 0;
    std::string symbol;
    I128 reserve_factor_x18 = X18_ONE / 10;
    I128 initial_price_x18 = 0;  // 0 = no price seeded
};

// =============================================================================
// Protocol Configuration
// =============================================================================
//
// {
//   "interest": { "base_rate": "0.02", "optimal_rate": "0.10",
//                 "max_rate": "1.0", "optimal_utilization": "0.8" },
//   "risk":     { "liquidation_threshold": "0.8", "max_loan_to_value": "0.75",
//                 "liquidation_bonus": "0.05", "close_factor": "0.5",
//                 "full_liquidation_health": "0.5",
//                 "credit_discounts": [ { "min_score": 100, "collateral": "0.05",
//                                         "interest": "0.01" } ] },
//   "credit":   { "score_ceiling": 1000,
//                 "tiers": [ { "remaining": "0.75", "points": 5 } ] },
//   "assets":   [ { "asset_id": 1, "symbol": "USDC", "reserve_factor": "0.1",
//                   "price": "1" } ]
// }
//
// Decimals may be strings (exact) or JSON numbers. Missing sections keep
// their defaults.

struct ProtocolConfig {
    InterestRateParams interest;
    RiskParams risk;
    CreditScoreTable credit;
    std::vector<AssetConfig> assets;

    static ProtocolConfig defaults() { return ProtocolConfig{}; }

    static ProtocolConfig from_json(const nlohmann::json& j);
    static ProtocolConfig from_string(std::string_view content);
    static ProtocolConfig from_file(std::string_view path);

    nlohmann::json to_json() const;

    // Throws ConfigError naming the first violated constraint
    void validate() const;
};

} // namespace lend

#endif // LEND_CONFIG_HPP
