// =============================================================================
// config.cpp - Protocol Configuration (JSON)
// =============================================================================

#include "lend/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace lend {

using json = nlohmann::json;

namespace {

I128 read_decimal(const json& node, const char* key, I128 fallback) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return fallback;

    if (it->is_string()) {
        I128 value = 0;
        if (!x18::parse(it->get<std::string>(), value)) {
            throw ConfigError(std::string("Invalid decimal for '") + key + "': " +
                              it->get<std::string>());
        }
        return value;
    }
    if (it->is_number_integer()) return x18::from_int(it->get<int64_t>());
    if (it->is_number()) {
        // Round-trip through the shortest decimal text to avoid binary noise
        std::ostringstream ss;
        ss.precision(15);
        ss << it->get<double>();
        I128 value = 0;
        if (!x18::parse(ss.str(), value)) {
            throw ConfigError(std::string("Invalid number for '") + key + "'");
        }
        return value;
    }
    throw ConfigError(std::string("Expected decimal for '") + key + "'");
}

template <typename T>
T read_uint(const json& node, const char* key, T fallback) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return fallback;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        throw ConfigError(std::string("Expected non-negative integer for '") + key + "'");
    }
    return static_cast<T>(it->get<uint64_t>());
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return empty;
    if (!it->is_object()) throw ConfigError(std::string("Section '") + key + "' must be an object");
    return *it;
}

} // namespace

// =============================================================================
// Loading
// =============================================================================

ProtocolConfig ProtocolConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("Config root must be an object");

    ProtocolConfig config;

    const json& interest = section(j, "interest");
    config.interest.base_rate_x18 = read_decimal(interest, "base_rate", config.interest.base_rate_x18);
    config.interest.optimal_rate_x18 = read_decimal(interest, "optimal_rate", config.interest.optimal_rate_x18);
    config.interest.max_rate_x18 = read_decimal(interest, "max_rate", config.interest.max_rate_x18);
    config.interest.optimal_utilization_x18 =
        read_decimal(interest, "optimal_utilization", config.interest.optimal_utilization_x18);

    const json& risk = section(j, "risk");
    config.risk.liquidation_threshold_x18 =
        read_decimal(risk, "liquidation_threshold", config.risk.liquidation_threshold_x18);
    config.risk.max_loan_to_value_x18 =
        read_decimal(risk, "max_loan_to_value", config.risk.max_loan_to_value_x18);
    config.risk.liquidation_bonus_x18 =
        read_decimal(risk, "liquidation_bonus", config.risk.liquidation_bonus_x18);
    config.risk.close_factor_x18 = read_decimal(risk, "close_factor", config.risk.close_factor_x18);
    config.risk.full_liquidation_health_x18 =
        read_decimal(risk, "full_liquidation_health", config.risk.full_liquidation_health_x18);

    if (risk.contains("credit_discounts")) {
        const json& list = risk["credit_discounts"];
        if (!list.is_array()) throw ConfigError("'credit_discounts' must be an array");
        config.risk.credit_discounts.clear();
        for (const auto& d : list) {
            CreditDiscount discount;
            discount.min_score = read_uint<uint32_t>(d, "min_score", 0);
            discount.collateral_discount_x18 = read_decimal(d, "collateral", 0);
            discount.interest_discount_x18 = read_decimal(d, "interest", 0);
            config.risk.credit_discounts.push_back(discount);
        }
    }

    const json& credit = section(j, "credit");
    config.credit.score_ceiling = read_uint<uint32_t>(credit, "score_ceiling", config.credit.score_ceiling);
    if (credit.contains("tiers")) {
        const json& list = credit["tiers"];
        if (!list.is_array()) throw ConfigError("'tiers' must be an array");
        config.credit.tiers.clear();
        for (const auto& t : list) {
            CreditTier tier;
            tier.remaining_fraction_x18 = read_decimal(t, "remaining", 0);
            tier.points = read_uint<uint32_t>(t, "points", 0);
            config.credit.tiers.push_back(tier);
        }
    }

    if (j.contains("assets")) {
        const json& list = j["assets"];
        if (!list.is_array()) throw ConfigError("'assets' must be an array");
        for (const auto& a : list) {
            if (!a.is_object() || !a.contains("asset_id")) {
                throw ConfigError("Asset entry requires 'asset_id'");
            }
            AssetConfig asset;
            asset.asset_id = read_uint<AssetId>(a, "asset_id", 0);
            asset.symbol = a.value("symbol", std::string{});
            asset.reserve_factor_x18 = read_decimal(a, "reserve_factor", asset.reserve_factor_x18);
            asset.initial_price_x18 = read_decimal(a, "price", 0);
            config.assets.push_back(asset);
        }
    }

    config.validate();
    return config;
}

ProtocolConfig ProtocolConfig::from_string(std::string_view content) {
    json j;
    try {
        j = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config JSON: ") + e.what());
    }
    return from_json(j);
}

ProtocolConfig ProtocolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

json ProtocolConfig::to_json() const {
    json j;
    j["interest"] = {
        {"base_rate", x18::to_string(interest.base_rate_x18)},
        {"optimal_rate", x18::to_string(interest.optimal_rate_x18)},
        {"max_rate", x18::to_string(interest.max_rate_x18)},
        {"optimal_utilization", x18::to_string(interest.optimal_utilization_x18)},
    };

    json discounts = json::array();
    for (const auto& d : risk.credit_discounts) {
        discounts.push_back({
            {"min_score", d.min_score},
            {"collateral", x18::to_string(d.collateral_discount_x18)},
            {"interest", x18::to_string(d.interest_discount_x18)},
        });
    }
    j["risk"] = {
        {"liquidation_threshold", x18::to_string(risk.liquidation_threshold_x18)},
        {"max_loan_to_value", x18::to_string(risk.max_loan_to_value_x18)},
        {"liquidation_bonus", x18::to_string(risk.liquidation_bonus_x18)},
        {"close_factor", x18::to_string(risk.close_factor_x18)},
        {"full_liquidation_health", x18::to_string(risk.full_liquidation_health_x18)},
        {"credit_discounts", discounts},
    };

    json tiers = json::array();
    for (const auto& t : credit.tiers) {
        tiers.push_back({{"remaining", x18::to_string(t.remaining_fraction_x18)}, {"points", t.points}});
    }
    j["credit"] = {{"score_ceiling", credit.score_ceiling}, {"tiers", tiers}};

    json assets_json = json::array();
    for (const auto& a : assets) {
        json entry = {
            {"asset_id", a.asset_id},
            {"symbol", a.symbol},
            {"reserve_factor", x18::to_string(a.reserve_factor_x18)},
        };
        if (a.initial_price_x18 > 0) entry["price"] = x18::to_string(a.initial_price_x18);
        assets_json.push_back(entry);
    }
    j["assets"] = assets_json;
    return j;
}

// =============================================================================
// Validation
// =============================================================================

void ProtocolConfig::validate() const {
    if (!InterestRateModel::validate(interest)) {
        throw ConfigError("Interest curve must be non-decreasing with 0 < optimal_utilization <= 1");
    }
    if (!risk.validate()) {
        throw ConfigError("Risk parameters invalid: require max_loan_to_value <= liquidation_threshold <= 1, "
                          "ascending credit discounts, and (1 + bonus) * threshold < 1 for every tier");
    }
    if (!credit.validate()) {
        throw ConfigError("Credit tiers must have strictly descending thresholds in [0, 1], at most 32");
    }

    std::set<AssetId> seen;
    for (const auto& a : assets) {
        if (!seen.insert(a.asset_id).second) {
            throw ConfigError("Duplicate asset_id " + std::to_string(a.asset_id));
        }
        if (a.reserve_factor_x18 < 0 || a.reserve_factor_x18 >= X18_ONE) {
            throw ConfigError("reserve_factor must be in [0, 1) for asset " + std::to_string(a.asset_id));
        }
        if (a.initial_price_x18 < 0) {
            throw ConfigError("price must be positive for asset " + std::to_string(a.asset_id));
        }
    }
}

} // namespace lend
