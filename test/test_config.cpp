// Lend Core - Configuration and JSON View Tests

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "support.hpp"

using namespace lend;
using namespace lend::test;

namespace {

const char* kConfig = R"({
  "interest": { "base_rate": "0.01", "optimal_rate": "0.08",
                "max_rate": "0.9", "optimal_utilization": "0.85" },
  "risk": {
    "liquidation_threshold": "0.75",
    "max_loan_to_value": 0.7,
    "liquidation_bonus": "0.08",
    "credit_discounts": [ { "min_score": 50, "collateral": "0.05", "interest": "0.005" } ]
  },
  "credit": { "score_ceiling": 500, "tiers": [ { "remaining": "0.5", "points": 10 },
                                              { "remaining": "0", "points": 10 } ] },
  "assets": [
    { "asset_id": 1, "symbol": "USDC", "reserve_factor": "0.1", "price": "1" },
    { "asset_id": 3, "symbol": "ETH", "price": 2000 }
  ]
})";

} // namespace

TEST_CASE("ProtocolConfig parsing", "[config]") {
    ProtocolConfig config = ProtocolConfig::from_string(kConfig);

    SECTION("Decimals from strings and numbers") {
        REQUIRE(config.interest.base_rate_x18 == D("0.01"));
        REQUIRE(config.interest.optimal_utilization_x18 == D("0.85"));
        REQUIRE(config.risk.liquidation_threshold_x18 == D("0.75"));
        REQUIRE(config.risk.max_loan_to_value_x18 == D("0.7"));
        REQUIRE(config.assets[1].initial_price_x18 == D("2000"));
    }

    SECTION("Missing keys keep defaults") {
        REQUIRE(config.risk.close_factor_x18 == X18_HALF);
        REQUIRE(config.risk.full_liquidation_health_x18 == X18_HALF);
        REQUIRE(config.assets[1].reserve_factor_x18 == D("0.1"));
    }

    SECTION("Lists replace the defaults") {
        REQUIRE(config.risk.credit_discounts.size() == 1);
        REQUIRE(config.risk.credit_discounts[0].min_score == 50);
        REQUIRE(config.risk.credit_discounts[0].interest_discount_x18 == D("0.005"));
        REQUIRE(config.credit.score_ceiling == 500);
        REQUIRE(config.credit.tiers.size() == 2);
        REQUIRE(config.credit.tiers[0].points == 10);
        REQUIRE(config.assets.size() == 2);
        REQUIRE(config.assets[1].symbol == "ETH");
    }

    SECTION("Serialized form loads back to the same parameters") {
        ProtocolConfig reloaded = ProtocolConfig::from_json(config.to_json());
        REQUIRE(reloaded.interest.max_rate_x18 == config.interest.max_rate_x18);
        REQUIRE(reloaded.risk.liquidation_bonus_x18 == config.risk.liquidation_bonus_x18);
        REQUIRE(reloaded.credit.tiers.size() == config.credit.tiers.size());
        REQUIRE(reloaded.assets.size() == config.assets.size());
        REQUIRE(reloaded.assets[1].initial_price_x18 == D("2000"));
    }

    SECTION("Empty document is the default protocol") {
        ProtocolConfig defaults = ProtocolConfig::from_string("{}");
        REQUIRE(defaults.risk.liquidation_threshold_x18 == D("0.8"));
        REQUIRE(defaults.credit.tiers.size() == 4);
        REQUIRE(defaults.assets.empty());
    }
}

TEST_CASE("ProtocolConfig rejects invalid input", "[config]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string("{ \"interest\": "), ConfigError);
        REQUIRE_THROWS_AS(ProtocolConfig::from_string("[]"), ConfigError);
    }

    SECTION("Bad decimal text") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(R"({"risk": {"close_factor": "half"}})"),
                          ConfigError);
    }

    SECTION("Section of the wrong type") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(R"({"risk": 5})"), ConfigError);
    }

    SECTION("Decreasing interest curve") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(
            R"({"interest": {"base_rate": "0.2", "optimal_rate": "0.1"}})"), ConfigError);
    }

    SECTION("Bonus that cannot restore health") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(
            R"({"risk": {"liquidation_bonus": "0.3"}})"), ConfigError);
    }

    SECTION("Ascending credit tiers") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(
            R"({"credit": {"tiers": [{"remaining": "0.25", "points": 1},
                                     {"remaining": "0.5", "points": 1}]}})"), ConfigError);
    }

    SECTION("Duplicate assets") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(
            R"({"assets": [{"asset_id": 1}, {"asset_id": 1}]})"), ConfigError);
    }

    SECTION("Negative score ceiling") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_string(
            R"({"credit": {"score_ceiling": -1}})"), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_file("/nonexistent/lend.json"), ConfigError);
    }
}

TEST_CASE("LendingProtocol applies its configuration", "[config]") {
    ProtocolConfig config = ProtocolConfig::from_string(kConfig);
    PriceFeed feed;
    InMemoryCustody custody;
    LendingProtocol protocol(config, feed, custody, [] { return T0; });

    REQUIRE(protocol.list_assets() == std::vector<AssetId>{1, 3});
    REQUIRE(protocol.risk_engine().liquidation_threshold_x18(0) == D("0.75"));
    REQUIRE(protocol.risk_engine().liquidation_threshold_x18(50) == D("0.8"));
    REQUIRE(*protocol.get_borrow_rate(1) == D("0.01"));
    REQUIRE(protocol.get_pool_state(1)->last_update_timestamp == T0);

    SECTION("Invalid configuration is refused at construction") {
        ProtocolConfig bad = ProtocolConfig::defaults();
        bad.risk.max_loan_to_value_x18 = D("0.9");
        REQUIRE_THROWS_AS(LendingProtocol(bad, feed, custody), ConfigError);
    }
}

TEST_CASE("JSON views render exact decimals", "[config]") {
    Harness h;
    UserId alice = h.funded("alice", USDC, "10000");
    REQUIRE(h.p().deposit(alice, USDC, D("10000")) == errors::OK);

    nlohmann::json pool = as_json(*h.p().get_pool_state(USDC));
    REQUIRE(pool["symbol"] == "USDC");
    REQUIRE(pool["total_supply"] == "10000");
    REQUIRE(pool["reserve_factor"] == "0.1");
    REQUIRE(pool["borrow_rate"] == "0.02");

    nlohmann::json record = as_json(*h.p().get_credit_record(alice));
    REQUIRE(record["account"] == "alice");
    REQUIRE(record["credit_score"] == 0);

    REQUIRE(health_to_string(X18_INFINITY) == "inf");
    REQUIRE(health_to_string(D("1.08")) == "1.08");
}
