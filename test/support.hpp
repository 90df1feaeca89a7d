// Lend Core - Shared Test Fixtures

#ifndef LEND_TEST_SUPPORT_HPP
#define LEND_TEST_SUPPORT_HPP

#include <catch2/catch_tostring.hpp>
#include <lend/lend.hpp>

#include <memory>
#include <string>
#include <vector>

// X18 values print as decimals in failure messages
namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 v) { return lend::x18::to_string(v); }
};
} // namespace Catch

namespace lend::test {

inline I128 D(const char* text) { return x18::from_string(text); }

constexpr AssetId USDC = 1;
constexpr AssetId XRD = 2;
constexpr uint64_t T0 = 1700000000;

inline ProtocolConfig two_asset_config() {
    ProtocolConfig config = ProtocolConfig::defaults();
    config.assets = {
        {USDC, "USDC", X18_ONE / 10, X18_ONE},
        {XRD, "XRD", X18_ONE / 10, X18_ONE},
    };
    return config;
}

// Protocol over an in-memory feed and custody with a manual clock.
// Both assets start at $1.
struct Harness {
    PriceFeed feed;
    InMemoryCustody custody;
    uint64_t now = T0;
    std::unique_ptr<LendingProtocol> protocol;

    explicit Harness(const ProtocolConfig& config = two_asset_config()) {
        protocol = std::make_unique<LendingProtocol>(config, feed, custody, [this] { return now; });
        for (const auto& asset : config.assets) {
            if (asset.initial_price_x18 > 0) feed.set_price(asset.asset_id, asset.initial_price_x18, now);
        }
    }

    LendingProtocol& p() { return *protocol; }

    UserId user(const std::string& account) {
        int64_t id = protocol->register_user(account);
        return id > 0 ? static_cast<UserId>(id) : 0;
    }

    UserId funded(const std::string& account, AssetId asset_id, const char* amount) {
        UserId id = user(account);
        custody.mint(id, asset_id, D(amount));
        return id;
    }

    void advance(uint64_t seconds) { now += seconds; }
};

// Collects every callback for later inspection
class RecordingListener : public ProtocolListener {
public:
    void on_event(const ProtocolEvent& event) override { events.push_back(event); }
    void on_rejected(Operation op, UserId, int32_t code) override { rejected.push_back({op, code}); }
    void on_shortfall(const LiquidationResult& result) override { shortfalls.push_back(result); }

    size_t count(Operation op) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.op == op) ++n;
        }
        return n;
    }

    std::vector<ProtocolEvent> events;
    std::vector<std::pair<Operation, int32_t>> rejected;
    std::vector<LiquidationResult> shortfalls;
};

} // namespace lend::test

#endif // LEND_TEST_SUPPORT_HPP
