#ifndef LEND_FEED_HPP
#define LEND_FEED_HPP

#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>

#include "types.hpp"

namespace lend {

// =============================================================================
// Price Feed Interface
// =============================================================================

// Read-only view of a trusted external price source. Prices are in a
// common unit of account per unit of asset.
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;
    virtual std::optional<I128> get_price(AssetId asset_id) const = 0;
};

// =============================================================================
// PriceFeed - Trusted-Setter Price Store
// =============================================================================

class PriceFeed : public IPriceFeed {
public:
    PriceFeed() = default;

    // Non-copyable
    PriceFeed(const PriceFeed&) = delete;
    PriceFeed& operator=(const PriceFeed&) = delete;

    // Privileged writer
    int32_t set_price(AssetId asset_id, I128 price_x18, uint64_t timestamp = 0);
    int32_t set_prices(const std::vector<std::pair<AssetId, I128>>& updates);
    void remove_price(AssetId asset_id);

    std::optional<I128> get_price(AssetId asset_id) const override;
    std::optional<uint64_t> last_update(AssetId asset_id) const;

private:
    struct Entry {
        I128 price_x18;
        uint64_t timestamp;
    };

    std::unordered_map<AssetId, Entry> prices_;
    mutable std::shared_mutex mutex_;
};

uint64_t current_timestamp();

} // namespace lend

#endif // LEND_FEED_HPP
