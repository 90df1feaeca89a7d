// =============================================================================
// feed.cpp - Trusted Price Store
// =============================================================================

#include "lend/feed.hpp"
#include <chrono>
#include <mutex>

namespace lend {

uint64_t current_timestamp() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

int32_t PriceFeed::set_price(AssetId asset_id, I128 price_x18, uint64_t timestamp) {
    if (price_x18 <= 0) return errors::INVALID_PRICE;
    if (timestamp == 0) timestamp = current_timestamp();

    std::unique_lock lock(mutex_);
    prices_[asset_id] = Entry{price_x18, timestamp};
    return errors::OK;
}

int32_t PriceFeed::set_prices(const std::vector<std::pair<AssetId, I128>>& updates) {
    // All-or-nothing
    for (const auto& [asset_id, price] : updates) {
        (void)asset_id;
        if (price <= 0) return errors::INVALID_PRICE;
    }

    uint64_t now = current_timestamp();
    std::unique_lock lock(mutex_);
    for (const auto& [asset_id, price] : updates) {
        prices_[asset_id] = Entry{price, now};
    }
    return errors::OK;
}

void PriceFeed::remove_price(AssetId asset_id) {
    std::unique_lock lock(mutex_);
    prices_.erase(asset_id);
}

std::optional<I128> PriceFeed::get_price(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(asset_id);
    if (it == prices_.end()) return std::nullopt;
    return it->second.price_x18;
}

std::optional<uint64_t> PriceFeed::last_update(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(asset_id);
    if (it == prices_.end()) return std::nullopt;
    return it->second.timestamp;
}

} // namespace lend
