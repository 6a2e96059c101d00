// =============================================================================
// oracle.cpp - Price Oracle Adapter
// =============================================================================

#include "lever/oracle.hpp"

namespace lever {

// =============================================================================
// ManualPriceFeed
// =============================================================================

void ManualPriceFeed::set_price(const Currency& asset, I128 price, uint8_t decimals,
                                uint64_t updated_at) {
    rounds_[asset] = PriceRound{price, decimals, updated_at};
}

void ManualPriceFeed::clear(const Currency& asset) {
    rounds_.erase(asset);
}

std::optional<PriceRound> ManualPriceFeed::latest_price(const Currency& asset) const {
    auto it = rounds_.find(asset);
    if (it == rounds_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// PriceOracle
// =============================================================================

PriceOracle::PriceOracle(const Chain& chain, uint64_t staleness_window)
    : chain_(chain), staleness_window_(staleness_window) {}

void PriceOracle::set_feed(const Currency& asset, const IPriceFeed* feed) {
    if (feed == nullptr) {
        feeds_.erase(asset);
        return;
    }
    feeds_[asset] = feed;
}

void PriceOracle::remove_feed(const Currency& asset) {
    feeds_.erase(asset);
}

bool PriceOracle::has_feed(const Currency& asset) const {
    return feeds_.find(asset) != feeds_.end();
}

const IPriceFeed* PriceOracle::feed(const Currency& asset) const {
    auto it = feeds_.find(asset);
    return it != feeds_.end() ? it->second : nullptr;
}

OracleQuote PriceOracle::quote(const Currency& asset) const {
    total_quotes_.fetch_add(1, std::memory_order_relaxed);

    auto reject = [this](int32_t status) {
        rejected_quotes_.fetch_add(1, std::memory_order_relaxed);
        return OracleQuote{status, 0, 0};
    };

    auto it = feeds_.find(asset);
    if (it == feeds_.end()) {
        return reject(errors::PRICE_FEED_NOT_SET);
    }

    std::optional<PriceRound> round = it->second->latest_price(asset);
    if (!round || round->price <= 0 || round->decimals > 36) {
        return reject(errors::INVALID_PRICE);
    }

    uint64_t now = chain_.timestamp();
    if (round->updated_at > now) {
        return reject(errors::INVALID_PRICE);
    }
    if (now - round->updated_at > staleness_window_) {
        return reject(errors::PRICE_STALE);
    }

    I128 price_x18 = normalize(round->price, round->decimals);
    if (price_x18 <= 0) {
        return reject(errors::INVALID_PRICE);
    }
    return OracleQuote{errors::OK, price_x18, round->updated_at};
}

bool PriceOracle::is_price_fresh(const Currency& asset) const {
    return quote(asset).ok();
}

uint64_t PriceOracle::price_age(const Currency& asset) const {
    auto it = feeds_.find(asset);
    if (it == feeds_.end()) return UINT64_MAX;

    std::optional<PriceRound> round = it->second->latest_price(asset);
    if (!round || round->updated_at > chain_.timestamp()) return UINT64_MAX;
    return chain_.timestamp() - round->updated_at;
}

PriceOracle::Stats PriceOracle::get_stats() const {
    return Stats{
        feeds_.size(),
        total_quotes_.load(std::memory_order_relaxed),
        rejected_quotes_.load(std::memory_order_relaxed)
    };
}

// Scale a feed price to 18 decimals
I128 PriceOracle::normalize(I128 price, uint8_t decimals) {
    if (decimals == 18) return price;
    if (decimals < 18) {
        I128 scale = x18::pow10(18 - decimals);
        // Out of X18 range; zero is rejected as an invalid price
        if (price > I128_MAX / scale || price < -(I128_MAX / scale)) return 0;
        return price * scale;
    }
    return price / x18::pow10(decimals - 18);
}

} // namespace lever
