#ifndef LEVER_ORACLE_HPP
#define LEVER_ORACLE_HPP

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "chain.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Price Round from a Feed
// =============================================================================

struct PriceRound {
    I128 price;             // in the feed's own decimals
    uint8_t decimals;
    uint64_t updated_at;    // unix seconds
};

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual std::string description() const = 0;
    virtual std::optional<PriceRound> latest_price(const Currency& asset) const = 0;
};

// Feed whose rounds are pushed by an operator (tests, demo, keeper bots)
class ManualPriceFeed : public IPriceFeed {
public:
    explicit ManualPriceFeed(std::string description = "manual")
        : description_(std::move(description)) {}

    std::string description() const override { return description_; }

    void set_price(const Currency& asset, I128 price, uint8_t decimals, uint64_t updated_at);
    void clear(const Currency& asset);

    std::optional<PriceRound> latest_price(const Currency& asset) const override;

private:
    std::string description_;
    std::map<Currency, PriceRound> rounds_;
};

// =============================================================================
// Normalized Quote
// =============================================================================

struct OracleQuote {
    int32_t status;
    I128 price_x18;
    uint64_t updated_at;

    bool ok() const { return status == errors::OK; }
};

// Default staleness window (1 hour)
constexpr uint64_t DEFAULT_STALENESS_WINDOW = 3600;

// =============================================================================
// PriceOracle - Feed registry with staleness and decimals normalization
// =============================================================================

class PriceOracle {
public:
    explicit PriceOracle(const Chain& chain, uint64_t staleness_window = DEFAULT_STALENESS_WINDOW);
    ~PriceOracle() = default;

    // Non-copyable
    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    // Feed is not owned; it must outlive the oracle
    void set_feed(const Currency& asset, const IPriceFeed* feed);
    void remove_feed(const Currency& asset);
    bool has_feed(const Currency& asset) const;
    const IPriceFeed* feed(const Currency& asset) const;

    uint64_t staleness_window() const { return staleness_window_; }
    void set_staleness_window(uint64_t seconds) { staleness_window_ = seconds; }

    // =========================================================================
    // Price Queries
    // =========================================================================

    // Reads the feed on every call
    OracleQuote quote(const Currency& asset) const;

    bool is_price_fresh(const Currency& asset) const;
    uint64_t price_age(const Currency& asset) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_feeds;
        uint64_t total_quotes;
        uint64_t rejected_quotes;
    };
    Stats get_stats() const;

private:
    const Chain& chain_;
    uint64_t staleness_window_;
    std::map<Currency, const IPriceFeed*> feeds_;

    mutable std::atomic<uint64_t> total_quotes_{0};
    mutable std::atomic<uint64_t> rejected_quotes_{0};

    static I128 normalize(I128 price, uint8_t decimals);
};

} // namespace lever

#endif // LEVER_ORACLE_HPP
