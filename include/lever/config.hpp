#ifndef LEVER_CONFIG_HPP
#define LEVER_CONFIG_HPP

#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "interest.hpp"
#include "leverage.hpp"
#include "oracle.hpp"
#include "router.hpp"

namespace lever {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Section Configs
// =============================================================================

struct ChainConfig {
    uint64_t seconds_per_block = 12;
    uint64_t start_block = 1;
    uint64_t start_timestamp = 1704067200;  // 2024-01-01T00:00:00Z
};

struct LedgerConfig {
    uint32_t ltv_ratio = 50;
    uint32_t liquidation_threshold = 80;
    uint32_t liquidator_reward_bips = 500;
    uint64_t staleness_window = DEFAULT_STALENESS_WINDOW;
    bool interest_enabled = true;
};

struct InterestConfig {
    uint64_t period_blocks = DEFAULT_PERIOD_BLOCKS;
    uint64_t blocks_per_year = DEFAULT_BLOCKS_PER_YEAR;
    uint32_t annual_rate_bips = 500;
};

struct LeverageConfig {
    uint32_t max_leverage = DEFAULT_MAX_LEVERAGE;
    uint32_t swap_fee_bips = fees::FEE_030;
};

// =============================================================================
// Config - JSON-backed protocol configuration
// =============================================================================

struct Config {
    ChainConfig chain;
    LedgerConfig ledger;
    InterestConfig interest;
    LeverageConfig leverage;

    // Missing keys keep their defaults. Throws ConfigError on unreadable
    // input, wrong value types or out-of-range values.
    static Config from_file(const std::string& path);
    static Config from_json(const std::string& content);

    std::string to_json(int indent = 2) const;

    // Throws ConfigError naming the first offending field
    void validate() const;
};

void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

} // namespace lever

#endif // LEVER_CONFIG_HPP
