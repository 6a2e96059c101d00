// =============================================================================
// config.cpp - Protocol Configuration
// =============================================================================

#include "lever/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lever {

using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& section, const char* key, T& field) {
    auto it = section.find(key);
    if (it != section.end()) it->get_to(field);
}

const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    auto it = j.find(name);
    if (it == j.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return *it;
}

}  // namespace

// =============================================================================
// JSON Mapping
// =============================================================================

void to_json(json& j, const Config& config) {
    j = json{
        {"chain", {
            {"seconds_per_block", config.chain.seconds_per_block},
            {"start_block", config.chain.start_block},
            {"start_timestamp", config.chain.start_timestamp}
        }},
        {"ledger", {
            {"ltv_ratio", config.ledger.ltv_ratio},
            {"liquidation_threshold", config.ledger.liquidation_threshold},
            {"liquidator_reward_bips", config.ledger.liquidator_reward_bips},
            {"staleness_window", config.ledger.staleness_window},
            {"interest_enabled", config.ledger.interest_enabled}
        }},
        {"interest", {
            {"period_blocks", config.interest.period_blocks},
            {"blocks_per_year", config.interest.blocks_per_year},
            {"annual_rate_bips", config.interest.annual_rate_bips}
        }},
        {"leverage", {
            {"max_leverage", config.leverage.max_leverage},
            {"swap_fee_bips", config.leverage.swap_fee_bips}
        }}
    };
}

void from_json(const json& j, Config& config) {
    if (!j.is_object()) throw ConfigError("Config root must be an object");

    const json& chain = section(j, "chain");
    read(chain, "seconds_per_block", config.chain.seconds_per_block);
    read(chain, "start_block", config.chain.start_block);
    read(chain, "start_timestamp", config.chain.start_timestamp);

    const json& ledger = section(j, "ledger");
    read(ledger, "ltv_ratio", config.ledger.ltv_ratio);
    read(ledger, "liquidation_threshold", config.ledger.liquidation_threshold);
    read(ledger, "liquidator_reward_bips", config.ledger.liquidator_reward_bips);
    read(ledger, "staleness_window", config.ledger.staleness_window);
    read(ledger, "interest_enabled", config.ledger.interest_enabled);

    const json& interest = section(j, "interest");
    read(interest, "period_blocks", config.interest.period_blocks);
    read(interest, "blocks_per_year", config.interest.blocks_per_year);
    read(interest, "annual_rate_bips", config.interest.annual_rate_bips);

    const json& leverage = section(j, "leverage");
    read(leverage, "max_leverage", config.leverage.max_leverage);
    read(leverage, "swap_fee_bips", config.leverage.swap_fee_bips);
}

// =============================================================================
// Loading
// =============================================================================

Config Config::from_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(const std::string& content) {
    Config config;
    try {
        json::parse(content).get_to(config);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }
    config.validate();
    return config;
}

std::string Config::to_json(int indent) const {
    json j = *this;
    return j.dump(indent);
}

void Config::validate() const {
    if (chain.seconds_per_block == 0) {
        throw ConfigError("chain.seconds_per_block must be positive");
    }
    if (ledger.ltv_ratio == 0 || ledger.ltv_ratio > 100) {
        throw ConfigError("ledger.ltv_ratio must be in (0, 100]");
    }
    if (ledger.liquidation_threshold < ledger.ltv_ratio || ledger.liquidation_threshold > 100) {
        throw ConfigError("ledger.liquidation_threshold must be in [ltv_ratio, 100]");
    }
    if (ledger.liquidator_reward_bips > BIPS_DENOMINATOR) {
        throw ConfigError("ledger.liquidator_reward_bips must not exceed 10000");
    }
    if (interest.blocks_per_year == 0) {
        throw ConfigError("interest.blocks_per_year must be positive");
    }
    if (interest.period_blocks == 0 || interest.period_blocks > interest.blocks_per_year) {
        throw ConfigError("interest.period_blocks must be in [1, blocks_per_year]");
    }
    if (interest.annual_rate_bips == 0) {
        throw ConfigError("interest.annual_rate_bips must be positive");
    }
    if (leverage.max_leverage == 0) {
        throw ConfigError("leverage.max_leverage must be positive");
    }
    if (leverage.swap_fee_bips > fees::FEE_MAX) {
        throw ConfigError("leverage.swap_fee_bips must not exceed 1000");
    }
}

} // namespace lever
