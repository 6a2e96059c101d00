// =============================================================================
// lever.cpp - Unified Protocol Controller
// =============================================================================

#include "lever/lever.hpp"
#include <stdexcept>

namespace lever {

namespace {

void check(int32_t rc, const char* step) {
    if (rc != errors::OK) {
        throw std::runtime_error(std::string("Lever wiring failed at ") + step + ": " +
                                 errors::name(rc));
    }
}

} // namespace

// =============================================================================
// Construction & Wiring
// =============================================================================

Lever::Lever(const Config& config, const Address& admin,
             const AssetSpec& collateral, const AssetSpec& debt)
    : config_(config), admin_(admin) {
    config_.validate();

    chain_ = std::make_unique<Chain>(config_.chain.seconds_per_block,
                                     config_.chain.start_block,
                                     config_.chain.start_timestamp);

    collateral_ = std::make_unique<Token>(*chain_, addresses::COLLATERAL_TOKEN,
                                          collateral.symbol, collateral.decimals, admin_);
    debt_ = std::make_unique<Token>(*chain_, addresses::DEBT_TOKEN,
                                    debt.symbol, debt.decimals, admin_);

    feed_ = std::make_unique<ManualPriceFeed>("manual");
    oracle_ = std::make_unique<PriceOracle>(*chain_, config_.ledger.staleness_window);

    router_ = std::make_unique<ConstantProductRouter>(*chain_, addresses::ROUTER, admin_);
    router_->register_token(collateral_.get());
    router_->register_token(debt_.get());
    check(router_->create_pool(admin_, debt_->id(), collateral_->id(),
                               config_.leverage.swap_fee_bips), "create_pool");

    interest_ = std::make_unique<InterestEngine>(*chain_, admin_, addresses::INTEREST_ENGINE,
                                                 config_.interest.period_blocks,
                                                 config_.interest.blocks_per_year);

    VaultConfig vault;
    vault.collateral_asset = collateral_->id();
    vault.debt_asset = debt_->id();
    vault.ltv_ratio = config_.ledger.ltv_ratio;
    vault.liquidation_threshold = config_.ledger.liquidation_threshold;
    vault.liquidator_reward_bips = config_.ledger.liquidator_reward_bips;
    vault.treasury = addresses::TREASURY;

    ledger_ = std::make_unique<PositionLedger>(*chain_, addresses::LEDGER, admin_, vault,
                                               *collateral_, *debt_, *oracle_, interest_.get());
    check(ledger_->set_price_feed(admin_, collateral_->id(), feed_.get()), "collateral feed");
    check(ledger_->set_price_feed(admin_, debt_->id(), feed_.get()), "debt feed");
    check(debt_->access().grant(admin_, addresses::LEDGER, Role::MINTER), "grant minter");
    check(interest_->register_vault(admin_, addresses::LEDGER, ledger_.get(),
                                    config_.interest.annual_rate_bips), "register_vault");
    check(ledger_->set_interest_enabled(admin_, config_.ledger.interest_enabled), "interest toggle");

    builder_ = std::make_unique<LeverageBuilder>(*chain_, *ledger_, *router_, *collateral_, *debt_,
                                                 addresses::LEVERAGE_BUILDER,
                                                 config_.leverage.max_leverage,
                                                 config_.leverage.swap_fee_bips);
    check(ledger_->access().grant(admin_, addresses::LEVERAGE_BUILDER, Role::LEVERAGE),
          "grant leverage");
}

Lever::~Lever() = default;

// =============================================================================
// Operator Helpers
// =============================================================================

void Lever::set_collateral_price(I128 price, uint8_t decimals) {
    feed_->set_price(collateral_->id(), price, decimals, chain_->timestamp());
}

void Lever::set_debt_price(I128 price, uint8_t decimals) {
    feed_->set_price(debt_->id(), price, decimals, chain_->timestamp());
}

int32_t Lever::seed_pool(I128 debt_amount, I128 collateral_amount) {
    return chain_->atomic([&]() {
        int32_t rc = debt_->mint(admin_, admin_, debt_amount);
        if (rc != errors::OK) return rc;
        rc = collateral_->mint(admin_, admin_, collateral_amount);
        if (rc != errors::OK) return rc;

        rc = debt_->approve(admin_, router_->address(), debt_amount);
        if (rc != errors::OK) return rc;
        rc = collateral_->approve(admin_, router_->address(), collateral_amount);
        if (rc != errors::OK) return rc;

        return router_->add_liquidity(admin_, debt_->id(), collateral_->id(),
                                      config_.leverage.swap_fee_bips,
                                      debt_amount, collateral_amount);
    });
}

int32_t Lever::fund(const Address& who, I128 collateral_amount) {
    return collateral_->mint(admin_, who, collateral_amount);
}

int32_t Lever::advance_and_accrue(uint64_t blocks) {
    chain_->advance_blocks(blocks);

    for (uint64_t id = 1; id <= ledger_->position_count(); ++id) {
        std::optional<Position> pos = ledger_->get_position(id);
        if (!pos || pos->debt_amount == 0) continue;

        int32_t rc = ledger_->collect_interest(admin_, id);
        if (rc != errors::OK) return rc;
    }
    return errors::OK;
}

// =============================================================================
// Statistics
// =============================================================================

Lever::GlobalStats Lever::get_stats() const {
    return GlobalStats{
        ledger_->get_stats(),
        oracle_->get_stats(),
        router_->total_swaps(),
        interest_->treasury_balance(debt_->id()),
        chain_->events().size()
    };
}

} // namespace lever
