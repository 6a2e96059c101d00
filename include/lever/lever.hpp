#ifndef LEVER_LEVER_HPP
#define LEVER_LEVER_HPP

// =============================================================================
// Lever - Collateralized Lending Stack
//
// Component Addresses:
//   0x1001: collateral token
//   0x1002: debt token (minted by the ledger)
//   0x2001: exchange router
//   0x3001: interest engine (holds the interest treasury)
//   0x4001: position ledger
//   0x5001: leverage builder
//   0x6001: liquidation treasury
//
// =============================================================================

#include <memory>
#include <string>
#include <vector>

#include "types.hpp"
#include "chain.hpp"
#include "access.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "router.hpp"
#include "interest.hpp"
#include "ledger.hpp"
#include "leverage.hpp"
#include "config.hpp"

namespace lever {

namespace addresses {
constexpr Address COLLATERAL_TOKEN = make(0x1001);
constexpr Address DEBT_TOKEN       = make(0x1002);
constexpr Address ROUTER           = make(0x2001);
constexpr Address INTEREST_ENGINE  = make(0x3001);
constexpr Address LEDGER           = make(0x4001);
constexpr Address LEVERAGE_BUILDER = make(0x5001);
constexpr Address TREASURY         = make(0x6001);
} // namespace addresses

struct AssetSpec {
    std::string symbol;
    uint8_t decimals;
};

// =============================================================================
// Lever - Unified Protocol Controller
// =============================================================================

class Lever {
public:
    // Builds and wires every component; `admin` owns all of them.
    // Throws ConfigError on an invalid config.
    explicit Lever(const Config& config,
                   const Address& admin,
                   const AssetSpec& collateral = {"WETH", 18},
                   const AssetSpec& debt = {"lvUSD", 18});
    ~Lever();

    // Non-copyable
    Lever(const Lever&) = delete;
    Lever& operator=(const Lever&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Chain& chain() { return *chain_; }
    const Chain& chain() const { return *chain_; }

    Token& collateral_token() { return *collateral_; }
    Token& debt_token() { return *debt_; }

    ManualPriceFeed& feed() { return *feed_; }
    PriceOracle& oracle() { return *oracle_; }
    ConstantProductRouter& router() { return *router_; }
    InterestEngine& interest() { return *interest_; }

    PositionLedger& ledger() { return *ledger_; }
    const PositionLedger& ledger() const { return *ledger_; }

    LeverageBuilder& builder() { return *builder_; }

    const Config& config() const { return config_; }
    const Address& admin() const { return admin_; }

    // =========================================================================
    // Operator Helpers
    // =========================================================================

    // Pushes a round stamped with the current chain time
    void set_collateral_price(I128 price, uint8_t decimals);
    void set_debt_price(I128 price, uint8_t decimals);

    // Admin mints both sides and seeds the debt/collateral pool
    int32_t seed_pool(I128 debt_amount, I128 collateral_amount);

    // Test/demo faucet (admin mints collateral)
    int32_t fund(const Address& who, I128 collateral_amount);

    // Advance the chain and collect interest on every position with debt
    int32_t advance_and_accrue(uint64_t blocks);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        PositionLedger::Stats ledger_stats;
        PriceOracle::Stats oracle_stats;
        uint64_t total_swaps;
        I128 interest_treasury;
        size_t events;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

    struct ComponentInfo {
        const char* name;
        Address address;
        const char* description;
    };
    static std::vector<ComponentInfo> components() {
        return {
            {"CollateralToken", addresses::COLLATERAL_TOKEN, "Collateral asset"},
            {"DebtToken",       addresses::DEBT_TOKEN,       "Borrowable debt asset"},
            {"Router",          addresses::ROUTER,           "Constant-product swap router"},
            {"InterestEngine",  addresses::INTEREST_ENGINE,  "Period-based interest accrual"},
            {"PositionLedger",  addresses::LEDGER,           "Collateral/debt positions"},
            {"LeverageBuilder", addresses::LEVERAGE_BUILDER, "Leverage loop orchestrator"},
            {"Treasury",        addresses::TREASURY,         "Liquidation proceeds"},
        };
    }

private:
    Config config_;
    Address admin_;

    // Declaration order is teardown order in reverse: the chain outlives
    // every component attached to it.
    std::unique_ptr<Chain> chain_;
    std::unique_ptr<Token> collateral_;
    std::unique_ptr<Token> debt_;
    std::unique_ptr<ManualPriceFeed> feed_;
    std::unique_ptr<PriceOracle> oracle_;
    std::unique_ptr<ConstantProductRouter> router_;
    std::unique_ptr<InterestEngine> interest_;
    std::unique_ptr<PositionLedger> ledger_;
    std::unique_ptr<LeverageBuilder> builder_;
};

} // namespace lever

#endif // LEVER_LEVER_HPP
