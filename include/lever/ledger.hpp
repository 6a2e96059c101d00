#ifndef LEVER_LEDGER_HPP
#define LEVER_LEDGER_HPP

#include <atomic>
#include <map>
#include <optional>
#include <vector>

#include "access.hpp"
#include "chain.hpp"
#include "interest.hpp"
#include "oracle.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Vault Configuration
// =============================================================================

struct VaultConfig {
    Currency collateral_asset;
    Currency debt_asset;
    uint32_t ltv_ratio;               // percent, (0, 100]
    uint32_t liquidation_threshold;   // percent, [ltv_ratio, 100]
    uint32_t liquidator_reward_bips;  // share of seized collateral, <= 10000
    Address treasury;                 // receives the non-reward share of seizures

    bool valid() const;
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    uint64_t id;
    Address owner;
    I128 collateral_amount;
    I128 debt_amount;
    uint32_t leverage;        // hint recorded at open
    uint64_t opened_block;
    bool liquidated;
};

struct UserBalances {
    I128 collateral;
    I128 debt;
};

// =============================================================================
// Operation Results
// =============================================================================

struct OpenResult {
    int32_t status;
    uint64_t position_id;

    bool ok() const { return status == errors::OK; }
};

struct LiquidationResult {
    int32_t status;
    uint64_t position_id;
    Address liquidator;
    I128 health_x18;
    I128 seized_collateral;
    I128 liquidator_reward;
    I128 treasury_share;
    I128 written_off_debt;

    bool ok() const { return status == errors::OK; }
};

// Health reported for a position without debt
constexpr I128 INFINITE_HEALTH = I128_MAX;

// =============================================================================
// PositionLedger - Collateral/debt bookkeeping with LTV gate and liquidation
// =============================================================================

class PositionLedger : public IInterestDebtor, public IJournaled {
public:
    // Throws std::invalid_argument on an invalid config or token/asset mismatch.
    // Tokens, oracle and engine are not owned and must outlive the ledger.
    PositionLedger(Chain& chain, const Address& address, const Address& owner,
                   const VaultConfig& config, IToken& collateral_token, IToken& debt_token,
                   PriceOracle& oracle, InterestEngine* interest = nullptr);
    ~PositionLedger() override;

    // Non-copyable
    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    const Address& address() const { return address_; }
    const VaultConfig& config() const { return state_.config; }
    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }

    // =========================================================================
    // Position Lifecycle
    // =========================================================================

    // Pulls collateral from caller, mints debt_amount to caller.
    // Opening for another owner requires the LEVERAGE role.
    OpenResult open_position(const Address& caller, const Address& owner,
                             const Currency& collateral_asset, I128 collateral_amount,
                             I128 debt_amount, uint32_t leverage_hint = 1);

    int32_t add_collateral(const Address& caller, uint64_t position_id, I128 amount);
    int32_t remove_collateral(const Address& caller, uint64_t position_id, I128 amount);

    int32_t borrow(const Address& caller, uint64_t position_id, I128 amount);
    int32_t borrow_for(const Address& caller, uint64_t position_id,
                       const Address& beneficiary, I128 amount);

    // Burns from caller (caller must approve the ledger)
    int32_t repay(const Address& caller, uint64_t position_id, I128 amount);

    // Repays all debt from caller and returns all collateral to the owner
    int32_t close_position(const Address& caller, uint64_t position_id);

    // Permissionless
    LiquidationResult liquidate(const Address& caller, uint64_t position_id);

    // Permissionless trigger for interest accrual on one position
    int32_t collect_interest(const Address& caller, uint64_t position_id);

    // IInterestDebtor: only the interest engine, only during an accrual
    int32_t record_interest(const Address& caller, uint64_t position_id,
                            const Currency& debt_token, I128 amount) override;

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Position> get_position(uint64_t position_id) const;
    std::vector<Position> positions_of(const Address& owner) const;
    uint64_t position_count() const { return state_.next_id - 1; }

    I128 get_collateral_balance(const Address& user) const;
    I128 get_debt_balance(const Address& user) const;

    I128 total_collateral() const { return state_.total_collateral; }
    I128 total_debt() const { return state_.total_debt; }
    I128 written_off_debt() const { return state_.written_off_debt; }

    // Recorded debt plus interest due but not yet charged
    std::optional<I128> current_debt(uint64_t position_id) const;

    // collateral_value * PRECISION / debt_value; INFINITE_HEALTH without debt.
    // nullopt when the position is unknown or a price is unusable.
    std::optional<I128> get_position_health(uint64_t position_id) const;

    // Additional debt-asset units borrowable now, floored at zero
    std::optional<I128> get_max_borrowable(uint64_t position_id) const;

    // Total debt-asset units the collateral supports at ltv_ratio
    std::optional<I128> get_borrow_limit(uint64_t position_id) const;

    bool is_liquidatable(uint64_t position_id) const;

    // Health below which liquidation is permitted: PRECISION * 100 / liquidation_threshold
    I128 liquidation_health_floor() const;

    // USD value (X18) at the current oracle price
    std::optional<I128> collateral_value(I128 amount) const;
    std::optional<I128> debt_value(I128 amount) const;

    bool interest_enabled() const { return state_.interest_enabled; }

    // OK when both assets price cleanly, else the first oracle failure
    int32_t price_status() const;

    // =========================================================================
    // Administration (ADMIN role)
    // =========================================================================

    int32_t set_price_feed(const Address& caller, const Currency& asset, const IPriceFeed* feed);
    int32_t update_ltv(const Address& caller, uint32_t ltv_ratio, uint32_t liquidation_threshold);
    int32_t set_liquidator_reward(const Address& caller, uint32_t reward_bips);
    int32_t update_treasury(const Address& caller, const Address& treasury);
    int32_t set_interest_enabled(const Address& caller, bool enabled);

    // Collateral asset: only the surplus above total_collateral() is withdrawable
    int32_t emergency_withdraw(const Address& caller, IToken& token, const Address& to, I128 amount);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_positions;
        uint64_t open_positions;
        uint64_t total_liquidations;
        I128 total_collateral;
        I128 total_debt;
        I128 written_off_debt;
    };
    Stats get_stats() const;

    // IJournaled
    void checkpoint() override { journal_.push(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.drop(); }

private:
    struct State {
        VaultConfig config;
        std::map<uint64_t, Position> positions;
        std::map<Address, UserBalances> balances;
        std::map<Address, std::vector<uint64_t>> owner_index;
        uint64_t next_id = 1;
        I128 total_collateral = 0;
        I128 total_debt = 0;
        I128 written_off_debt = 0;
        uint64_t total_liquidations = 0;
        bool interest_enabled = false;
    };

    struct Prices {
        I128 collateral_x18;
        I128 debt_x18;
    };

    Chain& chain_;
    Address address_;
    AccessControl access_;
    IToken& collateral_token_;
    IToken& debt_token_;
    PriceOracle& oracle_;
    InterestEngine* interest_;

    std::atomic<bool> entered_{false};
    std::optional<uint64_t> accruing_;

    State state_;
    Journal<State> journal_;

    // Lookup
    Position* find(uint64_t position_id);
    const Position* find(uint64_t position_id) const;
    int32_t authorize(const Address& caller, const Position& pos) const;

    // Pricing (fresh oracle reads on every call)
    int32_t load_prices(Prices& out) const;
    I128 value_of_collateral(I128 amount, const Prices& prices) const;
    I128 value_of_debt(I128 amount, const Prices& prices) const;
    bool within_ltv(I128 collateral, I128 debt, const Prices& prices) const;
    I128 health(I128 collateral, I128 debt, const Prices& prices) const;

    // Interest
    int32_t accrue(uint64_t position_id);
    int32_t activate_interest(uint64_t position_id);
    int32_t deactivate_interest(uint64_t position_id);
    bool accrual_ready() const;

    // Aggregate bookkeeping
    void adjust_collateral(Position& pos, I128 delta);
    void adjust_debt(Position& pos, I128 delta);
};

} // namespace lever

#endif // LEVER_LEDGER_HPP
