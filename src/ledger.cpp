// =============================================================================
// ledger.cpp - Position Ledger Implementation
// =============================================================================

#include "lever/ledger.hpp"
#include <algorithm>
#include <stdexcept>

namespace lever {

namespace {

// Clears the in-accrual marker on every exit path
class AccrualScope {
public:
    AccrualScope(std::optional<uint64_t>& slot, uint64_t position_id) : slot_(slot) {
        slot_ = position_id;
    }
    ~AccrualScope() { slot_.reset(); }

    AccrualScope(const AccrualScope&) = delete;
    AccrualScope& operator=(const AccrualScope&) = delete;

private:
    std::optional<uint64_t>& slot_;
};

nlohmann::json position_json(const Position& pos) {
    return {
        {"position_id", pos.id},
        {"owner", addresses::to_hex(pos.owner)},
        {"collateral", x18::to_string(pos.collateral_amount)},
        {"debt", x18::to_string(pos.debt_amount)}
    };
}

} // namespace

bool VaultConfig::valid() const {
    return ltv_ratio > 0 &&
           ltv_ratio <= liquidation_threshold &&
           liquidation_threshold <= 100 &&
           liquidator_reward_bips <= BIPS_DENOMINATOR &&
           collateral_asset != debt_asset &&
           !addresses::is_zero(treasury);
}

// =============================================================================
// Constructor
// =============================================================================

PositionLedger::PositionLedger(Chain& chain, const Address& address, const Address& owner,
                               const VaultConfig& config, IToken& collateral_token,
                               IToken& debt_token, PriceOracle& oracle,
                               InterestEngine* interest)
    : chain_(chain),
      address_(address),
      access_(owner),
      collateral_token_(collateral_token),
      debt_token_(debt_token),
      oracle_(oracle),
      interest_(interest) {
    if (!config.valid()) {
        throw std::invalid_argument("PositionLedger: invalid vault config");
    }
    if (collateral_token.id() != config.collateral_asset || debt_token.id() != config.debt_asset) {
        throw std::invalid_argument("PositionLedger: token does not match vault asset");
    }
    state_.config = config;
    state_.interest_enabled = interest != nullptr;
    chain_.attach(this);
}

PositionLedger::~PositionLedger() {
    chain_.detach(this);
}

// =============================================================================
// Position Lifecycle
// =============================================================================

OpenResult PositionLedger::open_position(const Address& caller, const Address& owner,
                                         const Currency& collateral_asset, I128 collateral_amount,
                                         I128 debt_amount, uint32_t leverage_hint) {
    NonReentrant guard(entered_);
    if (!guard) return OpenResult{errors::REENTRANCY, 0};

    if (collateral_asset != state_.config.collateral_asset) {
        return OpenResult{errors::INVALID_ASSET, 0};
    }
    if (collateral_amount <= 0) return OpenResult{errors::INVALID_COLLATERAL_AMOUNT, 0};
    if (debt_amount < 0) return OpenResult{errors::INVALID_AMOUNT, 0};
    if (addresses::is_zero(owner)) return OpenResult{errors::INVALID_ADDRESS, 0};
    if (caller != owner && !access_.has_role(caller, Role::LEVERAGE)) {
        return OpenResult{errors::UNAUTHORIZED, 0};
    }

    uint64_t position_id = 0;
    int32_t status = chain_.atomic([&]() {
        if (debt_amount > 0) {
            Prices prices;
            int32_t rc = load_prices(prices);
            if (rc != errors::OK) return rc;
            if (!within_ltv(collateral_amount, debt_amount, prices)) {
                return errors::LOAN_EXCEEDS_LTV_LIMIT;
            }
        }

        int32_t rc = collateral_token_.transfer_from(address_, caller, address_, collateral_amount);
        if (rc != errors::OK) return rc;

        position_id = state_.next_id++;
        Position& pos = state_.positions[position_id];
        pos.id = position_id;
        pos.owner = owner;
        pos.collateral_amount = 0;
        pos.debt_amount = 0;
        pos.leverage = leverage_hint;
        pos.opened_block = chain_.block_number();
        pos.liquidated = false;
        state_.owner_index[owner].push_back(position_id);

        adjust_collateral(pos, collateral_amount);
        if (debt_amount > 0) {
            adjust_debt(pos, debt_amount);
            rc = debt_token_.mint(address_, caller, debt_amount);
            if (rc != errors::OK) return rc;
        }

        if (debt_amount > 0) {
            rc = activate_interest(position_id);
            if (rc != errors::OK) return rc;
        }

        nlohmann::json data = position_json(state_.positions[position_id]);
        data["leverage"] = leverage_hint;
        chain_.emit(address_, "PositionOpened", std::move(data));
        return errors::OK;
    });

    return OpenResult{status, status == errors::OK ? position_id : 0};
}

int32_t PositionLedger::add_collateral(const Address& caller, uint64_t position_id, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    if (amount <= 0) return errors::INVALID_COLLATERAL_AMOUNT;
    const Position* pos = find(position_id);
    if (!pos) return errors::POSITION_NOT_FOUND;
    int32_t rc = authorize(caller, *pos);
    if (rc != errors::OK) return rc;

    return chain_.atomic([&]() {
        int32_t status = collateral_token_.transfer_from(address_, caller, address_, amount);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        adjust_collateral(p, amount);
        chain_.emit(address_, "CollateralAdded", {
            {"position_id", position_id},
            {"amount", x18::to_string(amount)},
            {"collateral", x18::to_string(p.collateral_amount)}
        });
        return errors::OK;
    });
}

int32_t PositionLedger::remove_collateral(const Address& caller, uint64_t position_id, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    if (amount <= 0) return errors::INVALID_COLLATERAL_AMOUNT;
    const Position* pos = find(position_id);
    if (!pos) return errors::POSITION_NOT_FOUND;
    int32_t rc = authorize(caller, *pos);
    if (rc != errors::OK) return rc;

    return chain_.atomic([&]() {
        int32_t status = accrue(position_id);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        if (amount > p.collateral_amount) return errors::AMOUNT_EXCEEDS_COLLATERAL;

        I128 remaining = p.collateral_amount - amount;
        if (p.debt_amount > 0) {
            Prices prices;
            status = load_prices(prices);
            if (status != errors::OK) return status;
            if (!within_ltv(remaining, p.debt_amount, prices)) {
                return errors::INSUFFICIENT_COLLATERAL_AFTER_WITHDRAWAL;
            }
        }

        adjust_collateral(p, -amount);
        Address owner = p.owner;
        chain_.emit(address_, "CollateralRemoved", {
            {"position_id", position_id},
            {"amount", x18::to_string(amount)},
            {"collateral", x18::to_string(remaining)}
        });
        return collateral_token_.transfer(address_, owner, amount);
    });
}

int32_t PositionLedger::borrow(const Address& caller, uint64_t position_id, I128 amount) {
    return borrow_for(caller, position_id, caller, amount);
}

int32_t PositionLedger::borrow_for(const Address& caller, uint64_t position_id,
                                   const Address& beneficiary, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(beneficiary)) return errors::INVALID_ADDRESS;
    const Position* pos = find(position_id);
    if (!pos) return errors::POSITION_NOT_FOUND;
    int32_t rc = authorize(caller, *pos);
    if (rc != errors::OK) return rc;

    return chain_.atomic([&]() {
        // Fold accrued interest into debt before the limit check
        int32_t status = accrue(position_id);
        if (status != errors::OK) return status;

        Prices prices;
        status = load_prices(prices);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        bool was_debt_free = p.debt_amount == 0;
        if (!within_ltv(p.collateral_amount, p.debt_amount + amount, prices)) {
            return errors::LOAN_EXCEEDS_LTV_LIMIT;
        }

        adjust_debt(p, amount);
        chain_.emit(address_, "Borrowed", {
            {"position_id", position_id},
            {"beneficiary", addresses::to_hex(beneficiary)},
            {"amount", x18::to_string(amount)},
            {"debt", x18::to_string(p.debt_amount)}
        });

        if (was_debt_free) {
            status = activate_interest(position_id);
            if (status != errors::OK) return status;
        }
        return debt_token_.mint(address_, beneficiary, amount);
    });
}

int32_t PositionLedger::repay(const Address& caller, uint64_t position_id, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (!find(position_id)) return errors::POSITION_NOT_FOUND;

    return chain_.atomic([&]() {
        int32_t status = accrue(position_id);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        if (amount > p.debt_amount) return errors::AMOUNT_EXCEEDS_LOAN;

        adjust_debt(p, -amount);
        I128 remaining = p.debt_amount;
        chain_.emit(address_, "Repaid", {
            {"position_id", position_id},
            {"payer", addresses::to_hex(caller)},
            {"amount", x18::to_string(amount)},
            {"debt", x18::to_string(remaining)}
        });

        status = debt_token_.burn_from(address_, caller, amount);
        if (status != errors::OK) return status;

        if (remaining == 0) return deactivate_interest(position_id);
        return errors::OK;
    });
}

int32_t PositionLedger::close_position(const Address& caller, uint64_t position_id) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    const Position* pos = find(position_id);
    if (!pos) return errors::POSITION_NOT_FOUND;
    int32_t rc = authorize(caller, *pos);
    if (rc != errors::OK) return rc;

    return chain_.atomic([&]() {
        int32_t status = accrue(position_id);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        I128 debt = p.debt_amount;
        I128 collateral = p.collateral_amount;
        Address owner = p.owner;
        nlohmann::json data = position_json(p);

        adjust_debt(p, -debt);
        adjust_collateral(p, -collateral);
        chain_.emit(address_, "PositionClosed", std::move(data));

        if (debt > 0) {
            status = debt_token_.burn_from(address_, caller, debt);
            if (status != errors::OK) return status;
        }
        if (collateral > 0) {
            status = collateral_token_.transfer(address_, owner, collateral);
            if (status != errors::OK) return status;
        }
        return deactivate_interest(position_id);
    });
}

LiquidationResult PositionLedger::liquidate(const Address& caller, uint64_t position_id) {
    LiquidationResult result{};
    result.position_id = position_id;
    result.liquidator = caller;

    NonReentrant guard(entered_);
    if (!guard) {
        result.status = errors::REENTRANCY;
        return result;
    }
    if (!find(position_id)) {
        result.status = errors::POSITION_NOT_FOUND;
        return result;
    }

    LiquidationResult staged = result;
    result.status = chain_.atomic([&]() {
        int32_t status = accrue(position_id);
        if (status != errors::OK) return status;

        Position& p = *find(position_id);
        if (p.debt_amount == 0) return errors::POSITION_HEALTHY;

        Prices prices;
        status = load_prices(prices);
        if (status != errors::OK) return status;

        staged.health_x18 = health(p.collateral_amount, p.debt_amount, prices);
        if (staged.health_x18 >= liquidation_health_floor()) {
            return errors::POSITION_HEALTHY;
        }

        const VaultConfig& cfg = state_.config;
        staged.seized_collateral = p.collateral_amount;
        staged.liquidator_reward = x18::mul_div(staged.seized_collateral,
                                                static_cast<I128>(cfg.liquidator_reward_bips),
                                                BIPS_DENOMINATOR);
        staged.treasury_share = staged.seized_collateral - staged.liquidator_reward;
        staged.written_off_debt = p.debt_amount;

        // Debt asset already in circulation stays outstanding; the loss is
        // booked against the protocol reserve.
        Address owner = p.owner;
        adjust_collateral(p, -staged.seized_collateral);
        adjust_debt(p, -staged.written_off_debt);
        p.liquidated = true;
        state_.written_off_debt += staged.written_off_debt;
        state_.total_liquidations++;

        chain_.emit(address_, "Liquidated", {
            {"position_id", position_id},
            {"owner", addresses::to_hex(owner)},
            {"liquidator", addresses::to_hex(caller)},
            {"health", x18::to_string(staged.health_x18)},
            {"seized_collateral", x18::to_string(staged.seized_collateral)},
            {"liquidator_reward", x18::to_string(staged.liquidator_reward)},
            {"treasury_share", x18::to_string(staged.treasury_share)},
            {"written_off_debt", x18::to_string(staged.written_off_debt)}
        });

        if (staged.liquidator_reward > 0) {
            status = collateral_token_.transfer(address_, caller, staged.liquidator_reward);
            if (status != errors::OK) return status;
        }
        if (staged.treasury_share > 0) {
            status = collateral_token_.transfer(address_, cfg.treasury, staged.treasury_share);
            if (status != errors::OK) return status;
        }
        return deactivate_interest(position_id);
    });

    if (result.status == errors::OK) {
        staged.status = errors::OK;
        return staged;
    }
    result.health_x18 = staged.health_x18;
    return result;
}

int32_t PositionLedger::collect_interest(const Address& caller, uint64_t position_id) {
    (void)caller;  // permissionless
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;
    if (!find(position_id)) return errors::POSITION_NOT_FOUND;

    return chain_.atomic([&]() { return accrue(position_id); });
}

int32_t PositionLedger::record_interest(const Address& caller, uint64_t position_id,
                                        const Currency& debt_token, I128 amount) {
    if (!interest_ || caller != interest_->address()) return errors::UNAUTHORIZED;
    if (!accruing_ || *accruing_ != position_id) return errors::UNAUTHORIZED;
    if (debt_token != state_.config.debt_asset) return errors::INVALID_ASSET;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    Position* pos = find(position_id);
    if (!pos) return errors::POSITION_NOT_FOUND;

    adjust_debt(*pos, amount);
    chain_.emit(address_, "InterestCharged", {
        {"position_id", position_id},
        {"amount", x18::to_string(amount)},
        {"debt", x18::to_string(pos->debt_amount)}
    });
    return debt_token_.mint(address_, caller, amount);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Position> PositionLedger::get_position(uint64_t position_id) const {
    const Position* pos = find(position_id);
    if (!pos) return std::nullopt;
    return *pos;
}

std::vector<Position> PositionLedger::positions_of(const Address& owner) const {
    std::vector<Position> out;
    auto it = state_.owner_index.find(owner);
    if (it == state_.owner_index.end()) return out;

    for (uint64_t id : it->second) {
        const Position* pos = find(id);
        if (pos) out.push_back(*pos);
    }
    return out;
}

I128 PositionLedger::get_collateral_balance(const Address& user) const {
    auto it = state_.balances.find(user);
    return it != state_.balances.end() ? it->second.collateral : 0;
}

I128 PositionLedger::get_debt_balance(const Address& user) const {
    auto it = state_.balances.find(user);
    return it != state_.balances.end() ? it->second.debt : 0;
}

std::optional<I128> PositionLedger::current_debt(uint64_t position_id) const {
    const Position* pos = find(position_id);
    if (!pos) return std::nullopt;

    I128 pending = 0;
    if (accrual_ready()) {
        pending = interest_->calculate_interest_due(address_, position_id, pos->debt_amount);
    }
    return pos->debt_amount + pending;
}

std::optional<I128> PositionLedger::get_position_health(uint64_t position_id) const {
    const Position* pos = find(position_id);
    if (!pos) return std::nullopt;

    I128 debt = *current_debt(position_id);
    if (debt == 0) return INFINITE_HEALTH;

    Prices prices;
    if (load_prices(prices) != errors::OK) return std::nullopt;
    return health(pos->collateral_amount, debt, prices);
}

std::optional<I128> PositionLedger::get_borrow_limit(uint64_t position_id) const {
    const Position* pos = find(position_id);
    if (!pos) return std::nullopt;

    Prices prices;
    if (load_prices(prices) != errors::OK) return std::nullopt;

    I128 limit_value = x18::mul_div(value_of_collateral(pos->collateral_amount, prices),
                                    static_cast<I128>(state_.config.ltv_ratio),
                                    PERCENT_DENOMINATOR);
    return x18::mul_div(limit_value, x18::pow10(debt_token_.decimals()), prices.debt_x18);
}

std::optional<I128> PositionLedger::get_max_borrowable(uint64_t position_id) const {
    const Position* pos = find(position_id);
    if (!pos) return std::nullopt;

    Prices prices;
    if (load_prices(prices) != errors::OK) return std::nullopt;

    I128 limit_value = x18::mul_div(value_of_collateral(pos->collateral_amount, prices),
                                    static_cast<I128>(state_.config.ltv_ratio),
                                    PERCENT_DENOMINATOR);
    I128 debt_value = value_of_debt(*current_debt(position_id), prices);
    if (debt_value >= limit_value) return 0;

    return x18::mul_div(limit_value - debt_value, x18::pow10(debt_token_.decimals()),
                        prices.debt_x18);
}

bool PositionLedger::is_liquidatable(uint64_t position_id) const {
    std::optional<I128> h = get_position_health(position_id);
    return h.has_value() && *h < liquidation_health_floor();
}

I128 PositionLedger::liquidation_health_floor() const {
    return PRECISION * PERCENT_DENOMINATOR / static_cast<I128>(state_.config.liquidation_threshold);
}

std::optional<I128> PositionLedger::collateral_value(I128 amount) const {
    Prices prices;
    if (load_prices(prices) != errors::OK) return std::nullopt;
    return value_of_collateral(amount, prices);
}

std::optional<I128> PositionLedger::debt_value(I128 amount) const {
    Prices prices;
    if (load_prices(prices) != errors::OK) return std::nullopt;
    return value_of_debt(amount, prices);
}

int32_t PositionLedger::price_status() const {
    Prices prices;
    return load_prices(prices);
}

// =============================================================================
// Administration
// =============================================================================

int32_t PositionLedger::set_price_feed(const Address& caller, const Currency& asset,
                                       const IPriceFeed* feed) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (asset != state_.config.collateral_asset && asset != state_.config.debt_asset) {
        return errors::INVALID_ASSET;
    }
    if (feed == nullptr) return errors::INVALID_ADDRESS;

    const IPriceFeed* previous = oracle_.feed(asset);
    oracle_.set_feed(asset, feed);
    chain_.emit(address_, "PriceFeedUpdated", {
        {"asset", addresses::to_hex(asset.addr)},
        {"old", previous ? previous->description() : std::string("none")},
        {"new", feed->description()}
    });
    return errors::OK;
}

int32_t PositionLedger::update_ltv(const Address& caller, uint32_t ltv_ratio,
                                   uint32_t liquidation_threshold) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;

    VaultConfig next = state_.config;
    next.ltv_ratio = ltv_ratio;
    next.liquidation_threshold = liquidation_threshold;
    if (!next.valid()) return errors::INVALID_CONFIG;

    VaultConfig previous = state_.config;
    state_.config = next;
    chain_.emit(address_, "LtvUpdated", {
        {"old", {{"ltv_ratio", previous.ltv_ratio},
                 {"liquidation_threshold", previous.liquidation_threshold}}},
        {"new", {{"ltv_ratio", ltv_ratio},
                 {"liquidation_threshold", liquidation_threshold}}}
    });
    return errors::OK;
}

int32_t PositionLedger::set_liquidator_reward(const Address& caller, uint32_t reward_bips) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (reward_bips > BIPS_DENOMINATOR) return errors::INVALID_CONFIG;

    uint32_t previous = state_.config.liquidator_reward_bips;
    state_.config.liquidator_reward_bips = reward_bips;
    chain_.emit(address_, "LiquidatorRewardUpdated", {{"old", previous}, {"new", reward_bips}});
    return errors::OK;
}

int32_t PositionLedger::update_treasury(const Address& caller, const Address& treasury) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (addresses::is_zero(treasury)) return errors::INVALID_ADDRESS;

    Address previous = state_.config.treasury;
    state_.config.treasury = treasury;
    chain_.emit(address_, "TreasuryUpdated", {
        {"old", addresses::to_hex(previous)},
        {"new", addresses::to_hex(treasury)}
    });
    return errors::OK;
}

int32_t PositionLedger::set_interest_enabled(const Address& caller, bool enabled) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (enabled && (!interest_ || !interest_->is_registered(address_))) {
        return errors::INVALID_CONFIG;
    }

    bool previous = state_.interest_enabled;
    return chain_.atomic([&]() {
        state_.interest_enabled = enabled;
        if (enabled != previous && interest_ && interest_->is_registered(address_)) {
            // Clocks stop while accrual is off and restart at the current block
            for (const auto& [id, pos] : state_.positions) {
                if (pos.debt_amount == 0) continue;
                int32_t status = enabled ? interest_->activate(address_, address_, id)
                                         : interest_->deactivate(address_, address_, id);
                if (status != errors::OK) return status;
            }
        }
        chain_.emit(address_, "InterestToggled", {{"old", previous}, {"new", enabled}});
        return errors::OK;
    });
}

int32_t PositionLedger::emergency_withdraw(const Address& caller, IToken& token,
                                           const Address& to, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(to)) return errors::INVALID_ADDRESS;

    I128 available = token.balance_of(address_);
    if (token.id() == state_.config.collateral_asset) {
        available -= state_.total_collateral;
    }
    if (amount > available) return errors::INSUFFICIENT_BALANCE;

    return chain_.atomic([&]() {
        chain_.emit(address_, "EmergencyWithdraw", {
            {"token", addresses::to_hex(token.id().addr)},
            {"to", addresses::to_hex(to)},
            {"amount", x18::to_string(amount)}
        });
        return token.transfer(address_, to, amount);
    });
}

// =============================================================================
// Statistics
// =============================================================================

PositionLedger::Stats PositionLedger::get_stats() const {
    uint64_t open = static_cast<uint64_t>(std::count_if(
        state_.positions.begin(), state_.positions.end(),
        [](const auto& entry) {
            return entry.second.collateral_amount > 0 || entry.second.debt_amount > 0;
        }));

    return Stats{
        state_.next_id - 1,
        open,
        state_.total_liquidations,
        state_.total_collateral,
        state_.total_debt,
        state_.written_off_debt
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

Position* PositionLedger::find(uint64_t position_id) {
    auto it = state_.positions.find(position_id);
    return it != state_.positions.end() ? &it->second : nullptr;
}

const Position* PositionLedger::find(uint64_t position_id) const {
    auto it = state_.positions.find(position_id);
    return it != state_.positions.end() ? &it->second : nullptr;
}

int32_t PositionLedger::authorize(const Address& caller, const Position& pos) const {
    if (caller == pos.owner || access_.has_role(caller, Role::LEVERAGE)) {
        return errors::OK;
    }
    return errors::NOT_POSITION_OWNER;
}

int32_t PositionLedger::load_prices(Prices& out) const {
    OracleQuote collateral = oracle_.quote(state_.config.collateral_asset);
    if (!collateral.ok()) return collateral.status;
    OracleQuote debt = oracle_.quote(state_.config.debt_asset);
    if (!debt.ok()) return debt.status;

    out.collateral_x18 = collateral.price_x18;
    out.debt_x18 = debt.price_x18;
    return errors::OK;
}

I128 PositionLedger::value_of_collateral(I128 amount, const Prices& prices) const {
    return x18::mul_div(amount, prices.collateral_x18, x18::pow10(collateral_token_.decimals()));
}

I128 PositionLedger::value_of_debt(I128 amount, const Prices& prices) const {
    return x18::mul_div(amount, prices.debt_x18, x18::pow10(debt_token_.decimals()));
}

// debt_value <= collateral_value * ltv / 100
bool PositionLedger::within_ltv(I128 collateral, I128 debt, const Prices& prices) const {
    if (debt <= 0) return true;
    I128 limit = x18::mul_div(value_of_collateral(collateral, prices),
                              static_cast<I128>(state_.config.ltv_ratio),
                              PERCENT_DENOMINATOR);
    return value_of_debt(debt, prices) <= limit;
}

I128 PositionLedger::health(I128 collateral, I128 debt, const Prices& prices) const {
    I128 dv = value_of_debt(debt, prices);
    if (dv <= 0) return INFINITE_HEALTH;
    return x18::mul_div(value_of_collateral(collateral, prices), PRECISION, dv);
}

bool PositionLedger::accrual_ready() const {
    return interest_ != nullptr && state_.interest_enabled && interest_->is_registered(address_);
}

int32_t PositionLedger::accrue(uint64_t position_id) {
    if (!accrual_ready()) return errors::OK;

    const Position* pos = find(position_id);
    if (!pos || pos->debt_amount == 0) return errors::OK;

    I128 debt = pos->debt_amount;
    if (interest_->calculate_interest_due(address_, position_id, debt) == 0) {
        return errors::OK;
    }

    AccrualScope scope(accruing_, position_id);
    return interest_->collect_interest(address_, address_, state_.config.debt_asset,
                                       position_id, debt);
}

int32_t PositionLedger::activate_interest(uint64_t position_id) {
    if (!accrual_ready()) return errors::OK;
    return interest_->activate(address_, address_, position_id);
}

int32_t PositionLedger::deactivate_interest(uint64_t position_id) {
    if (!interest_ || !interest_->is_registered(address_)) return errors::OK;
    return interest_->deactivate(address_, address_, position_id);
}

void PositionLedger::adjust_collateral(Position& pos, I128 delta) {
    pos.collateral_amount += delta;
    state_.balances[pos.owner].collateral += delta;
    state_.total_collateral += delta;
}

void PositionLedger::adjust_debt(Position& pos, I128 delta) {
    pos.debt_amount += delta;
    state_.balances[pos.owner].debt += delta;
    state_.total_debt += delta;
}

} // namespace lever
