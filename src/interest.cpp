// =============================================================================
// interest.cpp - Interest Accrual Engine
// =============================================================================

#include "lever/interest.hpp"
#include <stdexcept>

namespace lever {

// =============================================================================
// Constructor
// =============================================================================

InterestEngine::InterestEngine(Chain& chain, const Address& owner, const Address& address,
                               uint64_t period_blocks, uint64_t blocks_per_year)
    : chain_(chain),
      address_(address),
      access_(owner),
      blocks_per_year_(blocks_per_year) {
    if (blocks_per_year == 0 || period_blocks == 0 || period_blocks > blocks_per_year) {
        throw std::invalid_argument("InterestEngine: period_blocks must be in [1, blocks_per_year]");
    }
    state_.period_blocks = period_blocks;
    state_.period_share = compute_period_share(period_blocks);
    chain_.attach(this);
}

InterestEngine::~InterestEngine() {
    chain_.detach(this);
}

// =============================================================================
// Vault Registry
// =============================================================================

int32_t InterestEngine::register_vault(const Address& caller, const Address& vault,
                                       IInterestDebtor* debtor, uint32_t annual_rate_bips) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (addresses::is_zero(vault) || debtor == nullptr) return errors::INVALID_ADDRESS;
    if (annual_rate_bips == 0) return errors::INVALID_RATE;
    if (state_.vaults.count(vault)) return errors::VAULT_ALREADY_REGISTERED;

    state_.vaults[vault] = VaultRecord{debtor, annual_rate_bips};
    chain_.emit(address_, "VaultRegistered", {
        {"vault", addresses::to_hex(vault)},
        {"annual_rate_bips", annual_rate_bips}
    });
    return errors::OK;
}

int32_t InterestEngine::set_vault_rate(const Address& caller, const Address& vault,
                                       uint32_t annual_rate_bips) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (annual_rate_bips == 0) return errors::INVALID_RATE;

    auto it = state_.vaults.find(vault);
    if (it == state_.vaults.end()) return errors::VAULT_NOT_REGISTERED;

    uint32_t old_rate = it->second.annual_rate_bips;
    it->second.annual_rate_bips = annual_rate_bips;
    chain_.emit(address_, "VaultRateUpdated", {
        {"vault", addresses::to_hex(vault)},
        {"old", old_rate},
        {"new", annual_rate_bips}
    });
    return errors::OK;
}

bool InterestEngine::is_registered(const Address& vault) const {
    return state_.vaults.count(vault) > 0;
}

std::optional<uint32_t> InterestEngine::vault_rate(const Address& vault) const {
    const VaultRecord* record = this->vault(vault);
    if (!record) return std::nullopt;
    return record->annual_rate_bips;
}

// =============================================================================
// Period Granularity
// =============================================================================

int32_t InterestEngine::set_period_blocks(const Address& caller, uint64_t period_blocks) {
    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (period_blocks == 0 || period_blocks > blocks_per_year_) return errors::INVALID_PERIOD;

    uint64_t old_blocks = state_.period_blocks;
    state_.period_blocks = period_blocks;
    state_.period_share = compute_period_share(period_blocks);
    chain_.emit(address_, "PeriodBlocksUpdated", {
        {"old", old_blocks},
        {"new", period_blocks},
        {"period_share", x18::to_string(state_.period_share)}
    });
    return errors::OK;
}

// =============================================================================
// Position Lifecycle
// =============================================================================

int32_t InterestEngine::activate(const Address& caller, const Address& vault,
                                 uint64_t position_id) {
    if (!this->vault(vault)) return errors::VAULT_NOT_REGISTERED;
    if (caller != vault) return errors::VAULT_NOT_CALLER;

    InterestState& st = state_.positions[{vault, position_id}];
    st.last_collection_block = chain_.block_number();
    return errors::OK;
}

int32_t InterestEngine::deactivate(const Address& caller, const Address& vault,
                                   uint64_t position_id) {
    if (!this->vault(vault)) return errors::VAULT_NOT_REGISTERED;
    if (caller != vault) return errors::VAULT_NOT_CALLER;

    auto it = state_.positions.find({vault, position_id});
    if (it != state_.positions.end()) {
        it->second.last_collection_block = 0;
    }
    return errors::OK;
}

std::optional<InterestState> InterestEngine::interest_state(const Address& vault,
                                                            uint64_t position_id) const {
    auto it = state_.positions.find({vault, position_id});
    if (it == state_.positions.end()) return std::nullopt;
    return it->second;
}

bool InterestEngine::is_active(const Address& vault, uint64_t position_id) const {
    auto it = state_.positions.find({vault, position_id});
    return it != state_.positions.end() && it->second.last_collection_block != 0;
}

// =============================================================================
// Accrual
// =============================================================================

I128 InterestEngine::period_interest(const Address& vault, I128 debt) const {
    const VaultRecord* record = this->vault(vault);
    if (!record || record->annual_rate_bips == 0 || debt <= 0) return 0;

    // debt * rate_bips * period_share / (10000 * PRECISION), floored
    I128 scaled_rate = static_cast<I128>(record->annual_rate_bips) * state_.period_share;
    return x18::mul_div(debt, scaled_rate, BIPS_DENOMINATOR * PRECISION);
}

uint64_t InterestEngine::periods_elapsed(const Address& vault, uint64_t position_id) const {
    auto it = state_.positions.find({vault, position_id});
    if (it == state_.positions.end() || it->second.last_collection_block == 0) return 0;

    uint64_t last = it->second.last_collection_block;
    uint64_t now = chain_.block_number();
    if (now <= last) return 0;
    return (now - last) / state_.period_blocks;
}

uint64_t InterestEngine::blocks_until_next_period(const Address& vault,
                                                  uint64_t position_id) const {
    auto it = state_.positions.find({vault, position_id});
    if (it == state_.positions.end() || it->second.last_collection_block == 0) return 0;

    uint64_t last = it->second.last_collection_block;
    uint64_t now = chain_.block_number();
    uint64_t elapsed = now > last ? now - last : 0;
    return state_.period_blocks - (elapsed % state_.period_blocks);
}

I128 InterestEngine::calculate_interest_due(const Address& vault, uint64_t position_id,
                                            I128 debt) const {
    if (!this->vault(vault) || debt <= 0) return 0;

    uint64_t periods = periods_elapsed(vault, position_id);
    if (periods == 0) return 0;

    // Fixed quantum per whole period; partial periods accrue nothing
    return period_interest(vault, debt) * static_cast<I128>(periods);
}

int32_t InterestEngine::collect_interest(const Address& caller, const Address& vault,
                                         const Currency& debt_token, uint64_t position_id,
                                         I128 debt) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    const VaultRecord* record = this->vault(vault);
    if (!record) return errors::VAULT_NOT_REGISTERED;
    if (caller != vault) return errors::VAULT_NOT_CALLER;

    if (periods_elapsed(vault, position_id) == 0) {
        return errors::OK;
    }

    I128 due = calculate_interest_due(vault, position_id, debt);
    if (due <= 0) return errors::NO_INTEREST_TO_COLLECT;

    return chain_.atomic([&]() {
        int32_t rc = record->debtor->record_interest(address_, position_id, debt_token, due);
        if (rc != errors::OK) return rc;

        InterestState& st = state_.positions[{vault, position_id}];
        st.last_collection_block = chain_.block_number();
        st.total_collected += due;
        state_.treasury[debt_token] += due;

        chain_.emit(address_, "InterestCollected", {
            {"vault", addresses::to_hex(vault)},
            {"position_id", position_id},
            {"amount", x18::to_string(due)},
            {"block", chain_.block_number()}
        });
        return errors::OK;
    });
}

// =============================================================================
// Treasury
// =============================================================================

I128 InterestEngine::treasury_balance(const Currency& token) const {
    auto it = state_.treasury.find(token);
    return it != state_.treasury.end() ? it->second : 0;
}

int32_t InterestEngine::withdraw_treasury(const Address& caller, IToken& token,
                                          const Address& to, I128 amount) {
    NonReentrant guard(entered_);
    if (!guard) return errors::REENTRANCY;

    int32_t rc = access_.require(caller, Role::ADMIN);
    if (rc != errors::OK) return rc;
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(to)) return errors::INVALID_ADDRESS;
    if (amount > treasury_balance(token.id())) return errors::INSUFFICIENT_BALANCE;

    return chain_.atomic([&]() {
        state_.treasury[token.id()] -= amount;
        int32_t status = token.transfer(address_, to, amount);
        if (status != errors::OK) return status;

        chain_.emit(address_, "TreasuryWithdrawn", {
            {"token", addresses::to_hex(token.id().addr)},
            {"to", addresses::to_hex(to)},
            {"amount", x18::to_string(amount)}
        });
        return errors::OK;
    });
}

// =============================================================================
// Internal Helpers
// =============================================================================

const VaultRecord* InterestEngine::vault(const Address& vault) const {
    auto it = state_.vaults.find(vault);
    return it != state_.vaults.end() ? &it->second : nullptr;
}

I128 InterestEngine::compute_period_share(uint64_t period_blocks) const {
    return static_cast<I128>(period_blocks) * PRECISION / static_cast<I128>(blocks_per_year_);
}

} // namespace lever
