#ifndef LEVER_INTEREST_HPP
#define LEVER_INTEREST_HPP

#include <atomic>
#include <map>
#include <optional>
#include <utility>

#include "access.hpp"
#include "chain.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Interest Debtor (implemented by vaults)
// =============================================================================

// Called back by the engine during collection. Implementations add `amount`
// to the position's debt and mint the same amount of debt asset to `caller`.
class IInterestDebtor {
public:
    virtual ~IInterestDebtor() = default;

    virtual int32_t record_interest(const Address& caller, uint64_t position_id,
                                    const Currency& debt_token, I128 amount) = 0;
};

// =============================================================================
// Interest State (per vault, per position)
// =============================================================================

struct InterestState {
    uint64_t last_collection_block;  // 0 = inactive / dormant
    I128 total_collected;
};

struct VaultRecord {
    IInterestDebtor* debtor;
    uint32_t annual_rate_bips;
};

constexpr uint64_t DEFAULT_PERIOD_BLOCKS = 7200;        // ~1 day of 12s blocks
constexpr uint64_t DEFAULT_BLOCKS_PER_YEAR = 2628000;   // 365 days of 12s blocks

// =============================================================================
// InterestEngine - Period-discretized simple interest
// =============================================================================

class InterestEngine : public IJournaled {
public:
    // Throws std::invalid_argument when period_blocks is 0 or exceeds blocks_per_year
    InterestEngine(Chain& chain, const Address& owner, const Address& address,
                   uint64_t period_blocks = DEFAULT_PERIOD_BLOCKS,
                   uint64_t blocks_per_year = DEFAULT_BLOCKS_PER_YEAR);
    ~InterestEngine() override;

    // Non-copyable
    InterestEngine(const InterestEngine&) = delete;
    InterestEngine& operator=(const InterestEngine&) = delete;

    const Address& address() const { return address_; }
    AccessControl& access() { return access_; }

    // =========================================================================
    // Vault Registry
    // =========================================================================

    // One-time; annual_rate_bips must be non-zero
    int32_t register_vault(const Address& caller, const Address& vault,
                           IInterestDebtor* debtor, uint32_t annual_rate_bips);
    int32_t set_vault_rate(const Address& caller, const Address& vault, uint32_t annual_rate_bips);

    bool is_registered(const Address& vault) const;
    std::optional<uint32_t> vault_rate(const Address& vault) const;

    // =========================================================================
    // Period Granularity
    // =========================================================================

    int32_t set_period_blocks(const Address& caller, uint64_t period_blocks);

    uint64_t period_blocks() const { return state_.period_blocks; }
    uint64_t blocks_per_year() const { return blocks_per_year_; }

    // period_blocks / blocks_per_year, X18
    I128 period_share() const { return state_.period_share; }

    // =========================================================================
    // Position Lifecycle (vault only)
    // =========================================================================

    int32_t activate(const Address& caller, const Address& vault, uint64_t position_id);
    int32_t deactivate(const Address& caller, const Address& vault, uint64_t position_id);

    std::optional<InterestState> interest_state(const Address& vault, uint64_t position_id) const;
    bool is_active(const Address& vault, uint64_t position_id) const;

    // =========================================================================
    // Accrual
    // =========================================================================

    // One whole period's charge on `debt` for the vault's rate
    I128 period_interest(const Address& vault, I128 debt) const;

    // Whole periods since the last collection; 0 when inactive
    uint64_t periods_elapsed(const Address& vault, uint64_t position_id) const;

    // Blocks left until the next whole period completes; 0 when inactive
    uint64_t blocks_until_next_period(const Address& vault, uint64_t position_id) const;

    I128 calculate_interest_due(const Address& vault, uint64_t position_id, I128 debt) const;

    // Vault only. No-op when the position is not period-ready.
    int32_t collect_interest(const Address& caller, const Address& vault,
                             const Currency& debt_token, uint64_t position_id, I128 debt);

    // =========================================================================
    // Treasury
    // =========================================================================

    I128 treasury_balance(const Currency& token) const;
    int32_t withdraw_treasury(const Address& caller, IToken& token, const Address& to, I128 amount);

    // IJournaled
    void checkpoint() override { journal_.push(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.drop(); }

private:
    using StateKey = std::pair<Address, uint64_t>;

    struct State {
        std::map<Address, VaultRecord> vaults;
        std::map<StateKey, InterestState> positions;
        std::map<Currency, I128> treasury;
        uint64_t period_blocks = DEFAULT_PERIOD_BLOCKS;
        I128 period_share = 0;
    };

    Chain& chain_;
    Address address_;
    AccessControl access_;
    uint64_t blocks_per_year_;
    std::atomic<bool> entered_{false};

    State state_;
    Journal<State> journal_;

    const VaultRecord* vault(const Address& vault) const;
    I128 compute_period_share(uint64_t period_blocks) const;
};

} // namespace lever

#endif // LEVER_INTEREST_HPP
