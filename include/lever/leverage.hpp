#ifndef LEVER_LEVERAGE_HPP
#define LEVER_LEVERAGE_HPP

#include <atomic>
#include <vector>

#include "chain.hpp"
#include "ledger.hpp"
#include "router.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

constexpr uint32_t DEFAULT_MAX_LEVERAGE = 10;

// =============================================================================
// Leverage Results
// =============================================================================

struct LeverageResult {
    int32_t status;
    uint64_t position_id;
    I128 total_collateral;          // recorded on the position after the loop
    I128 total_debt;
    uint32_t leverage;
    std::vector<I128> swap_outputs; // one per reinvested tranche
    I128 returned_debt;             // debt asset handed back to the caller

    bool ok() const { return status == errors::OK; }
};

struct LeveragePreview {
    int32_t status;
    I128 total_collateral;
    I128 total_debt;
    I128 returned_debt;
    std::vector<I128> swap_outputs;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// LeverageBuilder - Borrow / swap / redeposit loop in one atomic call
// =============================================================================

// Holds no state between calls. Needs the ledger's LEVERAGE role.
class LeverageBuilder {
public:
    LeverageBuilder(Chain& chain, PositionLedger& ledger, ISwapRouter& router,
                    IToken& collateral_token, IToken& debt_token, const Address& address,
                    uint32_t max_leverage = DEFAULT_MAX_LEVERAGE,
                    uint32_t swap_fee_bips = fees::FEE_030);

    // Non-copyable
    LeverageBuilder(const LeverageBuilder&) = delete;
    LeverageBuilder& operator=(const LeverageBuilder&) = delete;

    const Address& address() const { return address_; }
    uint32_t max_leverage() const { return max_leverage_; }
    SwapRoute route() const;

    // Caller approves the builder for collateral_amount. The position is
    // owned by caller; the final borrowed tranche is returned unswapped.
    // swap_hints[i], when present, replaces min_amount_out for swap i.
    LeverageResult leverage_position(const Address& caller, I128 collateral_amount,
                                     uint32_t leverage, I128 min_amount_out,
                                     const std::vector<I128>& swap_hints = {});

    // Estimate from current prices and router quotes; changes nothing.
    // Quotes are taken against current reserves, ignoring earlier swaps.
    LeveragePreview preview(I128 collateral_amount, uint32_t leverage) const;

private:
    Chain& chain_;
    PositionLedger& ledger_;
    ISwapRouter& router_;
    IToken& collateral_token_;
    IToken& debt_token_;
    Address address_;
    uint32_t max_leverage_;
    uint32_t swap_fee_bips_;

    std::atomic<bool> entered_{false};

    int32_t validate(I128 collateral_amount, uint32_t leverage) const;
    int32_t borrow_headroom(uint64_t position_id, I128& out) const;
    I128 borrowable_against(I128 collateral, I128 debt) const;
};

} // namespace lever

#endif // LEVER_LEVERAGE_HPP
