// =============================================================================
// leverage.cpp - Leverage Loop Builder
// =============================================================================

#include "lever/leverage.hpp"

namespace lever {

LeverageBuilder::LeverageBuilder(Chain& chain, PositionLedger& ledger, ISwapRouter& router,
                                 IToken& collateral_token, IToken& debt_token,
                                 const Address& address, uint32_t max_leverage,
                                 uint32_t swap_fee_bips)
    : chain_(chain),
      ledger_(ledger),
      router_(router),
      collateral_token_(collateral_token),
      debt_token_(debt_token),
      address_(address),
      max_leverage_(max_leverage),
      swap_fee_bips_(swap_fee_bips) {}

SwapRoute LeverageBuilder::route() const {
    return SwapRoute{debt_token_.id(), collateral_token_.id(), swap_fee_bips_};
}

// =============================================================================
// Leverage Loop
// =============================================================================

LeverageResult LeverageBuilder::leverage_position(const Address& caller, I128 collateral_amount,
                                                  uint32_t leverage, I128 min_amount_out,
                                                  const std::vector<I128>& swap_hints) {
    LeverageResult result{};
    result.leverage = leverage;

    NonReentrant guard(entered_);
    if (!guard) {
        result.status = errors::REENTRANCY;
        return result;
    }

    result.status = validate(collateral_amount, leverage);
    if (result.status != errors::OK) return result;

    LeverageResult staged = result;
    result.status = chain_.atomic([&]() {
        // Stage the initial collateral at the builder, then open on the caller's behalf
        int32_t rc = collateral_token_.transfer_from(address_, caller, address_, collateral_amount);
        if (rc != errors::OK) return rc;
        rc = collateral_token_.approve(address_, ledger_.address(), collateral_amount);
        if (rc != errors::OK) return rc;

        OpenResult opened = ledger_.open_position(address_, caller, collateral_token_.id(),
                                                  collateral_amount, 0, leverage);
        if (!opened.ok()) return opened.status;
        staged.position_id = opened.position_id;

        for (uint32_t i = 0; i < leverage; ++i) {
            I128 headroom = 0;
            rc = borrow_headroom(staged.position_id, headroom);
            if (rc != errors::OK) return rc;

            rc = ledger_.borrow_for(address_, staged.position_id, address_, headroom);
            if (rc != errors::OK) return rc;

            // Last tranche goes back to the caller as spendable debt asset
            if (i + 1 == leverage) break;

            rc = debt_token_.approve(address_, router_.address(), headroom);
            if (rc != errors::OK) return rc;

            I128 min_out = i < swap_hints.size() ? swap_hints[i] : min_amount_out;
            SwapResult swap = router_.swap_exact_input(address_, route(), headroom,
                                                       min_out, address_);
            if (!swap.ok()) return swap.status;
            staged.swap_outputs.push_back(swap.amount_out);

            rc = collateral_token_.approve(address_, ledger_.address(), swap.amount_out);
            if (rc != errors::OK) return rc;
            rc = ledger_.add_collateral(address_, staged.position_id, swap.amount_out);
            if (rc != errors::OK) return rc;
        }

        staged.returned_debt = debt_token_.balance_of(address_);
        if (staged.returned_debt > 0) {
            rc = debt_token_.transfer(address_, caller, staged.returned_debt);
            if (rc != errors::OK) return rc;
        }

        std::optional<Position> pos = ledger_.get_position(staged.position_id);
        if (!pos) return errors::POSITION_NOT_FOUND;
        staged.total_collateral = pos->collateral_amount;
        staged.total_debt = pos->debt_amount;

        nlohmann::json outputs = nlohmann::json::array();
        for (I128 out : staged.swap_outputs) {
            outputs.push_back(x18::to_string(out));
        }
        chain_.emit(address_, "LeveragedPositionOpened", {
            {"position_id", staged.position_id},
            {"owner", addresses::to_hex(caller)},
            {"leverage", leverage},
            {"total_collateral", x18::to_string(staged.total_collateral)},
            {"total_debt", x18::to_string(staged.total_debt)},
            {"returned_debt", x18::to_string(staged.returned_debt)},
            {"swap_outputs", outputs}
        });
        return errors::OK;
    });

    if (result.status != errors::OK) return result;
    staged.status = errors::OK;
    return staged;
}

// =============================================================================
// Preview
// =============================================================================

LeveragePreview LeverageBuilder::preview(I128 collateral_amount, uint32_t leverage) const {
    LeveragePreview out{};
    out.status = validate(collateral_amount, leverage);
    if (out.status != errors::OK) return out;
    out.status = ledger_.price_status();
    if (out.status != errors::OK) return out;

    out.total_collateral = collateral_amount;
    for (uint32_t i = 0; i < leverage; ++i) {
        I128 headroom = borrowable_against(out.total_collateral, out.total_debt);
        if (headroom <= 0) {
            out.status = errors::NO_BORROW_CAPACITY;
            return out;
        }
        out.total_debt += headroom;

        if (i + 1 == leverage) {
            out.returned_debt = headroom;
            break;
        }

        std::optional<I128> quoted = router_.quote_exact_input(route(), headroom);
        if (!quoted) {
            out.status = errors::POOL_NOT_FOUND;
            return out;
        }
        out.swap_outputs.push_back(*quoted);
        out.total_collateral += *quoted;
    }
    return out;
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t LeverageBuilder::validate(I128 collateral_amount, uint32_t leverage) const {
    if (leverage == 0) return errors::INVALID_LEVERAGE;
    if (leverage > max_leverage_) return errors::LEVERAGE_EXCEEDS_MAX;
    if (collateral_amount <= 0) return errors::INVALID_COLLATERAL_AMOUNT;
    return errors::OK;
}

// borrow limit minus current debt (pending interest included)
int32_t LeverageBuilder::borrow_headroom(uint64_t position_id, I128& out) const {
    std::optional<I128> limit = ledger_.get_borrow_limit(position_id);
    if (!limit) {
        int32_t rc = ledger_.price_status();
        return rc != errors::OK ? rc : errors::POSITION_NOT_FOUND;
    }
    std::optional<I128> debt = ledger_.current_debt(position_id);
    if (!debt) return errors::POSITION_NOT_FOUND;

    if (*limit <= *debt) return errors::NO_BORROW_CAPACITY;
    out = *limit - *debt;
    return errors::OK;
}

I128 LeverageBuilder::borrowable_against(I128 collateral, I128 debt) const {
    std::optional<I128> collateral_usd = ledger_.collateral_value(collateral);
    std::optional<I128> debt_usd = ledger_.debt_value(debt);
    std::optional<I128> unit_usd = ledger_.debt_value(x18::pow10(debt_token_.decimals()));
    if (!collateral_usd || !debt_usd || !unit_usd || *unit_usd <= 0) return 0;

    I128 limit_usd = x18::mul_div(*collateral_usd,
                                  static_cast<I128>(ledger_.config().ltv_ratio),
                                  PERCENT_DENOMINATOR);
    if (limit_usd <= *debt_usd) return 0;
    return x18::mul_div(limit_usd - *debt_usd, x18::pow10(debt_token_.decimals()), *unit_usd);
}

} // namespace lever
