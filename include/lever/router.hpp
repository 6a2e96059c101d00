#ifndef LEVER_ROUTER_HPP
#define LEVER_ROUTER_HPP

#include <map>
#include <optional>
#include <tuple>

#include "chain.hpp"
#include "token.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Swap Route (trading pair + fee tier)
// =============================================================================

struct SwapRoute {
    Currency token_in;
    Currency token_out;
    uint32_t fee_bips;
};

// Standard fee tiers (bips)
namespace fees {
constexpr uint32_t FEE_005 = 5;      // 0.05%
constexpr uint32_t FEE_030 = 30;     // 0.30%
constexpr uint32_t FEE_100 = 100;    // 1.00%
constexpr uint32_t FEE_MAX = 1000;   // 10.00%
}

struct SwapResult {
    int32_t status;
    I128 amount_out;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Exchange Router Interface
// =============================================================================

class ISwapRouter {
public:
    virtual ~ISwapRouter() = default;

    // Spender that callers approve before swapping
    virtual const Address& address() const = 0;

    // Pulls amount_in from caller (allowance required), pays recipient.
    // Fails with SLIPPAGE_EXCEEDED when the output is below min_amount_out.
    virtual SwapResult swap_exact_input(const Address& caller, const SwapRoute& route,
                                        I128 amount_in, I128 min_amount_out,
                                        const Address& recipient) = 0;

    virtual std::optional<I128> quote_exact_input(const SwapRoute& route, I128 amount_in) const = 0;
};

// =============================================================================
// Pool Reserves
// =============================================================================

struct PoolReserves {
    Currency token0;    // sorted: token0 < token1
    Currency token1;
    uint32_t fee_bips;
    I128 reserve0;
    I128 reserve1;
};

// =============================================================================
// ConstantProductRouter - x*y=k pools held at the router's address
// =============================================================================

class ConstantProductRouter : public ISwapRouter, public IJournaled {
public:
    ConstantProductRouter(Chain& chain, const Address& address, const Address& owner);
    ~ConstantProductRouter() override;

    // Non-copyable
    ConstantProductRouter(const ConstantProductRouter&) = delete;
    ConstantProductRouter& operator=(const ConstantProductRouter&) = delete;

    const Address& address() const override { return address_; }

    // Token is not owned; it must outlive the router
    void register_token(IToken* token);

    // =========================================================================
    // Pools
    // =========================================================================

    int32_t create_pool(const Address& caller, const Currency& a, const Currency& b,
                        uint32_t fee_bips);

    // Seed or deepen a pool; pulls both amounts from caller
    int32_t add_liquidity(const Address& caller, const Currency& a, const Currency& b,
                          uint32_t fee_bips, I128 amount_a, I128 amount_b);

    std::optional<PoolReserves> get_reserves(const Currency& a, const Currency& b,
                                             uint32_t fee_bips) const;

    // =========================================================================
    // Swaps
    // =========================================================================

    SwapResult swap_exact_input(const Address& caller, const SwapRoute& route,
                                I128 amount_in, I128 min_amount_out,
                                const Address& recipient) override;

    std::optional<I128> quote_exact_input(const SwapRoute& route, I128 amount_in) const override;

    uint64_t total_swaps() const { return state_.total_swaps; }

    // IJournaled
    void checkpoint() override { journal_.push(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.drop(); }

private:
    using PoolKey = std::tuple<Currency, Currency, uint32_t>;

    struct State {
        std::map<PoolKey, PoolReserves> pools;
        uint64_t total_swaps = 0;
    };

    Chain& chain_;
    Address address_;
    Address owner_;
    std::map<Currency, IToken*> tokens_;

    State state_;
    Journal<State> journal_;

    static PoolKey make_key(const Currency& a, const Currency& b, uint32_t fee_bips);
    IToken* token(const Currency& id) const;

    static I128 amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out, uint32_t fee_bips);
};

} // namespace lever

#endif // LEVER_ROUTER_HPP
