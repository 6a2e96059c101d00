// =============================================================================
// router.cpp - Constant-product exchange router
// =============================================================================

#include "lever/router.hpp"

namespace lever {

ConstantProductRouter::ConstantProductRouter(Chain& chain, const Address& address,
                                             const Address& owner)
    : chain_(chain), address_(address), owner_(owner) {
    chain_.attach(this);
}

ConstantProductRouter::~ConstantProductRouter() {
    chain_.detach(this);
}

void ConstantProductRouter::register_token(IToken* token) {
    if (token != nullptr) tokens_[token->id()] = token;
}

// =============================================================================
// Pools
// =============================================================================

int32_t ConstantProductRouter::create_pool(const Address& caller, const Currency& a,
                                           const Currency& b, uint32_t fee_bips) {
    if (caller != owner_) return errors::UNAUTHORIZED;
    if (a == b || !token(a) || !token(b)) return errors::INVALID_ASSET;
    if (fee_bips > fees::FEE_MAX) return errors::INVALID_CONFIG;

    PoolKey key = make_key(a, b, fee_bips);
    if (state_.pools.count(key)) return errors::POOL_ALREADY_INITIALIZED;

    PoolReserves pool;
    pool.token0 = std::get<0>(key);
    pool.token1 = std::get<1>(key);
    pool.fee_bips = fee_bips;
    pool.reserve0 = 0;
    pool.reserve1 = 0;
    state_.pools[key] = pool;

    chain_.emit(address_, "PoolCreated", {
        {"token0", addresses::to_hex(pool.token0.addr)},
        {"token1", addresses::to_hex(pool.token1.addr)},
        {"fee_bips", fee_bips}
    });
    return errors::OK;
}

int32_t ConstantProductRouter::add_liquidity(const Address& caller, const Currency& a,
                                             const Currency& b, uint32_t fee_bips,
                                             I128 amount_a, I128 amount_b) {
    if (amount_a <= 0 || amount_b <= 0) return errors::INVALID_AMOUNT;

    return chain_.atomic([&]() {
        auto it = state_.pools.find(make_key(a, b, fee_bips));
        if (it == state_.pools.end()) return errors::POOL_NOT_FOUND;

        int32_t rc = token(a)->transfer_from(address_, caller, address_, amount_a);
        if (rc != errors::OK) return rc;
        rc = token(b)->transfer_from(address_, caller, address_, amount_b);
        if (rc != errors::OK) return rc;

        PoolReserves& pool = it->second;
        if (pool.token0 == a) {
            pool.reserve0 += amount_a;
            pool.reserve1 += amount_b;
        } else {
            pool.reserve0 += amount_b;
            pool.reserve1 += amount_a;
        }
        return errors::OK;
    });
}

std::optional<PoolReserves> ConstantProductRouter::get_reserves(const Currency& a,
                                                                const Currency& b,
                                                                uint32_t fee_bips) const {
    auto it = state_.pools.find(make_key(a, b, fee_bips));
    if (it == state_.pools.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Swaps
// =============================================================================

std::optional<I128> ConstantProductRouter::quote_exact_input(const SwapRoute& route,
                                                             I128 amount_in) const {
    if (amount_in <= 0) return std::nullopt;
    auto it = state_.pools.find(make_key(route.token_in, route.token_out, route.fee_bips));
    if (it == state_.pools.end()) return std::nullopt;

    const PoolReserves& pool = it->second;
    bool zero_for_one = pool.token0 == route.token_in;
    I128 reserve_in = zero_for_one ? pool.reserve0 : pool.reserve1;
    I128 reserve_out = zero_for_one ? pool.reserve1 : pool.reserve0;
    if (reserve_in <= 0 || reserve_out <= 0) return std::nullopt;

    return amount_out(amount_in, reserve_in, reserve_out, pool.fee_bips);
}

SwapResult ConstantProductRouter::swap_exact_input(const Address& caller, const SwapRoute& route,
                                                   I128 amount_in, I128 min_amount_out,
                                                   const Address& recipient) {
    if (amount_in <= 0) return SwapResult{errors::INVALID_AMOUNT, 0};
    if (addresses::is_zero(recipient)) return SwapResult{errors::INVALID_ADDRESS, 0};

    I128 out = 0;
    int32_t status = chain_.atomic([&]() {
        auto it = state_.pools.find(make_key(route.token_in, route.token_out, route.fee_bips));
        if (it == state_.pools.end()) return errors::POOL_NOT_FOUND;

        PoolReserves& pool = it->second;
        bool zero_for_one = pool.token0 == route.token_in;
        I128& reserve_in = zero_for_one ? pool.reserve0 : pool.reserve1;
        I128& reserve_out = zero_for_one ? pool.reserve1 : pool.reserve0;
        if (reserve_in <= 0 || reserve_out <= 0) return errors::INSUFFICIENT_LIQUIDITY;

        out = amount_out(amount_in, reserve_in, reserve_out, pool.fee_bips);
        if (out <= 0 || out >= reserve_out) return errors::INSUFFICIENT_LIQUIDITY;
        if (out < min_amount_out) return errors::SLIPPAGE_EXCEEDED;

        int32_t rc = token(route.token_in)->transfer_from(address_, caller, address_, amount_in);
        if (rc != errors::OK) return rc;

        reserve_in += amount_in;
        reserve_out -= out;

        rc = token(route.token_out)->transfer(address_, recipient, out);
        if (rc != errors::OK) return rc;

        state_.total_swaps++;
        chain_.emit(address_, "Swap", {
            {"sender", addresses::to_hex(caller)},
            {"recipient", addresses::to_hex(recipient)},
            {"token_in", addresses::to_hex(route.token_in.addr)},
            {"token_out", addresses::to_hex(route.token_out.addr)},
            {"amount_in", x18::to_string(amount_in)},
            {"amount_out", x18::to_string(out)}
        });
        return errors::OK;
    });

    return SwapResult{status, status == errors::OK ? out : 0};
}

// =============================================================================
// Internal Helpers
// =============================================================================

ConstantProductRouter::PoolKey ConstantProductRouter::make_key(const Currency& a,
                                                               const Currency& b,
                                                               uint32_t fee_bips) {
    return a < b ? PoolKey{a, b, fee_bips} : PoolKey{b, a, fee_bips};
}

IToken* ConstantProductRouter::token(const Currency& id) const {
    auto it = tokens_.find(id);
    return it != tokens_.end() ? it->second : nullptr;
}

// out = reserve_out * in_with_fee / (reserve_in + in_with_fee)
I128 ConstantProductRouter::amount_out(I128 amount_in, I128 reserve_in, I128 reserve_out,
                                       uint32_t fee_bips) {
    I128 in_with_fee = x18::mul_div(amount_in, BIPS_DENOMINATOR - fee_bips, BIPS_DENOMINATOR);
    return x18::mul_div(reserve_out, in_with_fee, reserve_in + in_with_fee);
}

} // namespace lever
