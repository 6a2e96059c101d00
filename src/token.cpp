// =============================================================================
// token.cpp - In-memory fungible token
// =============================================================================

#include "lever/token.hpp"

namespace lever {

Token::Token(Chain& chain, const Address& address, std::string symbol,
             uint8_t decimals, const Address& owner)
    : chain_(chain),
      address_(address),
      symbol_(std::move(symbol)),
      decimals_(decimals),
      access_(owner) {
    chain_.attach(this);
}

Token::~Token() {
    chain_.detach(this);
}

// =============================================================================
// Queries
// =============================================================================

I128 Token::balance_of(const Address& who) const {
    auto it = state_.balances.find(who);
    return it != state_.balances.end() ? it->second : 0;
}

I128 Token::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

// =============================================================================
// Transfers
// =============================================================================

int32_t Token::transfer(const Address& caller, const Address& to, I128 amount) {
    return chain_.atomic([&]() { return move(caller, to, amount); });
}

int32_t Token::transfer_from(const Address& caller, const Address& from,
                             const Address& to, I128 amount) {
    return chain_.atomic([&]() {
        int32_t rc = spend_allowance(from, caller, amount);
        if (rc != errors::OK) return rc;
        return move(from, to, amount);
    });
}

int32_t Token::approve(const Address& caller, const Address& spender, I128 amount) {
    if (addresses::is_zero(spender)) return errors::INVALID_ADDRESS;
    if (amount < 0) return errors::INVALID_AMOUNT;
    state_.allowances[{caller, spender}] = amount;
    return errors::OK;
}

// =============================================================================
// Supply
// =============================================================================

int32_t Token::mint(const Address& caller, const Address& to, I128 amount) {
    if (!access_.has_role(caller, Role::MINTER) && caller != access_.owner()) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(to)) return errors::INVALID_ADDRESS;
    if (amount <= 0) return errors::INVALID_AMOUNT;

    state_.balances[to] += amount;
    state_.total_supply += amount;
    return errors::OK;
}

int32_t Token::burn_from(const Address& caller, const Address& from, I128 amount) {
    if (!access_.has_role(caller, Role::MINTER) && caller != access_.owner()) {
        return errors::UNAUTHORIZED;
    }
    if (amount <= 0) return errors::INVALID_AMOUNT;

    return chain_.atomic([&]() {
        if (caller != from) {
            int32_t rc = spend_allowance(from, caller, amount);
            if (rc != errors::OK) return rc;
        }
        auto it = state_.balances.find(from);
        if (it == state_.balances.end() || it->second < amount) {
            return errors::INSUFFICIENT_BALANCE;
        }
        it->second -= amount;
        state_.total_supply -= amount;
        return errors::OK;
    });
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t Token::move(const Address& from, const Address& to, I128 amount) {
    if (amount <= 0) return errors::INVALID_AMOUNT;
    if (addresses::is_zero(to)) return errors::INVALID_ADDRESS;

    auto it = state_.balances.find(from);
    if (it == state_.balances.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    it->second -= amount;
    state_.balances[to] += amount;

    if (hook_ && hook_(from, to, amount) != errors::OK) {
        return errors::HOOK_FAILED;
    }
    return errors::OK;
}

int32_t Token::spend_allowance(const Address& owner, const Address& spender, I128 amount) {
    auto it = state_.allowances.find({owner, spender});
    if (it == state_.allowances.end() || it->second < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }
    if (it->second != UNLIMITED_ALLOWANCE) {
        it->second -= amount;
    }
    return errors::OK;
}

} // namespace lever
