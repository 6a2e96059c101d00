#ifndef LEVER_TOKEN_HPP
#define LEVER_TOKEN_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>

#include "access.hpp"
#include "chain.hpp"
#include "types.hpp"

namespace lever {

// =============================================================================
// Fungible Token Interface
// =============================================================================

class IToken {
public:
    virtual ~IToken() = default;

    virtual Currency id() const = 0;
    virtual const std::string& symbol() const = 0;
    virtual uint8_t decimals() const = 0;

    virtual I128 balance_of(const Address& who) const = 0;
    virtual I128 allowance(const Address& owner, const Address& spender) const = 0;
    virtual I128 total_supply() const = 0;

    virtual int32_t transfer(const Address& caller, const Address& to, I128 amount) = 0;
    virtual int32_t transfer_from(const Address& caller, const Address& from,
                                  const Address& to, I128 amount) = 0;
    virtual int32_t approve(const Address& caller, const Address& spender, I128 amount) = 0;

    // Privileged (MINTER)
    virtual int32_t mint(const Address& caller, const Address& to, I128 amount) = 0;
    virtual int32_t burn_from(const Address& caller, const Address& from, I128 amount) = 0;
};

// Allowance value that is never decremented
constexpr I128 UNLIMITED_ALLOWANCE = I128_MAX;

// =============================================================================
// Token - In-memory balance/allowance ledger
// =============================================================================

class Token : public IToken, public IJournaled {
public:
    Token(Chain& chain, const Address& address, std::string symbol,
          uint8_t decimals, const Address& owner);
    ~Token() override;

    // Non-copyable
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    Currency id() const override { return Currency(address_); }
    const std::string& symbol() const override { return symbol_; }
    uint8_t decimals() const override { return decimals_; }

    I128 balance_of(const Address& who) const override;
    I128 allowance(const Address& owner, const Address& spender) const override;
    I128 total_supply() const override { return state_.total_supply; }

    int32_t transfer(const Address& caller, const Address& to, I128 amount) override;
    int32_t transfer_from(const Address& caller, const Address& from,
                          const Address& to, I128 amount) override;
    int32_t approve(const Address& caller, const Address& spender, I128 amount) override;

    int32_t mint(const Address& caller, const Address& to, I128 amount) override;
    int32_t burn_from(const Address& caller, const Address& from, I128 amount) override;

    AccessControl& access() { return access_; }

    // Invoked after balances move; a non-OK return fails the transfer.
    // Models the callback surface of hooked token standards.
    using TransferHook = std::function<int32_t(const Address& from, const Address& to, I128 amount)>;
    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

    // IJournaled
    void checkpoint() override { journal_.push(state_); }
    void rollback() override { journal_.restore(state_); }
    void commit() override { journal_.drop(); }

private:
    struct State {
        std::map<Address, I128> balances;
        std::map<std::pair<Address, Address>, I128> allowances;
        I128 total_supply = 0;
    };

    Chain& chain_;
    Address address_;
    std::string symbol_;
    uint8_t decimals_;
    AccessControl access_;
    TransferHook hook_;

    State state_;
    Journal<State> journal_;

    int32_t move(const Address& from, const Address& to, I128 amount);
    int32_t spend_allowance(const Address& owner, const Address& spender, I128 amount);
};

} // namespace lever

#endif // LEVER_TOKEN_HPP
