// Lever - Shared test fixture

#ifndef LEVER_TEST_FIXTURE_HPP
#define LEVER_TEST_FIXTURE_HPP

#include <lever/lever.hpp>

namespace lever::test {

constexpr Address ADMIN = addresses::make(0xA11CE);
constexpr Address ALICE = addresses::make(0xA1);
constexpr Address BOB = addresses::make(0xB0B);
constexpr Address KEEPER = addresses::make(0xC0FFEE);

// 8-decimal feed prices
constexpr I128 USD_200 = 20000000000;
constexpr I128 USD_120 = 12000000000;
constexpr I128 USD_1 = 100000000;

inline I128 units(int64_t n) { return x18::from_int(n); }

// Full stack at default config: collateral priced at $200, debt at $1
struct Protocol {
    Lever lever;

    explicit Protocol(const Config& config = Config{}) : lever(config, ADMIN) {
        refresh_prices();
    }

    PositionLedger& ledger() { return lever.ledger(); }
    InterestEngine& interest() { return lever.interest(); }
    Chain& chain() { return lever.chain(); }
    Token& collateral() { return lever.collateral_token(); }
    Token& debt() { return lever.debt_token(); }

    void refresh_prices(I128 collateral_price = USD_200) {
        lever.set_collateral_price(collateral_price, 8);
        lever.set_debt_price(USD_1, 8);
    }

    // Mints collateral to `who`, approves the ledger and opens
    OpenResult open(const Address& who, I128 collateral_amount, I128 debt_amount = 0) {
        if (lever.fund(who, collateral_amount) != errors::OK) return OpenResult{errors::UNAUTHORIZED, 0};
        collateral().approve(who, addresses::LEDGER, collateral_amount);
        return ledger().open_position(who, who, collateral().id(), collateral_amount, debt_amount);
    }

    // Lets the ledger burn `who`'s debt asset on repay/close
    void approve_repay(const Address& who, I128 amount = UNLIMITED_ALLOWANCE) {
        debt().approve(who, addresses::LEDGER, amount);
    }
};

} // namespace lever::test

#endif // LEVER_TEST_FIXTURE_HPP
