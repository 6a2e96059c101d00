// Lever - Interest accrual engine tests

#include <catch2/catch.hpp>
#include <lever/interest.hpp>

using namespace lever;

namespace {

const Address OWNER = addresses::make(1);
const Address ENGINE = addresses::make(0x3001);
const Address VAULT = addresses::make(0x4001);
const Address STRANGER = addresses::make(0xBAD);
const Currency DEBT(addresses::make(0x1002));

// Records charges the engine pushes back to the vault
class RecordingDebtor : public IInterestDebtor {
public:
    int32_t record_interest(const Address& caller, uint64_t position_id,
                            const Currency& debt_token, I128 amount) override {
        if (caller != ENGINE) return errors::UNAUTHORIZED;
        if (reject) return reject;
        last_position = position_id;
        last_token = debt_token;
        charged += amount;
        ++calls;
        return errors::OK;
    }

    I128 charged = 0;
    int calls = 0;
    uint64_t last_position = 0;
    Currency last_token;
    int32_t reject = errors::OK;
};

struct Fixture {
    Chain chain;
    InterestEngine engine{chain, OWNER, ENGINE};
    RecordingDebtor debtor;

    Fixture() {
        engine.register_vault(OWNER, VAULT, &debtor, 500);
    }

    int32_t collect(uint64_t id, I128 debt) {
        return engine.collect_interest(VAULT, VAULT, DEBT, id, debt);
    }
};

} // namespace

TEST_CASE("Vault registration", "[interest]") {
    Chain chain;
    InterestEngine engine(chain, OWNER, ENGINE);
    RecordingDebtor debtor;

    REQUIRE(engine.register_vault(STRANGER, VAULT, &debtor, 500) == errors::UNAUTHORIZED);
    REQUIRE(engine.register_vault(OWNER, VAULT, &debtor, 0) == errors::INVALID_RATE);
    REQUIRE(engine.register_vault(OWNER, VAULT, &debtor, 500) == errors::OK);
    REQUIRE(engine.register_vault(OWNER, VAULT, &debtor, 700) == errors::VAULT_ALREADY_REGISTERED);
    REQUIRE(engine.vault_rate(VAULT) == 500u);

    REQUIRE(engine.set_vault_rate(OWNER, VAULT, 800) == errors::OK);
    REQUIRE(engine.vault_rate(VAULT) == 800u);
    REQUIRE(engine.set_vault_rate(OWNER, STRANGER, 800) == errors::VAULT_NOT_REGISTERED);

    auto updates = chain.events_named("VaultRateUpdated");
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].data["old"] == 500);
    REQUIRE(updates[0].data["new"] == 800);
}

TEST_CASE("Period granularity", "[interest]") {
    Chain chain;
    InterestEngine engine(chain, OWNER, ENGINE, 7200, 2628000);

    REQUIRE(engine.period_share() == I128(7200) * PRECISION / 2628000);

    REQUIRE(engine.set_period_blocks(OWNER, 0) == errors::INVALID_PERIOD);
    REQUIRE(engine.set_period_blocks(OWNER, 2628001) == errors::INVALID_PERIOD);
    REQUIRE(engine.set_period_blocks(STRANGER, 100) == errors::UNAUTHORIZED);
    REQUIRE(engine.set_period_blocks(OWNER, 100) == errors::OK);
    REQUIRE(engine.period_blocks() == 100);
    REQUIRE(engine.period_share() == I128(100) * PRECISION / 2628000);
    REQUIRE(chain.count_events("PeriodBlocksUpdated") == 1);

    REQUIRE_THROWS_AS(InterestEngine(chain, OWNER, ENGINE, 0), std::invalid_argument);
}

TEST_CASE("Interest due grows by a fixed quantum per whole period", "[interest]") {
    Fixture f;
    const I128 debt = x18::from_int(50000);
    REQUIRE(f.engine.activate(VAULT, VAULT, 1) == errors::OK);

    // 50000 * 500 bips * (7200 / 2628000), floored
    const I128 quantum = f.engine.period_interest(VAULT, debt);
    REQUIRE(quantum == I128(6849315068493150000ULL));

    SECTION("Nothing before the first boundary") {
        f.chain.advance_blocks(7199);
        REQUIRE(f.engine.calculate_interest_due(VAULT, 1, debt) == 0);
        REQUIRE(f.engine.blocks_until_next_period(VAULT, 1) == 1);
    }

    SECTION("Linear in whole periods, partial periods dropped") {
        for (uint64_t n = 1; n <= 5; ++n) {
            f.chain.advance_blocks(7200);
            REQUIRE(f.engine.periods_elapsed(VAULT, 1) == n);
            REQUIRE(f.engine.calculate_interest_due(VAULT, 1, debt) == quantum * I128(n));
        }
        f.chain.advance_blocks(7199);
        REQUIRE(f.engine.calculate_interest_due(VAULT, 1, debt) == quantum * 5);
    }

    SECTION("Unregistered vault or zero debt") {
        f.chain.advance_blocks(7200);
        REQUIRE(f.engine.calculate_interest_due(STRANGER, 1, debt) == 0);
        REQUIRE(f.engine.calculate_interest_due(VAULT, 1, 0) == 0);
    }
}

TEST_CASE("Collecting interest", "[interest]") {
    Fixture f;
    const I128 debt = x18::from_int(50000);
    f.engine.activate(VAULT, VAULT, 7);
    const I128 quantum = f.engine.period_interest(VAULT, debt);

    SECTION("Only the vault may collect") {
        f.chain.advance_blocks(7200);
        REQUIRE(f.engine.collect_interest(STRANGER, VAULT, DEBT, 7, debt) == errors::VAULT_NOT_CALLER);
        REQUIRE(f.engine.collect_interest(STRANGER, STRANGER, DEBT, 7, debt) == errors::VAULT_NOT_REGISTERED);
    }

    SECTION("Early collection is a no-op") {
        f.chain.advance_blocks(100);
        REQUIRE(f.collect(7, debt) == errors::OK);
        REQUIRE(f.debtor.calls == 0);
        REQUIRE(f.engine.interest_state(VAULT, 7)->last_collection_block == 1);
    }

    SECTION("Charge, advance, then idempotent within the window") {
        f.chain.advance_blocks(7200);
        REQUIRE(f.collect(7, debt) == errors::OK);
        REQUIRE(f.debtor.charged == quantum);
        REQUIRE(f.debtor.last_position == 7);
        REQUIRE(f.debtor.last_token == DEBT);

        InterestState st = *f.engine.interest_state(VAULT, 7);
        REQUIRE(st.last_collection_block == f.chain.block_number());
        REQUIRE(st.total_collected == quantum);
        REQUIRE(f.engine.treasury_balance(DEBT) == quantum);
        REQUIRE(f.chain.count_events("InterestCollected") == 1);

        f.chain.advance_blocks(7199);
        REQUIRE(f.collect(7, debt + quantum) == errors::OK);
        REQUIRE(f.debtor.calls == 1);
        REQUIRE(f.engine.treasury_balance(DEBT) == quantum);
    }

    SECTION("Dust debt has nothing to collect") {
        f.chain.advance_blocks(7200);
        REQUIRE(f.collect(7, 1) == errors::NO_INTEREST_TO_COLLECT);
    }

    SECTION("Debtor failure rolls back the collection") {
        f.chain.advance_blocks(7200);
        f.debtor.reject = errors::HOOK_FAILED;
        REQUIRE(f.collect(7, debt) == errors::HOOK_FAILED);
        REQUIRE(f.engine.interest_state(VAULT, 7)->last_collection_block == 1);
        REQUIRE(f.engine.treasury_balance(DEBT) == 0);
        REQUIRE(f.chain.count_events("InterestCollected") == 0);
    }

    SECTION("Deactivated positions are dormant") {
        REQUIRE(f.engine.deactivate(VAULT, VAULT, 7) == errors::OK);
        REQUIRE_FALSE(f.engine.is_active(VAULT, 7));
        REQUIRE(f.engine.interest_state(VAULT, 7).has_value());
        f.chain.advance_blocks(7200 * 3);
        REQUIRE(f.engine.calculate_interest_due(VAULT, 7, debt) == 0);
        REQUIRE(f.engine.blocks_until_next_period(VAULT, 7) == 0);
    }
}

TEST_CASE("Treasury withdrawal", "[interest]") {
    Fixture f;
    Token usd(f.chain, DEBT.addr, "lvUSD", 18, OWNER);
    const I128 debt = x18::from_int(50000);
    f.engine.activate(VAULT, VAULT, 1);
    f.chain.advance_blocks(7200);
    f.collect(1, debt);
    const I128 pool = f.engine.treasury_balance(DEBT);

    // The vault mints collected interest to the engine
    usd.mint(OWNER, ENGINE, pool);

    REQUIRE(f.engine.withdraw_treasury(STRANGER, usd, STRANGER, pool) == errors::UNAUTHORIZED);
    REQUIRE(f.engine.withdraw_treasury(OWNER, usd, OWNER, pool + 1) == errors::INSUFFICIENT_BALANCE);
    REQUIRE(f.engine.withdraw_treasury(OWNER, usd, OWNER, pool) == errors::OK);
    REQUIRE(usd.balance_of(OWNER) == pool);
    REQUIRE(f.engine.treasury_balance(DEBT) == 0);
    REQUIRE(f.chain.count_events("TreasuryWithdrawn") == 1);
}
