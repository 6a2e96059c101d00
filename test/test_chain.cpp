// Lever - Execution context tests

#include <catch2/catch.hpp>
#include <lever/chain.hpp>
#include <lever/access.hpp>

#include <stdexcept>

using namespace lever;

namespace {

// Journaled counter standing in for a component's state
class Counter : public IJournaled {
public:
    explicit Counter(Chain& chain) : chain_(chain) { chain_.attach(this); }
    ~Counter() override { chain_.detach(this); }

    int value = 0;

    void checkpoint() override { journal_.push(value); }
    void rollback() override { journal_.restore(value); }
    void commit() override { journal_.drop(); }

    size_t depth() const { return journal_.depth(); }

private:
    Chain& chain_;
    Journal<int> journal_;
};

const Address EMITTER = addresses::make(0xE);

} // namespace

TEST_CASE("Chain clock", "[chain]") {
    Chain chain(12, 100, 1000);
    REQUIRE(chain.block_number() == 100);
    REQUIRE(chain.timestamp() == 1000);

    chain.advance_blocks(10);
    REQUIRE(chain.block_number() == 110);
    REQUIRE(chain.timestamp() == 1120);

    chain.advance_time(5);
    REQUIRE(chain.block_number() == 110);
    REQUIRE(chain.timestamp() == 1125);
}

TEST_CASE("Atomic scopes commit or roll back", "[chain]") {
    Chain chain;
    Counter counter(chain);

    SECTION("Success commits state and events") {
        int32_t rc = chain.atomic([&]() {
            counter.value = 5;
            chain.emit(EMITTER, "Set", {{"value", 5}});
            return errors::OK;
        });
        REQUIRE(rc == errors::OK);
        REQUIRE(counter.value == 5);
        REQUIRE(chain.count_events("Set") == 1);
        REQUIRE(counter.depth() == 0);
    }

    SECTION("Error code restores state and drops events") {
        counter.value = 1;
        int32_t rc = chain.atomic([&]() {
            counter.value = 9;
            chain.emit(EMITTER, "Set", {{"value", 9}});
            return errors::INVALID_AMOUNT;
        });
        REQUIRE(rc == errors::INVALID_AMOUNT);
        REQUIRE(counter.value == 1);
        REQUIRE(chain.events().empty());
        REQUIRE(counter.depth() == 0);
    }

    SECTION("Exception restores state and propagates") {
        counter.value = 2;
        REQUIRE_THROWS_AS(chain.atomic([&]() -> int32_t {
            counter.value = 3;
            throw std::runtime_error("boom");
        }), std::runtime_error);
        REQUIRE(counter.value == 2);
        REQUIRE(chain.scope_depth() == 0);
    }

    SECTION("Failed inner scope leaves outer scope work intact") {
        int32_t rc = chain.atomic([&]() {
            counter.value = 10;
            int32_t inner = chain.atomic([&]() {
                counter.value = 20;
                return errors::HOOK_FAILED;
            });
            REQUIRE(inner == errors::HOOK_FAILED);
            REQUIRE(counter.value == 10);
            return errors::OK;
        });
        REQUIRE(rc == errors::OK);
        REQUIRE(counter.value == 10);
    }

    SECTION("Failed outer scope discards committed inner scope") {
        int32_t rc = chain.atomic([&]() {
            chain.atomic([&]() {
                counter.value = 30;
                chain.emit(EMITTER, "Inner", {});
                return errors::OK;
            });
            return errors::SLIPPAGE_EXCEEDED;
        });
        REQUIRE(rc == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(counter.value == 0);
        REQUIRE(chain.count_events("Inner") == 0);
    }
}

TEST_CASE("Listeners only see committed events", "[chain]") {
    Chain chain;
    Counter counter(chain);
    std::vector<std::string> seen;
    chain.set_listener([&](const Event& e) { seen.push_back(e.name); });

    chain.atomic([&]() {
        chain.emit(EMITTER, "Kept", {});
        REQUIRE(seen.empty());
        return errors::OK;
    });
    chain.atomic([&]() {
        chain.emit(EMITTER, "Dropped", {});
        return errors::INVALID_AMOUNT;
    });
    chain.emit(EMITTER, "Direct", {});

    REQUIRE(seen == std::vector<std::string>{"Kept", "Direct"});

    nlohmann::json log = chain.to_json();
    REQUIRE(log.size() == 2);
    REQUIRE(log[0]["event"] == "Kept");
    REQUIRE(log[1]["emitter"] == addresses::to_hex(EMITTER));
}

TEST_CASE("Participants cannot change inside a scope", "[chain]") {
    Chain chain;
    chain.atomic([&]() {
        REQUIRE_THROWS_AS(Counter(chain), std::logic_error);
        return errors::OK;
    });
}

TEST_CASE("NonReentrant guard", "[chain]") {
    std::atomic<bool> flag{false};
    {
        NonReentrant outer(flag);
        REQUIRE(static_cast<bool>(outer));
        NonReentrant inner(flag);
        REQUIRE_FALSE(static_cast<bool>(inner));
    }
    REQUIRE_FALSE(flag.load());

    NonReentrant again(flag);
    REQUIRE(static_cast<bool>(again));
}

TEST_CASE("Access control", "[access]") {
    const Address owner = addresses::make(1);
    const Address alice = addresses::make(2);
    AccessControl access(owner);

    REQUIRE(access.has_role(owner, Role::ADMIN));
    REQUIRE(access.require(alice, Role::ADMIN) == errors::UNAUTHORIZED);

    REQUIRE(access.grant(alice, alice, Role::LEVERAGE) == errors::UNAUTHORIZED);
    REQUIRE(access.grant(owner, alice, Role::LEVERAGE) == errors::OK);
    REQUIRE(access.has_role(alice, Role::LEVERAGE));
    REQUIRE_FALSE(access.has_role(alice, Role::MINTER));

    REQUIRE(access.revoke(owner, alice, Role::LEVERAGE) == errors::OK);
    REQUIRE_FALSE(access.has_role(alice, Role::LEVERAGE));

    REQUIRE(access.transfer_ownership(owner, alice) == errors::OK);
    REQUIRE(access.owner() == alice);
    REQUIRE_FALSE(access.has_role(owner, Role::ADMIN));
}
