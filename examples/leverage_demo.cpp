// Lever - Leverage Demo
// Opens a leveraged position, lets interest accrue for a month of blocks,
// then prints the position and the audit log.
//
// Usage: leverage_demo [config.json] [leverage]

#include <lever/lever.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace lever;

namespace {

std::string units(I128 amount) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(4) << x18::to_double(amount);
    return out.str();
}

void print_position(PositionLedger& ledger, uint64_t id) {
    std::optional<Position> pos = ledger.get_position(id);
    if (!pos) {
        std::cout << "  position " << id << " not found\n";
        return;
    }

    std::cout << "  position #" << pos->id
              << " owner=" << addresses::to_hex(pos->owner) << "\n"
              << "    collateral: " << units(pos->collateral_amount) << "\n"
              << "    debt:       " << units(pos->debt_amount) << "\n";

    std::optional<I128> health = ledger.get_position_health(id);
    if (!health) {
        std::cout << "    health:     unavailable (" << errors::name(ledger.price_status()) << ")\n";
    } else if (*health == INFINITE_HEALTH) {
        std::cout << "    health:     inf\n";
    } else {
        std::cout << "    health:     " << units(*health) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    uint32_t leverage = 3;

    try {
        if (argc > 1) config = Config::from_file(argv[1]);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    if (argc > 2) leverage = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));

    const Address admin = addresses::make(0xA11CE);
    const Address user = addresses::make(0xB0B);

    Lever protocol(config, admin);
    std::cout << "Lever " << Lever::version() << "\n";
    for (const auto& c : Lever::components()) {
        std::cout << "  " << std::left << std::setw(16) << c.name
                  << addresses::to_hex(c.address) << "  " << c.description << "\n";
    }

    // 1 WETH = 2000 USD, 1 lvUSD = 1 USD (8-decimal feed)
    protocol.set_collateral_price(200000000000, 8);
    protocol.set_debt_price(100000000, 8);

    int32_t rc = protocol.seed_pool(x18::from_int(20000000), x18::from_int(10000));
    if (rc != errors::OK) {
        std::cerr << "seed_pool failed: " << errors::name(rc) << "\n";
        return EXIT_FAILURE;
    }

    const I128 deposit = x18::from_int(10);
    rc = protocol.fund(user, deposit);
    if (rc == errors::OK) {
        rc = protocol.collateral_token().approve(user, protocol.builder().address(), deposit);
    }
    if (rc != errors::OK) {
        std::cerr << "funding failed: " << errors::name(rc) << "\n";
        return EXIT_FAILURE;
    }

    LeveragePreview preview = protocol.builder().preview(deposit, leverage);
    if (preview.ok()) {
        std::cout << "\nPreview x" << leverage << ": collateral " << units(preview.total_collateral)
                  << ", debt " << units(preview.total_debt) << "\n";
    }

    LeverageResult result = protocol.builder().leverage_position(user, deposit, leverage, 0);
    if (!result.ok()) {
        std::cerr << "leverage_position failed: " << errors::name(result.status) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "\nOpened x" << result.leverage << "\n";
    for (size_t i = 0; i < result.swap_outputs.size(); ++i) {
        std::cout << "  swap " << i << " -> " << units(result.swap_outputs[i]) << " WETH\n";
    }
    std::cout << "  returned " << units(result.returned_debt) << " lvUSD\n";
    print_position(protocol.ledger(), result.position_id);

    // ~30 days of blocks; prices refreshed so the oracle stays within its window
    const uint64_t month = protocol.interest().period_blocks() * 30;
    rc = protocol.advance_and_accrue(month);
    protocol.set_collateral_price(200000000000, 8);
    protocol.set_debt_price(100000000, 8);
    if (rc != errors::OK) {
        std::cerr << "accrual failed: " << errors::name(rc) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "\nAfter " << month << " blocks\n";
    print_position(protocol.ledger(), result.position_id);

    Lever::GlobalStats stats = protocol.get_stats();
    std::cout << "\nStats\n"
              << "  positions:         " << stats.ledger_stats.total_positions << "\n"
              << "  total collateral:  " << units(stats.ledger_stats.total_collateral) << "\n"
              << "  total debt:        " << units(stats.ledger_stats.total_debt) << "\n"
              << "  swaps:             " << stats.total_swaps << "\n"
              << "  interest treasury: " << units(stats.interest_treasury) << "\n"
              << "  events:            " << stats.events << "\n";

    std::cout << "\nEvent log\n" << protocol.chain().to_json().dump(2) << "\n";
    return EXIT_SUCCESS;
}
