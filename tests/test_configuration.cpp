/*
 * Configuration validation and derived quantities
 */

#include "configuration.hpp"
#include "sim_errors.hpp"
#include "test_support.hpp"
#include <iostream>
#include <limits>

using namespace test_support;

// Returns the parameter named by the ConfigurationError, or "" if validation passed
static std::string rejected_parameter(const Config& config) {
    try {
        Configuration::validate(config);
    } catch (const ConfigurationError& e) {
        return e.parameter();
    }
    return "";
}

bool test_valid_config() {
    std::cout << "Testing valid configuration..." << std::flush;

    Configuration config = Configuration::validate(exampleConfig());
    assert(config.battery().name == "Example");
    assert(config.market().resolution_minutes == 60);

    std::cout << " PASS\n";
    return true;
}

bool test_battery_constraints() {
    std::cout << "Testing battery constraints..." << std::flush;

    Config c = exampleConfig();
    c.battery.soc_min = 0.9;
    c.battery.soc_max = 0.9;
    assert(rejected_parameter(c) == "battery.soc_min");

    c = exampleConfig();
    c.battery.energy_mwh = -1.0;
    assert(rejected_parameter(c) == "battery.energy_mwh");

    c = exampleConfig();
    c.battery.power_mw = 0.0;
    assert(rejected_parameter(c) == "battery.power_mw");

    c = exampleConfig();
    c.battery.charge_efficiency = 1.2;
    assert(rejected_parameter(c) == "battery.charge_efficiency");

    c = exampleConfig();
    c.battery.discharge_efficiency = std::numeric_limits<double>::quiet_NaN();
    assert(rejected_parameter(c) == "battery.discharge_efficiency");

    c = exampleConfig();
    c.battery.soc_initial = 0.05;
    assert(rejected_parameter(c) == "battery.soc_initial");

    // A PV-only plant with no storage is allowed
    c = exampleConfig();
    c.battery.energy_mwh = 0.0;
    assert(rejected_parameter(c).empty());

    std::cout << " PASS\n";
    return true;
}

bool test_market_and_tariff_constraints() {
    std::cout << "Testing market and tariff constraints..." << std::flush;

    Config c = exampleConfig();
    c.market.start_day = parseDate("2024-03-02");
    assert(rejected_parameter(c) == "market.date_range");

    c = exampleConfig();
    c.market.resolution_minutes = 7;
    assert(rejected_parameter(c) == "market.resolution_minutes");

    c = exampleConfig();
    c.market.price_floor = 100.0;
    c.market.price_ceiling = 50.0;
    assert(rejected_parameter(c) == "market.price_floor");

    c = exampleConfig();
    c.pv.export_efficiency = 0.0;
    assert(rejected_parameter(c) == "pv.export_efficiency");

    c = exampleConfig();
    c.tariffs.network_loss_factor = 0.0;
    assert(rejected_parameter(c) == "tariffs.network_loss_factor");

    c = exampleConfig();
    c.tariffs.import_rate_per_mwh = -0.5;
    assert(rejected_parameter(c) == "tariffs.import_rate_per_mwh");

    c = exampleConfig();
    c.tariffs.demand_window = TimeWindow{600, 600};
    assert(rejected_parameter(c) == "tariffs.demand_window");

    // Infinite tariff components are rejected like negative ones
    const double inf = std::numeric_limits<double>::infinity();
    c = exampleConfig();
    c.tariffs.fixed_charge = inf;
    assert(rejected_parameter(c) == "tariffs.fixed_charge");

    c = exampleConfig();
    c.tariffs.import_rate_per_mwh = inf;
    assert(rejected_parameter(c) == "tariffs.import_rate_per_mwh");

    c = exampleConfig();
    c.tariffs.export_rate_per_mwh = inf;
    assert(rejected_parameter(c) == "tariffs.export_rate_per_mwh");

    c = exampleConfig();
    c.tariffs.demand_rate_per_mw = inf;
    assert(rejected_parameter(c) == "tariffs.demand_rate_per_mw");

    c = exampleConfig();
    c.tariffs.network_loss_factor = inf;
    assert(rejected_parameter(c) == "tariffs.network_loss_factor");

    std::cout << " PASS\n";
    return true;
}

bool test_window_overlap() {
    std::cout << "Testing dispatch window overlap..." << std::flush;

    Config c = exampleConfig();
    c.windows.charge_window = {10 * 60, 15 * 60};
    c.windows.discharge_window = {14 * 60, 20 * 60};
    assert(rejected_parameter(c) == "dispatch_windows");

    // Wrapping charge window 22:00-02:00 touching a discharge window that starts at 02:00
    c.windows.charge_window = {22 * 60, 2 * 60};
    c.windows.discharge_window = {2 * 60, 6 * 60};
    assert(rejected_parameter(c).empty());

    c.windows.discharge_window = {60, 6 * 60};
    assert(rejected_parameter(c) == "dispatch_windows");

    c = exampleConfig();
    c.windows.charge_window = {300, 300};
    assert(rejected_parameter(c) == "dispatch_windows.charge");

    std::cout << " PASS\n";
    return true;
}

bool test_derived_quantities() {
    std::cout << "Testing derived quantities..." << std::flush;

    Config c = exampleConfig();
    c.market.end_day = parseDate("2024-03-03");
    c.market.resolution_minutes = 5;
    Configuration config = Configuration::validate(c);

    assert(near(config.usableEnergyMwh(), 1.8));
    assert(near(config.intervalHours(), 5.0 / 60.0));
    assert(near(config.maxChargeMwhPerInterval(), 1.0 * 5.0 / 60.0));
    assert(config.periodDays() == 3);
    assert(config.intervalCount() == 3 * 288);
    assert(config.periodEnd() - config.periodStart() == 3 * 24 * kHour);

    std::cout << " PASS\n";
    return true;
}

bool test_fingerprint() {
    std::cout << "Testing configuration fingerprint..." << std::flush;

    Configuration a = Configuration::validate(exampleConfig());
    Configuration b = Configuration::validate(exampleConfig());
    assert(a.fingerprint() == b.fingerprint());

    Config changed = exampleConfig();
    changed.pv.bidirectional_charging = true;
    assert(Configuration::validate(changed).fingerprint() != a.fingerprint());

    changed = exampleConfig();
    changed.tariffs.demand_window = TimeWindow{17 * 60, 21 * 60};
    assert(Configuration::validate(changed).fingerprint() != a.fingerprint());

    std::cout << " PASS\n";
    return true;
}

bool test_price_clamp() {
    std::cout << "Testing price clamp..." << std::flush;

    MarketConfig market;
    market.price_floor = -1000.0;
    market.price_ceiling = 15000.0;
    assert(clampPrice(-5000.0, market) == -1000.0);
    assert(clampPrice(20000.0, market) == 15000.0);
    assert(clampPrice(42.5, market) == 42.5);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "CONFIGURATION TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_valid_config();
        all_passed &= test_battery_constraints();
        all_passed &= test_market_and_tariff_constraints();
        all_passed &= test_window_overlap();
        all_passed &= test_derived_quantities();
        all_passed &= test_fingerprint();
        all_passed &= test_price_clamp();

        std::cout << "\n============================================================================\n";
        if (!all_passed) {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All configuration tests PASSED\n";
        std::cout << "============================================================================\n";
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
