/*
 * Battery-only vs hybrid comparison
 */

#include "scenario_comparator.hpp"
#include "sim_errors.hpp"
#include "test_support.hpp"
#include <iostream>

using namespace test_support;

bool test_zero_solar_matches_battery_only() {
    std::cout << "Testing zero solar gives identical scenarios..." << std::flush;

    Configuration config = Configuration::validate(exampleConfig());
    TimeSeries prices = makeSeries("prices", config.periodStart(), 24, kHour,
                                   [](std::time_t t) { return 30.0 + minuteOfDay(t) / 30.0; });
    TimeSeries solar = constantSeries("solar", config, 0.0);

    ScenarioComparison cmp = ScenarioComparator(config).compare(prices, solar);
    assert(cmp.battery_only.label == "battery_only");
    assert(cmp.hybrid.label == "hybrid");
    assert(cmp.battery_only.records == cmp.hybrid.records);
    assert(cmp.delta.net_profit == 0.0);
    assert(cmp.delta.energy_revenue == 0.0);
    assert(cmp.delta.total_grid_import_mwh == 0.0);
    assert(cmp.delta.interval_count == 0);

    std::cout << " PASS\n";
    return true;
}

bool test_delta_is_hybrid_minus_battery_only() {
    std::cout << "Testing delta arithmetic..." << std::flush;

    Config c = exampleConfig();
    c.tariffs.import_rate_per_mwh = 3.0;
    Configuration config = Configuration::validate(c);
    TimeSeries prices = constantSeries("prices", config, 60.0);
    TimeSeries solar = makeSeries("solar", config.periodStart(), 24, kHour,
                                  [](std::time_t t) { return solarShape(t, 1.5); });

    ScenarioComparison cmp = ScenarioComparator(config).compare(prices, solar);
    assert(near(cmp.delta.net_profit, cmp.hybrid.metrics.net_profit - cmp.battery_only.metrics.net_profit));
    assert(near(cmp.delta.total_pv_production_mwh, cmp.hybrid.metrics.total_pv_production_mwh));
    assert(cmp.battery_only.metrics.total_pv_production_mwh == 0.0);
    assert(cmp.hybrid.metrics.total_pv_production_mwh > 0.0);
    assert(cmp.hybrid.records.size() == cmp.battery_only.records.size());

    std::cout << " PASS\n";
    return true;
}

bool test_solar_never_increases_grid_cost() {
    std::cout << "Testing solar never increases import cost..." << std::flush;

    for (bool bidirectional : {false, true}) {
        Config c = exampleConfig();
        c.market.end_day = parseDate("2024-03-03");
        c.market.resolution_minutes = 5;
        c.battery.soc_max = 0.9;
        c.windows.charge_window = {10 * 60 + 30, 14 * 60 + 30};
        c.windows.discharge_window = {17 * 60, 21 * 60};
        c.pv.bidirectional_charging = bidirectional;
        Configuration config = Configuration::validate(c);

        TimeSeries prices = makeSeries("prices", config.periodStart(), config.intervalCount(), 300,
                                       [](std::time_t t) { return 20.0 + (t / 300 % 29) * 4.0; });
        TimeSeries solar = makeSeries("solar", config.periodStart(), config.intervalCount(), 300,
                                      [](std::time_t t) { return solarShape(t, 1.2); });

        ScenarioComparison cmp = ScenarioComparator(config).compare(prices, solar);
        const auto& hybrid = cmp.hybrid.records;
        const auto& battery_only = cmp.battery_only.records;
        for (size_t i = 0; i < hybrid.size(); ++i) {
            assert(hybrid[i].grid_import_mwh <= battery_only[i].grid_import_mwh + 1e-9);
            assert(hybrid[i].soc >= battery_only[i].soc - 1e-9);
        }
        assert(cmp.hybrid.metrics.energy_cost <= cmp.battery_only.metrics.energy_cost + 1e-9);
        assert(cmp.hybrid.metrics.total_grid_import_mwh <= cmp.battery_only.metrics.total_grid_import_mwh + 1e-9);
        assert(cmp.delta.total_grid_export_mwh > 0.0);
    }

    std::cout << " PASS\n";
    return true;
}

bool test_errors_propagate() {
    std::cout << "Testing error propagation..." << std::flush;

    Configuration config = Configuration::validate(exampleConfig());
    TimeSeries prices = constantSeries("prices", config, 50.0);
    TimeSeries short_solar = makeSeries("solar", config.periodStart(), 10, kHour, [](std::time_t) { return 1.0; });

    bool threw = false;
    try {
        ScenarioComparator(config).compare(prices, short_solar);
    } catch (const DataUnavailableError& e) {
        threw = true;
        assert(e.timestamp() == config.periodStart() + 10 * kHour);
    }
    assert(threw);

    TimeSeries short_prices = makeSeries("prices", config.periodStart(), 6, kHour, [](std::time_t) { return 50.0; });
    TimeSeries solar = constantSeries("solar", config, 1.0);
    threw = false;
    try {
        ScenarioComparator(config).compare(short_prices, solar);
    } catch (const DataUnavailableError&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASS\n";
    return true;
}

bool test_run_single_scenario() {
    std::cout << "Testing single scenario run..." << std::flush;

    Configuration config = Configuration::validate(exampleConfig());
    TimeSeries prices = constantSeries("prices", config, 50.0);

    ScenarioResult result = ScenarioComparator(config).runScenario("baseline", prices, nullptr);
    assert(result.label == "baseline");
    assert(result.records.size() == 24);
    assert(result.metrics.interval_count == 24);
    assert(near(result.metrics.round_trip_efficiency, 0.9025));

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "SCENARIO COMPARATOR TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_zero_solar_matches_battery_only();
        all_passed &= test_delta_is_hybrid_minus_battery_only();
        all_passed &= test_solar_never_increases_grid_cost();
        all_passed &= test_errors_propagate();
        all_passed &= test_run_single_scenario();

        std::cout << "\n============================================================================\n";
        if (!all_passed) {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All scenario comparator tests PASSED\n";
        std::cout << "============================================================================\n";
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
