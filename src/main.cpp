#include "config_loader.hpp"
#include "configuration.hpp"
#include "csv_series_reader.hpp"
#include "report_writer.hpp"
#include "result_cache.hpp"
#include "scenario_comparator.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

/**
 * @brief Prints the headline metrics of one scenario.
 */
static void print_metrics(const std::string& title, const ScenarioMetrics& m) {
    std::cout << title << ":" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Total Charge:          " << m.total_charge_mwh << " MWh" << std::endl;
    std::cout << "  Total Discharge:       " << m.total_discharge_mwh << " MWh" << std::endl;
    std::cout << "  Total PV Export:       " << m.total_pv_to_grid_mwh << " MWh" << std::endl;
    std::cout << "  Round Trip Efficiency: " << m.round_trip_efficiency * 100.0 << " %" << std::endl;
    std::cout << "  Avg Price:             $" << m.average_price << "/MWh" << std::endl;
    std::cout << "  Import Weighted Price: $" << m.import_weighted_price << "/MWh" << std::endl;
    std::cout << "  Export Weighted Price: $" << m.export_weighted_price << "/MWh" << std::endl;
    std::cout << "  Solar Weighted Price:  $" << m.solar_weighted_price << "/MWh" << std::endl;
    std::cout << "  Spread Captured:       $" << m.spread_captured << "/MWh" << std::endl;
    std::cout << "  Energy Revenue:        $" << m.energy_revenue << std::endl;
    std::cout << "  Energy Cost:           $" << m.energy_cost << std::endl;
    std::cout << "  Network Cost:          $" << m.network_cost << std::endl;
    std::cout << "  Demand Charge:         $" << m.demand_charge << std::endl;
    std::cout << "  Fixed Charge:          $" << m.fixed_charge << std::endl;
    std::cout << "  Gross Profit:          $" << m.gross_profit << std::endl;
    std::cout << "  Net Profit:            $" << m.net_profit << std::endl;
    std::cout << std::defaultfloat;
}

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string profile_file = "bess_profile.yaml";
    if (argc > 1) {
        profile_file = argv[1];
    }
    std::cout << "Loading run profile from: " << profile_file << std::endl;

    RunProfile profile;
    try {
        profile = ConfigLoader::loadRunProfile(profile_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }

    // --- 2. Validate before anything touches the engine ---
    std::unique_ptr<Configuration> config;
    try {
        config = std::make_unique<Configuration>(Configuration::validate(profile.config));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration validated." << std::endl;
    std::cout << "  Battery: " << config->battery().power_mw << " MW / " << config->battery().energy_mwh
              << " MWh (" << config->battery().name << ")" << std::endl;
    std::cout << "  Solar:   " << config->pv().capacity_mw << " MW, charging "
              << (config->pv().bidirectional_charging ? "bidirectional" : "charge window only") << std::endl;
    std::cout << "  Region:  " << regionName(config->market().region) << ", "
              << formatDate(config->market().start_day) << " to " << formatDate(config->market().end_day)
              << " at " << config->market().resolution_minutes << " min" << std::endl;

    // --- 3. Load Time Series ---
    TimeSeries prices;
    TimeSeries solar;
    try {
        if (profile.data.prices_csv.empty()) {
            throw std::runtime_error("data.prices_csv is not set");
        }
        prices = CsvSeriesReader::read(profile.data.prices_csv, "prices");
        if (!profile.data.solar_csv.empty()) {
            solar = CsvSeriesReader::read(profile.data.solar_csv, "solar");
        } else {
            std::cerr << "Warning: no solar profile configured, hybrid run uses zero production" << std::endl;
            std::vector<TimePoint> zeros;
            for (const auto& p : prices.points()) {
                zeros.push_back({p.timestamp, 0.0});
            }
            solar = TimeSeries("solar", std::move(zeros));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading time series: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Loaded " << prices.size() << " price and " << solar.size() << " solar samples." << std::endl;

    // Finer data is averaged onto the simulation resolution
    const std::time_t step_seconds = static_cast<std::time_t>(config->market().resolution_minutes) * 60;
    TimeSeries resampled_prices = prices.resampled(step_seconds);
    if (resampled_prices.size() != prices.size()) {
        std::cout << "Resampled prices to " << config->market().resolution_minutes << " min: "
                  << resampled_prices.size() << " samples." << std::endl;
    }
    prices = std::move(resampled_prices);
    TimeSeries resampled_solar = solar.resampled(step_seconds);
    if (resampled_solar.size() != solar.size()) {
        std::cout << "Resampled solar to " << config->market().resolution_minutes << " min: "
                  << resampled_solar.size() << " samples." << std::endl;
    }
    solar = std::move(resampled_solar);

    // --- 4. Run both scenarios ---
    ResultCache cache;
    ResultCache::Entry comparison;
    try {
        comparison = cache.getOrCompare(*config, prices, solar);
    } catch (const std::exception& e) {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    print_metrics("Battery Only", comparison->battery_only.metrics);
    print_metrics("Hybrid PV + BESS", comparison->hybrid.metrics);
    print_metrics("Delta (Hybrid - Battery Only)", comparison->delta);

    // --- 5. Write Reports ---
    if (!profile.output.directory.empty()) {
        try {
            ReportWriter writer(profile.output.directory);
            std::cout << "\nSummary saved to: "
                      << writer.writeSummary(*comparison, *config, prices, profile.output.base_name) << std::endl;
            if (profile.output.write_intervals) {
                std::cout << "Intervals saved to: "
                          << writer.writeIntervals(comparison->battery_only, *config, prices, profile.output.base_name)
                          << std::endl;
                std::cout << "Intervals saved to: "
                          << writer.writeIntervals(comparison->hybrid, *config, prices, profile.output.base_name)
                          << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error writing reports: " << e.what() << std::endl;
            return 1;
        }
    }

    return 0;
}
