#include "report_writer.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

void emitMetrics(YAML::Emitter& out, const ScenarioMetrics& m) {
    out << YAML::BeginMap;
    out << YAML::Key << "total_charge_mwh" << YAML::Value << m.total_charge_mwh;
    out << YAML::Key << "total_discharge_mwh" << YAML::Value << m.total_discharge_mwh;
    out << YAML::Key << "total_grid_import_mwh" << YAML::Value << m.total_grid_import_mwh;
    out << YAML::Key << "total_grid_export_mwh" << YAML::Value << m.total_grid_export_mwh;
    out << YAML::Key << "total_pv_production_mwh" << YAML::Value << m.total_pv_production_mwh;
    out << YAML::Key << "total_pv_to_battery_mwh" << YAML::Value << m.total_pv_to_battery_mwh;
    out << YAML::Key << "total_pv_to_grid_mwh" << YAML::Value << m.total_pv_to_grid_mwh;
    out << YAML::Key << "round_trip_efficiency" << YAML::Value << m.round_trip_efficiency;
    out << YAML::Key << "average_price" << YAML::Value << m.average_price;
    out << YAML::Key << "import_weighted_price" << YAML::Value << m.import_weighted_price;
    out << YAML::Key << "export_weighted_price" << YAML::Value << m.export_weighted_price;
    out << YAML::Key << "solar_weighted_price" << YAML::Value << m.solar_weighted_price;
    out << YAML::Key << "spread_captured" << YAML::Value << m.spread_captured;
    out << YAML::Key << "energy_revenue" << YAML::Value << m.energy_revenue;
    out << YAML::Key << "energy_cost" << YAML::Value << m.energy_cost;
    out << YAML::Key << "network_cost" << YAML::Value << m.network_cost;
    out << YAML::Key << "demand_charge" << YAML::Value << m.demand_charge;
    out << YAML::Key << "fixed_charge" << YAML::Value << m.fixed_charge;
    out << YAML::Key << "gross_profit" << YAML::Value << m.gross_profit;
    out << YAML::Key << "net_profit" << YAML::Value << m.net_profit;
    out << YAML::Key << "final_soc" << YAML::Value << m.final_soc;
    out << YAML::Key << "interval_count" << YAML::Value << m.interval_count;
    out << YAML::EndMap;
}

void emitScenario(YAML::Emitter& out, const ScenarioResult& result, const Configuration& config,
                  const TimeSeries& prices) {
    out << YAML::BeginMap;
    out << YAML::Key << "metrics" << YAML::Value;
    emitMetrics(out, result.metrics);

    out << YAML::Key << "yearly" << YAML::Value << YAML::BeginSeq;
    for (const auto& year : FinancialEvaluator::evaluateByYear(result.records, prices, config.tariffs(), config.market())) {
        out << YAML::BeginMap;
        out << YAML::Key << "year" << YAML::Value << year.year;
        out << YAML::Key << "metrics" << YAML::Value;
        emitMetrics(out, year.metrics);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

} // namespace

ReportWriter::ReportWriter(std::string directory) : output_directory(std::move(directory)) {}

std::string ReportWriter::versionedFilename(const std::string& directory, const std::string& base_name,
                                            const std::string& extension, std::time_t now) {
    int next_version = 1;
    std::error_code ec;
    if (fs::is_directory(directory, ec)) {
        const std::string suffix = "." + extension;
        for (const auto& entry : fs::directory_iterator(directory, ec)) {
            std::string name = entry.path().filename().string();
            if (name.compare(0, base_name.size() + 1, base_name + "_") != 0 ||
                name.size() <= suffix.size() ||
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }
            std::string stem = name.substr(0, name.size() - suffix.size());
            size_t marker = stem.rfind("_v");
            if (marker == std::string::npos) continue;
            int version = std::atoi(stem.c_str() + marker + 2);
            if (version >= next_version) next_version = version + 1;
        }
    }

    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream name;
    name << base_name << "_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "_v" << next_version << "." << extension;
    return (fs::path(directory) / name.str()).string();
}

std::string ReportWriter::writeSummary(const ScenarioComparison& comparison, const Configuration& config,
                                       const TimeSeries& prices, const std::string& base_name) const {
    fs::create_directories(output_directory);
    std::string path = versionedFilename(output_directory, base_name + "_summary", "yaml", std::time(nullptr));

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "battery" << YAML::Value << config.battery().name;
    out << YAML::Key << "region" << YAML::Value << regionName(config.market().region);
    out << YAML::Key << "period_start" << YAML::Value << formatDate(config.market().start_day);
    out << YAML::Key << "period_end" << YAML::Value << formatDate(config.market().end_day);
    out << YAML::Key << "resolution_minutes" << YAML::Value << config.market().resolution_minutes;
    out << YAML::Key << "pv_capacity_mw" << YAML::Value << config.pv().capacity_mw;
    out << YAML::Key << "bidirectional_charging" << YAML::Value << config.pv().bidirectional_charging;
    out << YAML::Key << "battery_only" << YAML::Value;
    emitScenario(out, comparison.battery_only, config, prices);
    out << YAML::Key << "hybrid" << YAML::Value;
    emitScenario(out, comparison.hybrid, config, prices);
    out << YAML::Key << "delta" << YAML::Value;
    emitMetrics(out, comparison.delta);
    out << YAML::EndMap;

    if (!out.good()) {
        throw std::runtime_error("Failed to emit summary: " + out.GetLastError());
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write summary file: " + path);
    }
    file << out.c_str() << "\n";
    return path;
}

std::string ReportWriter::writeIntervals(const ScenarioResult& result, const Configuration& config,
                                         const TimeSeries& prices, const std::string& base_name) const {
    fs::create_directories(output_directory);
    std::string path = versionedFilename(output_directory, base_name + "_" + result.label, "csv", std::time(nullptr));

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write interval file: " + path);
    }
    file << "timestamp,price,grid_import_mwh,grid_export_mwh,battery_charge_mwh,battery_discharge_mwh,"
            "pv_production_mwh,pv_to_battery_mwh,pv_to_grid_mwh,soc\n";
    file << std::setprecision(10);
    for (const auto& r : result.records) {
        double price = clampPrice(prices.valueAt(r.timestamp).value_or(0.0), config.market());
        file << formatTimestamp(r.timestamp) << "," << price << ","
             << r.grid_import_mwh << "," << r.grid_export_mwh << ","
             << r.battery_charge_mwh << "," << r.battery_discharge_mwh << ","
             << r.pv_production_mwh << "," << r.pv_to_battery_mwh << ","
             << r.pv_to_grid_mwh << "," << r.soc << "\n";
    }
    return path;
}
