/*
 * Summary and interval report files
 */

#include "report_writer.hpp"
#include "test_support.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace test_support;
namespace fs = std::filesystem;

static fs::path scratch_directory() {
    fs::path dir = fs::temp_directory_path() / ("bess_report_test_" + std::to_string(std::time(nullptr)));
    fs::remove_all(dir);
    return dir;
}

static void touch(const fs::path& path) {
    std::ofstream out(path);
    out << "x\n";
}

bool test_versioned_filename() {
    std::cout << "Testing versioned file names..." << std::flush;

    fs::path dir = scratch_directory();
    std::time_t now = parseTimestamp("2024-05-06 07:08:09");

    // Missing directory starts at v1
    std::string first = ReportWriter::versionedFilename(dir.string(), "run", "csv", now);
    assert(fs::path(first).parent_path() == dir);
    std::string name = fs::path(first).filename().string();
    assert(name.compare(0, 4, "run_") == 0);
    assert(name.size() > 7 && name.compare(name.size() - 7, 7, "_v1.csv") == 0);

    fs::create_directories(dir);
    touch(dir / "run_20240101_000000_v1.csv");
    touch(dir / "run_20240102_000000_v3.csv");
    touch(dir / "run_20240102_000000_v7.yaml");  // other extension
    touch(dir / "other_20240101_000000_v9.csv"); // other base name
    touch(dir / "notes.csv");

    name = fs::path(ReportWriter::versionedFilename(dir.string(), "run", "csv", now)).filename().string();
    assert(name.compare(name.size() - 7, 7, "_v4.csv") == 0);

    name = fs::path(ReportWriter::versionedFilename(dir.string(), "run", "yaml", now)).filename().string();
    assert(name.compare(name.size() - 8, 8, "_v8.yaml") == 0);

    fs::remove_all(dir);

    std::cout << " PASS\n";
    return true;
}

bool test_summary_and_intervals() {
    std::cout << "Testing summary and interval reports..." << std::flush;

    fs::path dir = scratch_directory();
    Configuration config = Configuration::validate(exampleConfig());
    TimeSeries prices = makeSeries("prices", config.periodStart(), 24, kHour,
                                   [](std::time_t t) { return minuteOfDay(t) == 18 * 60 ? 20000.0 : 45.0; });
    TimeSeries solar = makeSeries("solar", config.periodStart(), 24, kHour,
                                  [](std::time_t t) { return solarShape(t, 1.0); });
    ScenarioComparison cmp = ScenarioComparator(config).compare(prices, solar);

    ReportWriter writer(dir.string());
    std::string summary_path = writer.writeSummary(cmp, config, prices, "example");
    assert(fs::exists(summary_path));

    YAML::Node summary = YAML::LoadFile(summary_path);
    assert(summary["battery"].as<std::string>() == "Example");
    assert(summary["region"].as<std::string>() == "NSW1");
    assert(summary["resolution_minutes"].as<int>() == 60);
    // Period bounds are the inclusive configured days
    assert(summary["period_start"].as<std::string>() == "2024-03-01");
    assert(summary["period_end"].as<std::string>() == "2024-03-01");
    assert(near(summary["hybrid"]["metrics"]["net_profit"].as<double>(), cmp.hybrid.metrics.net_profit, 1e-6));
    assert(near(summary["battery_only"]["metrics"]["energy_revenue"].as<double>(),
                cmp.battery_only.metrics.energy_revenue, 1e-6));
    assert(summary["hybrid"]["yearly"].size() == 1);
    assert(summary["hybrid"]["yearly"][0]["year"].as<int>() == 2024);
    assert(summary["delta"]["interval_count"].as<int>() == 0);

    // A second run never overwrites the first
    std::string again = writer.writeSummary(cmp, config, prices, "example");
    assert(again != summary_path);
    assert(fs::exists(summary_path) && fs::exists(again));

    std::string trace_path = writer.writeIntervals(cmp.hybrid, config, prices, "example");
    std::ifstream trace(trace_path);
    std::string line;
    std::getline(trace, line);
    assert(line.compare(0, 16, "timestamp,price,") == 0);
    size_t rows = 0;
    std::string row_18;
    while (std::getline(trace, line)) {
        if (line.compare(0, 16, "2024-03-01 18:00") == 0) row_18 = line;
        ++rows;
    }
    assert(rows == 24);
    // Prices are written clamped
    assert(row_18.compare(0, 23, "2024-03-01 18:00,15000,") == 0);
    assert(fs::path(trace_path).filename().string().compare(0, 15, "example_hybrid_") == 0);

    fs::remove_all(dir);

    std::cout << " PASS\n";
    return true;
}

bool test_unwritable_directory() {
    std::cout << "Testing unwritable output..." << std::flush;

    fs::path dir = scratch_directory();
    fs::create_directories(dir);
    fs::path blocker = dir / "blocker";
    touch(blocker);

    Configuration config = Configuration::validate(exampleConfig());
    TimeSeries prices = constantSeries("prices", config, 45.0);
    TimeSeries solar = constantSeries("solar", config, 0.0);
    ScenarioComparison cmp = ScenarioComparator(config).compare(prices, solar);

    // A regular file where the output directory should be
    ReportWriter writer((blocker / "reports").string());
    bool threw = false;
    try {
        writer.writeSummary(cmp, config, prices, "example");
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "REPORT WRITER TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_versioned_filename();
        all_passed &= test_summary_and_intervals();
        all_passed &= test_unwritable_directory();

        std::cout << "\n============================================================================\n";
        if (!all_passed) {
            std::cout << "Some tests FAILED\n";
            return 1;
        }
        std::cout << "All report writer tests PASSED\n";
        std::cout << "============================================================================\n";
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
