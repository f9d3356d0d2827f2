#include "config_loader.hpp"
#include "time_series.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

// Helpers to convert strings to enums
static Region to_region(const std::string& s) {
    if (s == "NSW1") return Region::NSW1;
    if (s == "VIC1") return Region::VIC1;
    if (s == "QLD1") return Region::QLD1;
    if (s == "SA1") return Region::SA1;
    if (s == "TAS1") return Region::TAS1;
    throw std::runtime_error("Invalid market region: " + s);
}

static FixedChargeCadence to_cadence(const std::string& s) {
    if (s == "yearly") return FixedChargeCadence::Yearly;
    if (s == "daily") return FixedChargeCadence::Daily;
    throw std::runtime_error("Invalid fixed charge cadence: " + s);
}

// Copies an optional scalar into target, leaving the default in place when absent
template <typename T>
static void read_optional(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

static const YAML::Node require_node(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error("Missing required configuration key: " + path);
    }
    return node;
}

static TimeWindow to_window(const YAML::Node& node, const std::string& path) {
    if (!node.IsSequence() || node.size() != 2) {
        throw std::runtime_error("Expected [\"HH:MM\", \"HH:MM\"] for " + path);
    }
    TimeWindow window;
    window.start_minute = parseTimeOfDay(node[0].as<std::string>());
    window.end_minute = parseTimeOfDay(node[1].as<std::string>());
    return window;
}

static Config parse_config(const YAML::Node& root) {
    Config config;

    // Battery
    const auto battery_node = require_node(root, "battery", "battery");
    read_optional(battery_node, "name", config.battery.name);
    config.battery.power_mw = require_node(battery_node, "power_mw", "battery.power_mw").as<double>();
    config.battery.energy_mwh = require_node(battery_node, "energy_mwh", "battery.energy_mwh").as<double>();
    read_optional(battery_node, "soc_min", config.battery.soc_min);
    read_optional(battery_node, "soc_max", config.battery.soc_max);
    read_optional(battery_node, "soc_initial", config.battery.soc_initial);
    read_optional(battery_node, "charge_efficiency", config.battery.charge_efficiency);
    read_optional(battery_node, "discharge_efficiency", config.battery.discharge_efficiency);

    // PV (optional section)
    if (const auto pv_node = root["pv"]) {
        read_optional(pv_node, "capacity_mw", config.pv.capacity_mw);
        read_optional(pv_node, "efficiency", config.pv.efficiency);
        read_optional(pv_node, "export_efficiency", config.pv.export_efficiency);
        read_optional(pv_node, "bidirectional_charging", config.pv.bidirectional_charging);
    }

    // Market
    const auto market_node = require_node(root, "market", "market");
    if (market_node["region"]) {
        config.market.region = to_region(market_node["region"].as<std::string>());
    }
    config.market.start_day = parseDate(require_node(market_node, "start", "market.start").as<std::string>());
    config.market.end_day = parseDate(require_node(market_node, "end", "market.end").as<std::string>());
    read_optional(market_node, "resolution_minutes", config.market.resolution_minutes);
    read_optional(market_node, "price_floor", config.market.price_floor);
    read_optional(market_node, "price_ceiling", config.market.price_ceiling);

    // Dispatch windows
    const auto windows_node = require_node(root, "dispatch_windows", "dispatch_windows");
    config.windows.charge_window =
        to_window(require_node(windows_node, "charge", "dispatch_windows.charge"), "dispatch_windows.charge");
    config.windows.discharge_window =
        to_window(require_node(windows_node, "discharge", "dispatch_windows.discharge"), "dispatch_windows.discharge");

    // Tariffs (optional section)
    if (const auto tariff_node = root["tariffs"]) {
        if (const auto fixed_node = tariff_node["fixed"]) {
            read_optional(fixed_node, "amount", config.tariffs.fixed_charge);
            if (fixed_node["cadence"]) {
                config.tariffs.fixed_cadence = to_cadence(fixed_node["cadence"].as<std::string>());
            }
        }
        if (const auto volume_node = tariff_node["volume"]) {
            read_optional(volume_node, "import_per_mwh", config.tariffs.import_rate_per_mwh);
            read_optional(volume_node, "export_per_mwh", config.tariffs.export_rate_per_mwh);
        }
        if (const auto demand_node = tariff_node["demand"]) {
            read_optional(demand_node, "rate_per_mw", config.tariffs.demand_rate_per_mw);
            if (demand_node["window"]) {
                config.tariffs.demand_window = to_window(demand_node["window"], "tariffs.demand.window");
            }
        }
        read_optional(tariff_node, "network_loss_factor", config.tariffs.network_loss_factor);
    }

    return config;
}

static RunProfile parse_profile(const YAML::Node& root) {
    RunProfile profile;
    profile.config = parse_config(root);

    if (const auto data_node = root["data"]) {
        read_optional(data_node, "prices_csv", profile.data.prices_csv);
        read_optional(data_node, "solar_csv", profile.data.solar_csv);
    }
    if (const auto output_node = root["output"]) {
        read_optional(output_node, "directory", profile.output.directory);
        read_optional(output_node, "base_name", profile.output.base_name);
        read_optional(output_node, "write_intervals", profile.output.write_intervals);
    }
    return profile;
}

Config ConfigLoader::loadConfig(const std::string& filename) {
    return parse_config(YAML::LoadFile(filename));
}

RunProfile ConfigLoader::loadRunProfile(const std::string& filename) {
    return parse_profile(YAML::LoadFile(filename));
}

RunProfile ConfigLoader::parseRunProfile(const std::string& yaml_text) {
    return parse_profile(YAML::Load(yaml_text));
}
