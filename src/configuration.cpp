#include "configuration.hpp"
#include "hash_util.hpp"
#include "sim_errors.hpp"
#include "time_series.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

constexpr int kMinutesPerDay = 24 * 60;
constexpr std::time_t kSecondsPerDay = 24 * 60 * 60;

std::string describe(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

// Written as !(ok) so that NaN is rejected as well
void require(bool ok, const std::string& parameter, double value, const std::string& rule) {
    if (!ok) {
        throw ConfigurationError(parameter, describe(value) + " (must be " + rule + ")");
    }
}

void requireFraction(double value, const std::string& parameter, bool allow_zero) {
    bool ok = allow_zero ? (value >= 0.0 && value <= 1.0) : (value > 0.0 && value <= 1.0);
    require(ok, parameter, value, allow_zero ? "in [0, 1]" : "in (0, 1]");
}

void requireWindow(const TimeWindow& window, const std::string& parameter) {
    if (window.start_minute < 0 || window.start_minute >= kMinutesPerDay ||
        window.end_minute < 0 || window.end_minute > kMinutesPerDay) {
        throw ConfigurationError(parameter, formatTimeOfDay(window.start_minute) + "-" +
                                                formatTimeOfDay(window.end_minute) + " is outside 00:00-24:00");
    }
    if (window.empty()) {
        throw ConfigurationError(parameter, "window is empty");
    }
}

void validateBattery(const BatteryConfig& b) {
    require(b.power_mw > 0.0 && std::isfinite(b.power_mw), "battery.power_mw", b.power_mw, "> 0");
    require(b.energy_mwh >= 0.0 && std::isfinite(b.energy_mwh), "battery.energy_mwh", b.energy_mwh, ">= 0");
    requireFraction(b.soc_min, "battery.soc_min", true);
    requireFraction(b.soc_max, "battery.soc_max", true);
    require(b.soc_min < b.soc_max, "battery.soc_min", b.soc_min, "< soc_max");
    require(b.soc_initial >= b.soc_min && b.soc_initial <= b.soc_max,
            "battery.soc_initial", b.soc_initial, "within [soc_min, soc_max]");
    requireFraction(b.charge_efficiency, "battery.charge_efficiency", false);
    requireFraction(b.discharge_efficiency, "battery.discharge_efficiency", false);
}

void validatePv(const PVConfig& pv) {
    require(pv.capacity_mw >= 0.0 && std::isfinite(pv.capacity_mw), "pv.capacity_mw", pv.capacity_mw, ">= 0");
    requireFraction(pv.efficiency, "pv.efficiency", false);
    requireFraction(pv.export_efficiency, "pv.export_efficiency", false);
}

void validateMarket(const MarketConfig& m) {
    if (m.start_day > m.end_day) {
        throw ConfigurationError("market.date_range",
                                 formatTimestamp(m.start_day) + " is after " + formatTimestamp(m.end_day));
    }
    if (m.start_day % kSecondsPerDay != 0 || m.end_day % kSecondsPerDay != 0) {
        throw ConfigurationError("market.date_range", "dates must fall on midnight");
    }
    if (m.resolution_minutes <= 0 || kMinutesPerDay % m.resolution_minutes != 0) {
        throw ConfigurationError("market.resolution_minutes",
                                 std::to_string(m.resolution_minutes) + " (must be positive and divide a day)");
    }
    require(m.price_floor <= m.price_ceiling, "market.price_floor", m.price_floor, "<= price_ceiling");
}

void validateWindows(const DispatchWindowConfig& w) {
    requireWindow(w.charge_window, "dispatch_windows.charge");
    requireWindow(w.discharge_window, "dispatch_windows.discharge");
    for (int minute = 0; minute < kMinutesPerDay; ++minute) {
        if (w.charge_window.contains(minute) && w.discharge_window.contains(minute)) {
            throw ConfigurationError("dispatch_windows",
                                     "charge and discharge windows overlap at " + formatTimeOfDay(minute));
        }
    }
}

void validateTariffs(const TariffConfig& t) {
    require(t.fixed_charge >= 0.0 && std::isfinite(t.fixed_charge), "tariffs.fixed_charge", t.fixed_charge, ">= 0");
    require(t.import_rate_per_mwh >= 0.0 && std::isfinite(t.import_rate_per_mwh),
            "tariffs.import_rate_per_mwh", t.import_rate_per_mwh, ">= 0");
    require(t.export_rate_per_mwh >= 0.0 && std::isfinite(t.export_rate_per_mwh),
            "tariffs.export_rate_per_mwh", t.export_rate_per_mwh, ">= 0");
    require(t.demand_rate_per_mw >= 0.0 && std::isfinite(t.demand_rate_per_mw),
            "tariffs.demand_rate_per_mw", t.demand_rate_per_mw, ">= 0");
    require(t.network_loss_factor > 0.0 && std::isfinite(t.network_loss_factor),
            "tariffs.network_loss_factor", t.network_loss_factor, "> 0");
    if (t.demand_window) {
        requireWindow(*t.demand_window, "tariffs.demand_window");
    }
}

} // namespace

Configuration Configuration::validate(const Config& config) {
    validateBattery(config.battery);
    validatePv(config.pv);
    validateMarket(config.market);
    validateWindows(config.windows);
    validateTariffs(config.tariffs);
    return Configuration(config);
}

double Configuration::usableEnergyMwh() const {
    return (params.battery.soc_max - params.battery.soc_min) * params.battery.energy_mwh;
}

double Configuration::intervalHours() const {
    return params.market.resolution_minutes / 60.0;
}

double Configuration::maxChargeMwhPerInterval() const {
    return params.battery.power_mw * intervalHours();
}

double Configuration::maxDischargeMwhPerInterval() const {
    return params.battery.power_mw * intervalHours();
}

std::time_t Configuration::periodStart() const {
    return params.market.start_day;
}

std::time_t Configuration::periodEnd() const {
    return params.market.end_day + kSecondsPerDay;
}

int Configuration::periodDays() const {
    return static_cast<int>((periodEnd() - periodStart()) / kSecondsPerDay);
}

size_t Configuration::intervalCount() const {
    return static_cast<size_t>(periodDays()) * (kMinutesPerDay / params.market.resolution_minutes);
}

uint64_t Configuration::fingerprint() const {
    Fnv1aHasher h;
    const auto& b = params.battery;
    h.add(b.name);
    h.add(b.power_mw);
    h.add(b.energy_mwh);
    h.add(b.soc_min);
    h.add(b.soc_max);
    h.add(b.soc_initial);
    h.add(b.charge_efficiency);
    h.add(b.discharge_efficiency);

    const auto& pv = params.pv;
    h.add(pv.capacity_mw);
    h.add(pv.efficiency);
    h.add(pv.export_efficiency);
    h.add(pv.bidirectional_charging);

    const auto& m = params.market;
    h.add(static_cast<int64_t>(m.region));
    h.add(static_cast<int64_t>(m.start_day));
    h.add(static_cast<int64_t>(m.end_day));
    h.add(static_cast<int64_t>(m.resolution_minutes));
    h.add(m.price_floor);
    h.add(m.price_ceiling);

    const auto& w = params.windows;
    h.add(static_cast<int64_t>(w.charge_window.start_minute));
    h.add(static_cast<int64_t>(w.charge_window.end_minute));
    h.add(static_cast<int64_t>(w.discharge_window.start_minute));
    h.add(static_cast<int64_t>(w.discharge_window.end_minute));

    const auto& t = params.tariffs;
    h.add(t.fixed_charge);
    h.add(static_cast<int64_t>(t.fixed_cadence));
    h.add(t.import_rate_per_mwh);
    h.add(t.export_rate_per_mwh);
    h.add(t.demand_rate_per_mw);
    h.add(t.demand_window.has_value());
    if (t.demand_window) {
        h.add(static_cast<int64_t>(t.demand_window->start_minute));
        h.add(static_cast<int64_t>(t.demand_window->end_minute));
    }
    h.add(t.network_loss_factor);
    return h.digest();
}

double clampPrice(double raw_price, const MarketConfig& market) {
    return std::min(std::max(raw_price, market.price_floor), market.price_ceiling);
}

std::string regionName(Region region) {
    switch (region) {
        case Region::NSW1: return "NSW1";
        case Region::VIC1: return "VIC1";
        case Region::QLD1: return "QLD1";
        case Region::SA1: return "SA1";
        case Region::TAS1: return "TAS1";
    }
    return "UNKNOWN";
}
