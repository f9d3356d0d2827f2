#include "simulation_engine.hpp"
#include "sim_errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

// Float slack allowed on SOC bounds before the overshoot counts as a logic fault
constexpr double kSocTolerance = 1e-9;
constexpr double kEnergyToleranceMwh = 1e-6;
// Residual energy left by float rounding at an SOC bound; not worth dispatching
constexpr double kNegligibleMwh = 1e-9;

} // namespace

SimulationEngine::SimulationEngine(const Configuration& cfg, std::shared_ptr<const DispatchPolicy> dispatch_policy)
    : config(cfg), policy(std::move(dispatch_policy)) {
    if (!policy) {
        policy = std::make_shared<WindowDispatchPolicy>();
    }
}

std::vector<EnergyFlowRecord> SimulationEngine::simulate(const TimeSeries& prices, const TimeSeries* solar) const {
    const std::time_t step_seconds = static_cast<std::time_t>(config.market().resolution_minutes) * 60;
    const size_t interval_count = config.intervalCount();

    requireIntervalGrid(prices);
    if (solar) {
        requireIntervalGrid(*solar);
    }

    BatteryState state;
    state.soc = config.battery().soc_initial;

    std::vector<EnergyFlowRecord> records;
    records.reserve(interval_count);

    for (size_t i = 0; i < interval_count; ++i) {
        std::time_t timestamp = config.periodStart() + static_cast<std::time_t>(i) * step_seconds;

        auto price = prices.valueAt(timestamp);
        if (!price) {
            throw DataUnavailableError("No price in series '" + prices.name() + "' for interval " +
                                           formatTimestamp(timestamp),
                                       timestamp);
        }

        double solar_mw = 0.0;
        if (solar) {
            auto value = solar->valueAt(timestamp);
            if (!value) {
                throw DataUnavailableError("No solar value in series '" + solar->name() + "' for interval " +
                                               formatTimestamp(timestamp),
                                           timestamp);
            }
            solar_mw = *value;
        }

        records.push_back(step(state, timestamp, clampPrice(*price, config.market()), solar_mw));
    }
    return records;
}

void SimulationEngine::requireIntervalGrid(const TimeSeries& series) const {
    const std::time_t step_seconds = static_cast<std::time_t>(config.market().resolution_minutes) * 60;
    const std::time_t start = config.periodStart();
    const auto& points = series.points();
    auto it = std::lower_bound(points.begin(), points.end(), start,
                               [](const TimePoint& p, std::time_t t) { return p.timestamp < t; });
    for (; it != points.end() && it->timestamp < config.periodEnd(); ++it) {
        if ((it->timestamp - start) % step_seconds != 0) {
            throw DataUnavailableError("Series '" + series.name() + "' has a sample at " +
                                           formatTimestamp(it->timestamp) + " between " +
                                           std::to_string(config.market().resolution_minutes) +
                                           "-minute intervals; resample it to the configured resolution",
                                       it->timestamp);
        }
    }
}

EnergyFlowRecord SimulationEngine::step(BatteryState& state, std::time_t timestamp, double price,
                                        double solar_mw) const {
    const BatteryConfig& battery = config.battery();
    const PVConfig& pv = config.pv();
    const double hours = config.intervalHours();
    const double capacity = battery.energy_mwh;
    const double eta_c = battery.charge_efficiency;
    const double eta_d = battery.discharge_efficiency;

    // 1. PV production at the point of connection; negative profile values are sensor noise
    double pv_mwh = std::min(pv.capacity_mw, std::max(solar_mw, 0.0)) * pv.efficiency * hours;

    // 2. Decide
    DispatchAction action = policy->decide(state, price, minuteOfDay(timestamp), config);

    // 3. Limits for this interval. Stored energy is what lands in the cells.
    const double power_limit = battery.power_mw * hours;
    const double headroom_stored = capacity > 0.0 ? std::max(0.0, (battery.soc_max - state.soc) * capacity) : 0.0;
    const double available_stored = capacity > 0.0 ? std::max(0.0, (state.soc - battery.soc_min) * capacity) : 0.0;

    // 4. Discharge is settled first; a discharging battery does not also store PV
    double discharge = 0.0;
    if (capacity > 0.0 && action.mode == DispatchMode::Discharge) {
        discharge = std::min(power_limit, available_stored * eta_d);
        if (discharge < kNegligibleMwh) discharge = 0.0;
    }

    // 5. PV charging takes priority over grid charging and shares the power limit with it
    double pv_to_battery = 0.0;
    if (action.pv_may_charge && discharge == 0.0 && capacity > 0.0) {
        pv_to_battery = std::min({pv_mwh, power_limit, headroom_stored / eta_c});
    }

    double grid_charge = 0.0;
    if (capacity > 0.0 && action.mode == DispatchMode::Charge) {
        double power_left = power_limit - pv_to_battery;
        double energy_left = (headroom_stored - pv_to_battery * eta_c) / eta_c;
        grid_charge = std::max(0.0, std::min(power_left, energy_left));
    }

    double pv_to_grid = (pv_mwh - pv_to_battery) * pv.export_efficiency;
    double charge = pv_to_battery + grid_charge;

    // 6. SOC update
    double soc_before = state.soc;
    double soc_after = soc_before;
    if (capacity > 0.0) {
        soc_after = soc_before + (charge * eta_c - discharge / eta_d) / capacity;
    }
    soc_after = boundedSoc(soc_after, battery, timestamp);

    state.soc = soc_after;
    state.charged_mwh += charge;
    state.discharged_mwh += discharge;

    // 7. Record
    EnergyFlowRecord record;
    record.timestamp = timestamp;
    record.grid_import_mwh = grid_charge;
    record.grid_export_mwh = discharge + pv_to_grid;
    record.battery_charge_mwh = charge;
    record.battery_discharge_mwh = discharge;
    record.pv_production_mwh = pv_mwh;
    record.pv_to_battery_mwh = pv_to_battery;
    record.pv_to_grid_mwh = pv_to_grid;
    record.soc = soc_after;

    checkEnergyBalance(record, soc_before, config);
    return record;
}

double boundedSoc(double soc, const BatteryConfig& battery, std::time_t timestamp) {
    if (!(soc >= battery.soc_min - kSocTolerance && soc <= battery.soc_max + kSocTolerance)) {
        std::ostringstream msg;
        msg << "SOC " << soc << " left [" << battery.soc_min << ", " << battery.soc_max
            << "] at " << formatTimestamp(timestamp);
        throw ComputationInvariantError(msg.str(), timestamp);
    }
    return std::min(std::max(soc, battery.soc_min), battery.soc_max);
}

void checkEnergyBalance(const EnergyFlowRecord& r, double soc_before, const Configuration& config) {
    const BatteryConfig& battery = config.battery();
    const PVConfig& pv = config.pv();

    double stored = r.battery_charge_mwh * battery.charge_efficiency -
                    r.battery_discharge_mwh / battery.discharge_efficiency;
    double soc_delta_mwh = (r.soc - soc_before) * battery.energy_mwh;
    double pv_balance = r.pv_to_battery_mwh + r.pv_to_grid_mwh / pv.export_efficiency - r.pv_production_mwh;
    double import_balance = r.grid_import_mwh + r.pv_to_battery_mwh - r.battery_charge_mwh;
    double export_balance = r.battery_discharge_mwh + r.pv_to_grid_mwh - r.grid_export_mwh;

    const char* failed = nullptr;
    if (std::fabs(stored - soc_delta_mwh) > kEnergyToleranceMwh) {
        failed = "stored energy does not match SOC change";
    } else if (std::fabs(pv_balance) > kEnergyToleranceMwh) {
        failed = "PV allocation does not match production";
    } else if (std::fabs(import_balance) > kEnergyToleranceMwh || std::fabs(export_balance) > kEnergyToleranceMwh) {
        failed = "grid flows do not match battery and PV flows";
    } else if (r.grid_import_mwh < 0.0 || r.battery_discharge_mwh < 0.0 || r.pv_to_battery_mwh < 0.0 ||
               r.pv_to_grid_mwh < 0.0) {
        failed = "negative energy flow";
    }

    if (failed) {
        throw ComputationInvariantError(std::string("Energy balance violated at ") +
                                            formatTimestamp(r.timestamp) + ": " + failed,
                                        r.timestamp);
    }
}

std::vector<EnergyFlowRecord> simulate(const Configuration& config, const TimeSeries& prices,
                                       const TimeSeries* solar) {
    return SimulationEngine(config).simulate(prices, solar);
}
