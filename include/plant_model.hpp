#ifndef PLANT_MODEL_H
#define PLANT_MODEL_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

/// @brief Market regions with price data available to the simulator.
enum class Region {
    NSW1,
    VIC1,
    QLD1,
    SA1,
    TAS1
};

/// @brief How the fixed network charge is billed.
enum class FixedChargeCadence {
    Yearly, ///< Annual amount, prorated over the simulated period
    Daily   ///< Amount per simulated day
};

/**
 * @struct TimeWindow
 * @brief A time-of-day interval [start, end) in minutes after midnight.
 *
 * A window whose end is before its start wraps past midnight.
 */
struct TimeWindow {
    int start_minute = 0;
    int end_minute = 0;

    bool empty() const { return start_minute == end_minute; }

    bool contains(int minute_of_day) const {
        if (start_minute <= end_minute) {
            return minute_of_day >= start_minute && minute_of_day < end_minute;
        }
        return minute_of_day >= start_minute || minute_of_day < end_minute;
    }
};

/**
 * @struct BatteryConfig
 * @brief Physical parameters of the storage system. SOC values are fractions of energy_mwh.
 */
struct BatteryConfig {
    std::string name = "BESS";
    double power_mw = 1.0;
    double energy_mwh = 2.0;
    double soc_min = 0.1;
    double soc_max = 0.9;
    double soc_initial = 0.1;
    double charge_efficiency = 0.95;
    double discharge_efficiency = 0.95;
};

/**
 * @struct PVConfig
 * @brief Co-located solar array parameters.
 */
struct PVConfig {
    double capacity_mw = 0.0;
    double efficiency = 0.95;
    double export_efficiency = 0.98;
    bool bidirectional_charging = false; ///< PV may charge the battery outside the charge window
};

/**
 * @struct MarketConfig
 * @brief Market region, simulated period and price limits.
 *
 * start_day and end_day are UTC midnights; both days are simulated.
 */
struct MarketConfig {
    Region region = Region::NSW1;
    std::time_t start_day = 0;
    std::time_t end_day = 0;
    int resolution_minutes = 5;
    double price_floor = -1000.0;
    double price_ceiling = 15000.0;
};

/**
 * @struct DispatchWindowConfig
 * @brief Fixed daily windows for grid charging and discharging.
 */
struct DispatchWindowConfig {
    TimeWindow charge_window;
    TimeWindow discharge_window;
};

/**
 * @struct TariffConfig
 * @brief Network tariff components.
 */
struct TariffConfig {
    double fixed_charge = 0.0;
    FixedChargeCadence fixed_cadence = FixedChargeCadence::Yearly;
    double import_rate_per_mwh = 0.0;
    double export_rate_per_mwh = 0.0;
    double demand_rate_per_mw = 0.0;           ///< Per MW of monthly peak import
    std::optional<TimeWindow> demand_window;   ///< Peak is measured only inside this window when set
    double network_loss_factor = 1.0;
};

/**
 * @struct Config
 * @brief Top-level structure holding the unvalidated simulation parameters.
 */
struct Config {
    BatteryConfig battery;
    PVConfig pv;
    MarketConfig market;
    DispatchWindowConfig windows;
    TariffConfig tariffs;
};

/**
 * @struct BatteryState
 * @brief Mutable state carried from one interval to the next within a single run.
 */
struct BatteryState {
    double soc = 0.0;
    double charged_mwh = 0.0;
    double discharged_mwh = 0.0;
};

/**
 * @struct EnergyFlowRecord
 * @brief Energy flows of one simulated interval.
 *
 * battery_charge_mwh is measured at the battery terminals before charge losses,
 * battery_discharge_mwh after discharge losses.
 */
struct EnergyFlowRecord {
    std::time_t timestamp = 0;
    double grid_import_mwh = 0.0;
    double grid_export_mwh = 0.0;
    double battery_charge_mwh = 0.0;
    double battery_discharge_mwh = 0.0;
    double pv_production_mwh = 0.0;
    double pv_to_battery_mwh = 0.0;
    double pv_to_grid_mwh = 0.0;
    double soc = 0.0;
};

inline bool operator==(const EnergyFlowRecord& a, const EnergyFlowRecord& b) {
    return a.timestamp == b.timestamp &&
           a.grid_import_mwh == b.grid_import_mwh &&
           a.grid_export_mwh == b.grid_export_mwh &&
           a.battery_charge_mwh == b.battery_charge_mwh &&
           a.battery_discharge_mwh == b.battery_discharge_mwh &&
           a.pv_production_mwh == b.pv_production_mwh &&
           a.pv_to_battery_mwh == b.pv_to_battery_mwh &&
           a.pv_to_grid_mwh == b.pv_to_grid_mwh &&
           a.soc == b.soc;
}

inline bool operator!=(const EnergyFlowRecord& a, const EnergyFlowRecord& b) {
    return !(a == b);
}

std::string regionName(Region region);

#endif // PLANT_MODEL_H
