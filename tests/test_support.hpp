#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "configuration.hpp"
#include "plant_model.hpp"
#include "time_series.hpp"
#include <cassert>
#include <cmath>
#include <functional>
#include <string>
#include <vector>

namespace test_support {

constexpr std::time_t kHour = 3600;

inline bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

/**
 * 1 MW / 2 MWh battery cycling between 10% and 100% SOC on 2024-03-01,
 * hourly intervals, charging 01:00-04:00 and discharging 17:00-20:00.
 */
inline Config exampleConfig() {
    Config config;
    config.battery.name = "Example";
    config.battery.power_mw = 1.0;
    config.battery.energy_mwh = 2.0;
    config.battery.soc_min = 0.1;
    config.battery.soc_max = 1.0;
    config.battery.soc_initial = 0.1;
    config.battery.charge_efficiency = 0.95;
    config.battery.discharge_efficiency = 0.95;

    config.pv.capacity_mw = 2.0;
    config.pv.efficiency = 0.95;
    config.pv.export_efficiency = 0.98;
    config.pv.bidirectional_charging = false;

    config.market.region = Region::NSW1;
    config.market.start_day = parseDate("2024-03-01");
    config.market.end_day = parseDate("2024-03-01");
    config.market.resolution_minutes = 60;

    config.windows.charge_window = {60, 240};
    config.windows.discharge_window = {17 * 60, 20 * 60};
    return config;
}

/// Series sampled every step seconds from start; value computed from the sample timestamp.
inline TimeSeries makeSeries(const std::string& name, std::time_t start, size_t count, std::time_t step,
                             const std::function<double(std::time_t)>& value) {
    std::vector<TimePoint> points;
    points.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::time_t t = start + static_cast<std::time_t>(i) * step;
        points.push_back({t, value(t)});
    }
    return TimeSeries(name, std::move(points));
}

inline TimeSeries constantSeries(const std::string& name, const Configuration& config, double value) {
    std::time_t step = config.market().resolution_minutes * 60;
    return makeSeries(name, config.periodStart(), config.intervalCount(), step,
                      [value](std::time_t) { return value; });
}

/// Bell-shaped solar production peaking at noon, zero outside 06:00-18:00.
inline double solarShape(std::time_t t, double peak_mw) {
    double hour = minuteOfDay(t) / 60.0;
    if (hour < 6.0 || hour >= 18.0) return 0.0;
    double x = (hour - 12.0) / 6.0;
    return peak_mw * std::exp(-2.0 * x * x);
}

} // namespace test_support

#endif // TEST_SUPPORT_H
