#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include "plant_model.hpp"
#include <cstdint>
#include <ctime>

/**
 * @class Configuration
 * @brief Immutable, validated simulation parameters.
 *
 * The only way to obtain a Configuration is through validate(), so every
 * instance the engine sees satisfies all parameter constraints.
 */
class Configuration {
public:
    /**
     * @brief Checks every parameter and builds the immutable configuration.
     * @param config The raw parameters, e.g. from ConfigLoader.
     * @return The validated configuration.
     * @throw ConfigurationError naming the first offending parameter.
     */
    static Configuration validate(const Config& config);

    const BatteryConfig& battery() const { return params.battery; }
    const PVConfig& pv() const { return params.pv; }
    const MarketConfig& market() const { return params.market; }
    const DispatchWindowConfig& windows() const { return params.windows; }
    const TariffConfig& tariffs() const { return params.tariffs; }
    const Config& raw() const { return params; }

    /// @brief (max SOC - min SOC) x energy capacity, in MWh.
    double usableEnergyMwh() const;

    double intervalHours() const;

    /// @brief Energy the battery can draw at its terminals in one interval at full power.
    double maxChargeMwhPerInterval() const;

    /// @brief Energy the battery can deliver at its terminals in one interval at full power.
    double maxDischargeMwhPerInterval() const;

    std::time_t periodStart() const;

    /// @brief Exclusive end of the simulated period (midnight after the last day).
    std::time_t periodEnd() const;

    int periodDays() const;
    size_t intervalCount() const;

    /// @brief Content hash over every parameter, used for cache keys.
    uint64_t fingerprint() const;

private:
    explicit Configuration(const Config& config) : params(config) {}

    Config params;
};

/// @brief Clamps a raw market price to the configured floor and ceiling.
double clampPrice(double raw_price, const MarketConfig& market);

#endif // CONFIGURATION_H
