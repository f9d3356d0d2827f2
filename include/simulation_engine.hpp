#ifndef SIMULATION_ENGINE_H
#define SIMULATION_ENGINE_H

#include "configuration.hpp"
#include "dispatch_policy.hpp"
#include "plant_model.hpp"
#include "time_series.hpp"
#include <memory>
#include <vector>

/**
 * @class SimulationEngine
 * @brief Steps the battery through the configured period one interval at a time.
 *
 * A run owns its BatteryState from start to finish; the engine itself holds no
 * mutable state, so one engine may serve concurrent runs.
 */
class SimulationEngine {
public:
    /**
     * @param config Validated configuration. Must outlive the engine.
     * @param policy Decision step; the fixed-window policy when null.
     */
    explicit SimulationEngine(const Configuration& config,
                              std::shared_ptr<const DispatchPolicy> policy = nullptr);

    /**
     * @brief Simulates every interval of the configured period in time order.
     * @param prices Market prices covering the period.
     * @param solar Solar production in MW covering the period, or nullptr for a battery-only run.
     * @return One record per interval.
     * @throw DataUnavailableError if a price or solar value is missing for an interval, or if
     * a series has samples between interval starts (resample it first, see TimeSeries::resampled).
     * @throw ComputationInvariantError if SOC leaves its bounds or energy is not conserved.
     */
    std::vector<EnergyFlowRecord> simulate(const TimeSeries& prices, const TimeSeries* solar = nullptr) const;

private:
    EnergyFlowRecord step(BatteryState& state, std::time_t timestamp, double price, double solar_mw) const;
    void requireIntervalGrid(const TimeSeries& series) const;

    const Configuration& config;
    std::shared_ptr<const DispatchPolicy> policy;
};

/**
 * @brief Snaps an SOC within float tolerance of its bounds back onto them.
 * @throw ComputationInvariantError if the SOC is outside [soc_min, soc_max] beyond tolerance.
 */
double boundedSoc(double soc, const BatteryConfig& battery, std::time_t timestamp);

/**
 * @brief Verifies that one interval conserves energy.
 *
 * Stored energy must match the SOC change, PV production must be fully allocated,
 * grid flows must match battery and PV flows, and no flow may be negative.
 * @throw ComputationInvariantError naming the record's timestamp.
 */
void checkEnergyBalance(const EnergyFlowRecord& record, double soc_before, const Configuration& config);

/// @brief Convenience wrapper running the fixed-window policy.
std::vector<EnergyFlowRecord> simulate(const Configuration& config, const TimeSeries& prices,
                                       const TimeSeries* solar = nullptr);

#endif // SIMULATION_ENGINE_H
