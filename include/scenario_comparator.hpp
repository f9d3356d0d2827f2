#ifndef SCENARIO_COMPARATOR_H
#define SCENARIO_COMPARATOR_H

#include "configuration.hpp"
#include "dispatch_policy.hpp"
#include "financial_evaluator.hpp"
#include "time_series.hpp"
#include <memory>
#include <string>

/**
 * @struct ScenarioComparison
 * @brief Battery-only and hybrid runs over the same period, plus hybrid - battery-only.
 */
struct ScenarioComparison {
    ScenarioResult battery_only;
    ScenarioResult hybrid;
    ScenarioMetrics delta;
};

/**
 * @class ScenarioComparator
 * @brief Runs the battery-only and hybrid scenarios and compares them.
 *
 * The two runs share no mutable state and execute on separate threads.
 */
class ScenarioComparator {
public:
    /**
     * @param config Validated configuration. Must outlive the comparator.
     * @param policy Decision step shared by both runs; the fixed-window policy when null.
     */
    explicit ScenarioComparator(const Configuration& config,
                                std::shared_ptr<const DispatchPolicy> policy = nullptr);

    /**
     * @brief Runs both scenarios concurrently.
     * @throw The first error raised by either run. No partial result is returned.
     */
    ScenarioComparison compare(const TimeSeries& prices, const TimeSeries& solar) const;

    /**
     * @brief Simulates and evaluates a single scenario.
     * @param solar Solar series for a hybrid run, nullptr for battery-only.
     */
    ScenarioResult runScenario(const std::string& label, const TimeSeries& prices, const TimeSeries* solar) const;

private:
    const Configuration& config;
    std::shared_ptr<const DispatchPolicy> policy;
};

#endif // SCENARIO_COMPARATOR_H
