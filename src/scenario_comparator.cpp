#include "scenario_comparator.hpp"
#include "simulation_engine.hpp"
#include <exception>
#include <thread>

ScenarioComparator::ScenarioComparator(const Configuration& cfg, std::shared_ptr<const DispatchPolicy> dispatch_policy)
    : config(cfg), policy(std::move(dispatch_policy)) {
    if (!policy) {
        policy = std::make_shared<WindowDispatchPolicy>();
    }
}

ScenarioResult ScenarioComparator::runScenario(const std::string& label, const TimeSeries& prices,
                                               const TimeSeries* solar) const {
    SimulationEngine engine(config, policy);

    ScenarioResult result;
    result.label = label;
    result.records = engine.simulate(prices, solar);
    result.metrics = FinancialEvaluator::evaluate(result.records, prices, config.tariffs(), config.market());
    return result;
}

ScenarioComparison ScenarioComparator::compare(const TimeSeries& prices, const TimeSeries& solar) const {
    ScenarioComparison comparison;
    std::exception_ptr battery_only_error;
    std::exception_ptr hybrid_error;

    std::thread battery_only_thread([&]() {
        try {
            comparison.battery_only = runScenario("battery_only", prices, nullptr);
        } catch (...) {
            battery_only_error = std::current_exception();
        }
    });

    try {
        comparison.hybrid = runScenario("hybrid", prices, &solar);
    } catch (...) {
        hybrid_error = std::current_exception();
    }
    battery_only_thread.join();

    if (battery_only_error) std::rethrow_exception(battery_only_error);
    if (hybrid_error) std::rethrow_exception(hybrid_error);

    comparison.delta = comparison.hybrid.metrics - comparison.battery_only.metrics;
    return comparison;
}
