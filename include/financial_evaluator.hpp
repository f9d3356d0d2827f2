#ifndef FINANCIAL_EVALUATOR_H
#define FINANCIAL_EVALUATOR_H

#include "plant_model.hpp"
#include "time_series.hpp"
#include <string>
#include <vector>

/**
 * @struct ScenarioMetrics
 * @brief Aggregated operational and financial results of one run.
 *
 * Flow-weighted prices are zero when their weighting flow is zero.
 */
struct ScenarioMetrics {
    // Energy
    double total_charge_mwh = 0.0;
    double total_discharge_mwh = 0.0;
    double total_grid_import_mwh = 0.0;
    double total_grid_export_mwh = 0.0;
    double total_pv_production_mwh = 0.0;
    double total_pv_to_battery_mwh = 0.0;
    double total_pv_to_grid_mwh = 0.0;
    double round_trip_efficiency = 0.0;

    // Prices
    double average_price = 0.0;          ///< Time-weighted
    double import_weighted_price = 0.0;  ///< Weighted by grid import
    double export_weighted_price = 0.0;  ///< Weighted by battery discharge
    double solar_weighted_price = 0.0;   ///< Weighted by PV production
    double spread_captured = 0.0;

    // Money
    double energy_revenue = 0.0;
    double energy_cost = 0.0;
    double network_cost = 0.0;           ///< Volumetric only
    double demand_charge = 0.0;
    double fixed_charge = 0.0;
    double gross_profit = 0.0;
    double net_profit = 0.0;

    // Run
    double final_soc = 0.0;
    int interval_count = 0;

    /// @brief Field-wise difference, used for scenario deltas.
    ScenarioMetrics operator-(const ScenarioMetrics& other) const;
};

/**
 * @struct ScenarioResult
 * @brief Metrics plus the full interval trace of one run.
 */
struct ScenarioResult {
    std::string label;
    ScenarioMetrics metrics;
    std::vector<EnergyFlowRecord> records;
};

/**
 * @struct YearlyMetrics
 * @brief Metrics restricted to one calendar year of a run.
 */
struct YearlyMetrics {
    int year;
    ScenarioMetrics metrics;
};

/**
 * @class FinancialEvaluator
 * @brief Turns an interval trace into revenue, cost and profitability metrics.
 *
 * Stateless; every call is a pure function of its arguments.
 */
class FinancialEvaluator {
public:
    /**
     * @brief Evaluates a whole run.
     * @param records The interval trace from SimulationEngine.
     * @param prices The raw price series the trace was simulated against.
     * @param tariffs Network tariff components.
     * @param market Price limits and resolution.
     * @throw DataUnavailableError if a record has no price.
     */
    static ScenarioMetrics evaluate(const std::vector<EnergyFlowRecord>& records, const TimeSeries& prices,
                                    const TariffConfig& tariffs, const MarketConfig& market);

    /**
     * @brief Evaluates each calendar year of a run separately. Fixed charges are
     * prorated against the length of each year.
     */
    static std::vector<YearlyMetrics> evaluateByYear(const std::vector<EnergyFlowRecord>& records,
                                                     const TimeSeries& prices, const TariffConfig& tariffs,
                                                     const MarketConfig& market);
};

#endif // FINANCIAL_EVALUATOR_H
