#include "financial_evaluator.hpp"
#include "configuration.hpp"
#include "sim_errors.hpp"
#include <algorithm>
#include <map>

namespace {

using RecordIter = std::vector<EnergyFlowRecord>::const_iterator;

double weightedAverage(double weighted_sum, double weight) {
    return weight > 0.0 ? weighted_sum / weight : 0.0;
}

ScenarioMetrics evaluateRange(RecordIter begin, RecordIter end, const TimeSeries& prices,
                              const TariffConfig& tariffs, const MarketConfig& market) {
    ScenarioMetrics m;
    if (begin == end) return m;

    const double hours = market.resolution_minutes / 60.0;
    double price_sum = 0.0;
    double import_price_sum = 0.0;
    double export_price_sum = 0.0;
    double solar_price_sum = 0.0;

    // Peak import MW per billing month, keyed by year * 12 + month
    std::map<int, double> monthly_peak_mw;

    for (auto it = begin; it != end; ++it) {
        const EnergyFlowRecord& r = *it;
        auto raw = prices.valueAt(r.timestamp);
        if (!raw) {
            throw DataUnavailableError("No price in series '" + prices.name() + "' for interval " +
                                           formatTimestamp(r.timestamp),
                                       r.timestamp);
        }
        double price = clampPrice(*raw, market);
        double settlement_price = price * tariffs.network_loss_factor;

        m.energy_revenue += r.grid_export_mwh * settlement_price;
        m.energy_cost += r.grid_import_mwh * settlement_price;
        m.network_cost += r.grid_import_mwh * tariffs.import_rate_per_mwh +
                          r.grid_export_mwh * tariffs.export_rate_per_mwh;

        m.total_charge_mwh += r.battery_charge_mwh;
        m.total_discharge_mwh += r.battery_discharge_mwh;
        m.total_grid_import_mwh += r.grid_import_mwh;
        m.total_grid_export_mwh += r.grid_export_mwh;
        m.total_pv_production_mwh += r.pv_production_mwh;
        m.total_pv_to_battery_mwh += r.pv_to_battery_mwh;
        m.total_pv_to_grid_mwh += r.pv_to_grid_mwh;

        price_sum += price;
        import_price_sum += r.grid_import_mwh * price;
        export_price_sum += r.battery_discharge_mwh * price;
        solar_price_sum += r.pv_production_mwh * price;

        if (!tariffs.demand_window || tariffs.demand_window->contains(minuteOfDay(r.timestamp))) {
            std::tm cal = utcCalendar(r.timestamp);
            double& peak = monthly_peak_mw[cal.tm_year * 12 + cal.tm_mon];
            peak = std::max(peak, r.grid_import_mwh / hours);
        }
    }

    m.interval_count = static_cast<int>(end - begin);
    m.final_soc = (end - 1)->soc;

    m.round_trip_efficiency = weightedAverage(m.total_discharge_mwh, m.total_charge_mwh);
    m.average_price = price_sum / m.interval_count;
    m.import_weighted_price = weightedAverage(import_price_sum, m.total_grid_import_mwh);
    m.export_weighted_price = weightedAverage(export_price_sum, m.total_discharge_mwh);
    m.solar_weighted_price = weightedAverage(solar_price_sum, m.total_pv_production_mwh);
    m.spread_captured = m.export_weighted_price - m.import_weighted_price;

    for (const auto& month : monthly_peak_mw) {
        m.demand_charge += month.second * tariffs.demand_rate_per_mw;
    }

    double days = m.interval_count * hours / 24.0;
    if (tariffs.fixed_cadence == FixedChargeCadence::Yearly) {
        int year = utcCalendar(begin->timestamp).tm_year + 1900;
        m.fixed_charge = tariffs.fixed_charge * days / daysInYear(year);
    } else {
        m.fixed_charge = tariffs.fixed_charge * days;
    }

    m.gross_profit = m.energy_revenue - m.energy_cost;
    m.net_profit = m.gross_profit - m.network_cost - m.fixed_charge - m.demand_charge;
    return m;
}

} // namespace

ScenarioMetrics ScenarioMetrics::operator-(const ScenarioMetrics& o) const {
    ScenarioMetrics d;
    d.total_charge_mwh = total_charge_mwh - o.total_charge_mwh;
    d.total_discharge_mwh = total_discharge_mwh - o.total_discharge_mwh;
    d.total_grid_import_mwh = total_grid_import_mwh - o.total_grid_import_mwh;
    d.total_grid_export_mwh = total_grid_export_mwh - o.total_grid_export_mwh;
    d.total_pv_production_mwh = total_pv_production_mwh - o.total_pv_production_mwh;
    d.total_pv_to_battery_mwh = total_pv_to_battery_mwh - o.total_pv_to_battery_mwh;
    d.total_pv_to_grid_mwh = total_pv_to_grid_mwh - o.total_pv_to_grid_mwh;
    d.round_trip_efficiency = round_trip_efficiency - o.round_trip_efficiency;
    d.average_price = average_price - o.average_price;
    d.import_weighted_price = import_weighted_price - o.import_weighted_price;
    d.export_weighted_price = export_weighted_price - o.export_weighted_price;
    d.solar_weighted_price = solar_weighted_price - o.solar_weighted_price;
    d.spread_captured = spread_captured - o.spread_captured;
    d.energy_revenue = energy_revenue - o.energy_revenue;
    d.energy_cost = energy_cost - o.energy_cost;
    d.network_cost = network_cost - o.network_cost;
    d.demand_charge = demand_charge - o.demand_charge;
    d.fixed_charge = fixed_charge - o.fixed_charge;
    d.gross_profit = gross_profit - o.gross_profit;
    d.net_profit = net_profit - o.net_profit;
    d.final_soc = final_soc - o.final_soc;
    d.interval_count = interval_count - o.interval_count;
    return d;
}

ScenarioMetrics FinancialEvaluator::evaluate(const std::vector<EnergyFlowRecord>& records, const TimeSeries& prices,
                                             const TariffConfig& tariffs, const MarketConfig& market) {
    return evaluateRange(records.begin(), records.end(), prices, tariffs, market);
}

std::vector<YearlyMetrics> FinancialEvaluator::evaluateByYear(const std::vector<EnergyFlowRecord>& records,
                                                              const TimeSeries& prices, const TariffConfig& tariffs,
                                                              const MarketConfig& market) {
    std::vector<YearlyMetrics> years;
    auto begin = records.begin();
    while (begin != records.end()) {
        int year = utcCalendar(begin->timestamp).tm_year + 1900;
        auto end = std::find_if(begin, records.end(), [year](const EnergyFlowRecord& r) {
            return utcCalendar(r.timestamp).tm_year + 1900 != year;
        });
        years.push_back({year, evaluateRange(begin, end, prices, tariffs, market)});
        begin = end;
    }
    return years;
}
