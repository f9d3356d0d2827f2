#ifndef REPORT_WRITER_H
#define REPORT_WRITER_H

#include "configuration.hpp"
#include "scenario_comparator.hpp"
#include "time_series.hpp"
#include <ctime>
#include <string>

/**
 * @class ReportWriter
 * @brief Writes comparison summaries (YAML) and interval traces (CSV).
 *
 * Files are named <base>_YYYYMMDD_HHMMSS_vN.<ext> so that repeated runs never
 * overwrite earlier reports.
 */
class ReportWriter {
public:
    /**
     * @param directory Output directory, created on first write.
     */
    explicit ReportWriter(std::string directory);

    /**
     * @brief Writes metrics of both scenarios, the delta and per-year breakdowns.
     * @return Path of the written file.
     * @throw std::runtime_error if the file cannot be written.
     */
    std::string writeSummary(const ScenarioComparison& comparison, const Configuration& config,
                             const TimeSeries& prices, const std::string& base_name) const;

    /**
     * @brief Writes one scenario's interval trace with the clamped price of each interval.
     * @return Path of the written file.
     * @throw std::runtime_error if the file cannot be written.
     */
    std::string writeIntervals(const ScenarioResult& result, const Configuration& config,
                               const TimeSeries& prices, const std::string& base_name) const;

    /**
     * @brief Builds the next free versioned file name in a directory.
     */
    static std::string versionedFilename(const std::string& directory, const std::string& base_name,
                                         const std::string& extension, std::time_t now);

private:
    std::string output_directory;
};

#endif // REPORT_WRITER_H
