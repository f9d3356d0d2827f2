#ifndef TIME_SERIES_H
#define TIME_SERIES_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct TimePoint
 * @brief A single sample of a time series. Timestamps are UTC seconds and mark the start of the interval.
 */
struct TimePoint {
    std::time_t timestamp;
    double value;
};

/**
 * @class TimeSeries
 * @brief Read-only, strictly ordered series of samples.
 *
 * Price series carry currency per MWh, solar series carry MW. A series may cover
 * more than the simulated period; missing intervals are reported at lookup time.
 */
class TimeSeries {
public:
    TimeSeries() = default;

    /**
     * @brief Builds a series from samples.
     * @param name Label used in diagnostics.
     * @param points Samples in strictly increasing timestamp order.
     * @throw DataUnavailableError if timestamps are not strictly increasing.
     */
    TimeSeries(std::string name, std::vector<TimePoint> points);

    /**
     * @brief Looks up the sample starting exactly at the given timestamp.
     * @return The value, or std::nullopt if the timestamp is absent or the value is NaN.
     */
    std::optional<double> valueAt(std::time_t timestamp) const;

    /**
     * @brief Returns the common spacing between samples in seconds, or 0 if the
     * series has fewer than two samples or is unevenly spaced.
     */
    std::time_t spacingSeconds() const;

    /**
     * @brief Averages the samples onto a coarser grid of step_seconds.
     *
     * Each output sample is the mean of the input samples starting in its bucket.
     * A bucket containing a NaN sample is NaN, so gaps stay visible to the engine.
     * A series already on the grid comes back unchanged.
     */
    TimeSeries resampled(std::time_t step_seconds) const;

    /// @brief Content hash over timestamps and values. Stable across runs.
    uint64_t fingerprint() const;

    const std::string& name() const { return series_name; }
    const std::vector<TimePoint>& points() const { return samples; }
    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

private:
    std::string series_name;
    std::vector<TimePoint> samples;
};

/// @brief Parses "YYYY-MM-DD" into the UTC midnight of that day.
std::time_t parseDate(const std::string& text);

/// @brief Parses "YYYY-MM-DD HH:MM" or "YYYY-MM-DDTHH:MM[:SS]" as UTC.
std::time_t parseTimestamp(const std::string& text);

/// @brief Parses "HH:MM" into minutes after midnight. "24:00" is accepted as 1440.
int parseTimeOfDay(const std::string& text);

/// @brief Formats the UTC calendar day of a timestamp as "YYYY-MM-DD".
std::string formatDate(std::time_t timestamp);

/// @brief Formats a UTC timestamp as "YYYY-MM-DD HH:MM".
std::string formatTimestamp(std::time_t timestamp);

/// @brief Formats minutes after midnight as "HH:MM".
std::string formatTimeOfDay(int minute_of_day);

int minuteOfDay(std::time_t timestamp);

/// @brief Broken-down UTC calendar fields of a timestamp.
std::tm utcCalendar(std::time_t timestamp);

int daysInYear(int year);

#endif // TIME_SERIES_H
