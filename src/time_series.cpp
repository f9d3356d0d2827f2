#include "time_series.hpp"
#include "hash_util.hpp"
#include "sim_errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

TimeSeries::TimeSeries(std::string name, std::vector<TimePoint> points)
    : series_name(std::move(name)), samples(std::move(points)) {
    for (size_t i = 1; i < samples.size(); ++i) {
        if (samples[i].timestamp <= samples[i - 1].timestamp) {
            throw DataUnavailableError("Series '" + series_name + "' is not strictly ordered at " +
                                           formatTimestamp(samples[i].timestamp),
                                       samples[i].timestamp);
        }
    }
}

std::optional<double> TimeSeries::valueAt(std::time_t timestamp) const {
    auto it = std::lower_bound(samples.begin(), samples.end(), timestamp,
                               [](const TimePoint& p, std::time_t t) { return p.timestamp < t; });
    if (it == samples.end() || it->timestamp != timestamp || std::isnan(it->value)) {
        return std::nullopt;
    }
    return it->value;
}

std::time_t TimeSeries::spacingSeconds() const {
    if (samples.size() < 2) return 0;
    std::time_t step = samples[1].timestamp - samples[0].timestamp;
    for (size_t i = 2; i < samples.size(); ++i) {
        if (samples[i].timestamp - samples[i - 1].timestamp != step) return 0;
    }
    return step;
}

TimeSeries TimeSeries::resampled(std::time_t step_seconds) const {
    if (step_seconds <= 0) {
        throw std::runtime_error("Resampling step must be positive");
    }
    std::vector<TimePoint> buckets;
    double sum = 0.0;
    size_t count = 0;
    for (const auto& p : samples) {
        // Buckets are aligned to the epoch, which puts them on midnight for steps dividing a day
        std::time_t start = p.timestamp - ((p.timestamp % step_seconds) + step_seconds) % step_seconds;
        if (buckets.empty() || buckets.back().timestamp != start) {
            if (!buckets.empty()) buckets.back().value = sum / count;
            buckets.push_back({start, 0.0});
            sum = 0.0;
            count = 0;
        }
        // A NaN sample makes the whole bucket missing
        sum += p.value;
        ++count;
    }
    if (!buckets.empty()) buckets.back().value = sum / count;
    return TimeSeries(series_name, std::move(buckets));
}

uint64_t TimeSeries::fingerprint() const {
    Fnv1aHasher hasher;
    hasher.add(static_cast<int64_t>(samples.size()));
    for (const auto& p : samples) {
        hasher.add(static_cast<int64_t>(p.timestamp));
        hasher.add(p.value);
    }
    return hasher.digest();
}

namespace {

std::time_t makeUtc(int year, int month, int day, int hour, int minute, int second, const std::string& text) {
    std::tm fields{};
    fields.tm_year = year - 1900;
    fields.tm_mon = month - 1;
    fields.tm_mday = day;
    fields.tm_hour = hour;
    fields.tm_min = minute;
    fields.tm_sec = second;
    std::time_t t = timegm(&fields);

    // timegm normalises out-of-range fields, so a changed day means the input was invalid
    std::tm check = utcCalendar(t);
    if (month < 1 || month > 12 || check.tm_mday != day || check.tm_mon != month - 1 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw std::runtime_error("Invalid date/time: " + text);
    }
    return t;
}

} // namespace

std::time_t parseDate(const std::string& text) {
    int year, month, day;
    char tail;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3) {
        throw std::runtime_error("Invalid date (expected YYYY-MM-DD): " + text);
    }
    return makeUtc(year, month, day, 0, 0, 0, text);
}

std::time_t parseTimestamp(const std::string& text) {
    int year, month, day, hour, minute, second = 0;
    char sep;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                              &year, &month, &day, &sep, &hour, &minute, &second);
    if (matched < 6 || (sep != ' ' && sep != 'T')) {
        throw std::runtime_error("Invalid timestamp (expected YYYY-MM-DD HH:MM): " + text);
    }
    return makeUtc(year, month, day, hour, minute, second, text);
}

int parseTimeOfDay(const std::string& text) {
    int hour, minute;
    char tail;
    if (std::sscanf(text.c_str(), "%2d:%2d%c", &hour, &minute, &tail) != 2 ||
        hour < 0 || minute < 0 || minute > 59 || hour > 24 || (hour == 24 && minute != 0)) {
        throw std::runtime_error("Invalid time of day (expected HH:MM): " + text);
    }
    return hour * 60 + minute;
}

std::string formatDate(std::time_t timestamp) {
    std::tm fields = utcCalendar(timestamp);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", fields.tm_year + 1900, fields.tm_mon + 1, fields.tm_mday);
    return buffer;
}

std::string formatTimestamp(std::time_t timestamp) {
    std::tm fields = utcCalendar(timestamp);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d",
                  fields.tm_year + 1900, fields.tm_mon + 1, fields.tm_mday,
                  fields.tm_hour, fields.tm_min);
    return buffer;
}

std::string formatTimeOfDay(int minute_of_day) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", minute_of_day / 60, minute_of_day % 60);
    return buffer;
}

int minuteOfDay(std::time_t timestamp) {
    std::tm fields = utcCalendar(timestamp);
    return fields.tm_hour * 60 + fields.tm_min;
}

std::tm utcCalendar(std::time_t timestamp) {
    std::tm fields{};
    gmtime_r(&timestamp, &fields);
    return fields;
}

int daysInYear(int year) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 366 : 365;
}
