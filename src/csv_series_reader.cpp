#include "csv_series_reader.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

TimeSeries CsvSeriesReader::read(const std::string& filename, const std::string& series_name) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open series file: " + filename);
    }
    return read(file, series_name);
}

TimeSeries CsvSeriesReader::read(std::istream& input, const std::string& series_name) {
    std::vector<TimePoint> points;
    std::string line;
    size_t line_number = 0;
    bool header_allowed = true;

    while (std::getline(input, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t comma = line.find(',');
        if (comma == std::string::npos) {
            throw std::runtime_error(series_name + " line " + std::to_string(line_number) + ": expected timestamp,value");
        }
        std::string stamp = trim(line.substr(0, comma));
        std::string value_text = trim(line.substr(comma + 1));

        std::time_t timestamp;
        try {
            timestamp = parseTimestamp(stamp);
        } catch (const std::runtime_error&) {
            if (header_allowed) {
                header_allowed = false;
                continue;
            }
            throw std::runtime_error(series_name + " line " + std::to_string(line_number) + ": bad timestamp '" + stamp + "'");
        }
        header_allowed = false;

        double value = std::numeric_limits<double>::quiet_NaN();
        if (!value_text.empty()) {
            char* end = nullptr;
            value = std::strtod(value_text.c_str(), &end);
            if (end == value_text.c_str() || *end != '\0') {
                throw std::runtime_error(series_name + " line " + std::to_string(line_number) + ": bad value '" + value_text + "'");
            }
        }
        points.push_back({timestamp, value});
    }

    return TimeSeries(series_name, std::move(points));
}
