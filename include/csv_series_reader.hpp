#ifndef CSV_SERIES_READER_H
#define CSV_SERIES_READER_H

#include "time_series.hpp"
#include <istream>
#include <string>

/**
 * @class CsvSeriesReader
 * @brief Reads "timestamp,value" files into a TimeSeries.
 *
 * Timestamps use "YYYY-MM-DD HH:MM" in market time. Blank lines, lines starting
 * with '#' and a header line are skipped. Empty values are kept as gaps.
 */
class CsvSeriesReader {
public:
    /**
     * @throw std::runtime_error if the file cannot be opened or a line is malformed.
     */
    static TimeSeries read(const std::string& filename, const std::string& series_name);

    static TimeSeries read(std::istream& input, const std::string& series_name);
};

#endif // CSV_SERIES_READER_H
