#ifndef SIM_ERRORS_H
#define SIM_ERRORS_H

#include <ctime>
#include <stdexcept>
#include <string>

/**
 * @class ConfigurationError
 * @brief Thrown when a configuration parameter violates its constraints.
 */
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& parameter, const std::string& detail)
        : std::runtime_error("Invalid configuration parameter '" + parameter + "': " + detail),
          parameter_name(parameter) {}

    const std::string& parameter() const { return parameter_name; }

private:
    std::string parameter_name;
};

/**
 * @class DataUnavailableError
 * @brief Thrown when a time series does not cover an interval of the simulated period.
 */
class DataUnavailableError : public std::runtime_error {
public:
    DataUnavailableError(const std::string& what, std::time_t ts)
        : std::runtime_error(what), offending_timestamp(ts) {}

    std::time_t timestamp() const { return offending_timestamp; }

private:
    std::time_t offending_timestamp;
};

/**
 * @class ComputationInvariantError
 * @brief Thrown when the simulation detects an internal inconsistency. Always fatal.
 */
class ComputationInvariantError : public std::runtime_error {
public:
    ComputationInvariantError(const std::string& what, std::time_t ts)
        : std::runtime_error(what), offending_timestamp(ts) {}

    std::time_t timestamp() const { return offending_timestamp; }

private:
    std::time_t offending_timestamp;
};

#endif // SIM_ERRORS_H
