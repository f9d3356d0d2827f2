#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "plant_model.hpp"
#include <string>

/**
 * @struct DataSources
 * @brief Input files for the command-line front end.
 */
struct DataSources {
    std::string prices_csv;
    std::string solar_csv; ///< Empty when no solar profile is available
};

/**
 * @struct ReportOptions
 * @brief Where and how results are written.
 */
struct ReportOptions {
    std::string directory; ///< Empty disables report files
    std::string base_name = "bess_simulation";
    bool write_intervals = true;
};

/**
 * @struct RunProfile
 * @brief Everything a command-line run needs: parameters, inputs and outputs.
 */
struct RunProfile {
    Config config;
    DataSources data;
    ReportOptions output;
};

/**
 * @class ConfigLoader
 * @brief Parses the YAML run profile.
 *
 * This class uses the yaml-cpp library. Parameters that are absent keep the
 * defaults of their structures; the result is not validated here, see
 * Configuration::validate.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads the simulation parameters from a YAML file.
     * @param filename The path to the YAML file.
     * @return The unvalidated parameters.
     * @throw std::runtime_error if the file cannot be opened or parsed.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Loads the parameters plus the data and output sections.
     * @throw std::runtime_error if the file cannot be opened or parsed.
     */
    static RunProfile loadRunProfile(const std::string& filename);

    /**
     * @brief Parses a run profile from YAML text.
     * @throw std::runtime_error on malformed content.
     */
    static RunProfile parseRunProfile(const std::string& yaml_text);
};

#endif // CONFIG_LOADER_H
