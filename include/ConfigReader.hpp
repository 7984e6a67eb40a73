#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "PDRIFT.hpp"
#include "DriftConfig.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace PDRIFT {

/**
 * @brief INI-style configuration reader
 *
 * Configures a complete drift run from a single text file:
 *
 *   [drift]            scheme, max_age_seconds
 *   [processes]        turbulentmixing, verticaladvection
 *   [turbulentmixing]  timestep, verticalresolution, diffusivitymodel, seed
 *   [simulation]       time_step, duration, output_frequency, output_file
 *   [seed]             x, y, z, radius, number, wind_drift_factor
 *   [environment]      uniform field values and land boxes
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    bool loadFile(const std::string& filename);

    // Structured parsing
    bool parseDriftConfig(DriftConfig& config) const;
    bool parseSimulationConfig(SimulationConfig& config) const;

    // Raw access
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief Check the loaded values against the accepted ranges
     *
     * Unknown option names and out-of-range numbers are errors; missing
     * sections are warnings (defaults apply).
     */
    ValidationResult validate() const;

    // Template generation
    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
    bool isNumber(const std::string& str) const;
    bool isBool(const std::string& str) const;
};

} // namespace PDRIFT

#endif // CONFIG_READER_HPP
