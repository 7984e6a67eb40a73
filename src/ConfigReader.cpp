#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace PDRIFT {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

bool ConfigReader::isNumber(const std::string& str) const {
    if (str.empty()) return false;
    std::istringstream iss(str);
    double value;
    iss >> value;
    return !iss.fail() && iss.eof();
}

bool ConfigReader::isBool(const std::string& str) const {
    std::string val = str;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "yes" || val == "1" || val == "on" ||
           val == "false" || val == "no" || val == "0" || val == "off";
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Structured parsing
// =============================================================================

bool ConfigReader::parseDriftConfig(DriftConfig& config) const {
    try {
        config.scheme = parseAdvectionScheme(getString("drift", "scheme", "euler"));
        config.mixing.diffusivitymodel =
            parseDiffusivityModel(getString("turbulentmixing", "diffusivitymodel", "environment"));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    std::string max_age = getString("drift", "max_age_seconds");
    std::string max_age_lower = max_age;
    std::transform(max_age_lower.begin(), max_age_lower.end(), max_age_lower.begin(), ::tolower);
    if (max_age.empty() || max_age_lower == "none") {
        config.max_age_seconds.reset();
    } else {
        config.max_age_seconds = getDouble("drift", "max_age_seconds", 0.0);
    }

    config.turbulentmixing = getBool("processes", "turbulentmixing", false);
    config.verticaladvection = getBool("processes", "verticaladvection", true);

    config.mixing.timestep = getDouble("turbulentmixing", "timestep", 1.0);
    config.mixing.verticalresolution = getDouble("turbulentmixing", "verticalresolution", 1.0);
    config.mixing.seed = static_cast<unsigned int>(
        std::max(0, getInt("turbulentmixing", "seed", 0)));

    return true;
}

bool ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    if (!hasSection("simulation")) return false;

    config.time_step = getDouble("simulation", "time_step", 3600.0);
    config.duration = getDouble("simulation", "duration", 86400.0);
    config.output_frequency = getInt("simulation", "output_frequency", 1);
    config.output_file = getString("simulation", "output_file", config.output_file);
    config.write_trajectories = getBool("simulation", "write_trajectories", true);

    config.seed_x = getDouble("seed", "x", 0.0);
    config.seed_y = getDouble("seed", "y", 0.0);
    config.seed_z = getDouble("seed", "z", 0.0);
    config.seed_radius = getDouble("seed", "radius", 0.0);
    config.seed_number = getInt("seed", "number", 1);
    config.seed_wind_drift_factor = getDouble("seed", "wind_drift_factor", 0.02);

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto fail = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("simulation")) {
        result.warnings.push_back("No [simulation] section found - using defaults");
    }
    if (!hasSection("drift")) {
        result.warnings.push_back("No [drift] section found - using defaults");
    }

    // Option values
    try {
        parseAdvectionScheme(getString("drift", "scheme", "euler"));
    } catch (const std::invalid_argument& e) {
        fail(e.what());
    }
    try {
        parseDiffusivityModel(getString("turbulentmixing", "diffusivitymodel", "environment"));
    } catch (const std::invalid_argument& e) {
        fail(e.what());
    }

    for (const auto& key : {"turbulentmixing", "verticaladvection"}) {
        if (hasKey("processes", key) && !isBool(getString("processes", key))) {
            fail(std::string("[processes]:") + key + " must be a boolean");
        }
    }

    // Numeric values
    std::string max_age = getString("drift", "max_age_seconds");
    std::string max_age_lower = max_age;
    std::transform(max_age_lower.begin(), max_age_lower.end(), max_age_lower.begin(), ::tolower);
    if (!max_age.empty() && max_age_lower != "none" && !isNumber(max_age)) {
        fail("[drift]:max_age_seconds must be a number or 'none'");
    }
    for (const auto& key : {"timestep", "verticalresolution"}) {
        if (hasKey("turbulentmixing", key) && !isNumber(getString("turbulentmixing", key))) {
            fail(std::string("[turbulentmixing]:") + key + " must be a number");
        }
    }

    DriftConfig drift;
    if (parseDriftConfig(drift)) {
        for (const auto& err : drift.checkRanges()) {
            fail(err);
        }
    }

    if (hasSection("simulation")) {
        if (getDouble("simulation", "time_step", 3600.0) <= 0.0) {
            fail("[simulation]:time_step must be positive");
        }
        if (getDouble("simulation", "duration", 86400.0) < 0.0) {
            fail("[simulation]:duration must be non-negative");
        }
        double time_step = getDouble("simulation", "time_step", 3600.0);
        double duration = getDouble("simulation", "duration", 86400.0);
        if (time_step > 0.0 && duration / time_step > static_cast<double>(INT_MAX)) {
            fail("[simulation]:duration / time_step exceeds the maximum number of steps");
        }
        if (getInt("simulation", "output_frequency", 1) < 1) {
            fail("[simulation]:output_frequency must be >= 1");
        }
    }

    if (hasSection("seed")) {
        double wdf = getDouble("seed", "wind_drift_factor", 0.02);
        if (wdf < 0.0 || wdf > 1.0) {
            fail("[seed]:wind_drift_factor must be in [0, 1]");
        }
        if (getDouble("seed", "z", 0.0) > 0.0) {
            fail("[seed]:z must be <= 0 (sea surface is z = 0)");
        }
        if (getInt("seed", "number", 1) < 0) {
            fail("[seed]:number must be non-negative");
        }
        if (getDouble("seed", "radius", 0.0) < 0.0) {
            fail("[seed]:radius must be non-negative");
        }
    }

    return result;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);

    file << "# PDRIFT Configuration File\n";
    file << "# All units in SI unless otherwise specified\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[simulation]\n";
    file << "time_step = 3600.0                    # 1 hour\n";
    file << "duration = 172800.0                   # 2 days\n";
    file << "output_frequency = 1\n";
    file << "output_file = pdrift_output\n\n";

    file << "[seed]\n";
    file << "x = 0.0\n";
    file << "y = 0.0\n";
    file << "z = -5.0                              # depth below surface (m)\n";
    file << "radius = 1000.0\n";
    file << "number = 1000\n";
    file << "wind_drift_factor = 0.02\n\n";

    file << "[drift]\n";
    file << "scheme = euler                        # euler, runge-kutta\n";
    file << "max_age_seconds = none                # none or >= 0\n\n";

    file << "[processes]\n";
    file << "turbulentmixing = false\n";
    file << "verticaladvection = true\n\n";

    file << "[turbulentmixing]\n";
    file << "timestep = 1.0                        # 0.1 - 3600 s\n";
    file << "verticalresolution = 1.0              # 0.01 - 10 m\n";
    file << "diffusivitymodel = environment        # environment, constant, stepfunction, windspeed_Sundby1983\n";
    file << "seed = 0                              # 0 = nondeterministic\n\n";

    file << "[environment]\n";
    file << "# Omitted fields take fallback values\n";
    file << "x_sea_water_velocity = 0.1\n";
    file << "y_sea_water_velocity = 0.0\n";
    file << "x_wind = 5.0\n";
    file << "y_wind = 0.0\n";
    file << "upward_sea_water_velocity = 0.0\n";
    file << "ocean_vertical_diffusivity = 0.02\n";
    file << "sea_floor_depth_below_sea_level = 100.0\n";
    file << "# land_box = xmin, xmax, ymin, ymax\n";
    file << "# land_box_1 = 50000, 60000, -10000, 10000\n";

    file.close();
}

} // namespace PDRIFT
