#include "DriftConfig.hpp"
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <stdexcept>

namespace PDRIFT {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}
} // namespace

std::string schemeName(AdvectionScheme scheme) {
    switch (scheme) {
        case AdvectionScheme::EULER: return "euler";
        case AdvectionScheme::RUNGE_KUTTA: return "runge-kutta";
    }
    return "unknown";
}

AdvectionScheme parseAdvectionScheme(const std::string& name) {
    std::string s = toLower(name);
    if (s == "euler") return AdvectionScheme::EULER;
    if (s == "runge-kutta" || s == "runge_kutta" || s == "rk2") {
        return AdvectionScheme::RUNGE_KUTTA;
    }
    throw std::invalid_argument("Unknown advection scheme: " + name);
}

std::string diffusivityModelName(DiffusivityModel model) {
    switch (model) {
        case DiffusivityModel::ENVIRONMENT: return "environment";
        case DiffusivityModel::CONSTANT: return "constant";
        case DiffusivityModel::STEPFUNCTION: return "stepfunction";
        case DiffusivityModel::WINDSPEED_SUNDBY1983: return "windspeed_Sundby1983";
    }
    return "unknown";
}

DiffusivityModel parseDiffusivityModel(const std::string& name) {
    std::string s = toLower(name);
    if (s == "environment") return DiffusivityModel::ENVIRONMENT;
    if (s == "constant") return DiffusivityModel::CONSTANT;
    if (s == "stepfunction") return DiffusivityModel::STEPFUNCTION;
    if (s == "windspeed_sundby1983") return DiffusivityModel::WINDSPEED_SUNDBY1983;
    throw std::invalid_argument("Unknown diffusivity model: " + name);
}

unsigned int streamSeed(unsigned int seed, int stream) {
    if (seed == 0) return 0;

    std::seed_seq seq{seed, static_cast<unsigned int>(stream)};
    unsigned int derived[1];
    seq.generate(derived, derived + 1);
    return derived[0] != 0 ? derived[0] : 1u;
}

std::vector<std::string> DriftConfig::checkRanges() const {
    std::vector<std::string> errors;

    if (max_age_seconds && *max_age_seconds < 0.0) {
        std::ostringstream msg;
        msg << "max_age_seconds must be >= 0 (got " << *max_age_seconds << ")";
        errors.push_back(msg.str());
    }

    if (mixing.timestep < 0.1 || mixing.timestep > 3600.0) {
        std::ostringstream msg;
        msg << "turbulentmixing timestep must be in [0.1, 3600] s (got "
            << mixing.timestep << ")";
        errors.push_back(msg.str());
    }

    if (mixing.verticalresolution < 0.01 || mixing.verticalresolution > 10.0) {
        std::ostringstream msg;
        msg << "turbulentmixing verticalresolution must be in [0.01, 10] m (got "
            << mixing.verticalresolution << ")";
        errors.push_back(msg.str());
    }

    return errors;
}

} // namespace PDRIFT
