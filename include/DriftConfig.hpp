#ifndef DRIFT_CONFIG_HPP
#define DRIFT_CONFIG_HPP

/**
 * @file DriftConfig.hpp
 * @brief Per-run physics configuration of the drift model
 *
 * Read-only during stepping. Ranges are checked when the configuration is
 * loaded (see ConfigReader::validate); the step pipeline assumes a valid
 * configuration.
 */

#include <optional>
#include <string>
#include <vector>

namespace PDRIFT {

/**
 * @brief Horizontal advection integration scheme
 */
enum class AdvectionScheme {
    EULER,          ///< First order forward Euler
    RUNGE_KUTTA     ///< Second order midpoint
};

/**
 * @brief Source of the vertical eddy diffusivity used by turbulent mixing
 */
enum class DiffusivityModel {
    ENVIRONMENT,            ///< Per-particle profile from the environment sample
    CONSTANT,               ///< Surface value of the environment profile at all depths
    STEPFUNCTION,           ///< 0.1 m²/s above 20 m depth, 0.02 m²/s below
    WINDSPEED_SUNDBY1983    ///< Sundby (1983) wind speed parameterization
};

std::string schemeName(AdvectionScheme scheme);
AdvectionScheme parseAdvectionScheme(const std::string& name);

std::string diffusivityModelName(DiffusivityModel model);
DiffusivityModel parseDiffusivityModel(const std::string& name);

/**
 * @brief Turbulent mixing sub-parameters
 */
struct MixingConfig {
    double timestep = 1.0;              ///< Mixing sub-step (s), in [0.1, 3600]
    double verticalresolution = 1.0;    ///< Gradient spacing (m), in [0.01, 10]
    DiffusivityModel diffusivitymodel = DiffusivityModel::ENVIRONMENT;
    unsigned int seed = 0;              ///< Random walk seed, 0 = nondeterministic
};

/**
 * @brief Seed of an independent random stream derived from a base seed
 *
 * Used to give each MPI rank its own mixing sequence. A base seed of 0
 * (nondeterministic) is returned unchanged; any other base maps to a
 * non-zero seed that differs per stream.
 */
unsigned int streamSeed(unsigned int seed, int stream);

/**
 * @brief Physics configuration consumed by the step orchestrator
 */
struct DriftConfig {
    AdvectionScheme scheme = AdvectionScheme::EULER;
    std::optional<double> max_age_seconds;   ///< Unset: no age-based retirement
    bool turbulentmixing = false;
    bool verticaladvection = true;
    MixingConfig mixing;

    /// Range errors, empty when the configuration is valid
    std::vector<std::string> checkRanges() const;
};

} // namespace PDRIFT

#endif // DRIFT_CONFIG_HPP
