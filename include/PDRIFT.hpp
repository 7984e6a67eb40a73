#ifndef PDRIFT_HPP
#define PDRIFT_HPP

#include <petsc.h>

#include <string>
#include <vector>
#include <memory>
#include <map>

namespace PDRIFT {

// Forward declarations
class ParticleEnsemble;
class EnvironmentSample;
class FieldSampler;
class StepOrchestrator;
class DriftSimulation;
class ConfigReader;
struct DriftConfig;

// Physical constants
constexpr double SECONDS_PER_HOUR = 3600.0;
constexpr double SECONDS_PER_DAY = 86400.0;

/**
 * @brief Run-level settings for the simulation driver
 *
 * Holds everything outside the per-step physics configuration:
 * time stepping, seeding and output. All values in SI units.
 */
struct SimulationConfig {
    std::string config_file;
    std::string output_file = "pdrift_output";

    double time_step = 3600.0;           ///< Step length dt (s)
    double duration = 86400.0;           ///< Total simulated time (s)
    int output_frequency = 1;            ///< Write trajectories every N steps
    bool write_trajectories = true;

    // Seeding: uniform disc of particles
    double seed_x = 0.0;                 ///< Disc centre x (m)
    double seed_y = 0.0;                 ///< Disc centre y (m)
    double seed_z = 0.0;                 ///< Seeding depth (m, <= 0)
    double seed_radius = 0.0;            ///< Disc radius (m)
    int seed_number = 1;                 ///< Total particles across all ranks
    double seed_wind_drift_factor = 0.02;

    int numSteps() const {
        if (time_step <= 0.0) return 0;
        return static_cast<int>(duration / time_step + 0.5);
    }
};

} // namespace PDRIFT

#endif // PDRIFT_HPP
