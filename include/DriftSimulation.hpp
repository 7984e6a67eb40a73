#ifndef DRIFT_SIMULATION_HPP
#define DRIFT_SIMULATION_HPP

#include "PDRIFT.hpp"
#include "DriftConfig.hpp"
#include "ParticleEnsemble.hpp"
#include "EnvironmentSample.hpp"
#include "StepOrchestrator.hpp"
#include <fstream>
#include <memory>
#include <vector>

namespace PDRIFT {

/**
 * @brief Ensemble counts and moments, reduced over all ranks
 */
struct EnsembleStatistics {
    long num_total = 0;
    long num_active = 0;
    long num_stranded = 0;
    long num_retired = 0;
    double mean_age_active = 0.0;         ///< s, over active particles
    double mean_displacement = 0.0;       ///< m, horizontal, over all particles
    double mean_depth_active = 0.0;       ///< m, over active particles
};

/**
 * @brief Drift run driver
 *
 * Seeds particles, distributes them over the ranks of the communicator and
 * advances them with the step orchestrator:
 *
 *   sample environment -> apply fallbacks -> step -> output
 *
 * Each rank owns a disjoint slice of the ensemble; only statistics are
 * communicated.
 */
class DriftSimulation {
public:
    DriftSimulation(MPI_Comm comm);
    ~DriftSimulation();

    // Initialization
    PetscErrorCode initialize(const SimulationConfig& sim_config,
                              const DriftConfig& drift_config);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode setFieldSampler(std::shared_ptr<FieldSampler> field_sampler);
    PetscErrorCode seedParticles();
    void setOutputFile(const std::string& prefix) { config.output_file = prefix; }

    // Run simulation
    PetscErrorCode run();
    PetscErrorCode advance(StepReport& report);

    // Output
    PetscErrorCode writeTrajectories(int step);
    PetscErrorCode writeSummary();

    PetscErrorCode computeStatistics(EnsembleStatistics& stats) const;

    const ParticleEnsemble& getEnsemble() const { return ensemble; }
    ParticleEnsemble& getEnsemble() { return ensemble; }
    const DriftConfig& getDriftConfig() const { return drift_config; }
    const SimulationConfig& getSimulationConfig() const { return config; }
    double getTime() const { return current_time; }

private:
    MPI_Comm comm;
    int rank, size;

    SimulationConfig config;
    DriftConfig drift_config;
    DriftConfig step_config;      ///< drift_config with this rank's mixing seed

    ParticleEnsemble ensemble;
    EnvironmentSample env;
    std::shared_ptr<FieldSampler> sampler;
    std::unique_ptr<StepOrchestrator> orchestrator;

    std::vector<double> x0, y0;   ///< Seeding positions
    double current_time;
    std::ofstream trajectory_file;
};

} // namespace PDRIFT

#endif // DRIFT_SIMULATION_HPP
