#include "DriftSimulation.hpp"
#include "ConfigReader.hpp"
#include <climits>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace PDRIFT {

namespace {
// Seeding positions are reproducible unless a mixing seed overrides this
const unsigned int DEFAULT_SEEDING_SEED = 42;
} // namespace

DriftSimulation::DriftSimulation(MPI_Comm comm_in)
    : comm(comm_in), rank(0), size(1),
      orchestrator(std::make_unique<StepOrchestrator>()),
      current_time(0.0) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

DriftSimulation::~DriftSimulation() {
    if (trajectory_file.is_open()) trajectory_file.close();
}

PetscErrorCode DriftSimulation::initialize(const SimulationConfig& sim_config,
                                           const DriftConfig& drift_cfg) {
    PetscFunctionBeginUser;

    auto errors = drift_cfg.checkRanges();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            PetscPrintf(comm, "Error: %s\n", err.c_str());
        }
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid drift configuration");
    }
    if (!(sim_config.time_step > 0.0)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Time step must be positive");
    }
    if (!(sim_config.duration >= 0.0) ||
        sim_config.duration / sim_config.time_step > static_cast<double>(INT_MAX)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Duration must be non-negative and span at most INT_MAX steps");
    }
    if (sim_config.output_frequency < 1) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Output frequency must be >= 1");
    }
    if (sim_config.seed_wind_drift_factor < 0.0 || sim_config.seed_wind_drift_factor > 1.0) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Seed wind_drift_factor must be in [0, 1]");
    }

    config = sim_config;
    drift_config = drift_cfg;

    // Each rank mixes its particles with its own random stream
    step_config = drift_cfg;
    step_config.mixing.seed = streamSeed(drift_cfg.mixing.seed, rank);
    current_time = 0.0;

    if (!sampler) {
        sampler = std::make_shared<UniformFieldSampler>();
    }

    if (rank == 0) {
        PetscPrintf(comm, "Configuration:\n");
        PetscPrintf(comm, "  Time step: %g s\n", config.time_step);
        PetscPrintf(comm, "  Duration: %g s (%.1f h, %d steps)\n", config.duration,
                    config.duration / SECONDS_PER_HOUR, config.numSteps());
        PetscPrintf(comm, "  Scheme: %s\n", schemeName(drift_config.scheme).c_str());
        if (drift_config.max_age_seconds) {
            PetscPrintf(comm, "  Max age: %g s\n", *drift_config.max_age_seconds);
        } else {
            PetscPrintf(comm, "  Max age: none\n");
        }
        PetscPrintf(comm, "  Turbulent mixing: %s\n", drift_config.turbulentmixing ? "on" : "off");
        if (drift_config.turbulentmixing) {
            PetscPrintf(comm, "    timestep = %g s, verticalresolution = %g m, diffusivitymodel = %s\n",
                        drift_config.mixing.timestep, drift_config.mixing.verticalresolution,
                        diffusivityModelName(drift_config.mixing.diffusivitymodel).c_str());
        }
        PetscPrintf(comm, "  Vertical advection: %s\n", drift_config.verticaladvection ? "on" : "off");
    }

    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    auto validation = reader.validate();
    if (rank == 0) {
        for (const auto& warning : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", warning.c_str());
        }
        for (const auto& error : validation.errors) {
            PetscPrintf(comm, "Error: %s\n", error.c_str());
        }
    }
    if (!validation.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid configuration file");
    }

    SimulationConfig sim_config;
    sim_config.config_file = config_file;
    reader.parseSimulationConfig(sim_config);

    DriftConfig drift_cfg;
    if (!reader.parseDriftConfig(drift_cfg)) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Failed to parse drift configuration");
    }

    auto uniform = std::make_shared<UniformFieldSampler>();
    uniform->configure(reader);
    ierr = setFieldSampler(uniform); CHKERRQ(ierr);

    ierr = initialize(sim_config, drift_cfg); CHKERRQ(ierr);

    if (rank == 0) {
        PetscPrintf(comm, "Configuration loaded successfully\n");
        if (uniform->numLandBoxes() > 0) {
            PetscPrintf(comm, "  Land boxes: %d\n", static_cast<int>(uniform->numLandBoxes()));
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::setFieldSampler(std::shared_ptr<FieldSampler> field_sampler) {
    PetscFunctionBeginUser;
    if (!field_sampler) {
        SETERRQ(comm, PETSC_ERR_ARG_NULL, "Field sampler must not be null");
    }
    sampler = std::move(field_sampler);
    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::seedParticles() {
    PetscFunctionBeginUser;

    if (config.seed_z > 0.0) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Seeding depth must be <= 0");
    }

    // Every rank draws the full sequence and keeps its own share
    unsigned int seed = drift_config.mixing.seed != 0 ? drift_config.mixing.seed
                                                      : DEFAULT_SEEDING_SEED;
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (int g = 0; g < config.seed_number; ++g) {
        double r = config.seed_radius * std::sqrt(unit(rng));
        double theta = 2.0 * M_PI * unit(rng);
        if (g % size != rank) continue;

        double px = config.seed_x + r * std::cos(theta);
        double py = config.seed_y + r * std::sin(theta);
        ensemble.addParticle(px, py, config.seed_z, config.seed_wind_drift_factor, g);
        x0.push_back(px);
        y0.push_back(py);
    }

    if (rank == 0) {
        PetscPrintf(comm, "Seeded %d particles (radius %g m around %g, %g; z = %g m)\n",
                    config.seed_number, config.seed_radius, config.seed_x, config.seed_y,
                    config.seed_z);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::advance(StepReport& report) {
    PetscFunctionBeginUser;

    env.sample(ensemble, *sampler);
    env.applyFallbacks();

    try {
        report = orchestrator->step(ensemble, env, step_config, config.time_step, sampler.get());
    } catch (const std::invalid_argument& e) {
        PetscPrintf(PETSC_COMM_SELF, "[%d] Error: %s\n", rank, e.what());
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_WRONG, "Step orchestrator rejected its input");
    }

    current_time += config.time_step;
    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (config.write_trajectories) {
        std::ostringstream name;
        name << config.output_file << "." << rank << ".csv";
        trajectory_file.open(name.str());
        if (!trajectory_file.is_open()) {
            SETERRQ(PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN, "Cannot open trajectory file");
        }
        trajectory_file << "step,time,id,x,y,z,age_seconds,status\n";
        ierr = writeTrajectories(0); CHKERRQ(ierr);
    }

    const int nsteps = config.numSteps();
    for (int step = 1; step <= nsteps; ++step) {
        StepReport report;
        ierr = advance(report); CHKERRQ(ierr);

        if (config.write_trajectories && step % config.output_frequency == 0) {
            ierr = writeTrajectories(step); CHKERRQ(ierr);
        }

        EnsembleStatistics stats;
        ierr = computeStatistics(stats); CHKERRQ(ierr);

        if (rank == 0) {
            PetscPrintf(comm, "Step %d, Time = %g s, active = %ld, stranded = %ld, retired = %ld\n",
                        step, current_time, stats.num_active, stats.num_stranded,
                        stats.num_retired);
        }

        if (stats.num_active == 0) {
            if (rank == 0) {
                PetscPrintf(comm, "All particles deactivated at step %d\n", step);
            }
            break;
        }
    }

    if (trajectory_file.is_open()) trajectory_file.close();

    ierr = writeSummary(); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::writeTrajectories(int step) {
    PetscFunctionBeginUser;

    if (!trajectory_file.is_open()) PetscFunctionReturn(0);

    trajectory_file << std::setprecision(10);
    for (std::size_t i = 0; i < ensemble.size(); ++i) {
        trajectory_file << step << "," << current_time << ","
                        << ensemble.id(i) << ","
                        << ensemble.x[i] << "," << ensemble.y[i] << "," << ensemble.z[i] << ","
                        << ensemble.age_seconds[i] << ","
                        << statusName(ensemble.status(i)) << "\n";
    }

    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::computeStatistics(EnsembleStatistics& stats) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    long counts[4] = {0, 0, 0, 0};
    double sums[3] = {0.0, 0.0, 0.0};   // age (active), displacement (all), depth (active)

    auto by_status = ensemble.countByStatus();
    counts[0] = static_cast<long>(ensemble.size());
    counts[1] = static_cast<long>(by_status[ParticleStatus::ACTIVE]);
    counts[2] = static_cast<long>(by_status[ParticleStatus::STRANDED]);
    counts[3] = static_cast<long>(by_status[ParticleStatus::RETIRED]);

    for (std::size_t i = 0; i < ensemble.size(); ++i) {
        if (i < x0.size()) {
            sums[1] += std::hypot(ensemble.x[i] - x0[i], ensemble.y[i] - y0[i]);
        }
        if (ensemble.isActive(i)) {
            sums[0] += ensemble.age_seconds[i];
            sums[2] += ensemble.z[i];
        }
    }

    ierr = MPI_Allreduce(MPI_IN_PLACE, counts, 4, MPI_LONG, MPI_SUM, comm); CHKERRMPI(ierr);
    ierr = MPI_Allreduce(MPI_IN_PLACE, sums, 3, MPI_DOUBLE, MPI_SUM, comm); CHKERRMPI(ierr);

    stats.num_total = counts[0];
    stats.num_active = counts[1];
    stats.num_stranded = counts[2];
    stats.num_retired = counts[3];
    stats.mean_age_active = counts[1] > 0 ? sums[0] / counts[1] : 0.0;
    stats.mean_displacement = counts[0] > 0 ? sums[1] / counts[0] : 0.0;
    stats.mean_depth_active = counts[1] > 0 ? sums[2] / counts[1] : 0.0;

    PetscFunctionReturn(0);
}

PetscErrorCode DriftSimulation::writeSummary() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    EnsembleStatistics stats;
    ierr = computeStatistics(stats); CHKERRQ(ierr);

    if (rank == 0) {
        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "Drift Simulation Summary\n");
        PetscPrintf(comm, "  Time: %g s\n", current_time);
        PetscPrintf(comm, "  Particles: %ld (active %ld, stranded %ld, retired %ld)\n",
                    stats.num_total, stats.num_active, stats.num_stranded, stats.num_retired);
        PetscPrintf(comm, "  Mean age (active): %g s\n", stats.mean_age_active);
        PetscPrintf(comm, "  Mean depth (active): %g m\n", stats.mean_depth_active);
        PetscPrintf(comm, "  Mean horizontal displacement: %g m\n", stats.mean_displacement);

        std::ofstream file(config.output_file + "_summary.txt");
        if (!file.is_open()) {
            SETERRQ(PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN, "Cannot open summary file");
        }

        file << "Drift Simulation Summary\n";
        file << "========================\n\n";
        file << "Time: " << current_time << " s\n";
        file << "Scheme: " << schemeName(drift_config.scheme) << "\n";
        file << "Turbulent mixing: " << (drift_config.turbulentmixing ? "on" : "off") << "\n";
        file << "Vertical advection: " << (drift_config.verticaladvection ? "on" : "off") << "\n\n";
        file << "Particles: " << stats.num_total << "\n";
        file << "  active: " << stats.num_active << "\n";
        file << "  stranded: " << stats.num_stranded << "\n";
        file << "  retired: " << stats.num_retired << "\n\n";
        file << "Mean age (active): " << stats.mean_age_active << " s\n";
        file << "Mean depth (active): " << stats.mean_depth_active << " m\n";
        file << "Mean horizontal displacement: " << stats.mean_displacement << " m\n";
        file.close();
    }

    PetscFunctionReturn(0);
}

} // namespace PDRIFT
