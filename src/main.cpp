#include "PDRIFT.hpp"
#include "DriftSimulation.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "pdrift - Lagrangian passive tracer drift simulator\n"
                    "Usage: pdrift_sim [options]\n\n"
                    "Options:\n"
                    "  -c <file>               Configuration file (.config)\n"
                    "  -o <file>               Output file prefix (overrides [simulation] output_file)\n"
                    "  -generate_config <file> Write a template configuration and exit\n\n"
                    "Examples:\n"
                    "  mpirun -np 4 pdrift_sim -c config/coastal_drift.config\n"
                    "  pdrift_sim -generate_config my_drift.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                PDRIFT::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
            }
            ierr = PetscFinalize();
            return 0;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);

        if (!config_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: pdrift_sim -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  pdrift - Lagrangian Passive Tracer Drift\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
        }

        try {
            PDRIFT::DriftSimulation sim(comm);

            ierr = sim.initializeFromConfigFile(config_file); CHKERRQ(ierr);

            if (output_provided) {
                sim.setOutputFile(output_file);
            }

            ierr = sim.seedParticles(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Starting simulation...\n");
                PetscPrintf(comm, "------------------------------------------------------------\n");
            }

            double start_time = MPI_Wtime();
            ierr = sim.run(); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Simulation completed successfully!\n");
                PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
                PetscPrintf(comm, "Output files written to: %s.*\n",
                            sim.getSimulationConfig().output_file.c_str());
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return ierr;
}
