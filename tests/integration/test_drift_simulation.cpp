/**
 * @file test_drift_simulation.cpp
 * @brief End-to-end drift runs through DriftSimulation
 */

#include <gtest/gtest.h>
#include "DriftSimulation.hpp"
#include "ConfigReader.hpp"
#include "PDRIFT.hpp"
#include <fstream>
#include <cmath>
#include <cstdio>
#include <string>

using namespace PDRIFT;

class DriftSimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        MPI_Comm_size(PETSC_COMM_WORLD, &size);

        sim_config.output_file = "test_drift_run";
        sim_config.write_trajectories = false;
        sim_config.time_step = 3600.0;
        sim_config.duration = 3600.0;
        sim_config.seed_number = 8;
        sim_config.seed_radius = 0.0;
        sim_config.seed_wind_drift_factor = 0.5;

        drift_config.verticaladvection = false;
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        std::remove((sim_config.output_file + "." + std::to_string(rank) + ".csv").c_str());
        if (rank == 0) {
            std::remove((sim_config.output_file + "_summary.txt").c_str());
            std::remove("test_drift_run.config");
        }
    }

    std::shared_ptr<UniformFieldSampler> calmSampler() {
        auto sampler = std::make_shared<UniformFieldSampler>();
        sampler->setCurrent(0.0, 0.0);
        sampler->setWind(0.0, 0.0);
        sampler->setSeaFloorDepth(100.0);
        sampler->setDiffusivity(0.01);
        return sampler;
    }

    int rank, size;
    SimulationConfig sim_config;
    DriftConfig drift_config;
};

TEST_F(DriftSimulationTest, SeedingDistributesParticles) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    sim_config.seed_radius = 500.0;
    sim_config.seed_number = 37;

    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);

    EnsembleStatistics stats;
    ASSERT_EQ(sim.computeStatistics(stats), 0);
    EXPECT_EQ(stats.num_total, 37);
    EXPECT_EQ(stats.num_active, 37);

    const auto& ens = sim.getEnsemble();
    for (std::size_t i = 0; i < ens.size(); ++i) {
        EXPECT_EQ(ens.id(i) % size, rank);
        EXPECT_LE(std::hypot(ens.x[i], ens.y[i]), 500.0 + 1e-9);
        EXPECT_DOUBLE_EQ(ens.windDriftFactor(i), 0.5);
    }
}

TEST_F(DriftSimulationTest, WindDriftOverOneHour) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    auto sampler = calmSampler();
    sampler->setWind(1.0, 0.0);

    ASSERT_EQ(sim.setFieldSampler(sampler), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    EnsembleStatistics stats;
    ASSERT_EQ(sim.computeStatistics(stats), 0);
    EXPECT_EQ(stats.num_active, 8);
    EXPECT_NEAR(stats.mean_displacement, 1800.0, 1e-6);
    EXPECT_NEAR(stats.mean_age_active, 3600.0, 1e-9);
    EXPECT_DOUBLE_EQ(sim.getTime(), 3600.0);
}

TEST_F(DriftSimulationTest, MaxAgeRetiresEnsemble) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    auto sampler = calmSampler();
    sampler->setWind(1.0, 0.0);
    drift_config.max_age_seconds = 1800.0;
    sim_config.duration = 4 * 3600.0;

    ASSERT_EQ(sim.setFieldSampler(sampler), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    EnsembleStatistics stats;
    ASSERT_EQ(sim.computeStatistics(stats), 0);
    EXPECT_EQ(stats.num_retired, 8);
    EXPECT_EQ(stats.num_active, 0);
    // Run stops once nothing is active
    EXPECT_DOUBLE_EQ(sim.getTime(), 3600.0);
}

TEST_F(DriftSimulationTest, CurrentCarriesParticlesOntoLand) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    auto sampler = calmSampler();
    sampler->setCurrent(0.5, 0.0);
    sampler->addLandBox(1000.0, 1e6, -1e6, 1e6);
    sim_config.seed_wind_drift_factor = 0.0;
    sim_config.duration = 2 * 3600.0;

    ASSERT_EQ(sim.setFieldSampler(sampler), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    EnsembleStatistics stats;
    ASSERT_EQ(sim.computeStatistics(stats), 0);
    EXPECT_EQ(stats.num_stranded, 8);
    EXPECT_EQ(stats.num_retired, 0);

    const auto& ens = sim.getEnsemble();
    for (std::size_t i = 0; i < ens.size(); ++i) {
        EXPECT_EQ(ens.status(i), ParticleStatus::STRANDED);
        EXPECT_EQ(ens.deactivationStep(i), 0);
        EXPECT_NEAR(ens.x[i], 1800.0, 1e-9);
    }
}

TEST_F(DriftSimulationTest, MixingKeepsParticlesInWaterColumn) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    auto sampler = calmSampler();
    sampler->setSeaFloorDepth(30.0);
    drift_config.turbulentmixing = true;
    drift_config.mixing.timestep = 60.0;
    drift_config.mixing.seed = 11;
    sim_config.seed_z = -10.0;
    sim_config.seed_number = 50;

    ASSERT_EQ(sim.setFieldSampler(sampler), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    const auto& ens = sim.getEnsemble();
    for (std::size_t i = 0; i < ens.size(); ++i) {
        EXPECT_LE(ens.z[i], 0.0);
        EXPECT_GE(ens.z[i], -30.0);
    }
}

TEST_F(DriftSimulationTest, MixingDiffersBetweenParticles) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    drift_config.turbulentmixing = true;
    drift_config.mixing.timestep = 60.0;
    drift_config.mixing.seed = 1234;
    sim_config.seed_z = -2.0;
    sim_config.seed_number = 2;
    sim_config.time_step = 1800.0;
    sim_config.duration = 1800.0;

    ASSERT_EQ(sim.setFieldSampler(calmSampler()), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    // Gather final depths by global id; ids 0 and 1 sit on different ranks
    // when run on two or more ranks
    double z[2] = {0.0, 0.0};
    const auto& ens = sim.getEnsemble();
    for (std::size_t i = 0; i < ens.size(); ++i) {
        z[ens.id(i)] = ens.z[i];
    }
    MPI_Allreduce(MPI_IN_PLACE, z, 2, MPI_DOUBLE, MPI_SUM, PETSC_COMM_WORLD);

    EXPECT_NE(z[0], z[1]);
    EXPECT_NE(z[0], -2.0);
}

TEST_F(DriftSimulationTest, WritesTrajectoryAndSummaryFiles) {
    DriftSimulation sim(PETSC_COMM_WORLD);
    sim_config.write_trajectories = true;
    sim_config.duration = 3 * 3600.0;

    ASSERT_EQ(sim.setFieldSampler(calmSampler()), 0);
    ASSERT_EQ(sim.initialize(sim_config, drift_config), 0);
    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);
    MPI_Barrier(PETSC_COMM_WORLD);

    std::ifstream csv(sim_config.output_file + "." + std::to_string(rank) + ".csv");
    ASSERT_TRUE(csv.is_open());
    std::string header;
    std::getline(csv, header);
    EXPECT_EQ(header, "step,time,id,x,y,z,age_seconds,status");

    int rows = 0;
    std::string line;
    while (std::getline(csv, line)) {
        if (!line.empty()) ++rows;
    }
    // Initial state plus three steps
    EXPECT_EQ(rows, 4 * static_cast<int>(sim.getEnsemble().size()));

    if (rank == 0) {
        std::ifstream summary(sim_config.output_file + "_summary.txt");
        EXPECT_TRUE(summary.is_open());
    }
}

TEST_F(DriftSimulationTest, InitializeFromConfigFile) {
    if (rank == 0) {
        std::ofstream config("test_drift_run.config");
        config << "[simulation]\n";
        config << "time_step = 600\n";
        config << "duration = 1800\n";
        config << "output_file = test_drift_run\n";
        config << "write_trajectories = false\n";
        config << "\n[seed]\n";
        config << "number = 4\n";
        config << "wind_drift_factor = 0.0\n";
        config << "\n[drift]\n";
        config << "scheme = runge-kutta\n";
        config << "max_age_seconds = none\n";
        config << "\n[processes]\n";
        config << "verticaladvection = false\n";
        config << "\n[environment]\n";
        config << "x_sea_water_velocity = 1.0\n";
        config.close();
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    DriftSimulation sim(PETSC_COMM_WORLD);
    ASSERT_EQ(sim.initializeFromConfigFile("test_drift_run.config"), 0);
    EXPECT_EQ(sim.getDriftConfig().scheme, AdvectionScheme::RUNGE_KUTTA);
    EXPECT_FALSE(sim.getDriftConfig().max_age_seconds.has_value());
    EXPECT_EQ(sim.getSimulationConfig().numSteps(), 3);

    ASSERT_EQ(sim.seedParticles(), 0);
    ASSERT_EQ(sim.run(), 0);

    EnsembleStatistics stats;
    ASSERT_EQ(sim.computeStatistics(stats), 0);
    EXPECT_EQ(stats.num_total, 4);
    EXPECT_NEAR(stats.mean_displacement, 1800.0, 1e-9);
}

TEST_F(DriftSimulationTest, RejectsInvalidConfiguration) {
    PetscPushErrorHandler(PetscIgnoreErrorHandler, nullptr);

    DriftSimulation sim(PETSC_COMM_WORLD);
    drift_config.mixing.timestep = 0.01;
    EXPECT_NE(sim.initialize(sim_config, drift_config), 0);

    drift_config.mixing.timestep = 1.0;
    sim_config.time_step = 0.0;
    EXPECT_NE(sim.initialize(sim_config, drift_config), 0);

    sim_config.time_step = 3600.0;
    sim_config.output_frequency = 0;
    EXPECT_NE(sim.initialize(sim_config, drift_config), 0);

    sim_config.output_frequency = 1;
    sim_config.time_step = 1e-3;
    sim_config.duration = 1e12;
    EXPECT_NE(sim.initialize(sim_config, drift_config), 0);

    EXPECT_NE(sim.initializeFromConfigFile("no_such_file.config"), 0);

    PetscPopErrorHandler();
}
