/**
 * @file test_vertical_processes.cpp
 * @brief Unit tests for turbulent mixing, vertical advection and
 *        diffusivity models
 */

#include <gtest/gtest.h>
#include "VerticalProcesses.hpp"
#include "EnvironmentSample.hpp"
#include "ParticleEnsemble.hpp"
#include <cmath>

using namespace PDRIFT;

class VerticalProcessesTest : public ::testing::Test {
protected:
    void SetUp() override {
        env.resize(1);
        env.applyFallbacks();
        env.sea_floor_depth_below_sea_level[0] = 50.0;
    }

    EnvironmentSample env;
    MixingConfig mixing;
};

TEST_F(VerticalProcessesTest, ReflectAtBoundaries) {
    EXPECT_DOUBLE_EQ(reflectInWaterColumn(-10.0, 50.0), -10.0);
    EXPECT_DOUBLE_EQ(reflectInWaterColumn(0.5, 50.0), -0.5);
    EXPECT_DOUBLE_EQ(reflectInWaterColumn(-52.0, 50.0), -48.0);
    EXPECT_DOUBLE_EQ(reflectInWaterColumn(-200.0, 50.0), 0.0);
}

TEST_F(VerticalProcessesTest, SubstepCount) {
    mixing.timestep = 60.0;
    EXPECT_EQ(VerticalMixer::numSubsteps(3600.0, mixing), 60);
    EXPECT_EQ(VerticalMixer::numSubsteps(90.0, mixing), 2);
    EXPECT_EQ(VerticalMixer::numSubsteps(10.0, mixing), 1);
}

TEST_F(VerticalProcessesTest, StepFunctionDiffusivity) {
    EXPECT_DOUBLE_EQ(VerticalMixer::diffusivity(env, 0, -5.0, DiffusivityModel::STEPFUNCTION), 0.1);
    EXPECT_DOUBLE_EQ(VerticalMixer::diffusivity(env, 0, -25.0, DiffusivityModel::STEPFUNCTION), 0.02);
}

TEST_F(VerticalProcessesTest, SundbyDiffusivityDependsOnWindSpeed) {
    env.x_wind[0] = 6.0;
    env.y_wind[0] = 8.0;

    double K = VerticalMixer::diffusivity(env, 0, -10.0, DiffusivityModel::WINDSPEED_SUNDBY1983);
    EXPECT_NEAR(K, 76.1e-4 + 2.26e-4 * 100.0, 1e-12);

    double K_deep = VerticalMixer::diffusivity(env, 0, -60.0, DiffusivityModel::WINDSPEED_SUNDBY1983);
    EXPECT_DOUBLE_EQ(K_deep, 0.02);
}

TEST_F(VerticalProcessesTest, ConstantModelUsesSurfaceValue) {
    auto& profile = env.ocean_vertical_diffusivity[0];
    for (std::size_t k = 0; k < profile.size(); ++k) {
        profile[k] = 0.05 - 0.0004 * static_cast<double>(k);
    }

    EXPECT_DOUBLE_EQ(VerticalMixer::diffusivity(env, 0, -80.0, DiffusivityModel::CONSTANT), 0.05);
    EXPECT_LT(VerticalMixer::diffusivity(env, 0, -80.0, DiffusivityModel::ENVIRONMENT), 0.05);
}

TEST_F(VerticalProcessesTest, MixingIsReproducibleWithSeed) {
    ParticleEnsemble a, b;
    for (int i = 0; i < 10; ++i) {
        a.addParticle(0.0, 0.0, -10.0, 0.0);
        b.addParticle(0.0, 0.0, -10.0, 0.0);
    }
    EnvironmentSample e;
    e.resize(10);
    e.applyFallbacks();

    VerticalMixer mixer_a(2024), mixer_b(2024);
    mixer_a.mix(a, a.activeIndices(), e, mixing, 60.0);
    mixer_b.mix(b, b.activeIndices(), e, mixing, 60.0);

    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.z[i], b.z[i]);
    }
}

TEST_F(VerticalProcessesTest, MixingStaysInWaterColumn) {
    ParticleEnsemble ens;
    for (int i = 0; i < 100; ++i) ens.addParticle(0.0, 0.0, -1.0 * (i % 5), 0.0);
    EnvironmentSample e;
    e.resize(ens.size());
    e.applyFallbacks();
    for (auto& H : e.sea_floor_depth_below_sea_level) H = 5.0;
    for (auto& profile : e.ocean_vertical_diffusivity) profile.assign(profile.size(), 0.5);

    VerticalMixer mixer(99);
    mixing.timestep = 5.0;
    mixer.mix(ens, ens.activeIndices(), e, mixing, 3600.0);

    for (std::size_t i = 0; i < ens.size(); ++i) {
        EXPECT_LE(ens.z[i], 0.0);
        EXPECT_GE(ens.z[i], -5.0);
    }
}

TEST_F(VerticalProcessesTest, ZeroDiffusivityMovesWithTerminalVelocityOnly) {
    ParticleEnsemble ens;
    ens.addParticle(0.0, 0.0, -20.0, 0.0);
    ens.terminal_velocity[0] = 0.002;
    env.ocean_vertical_diffusivity[0].assign(env.profileLevels().size(), 0.0);

    VerticalMixer mixer(1);
    mixing.timestep = 100.0;
    mixer.mix(ens, ens.activeIndices(), env, mixing, 1000.0);

    EXPECT_NEAR(ens.z[0], -18.0, 1e-9);
}

TEST_F(VerticalProcessesTest, PassiveTracerHasNoTerminalVelocity) {
    ParticleEnsemble ens;
    ens.addParticle(0.0, 0.0, -1.0, 0.0);
    ens.terminal_velocity[0] = 0.7;

    PassiveTracerVelocity model;
    model.update(ens, ens.activeIndices());

    EXPECT_DOUBLE_EQ(ens.terminal_velocity[0], 0.0);
}

TEST_F(VerticalProcessesTest, VerticalAdvectionClampsToSeaFloor) {
    ParticleEnsemble ens;
    ens.addParticle(0.0, 0.0, -45.0, 0.0);
    env.upward_sea_water_velocity[0] = -0.01;

    VerticalAdvection::advect(ens, ens.activeIndices(), env, 1000.0);

    EXPECT_DOUBLE_EQ(ens.z[0], -50.0);
}
