#include "VerticalProcesses.hpp"
#include "ParticleEnsemble.hpp"
#include "EnvironmentSample.hpp"
#include <algorithm>
#include <cmath>

namespace PDRIFT {

namespace {
// Variance of R ~ U[-1, 1]
const double RANDOM_WALK_R = 1.0 / 3.0;

// Step function diffusivity
const double STEP_DEPTH = 20.0;
const double STEP_K_UPPER = 0.1;
const double STEP_K_LOWER = 0.02;

// Sundby (1983): K = a + b * W^2 within the mixed layer
const double SUNDBY_A = 76.1e-4;
const double SUNDBY_B = 2.26e-4;
const double SUNDBY_MIXED_LAYER_DEPTH = 50.0;
const double SUNDBY_K_BELOW = 0.02;

double seaFloorDepth(const EnvironmentSample& env, std::size_t i) {
    double H = env.sea_floor_depth_below_sea_level[i];
    if (std::isnan(H) || H <= 0.0) return Fallback::sea_floor_depth_below_sea_level;
    return H;
}
} // namespace

double reflectInWaterColumn(double z, double sea_floor_depth) {
    if (z > 0.0) z = -z;
    if (z < -sea_floor_depth) z = -2.0 * sea_floor_depth - z;
    return std::min(0.0, std::max(z, -sea_floor_depth));
}

// ============================================================================
// TerminalVelocityModel Implementation
// ============================================================================

void TerminalVelocityModel::update(ParticleEnsemble& ensemble,
                                   const std::vector<std::size_t>& active) const {
    for (std::size_t i : active) {
        ensemble.terminal_velocity[i] = terminalVelocity(ensemble, i);
    }
}

// ============================================================================
// VerticalMixer Implementation
// ============================================================================

VerticalMixer::VerticalMixer(unsigned int seed)
    : uniform_(-1.0, 1.0) {
    reseed(seed);
}

void VerticalMixer::reseed(unsigned int seed) {
    if (seed == 0) {
        std::random_device rd;
        rng_.seed(rd());
    } else {
        rng_.seed(seed);
    }
    uniform_.reset();
}

double VerticalMixer::diffusivity(const EnvironmentSample& env, std::size_t i,
                                  double z, DiffusivityModel model) {
    switch (model) {
        case DiffusivityModel::ENVIRONMENT:
            return env.diffusivityAt(i, z);
        case DiffusivityModel::CONSTANT:
            return env.diffusivityAt(i, PROFILE_Z_MAX);
        case DiffusivityModel::STEPFUNCTION:
            return (z > -STEP_DEPTH) ? STEP_K_UPPER : STEP_K_LOWER;
        case DiffusivityModel::WINDSPEED_SUNDBY1983: {
            double W = std::hypot(env.x_wind[i], env.y_wind[i]);
            if (std::isnan(W)) W = 0.0;
            return (z > -SUNDBY_MIXED_LAYER_DEPTH) ? SUNDBY_A + SUNDBY_B * W * W
                                                   : SUNDBY_K_BELOW;
        }
    }
    return Fallback::ocean_vertical_diffusivity;
}

int VerticalMixer::numSubsteps(double dt, const MixingConfig& config) {
    int n = static_cast<int>(std::round(std::abs(dt) / config.timestep));
    return std::max(1, n);
}

void VerticalMixer::mix(ParticleEnsemble& ensemble,
                        const std::vector<std::size_t>& active,
                        const EnvironmentSample& env,
                        const MixingConfig& config,
                        double dt) {
    if (active.empty()) return;

    const int ntimes = numSubsteps(dt, config);
    const double dt_mix = std::abs(dt) / ntimes;
    const double dz = config.verticalresolution;
    const auto model = config.diffusivitymodel;

    for (int n = 0; n < ntimes; ++n) {
        for (std::size_t i : active) {
            double z = ensemble.z[i];
            double H = seaFloorDepth(env, i);
            double w = ensemble.terminal_velocity[i];

            double dKdz = (diffusivity(env, i, z + 0.5 * dz, model) -
                           diffusivity(env, i, z - 0.5 * dz, model)) / dz;
            double K = diffusivity(env, i, z + 0.5 * dKdz * dt_mix, model);
            K = std::max(K, 0.0);

            double R = uniform_(rng_);
            z += dKdz * dt_mix
               + R * std::sqrt(2.0 * K * dt_mix / RANDOM_WALK_R)
               + w * dt_mix;

            ensemble.z[i] = reflectInWaterColumn(z, H);
        }
    }
}

// ============================================================================
// Vertical advection
// ============================================================================

namespace VerticalAdvection {

void advect(ParticleEnsemble& ensemble,
            const std::vector<std::size_t>& active,
            const EnvironmentSample& env,
            double dt) {
    for (std::size_t i : active) {
        double w = env.upward_sea_water_velocity[i];
        double H = seaFloorDepth(env, i);
        double z = ensemble.z[i] + w * dt;
        ensemble.z[i] = std::min(0.0, std::max(z, -H));
    }
}

} // namespace VerticalAdvection

} // namespace PDRIFT
