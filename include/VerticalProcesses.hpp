#ifndef VERTICAL_PROCESSES_HPP
#define VERTICAL_PROCESSES_HPP

/**
 * @file VerticalProcesses.hpp
 * @brief Vertical displacement of particles
 *
 * - Terminal (rise/settling) velocity models
 * - Turbulent mixing as a random walk in a depth-dependent diffusivity
 *   (Visser 1997)
 * - Advection with the upward sea water velocity
 *
 * Particles are kept in the water column: the sea surface (z = 0) and the
 * sea floor (z = -depth) bound all vertical moves.
 */

#include "DriftConfig.hpp"
#include <vector>
#include <random>
#include <cstddef>

namespace PDRIFT {

class ParticleEnsemble;
class EnvironmentSample;

/**
 * @brief Intrinsic vertical velocity of a particle type (m/s, positive up)
 */
class TerminalVelocityModel {
public:
    virtual ~TerminalVelocityModel() = default;

    virtual double terminalVelocity(const ParticleEnsemble& ensemble,
                                    std::size_t i) const = 0;

    /// Recompute terminal_velocity for the given particles
    void update(ParticleEnsemble& ensemble,
                const std::vector<std::size_t>& active) const;
};

/**
 * @brief Passive tracer: follows the water, no buoyancy or settling
 */
class PassiveTracerVelocity : public TerminalVelocityModel {
public:
    double terminalVelocity(const ParticleEnsemble&, std::size_t) const override {
        return 0.0;
    }
};

/**
 * @brief Random walk vertical mixing
 *
 * For each mixing sub-step of length dt_mix:
 *
 *   z' = z + K'(z) dt_mix + R sqrt(2 K(z + K'(z) dt_mix / 2) dt_mix / r) + w dt_mix
 *
 * with R uniform in [-1, 1], r = 1/3 its variance, K' the centred difference
 * of K over verticalresolution and w the terminal velocity. The number of
 * sub-steps is round(dt / timestep), at least one, and dt_mix = dt / n.
 */
class VerticalMixer {
public:
    /// seed = 0 draws a seed from std::random_device
    explicit VerticalMixer(unsigned int seed = 0);

    void reseed(unsigned int seed);

    /// Eddy diffusivity (m²/s) for particle i at depth z under the given model
    static double diffusivity(const EnvironmentSample& env, std::size_t i,
                              double z, DiffusivityModel model);

    /// Number of mixing sub-steps used for a step of length dt
    static int numSubsteps(double dt, const MixingConfig& config);

    void mix(ParticleEnsemble& ensemble,
             const std::vector<std::size_t>& active,
             const EnvironmentSample& env,
             const MixingConfig& config,
             double dt);

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> uniform_;
};

namespace VerticalAdvection {

    /**
     * @brief z += w * dt, bounded by the sea surface and the sea floor
     */
    void advect(ParticleEnsemble& ensemble,
                const std::vector<std::size_t>& active,
                const EnvironmentSample& env,
                double dt);

} // namespace VerticalAdvection

/// Keep z within [-sea_floor_depth, 0], reflecting at both boundaries
double reflectInWaterColumn(double z, double sea_floor_depth);

} // namespace PDRIFT

#endif // VERTICAL_PROCESSES_HPP
