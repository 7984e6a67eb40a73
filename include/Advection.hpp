#ifndef ADVECTION_HPP
#define ADVECTION_HPP

/**
 * @file Advection.hpp
 * @brief Horizontal displacement of particles by ocean current and wind drag
 *
 * Both routines read velocities from the pre-step environment snapshot, so
 * applying them one after the other adds the two displacements computed at
 * the same starting position.
 */

#include "DriftConfig.hpp"
#include <vector>
#include <cstddef>

namespace PDRIFT {

class ParticleEnsemble;
class EnvironmentSample;
class FieldSampler;

namespace Advection {

    /**
     * @brief Move particles with the ambient horizontal current
     *
     * EULER:       x += u(x0) * dt
     * RUNGE_KUTTA: x += u(x0 + u(x0) * dt / 2) * dt, with the midpoint
     *              velocity taken from the sampler. Without a sampler the
     *              midpoint cannot be evaluated and EULER is used.
     *
     * @param active Indices of the particles to move
     */
    void advectOceanCurrent(ParticleEnsemble& ensemble,
                            const std::vector<std::size_t>& active,
                            const EnvironmentSample& env,
                            AdvectionScheme scheme,
                            double dt,
                            const FieldSampler* sampler = nullptr);

    /**
     * @brief Move particles by wind drag: x += wind_drift_factor * wind * dt
     */
    void advectWind(ParticleEnsemble& ensemble,
                    const std::vector<std::size_t>& active,
                    const EnvironmentSample& env,
                    double dt);

} // namespace Advection

} // namespace PDRIFT

#endif // ADVECTION_HPP
