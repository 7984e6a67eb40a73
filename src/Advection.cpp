#include "Advection.hpp"
#include "ParticleEnsemble.hpp"
#include "EnvironmentSample.hpp"
#include <cmath>

namespace PDRIFT {
namespace Advection {

namespace {
double orFallback(double value, double fallback) {
    return std::isnan(value) ? fallback : value;
}
} // namespace

void advectOceanCurrent(ParticleEnsemble& ensemble,
                        const std::vector<std::size_t>& active,
                        const EnvironmentSample& env,
                        AdvectionScheme scheme,
                        double dt,
                        const FieldSampler* sampler) {
    bool midpoint = (scheme == AdvectionScheme::RUNGE_KUTTA) && sampler != nullptr;

    for (std::size_t i : active) {
        double u = env.x_sea_water_velocity[i];
        double v = env.y_sea_water_velocity[i];

        if (midpoint) {
            double xm = ensemble.x[i] + 0.5 * u * dt;
            double ym = ensemble.y[i] + 0.5 * v * dt;
            FieldValues mid = sampler->sample(xm, ym, ensemble.z[i]);
            u = orFallback(mid.x_sea_water_velocity, Fallback::x_sea_water_velocity);
            v = orFallback(mid.y_sea_water_velocity, Fallback::y_sea_water_velocity);
        }

        ensemble.x[i] += u * dt;
        ensemble.y[i] += v * dt;
    }
}

void advectWind(ParticleEnsemble& ensemble,
                const std::vector<std::size_t>& active,
                const EnvironmentSample& env,
                double dt) {
    for (std::size_t i : active) {
        double factor = ensemble.windDriftFactor(i);
        ensemble.x[i] += factor * env.x_wind[i] * dt;
        ensemble.y[i] += factor * env.y_wind[i] * dt;
    }
}

} // namespace Advection
} // namespace PDRIFT
