#ifndef PARTICLE_ENSEMBLE_HPP
#define PARTICLE_ENSEMBLE_HPP

/**
 * @file ParticleEnsemble.hpp
 * @brief Passive tracer particle ensemble
 *
 * Structure-of-arrays storage for a homogeneous set of drifting particles.
 * The attribute set is fixed at compile time:
 * - position (x, y, z)
 * - age since seeding
 * - wind drift factor (fixed at seeding)
 * - terminal velocity (recomputed each step by the mixing stage)
 * - lifecycle status and the step at which the particle was deactivated
 *
 * Coordinates are projected metres; z is 0 at the sea surface and negative
 * downward.
 */

#include <vector>
#include <string>
#include <map>
#include <cstddef>

namespace PDRIFT {

/**
 * @brief Particle lifecycle status
 *
 * Transitions only ACTIVE -> (STRANDED | RETIRED), never back.
 */
enum class ParticleStatus {
    ACTIVE,         ///< Participates in all physical updates
    STRANDED,       ///< Reached land
    RETIRED         ///< Exceeded the maximum configured age
};

/// Lower-case name of a status ("active", "stranded", "retired")
std::string statusName(ParticleStatus status);

/// Inverse of statusName; throws std::invalid_argument for unknown names
ParticleStatus parseStatus(const std::string& name);

/**
 * @brief Ensemble of passive tracer particles
 *
 * Particle identity and indexing are stable: particles are only ever
 * appended by seeding and never removed or reordered. Deactivation flips
 * the status field in place.
 */
class ParticleEnsemble {
public:
    ParticleEnsemble();

    /**
     * @brief Append a particle
     *
     * @param x, y Horizontal position (m)
     * @param z Depth coordinate (m, <= 0)
     * @param wind_drift_factor Fraction of wind velocity applied, in [0, 1]
     * @param id Global identifier; -1 assigns the next local index
     * @return Index of the new particle
     */
    std::size_t addParticle(double x, double y, double z,
                            double wind_drift_factor, int id = -1);

    std::size_t size() const { return x.size(); }
    bool empty() const { return x.empty(); }

    bool isActive(std::size_t i) const { return status_[i] == ParticleStatus::ACTIVE; }
    std::size_t numActive() const;
    std::vector<std::size_t> activeIndices() const;

    ParticleStatus status(std::size_t i) const { return status_[i]; }
    const std::vector<ParticleStatus>& statuses() const { return status_; }

    /// Step index at which particle i left ACTIVE, -1 while active
    int deactivationStep(std::size_t i) const { return deactivation_step_[i]; }

    double windDriftFactor(std::size_t i) const { return wind_drift_factor_[i]; }
    const std::vector<double>& windDriftFactors() const { return wind_drift_factor_; }

    int id(std::size_t i) const { return id_[i]; }

    /**
     * @brief Deactivate every active particle selected by mask
     *
     * Particles that are already inactive keep their original reason and
     * deactivation step, so repeated calls are idempotent.
     *
     * @param mask One entry per particle
     * @param reason Status to assign (must not be ACTIVE)
     * @return Number of particles newly deactivated
     */
    std::size_t deactivate(const std::vector<bool>& mask, ParticleStatus reason);

    /// Number of completed steps; stamped onto deactivated particles
    int stepCounter() const { return step_counter_; }
    void advanceStepCounter() { ++step_counter_; }

    std::map<ParticleStatus, std::size_t> countByStatus() const;

    // Mutable physical state
    std::vector<double> x;                  ///< Horizontal position (m)
    std::vector<double> y;                  ///< Horizontal position (m)
    std::vector<double> z;                  ///< Vertical position (m, <= 0)
    std::vector<double> age_seconds;        ///< Time since seeding (s)
    std::vector<double> terminal_velocity;  ///< Rise (+) / settling (-) rate (m/s)

private:
    std::vector<double> wind_drift_factor_;
    std::vector<ParticleStatus> status_;
    std::vector<int> deactivation_step_;
    std::vector<int> id_;
    int step_counter_;
};

} // namespace PDRIFT

#endif // PARTICLE_ENSEMBLE_HPP
