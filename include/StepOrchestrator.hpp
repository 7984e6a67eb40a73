#ifndef STEP_ORCHESTRATOR_HPP
#define STEP_ORCHESTRATOR_HPP

/**
 * @file StepOrchestrator.hpp
 * @brief Per-timestep update pipeline for the passive tracer drift model
 *
 * One call to StepOrchestrator::step() advances every active particle by dt
 * through a fixed sequence of stages:
 *
 *  1. age               age_seconds += dt
 *  2. ocean_current     horizontal advection by the current
 *  3. wind              wind drag, scaled by wind_drift_factor
 *  4. terminal_velocity recompute (only when mixing runs)
 *  5. turbulent_mixing  [processes] turbulentmixing
 *  6. vertical_advection [processes] verticaladvection
 *  7. stranding         land_binary_mask == 1 -> STRANDED
 *  8. retirement        age_seconds >= max_age_seconds -> RETIRED
 *
 * The set of particles updated is fixed at the start of the call. Stages 7
 * and 8 only deactivate particles that are still active, so a particle on
 * land past its maximum age is reported as stranded.
 */

#include "DriftConfig.hpp"
#include <vector>
#include <string>
#include <memory>
#include <cstddef>

namespace PDRIFT {

class ParticleEnsemble;
class EnvironmentSample;
class FieldSampler;
class TerminalVelocityModel;
class VerticalMixer;

/**
 * @brief State shared by the stages of one step
 */
struct StepContext {
    ParticleEnsemble& ensemble;
    const EnvironmentSample& env;
    const DriftConfig& config;
    double dt;
    const FieldSampler* sampler;          ///< Optional, for re-sampling after moves

    std::vector<std::size_t> active;      ///< Particles active at the start of the step

    // Bookkeeping
    std::size_t num_stranded = 0;
    std::size_t num_retired = 0;
    std::vector<std::string> stages_run;

    StepContext(ParticleEnsemble& ens, const EnvironmentSample& environment,
                const DriftConfig& cfg, double time_step, const FieldSampler* s);
};

/**
 * @brief Outcome of one step
 */
struct StepReport {
    int step = 0;                         ///< Index of the completed step
    std::size_t num_updated = 0;          ///< Particles active at the start
    std::size_t num_stranded = 0;         ///< Newly stranded
    std::size_t num_retired = 0;          ///< Newly retired
    std::vector<std::string> stages_run;
};

/**
 * @brief One named stage of the step pipeline
 */
class StepStage {
public:
    virtual ~StepStage() = default;

    virtual std::string name() const = 0;

    /// Evaluated once per step, before any stage runs
    virtual bool enabled(const DriftConfig& config) const { (void)config; return true; }

    virtual void apply(StepContext& ctx) = 0;
};

class AgeAccrualStage : public StepStage {
public:
    std::string name() const override { return "age"; }
    void apply(StepContext& ctx) override;
};

class CurrentAdvectionStage : public StepStage {
public:
    std::string name() const override { return "ocean_current"; }
    void apply(StepContext& ctx) override;
};

class WindAdvectionStage : public StepStage {
public:
    std::string name() const override { return "wind"; }
    void apply(StepContext& ctx) override;
};

class TerminalVelocityStage : public StepStage {
public:
    explicit TerminalVelocityStage(std::shared_ptr<const TerminalVelocityModel> model);

    std::string name() const override { return "terminal_velocity"; }
    bool enabled(const DriftConfig& config) const override { return config.turbulentmixing; }
    void apply(StepContext& ctx) override;

private:
    std::shared_ptr<const TerminalVelocityModel> model_;
};

class TurbulentMixingStage : public StepStage {
public:
    TurbulentMixingStage();
    ~TurbulentMixingStage() override;

    std::string name() const override { return "turbulent_mixing"; }
    bool enabled(const DriftConfig& config) const override { return config.turbulentmixing; }
    void apply(StepContext& ctx) override;

private:
    std::unique_ptr<VerticalMixer> mixer_;
    unsigned int seed_;
};

class VerticalAdvectionStage : public StepStage {
public:
    std::string name() const override { return "vertical_advection"; }
    bool enabled(const DriftConfig& config) const override { return config.verticaladvection; }
    void apply(StepContext& ctx) override;
};

/**
 * @brief Strand particles whose position after all moves is on land
 *
 * The land mask is re-evaluated at the new positions when a sampler is
 * available; otherwise the snapshot value is used.
 */
class LandDeactivationStage : public StepStage {
public:
    std::string name() const override { return "stranding"; }
    void apply(StepContext& ctx) override;
};

class AgeRetirementStage : public StepStage {
public:
    std::string name() const override { return "retirement"; }
    bool enabled(const DriftConfig& config) const override {
        return config.max_age_seconds.has_value();
    }
    void apply(StepContext& ctx) override;
};

/**
 * @brief Runs the stage pipeline on an ensemble
 */
class StepOrchestrator {
public:
    /// Passive tracer pipeline (terminal velocity = 0)
    StepOrchestrator();
    explicit StepOrchestrator(std::shared_ptr<const TerminalVelocityModel> terminal_velocity);
    ~StepOrchestrator();

    StepOrchestrator(const StepOrchestrator&) = delete;
    StepOrchestrator& operator=(const StepOrchestrator&) = delete;

    /**
     * @brief Advance all active particles by dt
     *
     * @param ensemble Updated in place
     * @param env Snapshot sampled at the pre-step positions, fallbacks applied
     * @param config Validated configuration
     * @param dt Step length (s), > 0
     * @param sampler Optional field sampler for midpoint and post-move lookups
     */
    StepReport step(ParticleEnsemble& ensemble,
                    const EnvironmentSample& env,
                    const DriftConfig& config,
                    double dt,
                    const FieldSampler* sampler = nullptr);

    std::vector<std::string> stageNames() const;
    std::vector<std::string> enabledStages(const DriftConfig& config) const;

private:
    std::vector<std::unique_ptr<StepStage>> stages_;
};

} // namespace PDRIFT

#endif // STEP_ORCHESTRATOR_HPP
