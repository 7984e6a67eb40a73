#include "StepOrchestrator.hpp"
#include "ParticleEnsemble.hpp"
#include "EnvironmentSample.hpp"
#include "Advection.hpp"
#include "VerticalProcesses.hpp"
#include <stdexcept>
#include <sstream>
#include <utility>

namespace PDRIFT {

StepContext::StepContext(ParticleEnsemble& ens, const EnvironmentSample& environment,
                         const DriftConfig& cfg, double time_step, const FieldSampler* s)
    : ensemble(ens), env(environment), config(cfg), dt(time_step), sampler(s),
      active(ens.activeIndices()) {}

// ============================================================================
// Stages
// ============================================================================

void AgeAccrualStage::apply(StepContext& ctx) {
    for (std::size_t i : ctx.active) {
        ctx.ensemble.age_seconds[i] += ctx.dt;
    }
}

void CurrentAdvectionStage::apply(StepContext& ctx) {
    Advection::advectOceanCurrent(ctx.ensemble, ctx.active, ctx.env,
                                  ctx.config.scheme, ctx.dt, ctx.sampler);
}

void WindAdvectionStage::apply(StepContext& ctx) {
    Advection::advectWind(ctx.ensemble, ctx.active, ctx.env, ctx.dt);
}

TerminalVelocityStage::TerminalVelocityStage(std::shared_ptr<const TerminalVelocityModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("TerminalVelocityStage requires a terminal velocity model");
    }
}

void TerminalVelocityStage::apply(StepContext& ctx) {
    model_->update(ctx.ensemble, ctx.active);
}

TurbulentMixingStage::TurbulentMixingStage() : seed_(0) {}

TurbulentMixingStage::~TurbulentMixingStage() = default;

void TurbulentMixingStage::apply(StepContext& ctx) {
    const MixingConfig& mixing = ctx.config.mixing;

    // Created on first use so the configured seed applies
    if (!mixer_) {
        mixer_ = std::make_unique<VerticalMixer>(mixing.seed);
        seed_ = mixing.seed;
    } else if (mixing.seed != 0 && mixing.seed != seed_) {
        mixer_->reseed(mixing.seed);
        seed_ = mixing.seed;
    }

    mixer_->mix(ctx.ensemble, ctx.active, ctx.env, mixing, ctx.dt);
}

void VerticalAdvectionStage::apply(StepContext& ctx) {
    VerticalAdvection::advect(ctx.ensemble, ctx.active, ctx.env, ctx.dt);
}

void LandDeactivationStage::apply(StepContext& ctx) {
    auto& ens = ctx.ensemble;
    std::vector<bool> on_land(ens.size(), false);

    for (std::size_t i : ctx.active) {
        double mask = ctx.env.land_binary_mask[i];
        if (ctx.sampler) {
            mask = ctx.sampler->sample(ens.x[i], ens.y[i], ens.z[i]).land_binary_mask;
        }
        on_land[i] = (mask == 1.0);
    }

    ctx.num_stranded += ens.deactivate(on_land, ParticleStatus::STRANDED);
}

void AgeRetirementStage::apply(StepContext& ctx) {
    auto& ens = ctx.ensemble;
    const double max_age = *ctx.config.max_age_seconds;
    std::vector<bool> too_old(ens.size(), false);

    for (std::size_t i : ctx.active) {
        too_old[i] = ens.age_seconds[i] >= max_age;
    }

    ctx.num_retired += ens.deactivate(too_old, ParticleStatus::RETIRED);
}

// ============================================================================
// StepOrchestrator Implementation
// ============================================================================

StepOrchestrator::StepOrchestrator()
    : StepOrchestrator(std::make_shared<PassiveTracerVelocity>()) {}

StepOrchestrator::StepOrchestrator(std::shared_ptr<const TerminalVelocityModel> terminal_velocity) {
    stages_.push_back(std::make_unique<AgeAccrualStage>());
    stages_.push_back(std::make_unique<CurrentAdvectionStage>());
    stages_.push_back(std::make_unique<WindAdvectionStage>());
    stages_.push_back(std::make_unique<TerminalVelocityStage>(std::move(terminal_velocity)));
    stages_.push_back(std::make_unique<TurbulentMixingStage>());
    stages_.push_back(std::make_unique<VerticalAdvectionStage>());
    stages_.push_back(std::make_unique<LandDeactivationStage>());
    stages_.push_back(std::make_unique<AgeRetirementStage>());
}

StepOrchestrator::~StepOrchestrator() = default;

StepReport StepOrchestrator::step(ParticleEnsemble& ensemble,
                                  const EnvironmentSample& env,
                                  const DriftConfig& config,
                                  double dt,
                                  const FieldSampler* sampler) {
    if (!(dt > 0.0)) {
        std::ostringstream msg;
        msg << "Time step must be positive (got " << dt << ")";
        throw std::invalid_argument(msg.str());
    }
    if (env.size() != ensemble.size()) {
        std::ostringstream msg;
        msg << "Environment sample has " << env.size() << " entries for "
            << ensemble.size() << " particles";
        throw std::invalid_argument(msg.str());
    }

    StepContext ctx(ensemble, env, config, dt, sampler);

    // Gating is decided before any stage runs
    std::vector<StepStage*> pipeline;
    for (const auto& stage : stages_) {
        if (stage->enabled(config)) pipeline.push_back(stage.get());
    }

    if (!ctx.active.empty()) {
        for (StepStage* stage : pipeline) {
            stage->apply(ctx);
            ctx.stages_run.push_back(stage->name());
        }
    }

    StepReport report;
    report.step = ensemble.stepCounter();
    report.num_updated = ctx.active.size();
    report.num_stranded = ctx.num_stranded;
    report.num_retired = ctx.num_retired;
    report.stages_run = std::move(ctx.stages_run);

    ensemble.advanceStepCounter();
    return report;
}

std::vector<std::string> StepOrchestrator::stageNames() const {
    std::vector<std::string> names;
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

std::vector<std::string> StepOrchestrator::enabledStages(const DriftConfig& config) const {
    std::vector<std::string> names;
    for (const auto& stage : stages_) {
        if (stage->enabled(config)) names.push_back(stage->name());
    }
    return names;
}

} // namespace PDRIFT
