#include "ParticleEnsemble.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace PDRIFT {

std::string statusName(ParticleStatus status) {
    switch (status) {
        case ParticleStatus::ACTIVE: return "active";
        case ParticleStatus::STRANDED: return "stranded";
        case ParticleStatus::RETIRED: return "retired";
    }
    return "unknown";
}

ParticleStatus parseStatus(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "active") return ParticleStatus::ACTIVE;
    if (lower == "stranded") return ParticleStatus::STRANDED;
    if (lower == "retired") return ParticleStatus::RETIRED;

    throw std::invalid_argument("Unknown particle status: " + name);
}

// ============================================================================
// ParticleEnsemble Implementation
// ============================================================================

ParticleEnsemble::ParticleEnsemble() : step_counter_(0) {}

std::size_t ParticleEnsemble::addParticle(double px, double py, double pz,
                                          double wind_drift_factor, int pid) {
    if (wind_drift_factor < 0.0 || wind_drift_factor > 1.0) {
        throw std::invalid_argument("wind_drift_factor must be in [0, 1]");
    }

    std::size_t index = size();
    x.push_back(px);
    y.push_back(py);
    z.push_back(std::min(pz, 0.0));
    age_seconds.push_back(0.0);
    terminal_velocity.push_back(0.0);

    wind_drift_factor_.push_back(wind_drift_factor);
    status_.push_back(ParticleStatus::ACTIVE);
    deactivation_step_.push_back(-1);
    id_.push_back(pid >= 0 ? pid : static_cast<int>(index));

    return index;
}

std::size_t ParticleEnsemble::numActive() const {
    return static_cast<std::size_t>(
        std::count(status_.begin(), status_.end(), ParticleStatus::ACTIVE));
}

std::vector<std::size_t> ParticleEnsemble::activeIndices() const {
    std::vector<std::size_t> indices;
    indices.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) {
        if (isActive(i)) indices.push_back(i);
    }
    return indices;
}

std::size_t ParticleEnsemble::deactivate(const std::vector<bool>& mask,
                                         ParticleStatus reason) {
    if (reason == ParticleStatus::ACTIVE) {
        throw std::invalid_argument("Cannot deactivate with status 'active'");
    }
    if (mask.size() != size()) {
        throw std::invalid_argument("Deactivation mask size does not match ensemble size");
    }

    std::size_t count = 0;
    for (std::size_t i = 0; i < size(); ++i) {
        // First writer wins
        if (mask[i] && isActive(i)) {
            status_[i] = reason;
            deactivation_step_[i] = step_counter_;
            ++count;
        }
    }
    return count;
}

std::map<ParticleStatus, std::size_t> ParticleEnsemble::countByStatus() const {
    std::map<ParticleStatus, std::size_t> counts;
    counts[ParticleStatus::ACTIVE] = 0;
    counts[ParticleStatus::STRANDED] = 0;
    counts[ParticleStatus::RETIRED] = 0;
    for (auto s : status_) {
        counts[s]++;
    }
    return counts;
}

} // namespace PDRIFT
