#include "EnvironmentSample.hpp"
#include "ParticleEnsemble.hpp"
#include "ConfigReader.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace PDRIFT {

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();

std::size_t replaceMissing(std::vector<double>& values, double fallback) {
    std::size_t count = 0;
    for (auto& v : values) {
        if (std::isnan(v)) {
            v = fallback;
            ++count;
        }
    }
    return count;
}
} // namespace

FieldValues::FieldValues()
    : x_sea_water_velocity(NaN),
      y_sea_water_velocity(NaN),
      x_wind(NaN),
      y_wind(NaN),
      upward_sea_water_velocity(NaN),
      sea_floor_depth_below_sea_level(NaN),
      land_binary_mask(NaN) {}

// ============================================================================
// UniformFieldSampler Implementation
// ============================================================================

UniformFieldSampler::UniformFieldSampler()
    : diffusivity_(NaN) {
    values_.land_binary_mask = 0.0;
}

void UniformFieldSampler::addLandBox(double xmin, double xmax,
                                     double ymin, double ymax) {
    if (xmin > xmax) std::swap(xmin, xmax);
    if (ymin > ymax) std::swap(ymin, ymax);
    land_boxes_.push_back({xmin, xmax, ymin, ymax});
}

void UniformFieldSampler::configure(const ConfigReader& reader) {
    const std::string sec = "environment";

    auto readOptional = [&](const std::string& key, double& target) {
        if (reader.hasKey(sec, key)) {
            target = reader.getDouble(sec, key, target);
        }
    };

    readOptional("x_sea_water_velocity", values_.x_sea_water_velocity);
    readOptional("y_sea_water_velocity", values_.y_sea_water_velocity);
    readOptional("x_wind", values_.x_wind);
    readOptional("y_wind", values_.y_wind);
    readOptional("upward_sea_water_velocity", values_.upward_sea_water_velocity);
    readOptional("sea_floor_depth_below_sea_level", values_.sea_floor_depth_below_sea_level);
    readOptional("ocean_vertical_diffusivity", diffusivity_);

    for (const auto& key : reader.getKeys(sec)) {
        if (key != "land_box" && key.rfind("land_box_", 0) != 0) continue;
        auto box = reader.getDoubleArray(sec, key);
        if (box.size() != 4) {
            std::cerr << "Warning: [" << sec << "]:" << key
                      << " needs 4 values (xmin, xmax, ymin, ymax), got "
                      << box.size() << std::endl;
            continue;
        }
        addLandBox(box[0], box[1], box[2], box[3]);
    }
}

bool UniformFieldSampler::isLand(double x, double y) const {
    for (const auto& b : land_boxes_) {
        if (x >= b[0] && x <= b[1] && y >= b[2] && y <= b[3]) {
            return true;
        }
    }
    return false;
}

FieldValues UniformFieldSampler::sample(double x, double y, double /*z*/) const {
    FieldValues v = values_;
    v.land_binary_mask = isLand(x, y) ? 1.0 : 0.0;
    return v;
}

std::vector<double> UniformFieldSampler::diffusivityProfile(
    double /*x*/, double /*y*/, const std::vector<double>& levels) const {
    return std::vector<double>(levels.size(), diffusivity_);
}

// ============================================================================
// EnvironmentSample Implementation
// ============================================================================

EnvironmentSample::EnvironmentSample()
    : profile_z_(defaultProfileLevels()) {}

std::vector<double> EnvironmentSample::defaultProfileLevels(double spacing) {
    if (spacing <= 0.0) {
        throw std::invalid_argument("Profile level spacing must be positive");
    }
    std::vector<double> levels;
    int n = static_cast<int>(std::ceil((PROFILE_Z_MAX - PROFILE_Z_MIN) / spacing));
    for (int k = 0; k <= n; ++k) {
        levels.push_back(std::max(PROFILE_Z_MAX - k * spacing, PROFILE_Z_MIN));
    }
    return levels;
}

void EnvironmentSample::resize(std::size_t n) {
    x_sea_water_velocity.assign(n, NaN);
    y_sea_water_velocity.assign(n, NaN);
    x_wind.assign(n, NaN);
    y_wind.assign(n, NaN);
    upward_sea_water_velocity.assign(n, NaN);
    sea_floor_depth_below_sea_level.assign(n, NaN);
    land_binary_mask.assign(n, NaN);
    ocean_vertical_diffusivity.assign(n, std::vector<double>(profile_z_.size(), NaN));
}

void EnvironmentSample::setProfileLevels(const std::vector<double>& levels) {
    if (levels.empty()) {
        throw std::invalid_argument("Diffusivity profile needs at least one level");
    }
    profile_z_ = levels;
    std::sort(profile_z_.begin(), profile_z_.end(), std::greater<double>());

    for (auto& profile : ocean_vertical_diffusivity) {
        profile.assign(profile_z_.size(), NaN);
    }
}

void EnvironmentSample::sample(const ParticleEnsemble& ensemble,
                               const FieldSampler& sampler) {
    resize(ensemble.size());

    for (std::size_t i = 0; i < ensemble.size(); ++i) {
        if (!ensemble.isActive(i)) continue;

        FieldValues v = sampler.sample(ensemble.x[i], ensemble.y[i], ensemble.z[i]);
        x_sea_water_velocity[i] = v.x_sea_water_velocity;
        y_sea_water_velocity[i] = v.y_sea_water_velocity;
        x_wind[i] = v.x_wind;
        y_wind[i] = v.y_wind;
        upward_sea_water_velocity[i] = v.upward_sea_water_velocity;
        sea_floor_depth_below_sea_level[i] = v.sea_floor_depth_below_sea_level;
        land_binary_mask[i] = v.land_binary_mask;

        auto profile = sampler.diffusivityProfile(ensemble.x[i], ensemble.y[i], profile_z_);
        if (profile.size() == profile_z_.size()) {
            ocean_vertical_diffusivity[i] = profile;
        }
    }
}

void EnvironmentSample::fill(const FieldValues& values, double diffusivity) {
    std::fill(x_sea_water_velocity.begin(), x_sea_water_velocity.end(), values.x_sea_water_velocity);
    std::fill(y_sea_water_velocity.begin(), y_sea_water_velocity.end(), values.y_sea_water_velocity);
    std::fill(x_wind.begin(), x_wind.end(), values.x_wind);
    std::fill(y_wind.begin(), y_wind.end(), values.y_wind);
    std::fill(upward_sea_water_velocity.begin(), upward_sea_water_velocity.end(),
              values.upward_sea_water_velocity);
    std::fill(sea_floor_depth_below_sea_level.begin(), sea_floor_depth_below_sea_level.end(),
              values.sea_floor_depth_below_sea_level);
    std::fill(land_binary_mask.begin(), land_binary_mask.end(), values.land_binary_mask);
    for (auto& profile : ocean_vertical_diffusivity) {
        profile.assign(profile_z_.size(), diffusivity);
    }
}

std::size_t EnvironmentSample::applyFallbacks() {
    std::size_t count = 0;
    count += replaceMissing(x_sea_water_velocity, Fallback::x_sea_water_velocity);
    count += replaceMissing(y_sea_water_velocity, Fallback::y_sea_water_velocity);
    count += replaceMissing(x_wind, Fallback::x_wind);
    count += replaceMissing(y_wind, Fallback::y_wind);
    count += replaceMissing(upward_sea_water_velocity, Fallback::upward_sea_water_velocity);
    count += replaceMissing(sea_floor_depth_below_sea_level,
                            Fallback::sea_floor_depth_below_sea_level);
    count += replaceMissing(land_binary_mask, Fallback::land_binary_mask);
    for (auto& profile : ocean_vertical_diffusivity) {
        count += replaceMissing(profile, Fallback::ocean_vertical_diffusivity);
    }
    return count;
}

double EnvironmentSample::diffusivityAt(std::size_t i, double z) const {
    const auto& K = ocean_vertical_diffusivity[i];
    if (K.empty() || K.size() != profile_z_.size()) {
        return Fallback::ocean_vertical_diffusivity;
    }

    if (z >= profile_z_.front()) return K.front();
    if (z <= profile_z_.back()) return K.back();

    for (std::size_t k = 0; k + 1 < profile_z_.size(); ++k) {
        double z_upper = profile_z_[k];
        double z_lower = profile_z_[k + 1];
        if (z <= z_upper && z >= z_lower) {
            double span = z_upper - z_lower;
            if (span <= 0.0) return K[k];
            double w = (z_upper - z) / span;
            return (1.0 - w) * K[k] + w * K[k + 1];
        }
    }
    return K.back();
}

} // namespace PDRIFT
