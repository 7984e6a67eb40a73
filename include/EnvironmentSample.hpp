#ifndef ENVIRONMENT_SAMPLE_HPP
#define ENVIRONMENT_SAMPLE_HPP

/**
 * @file EnvironmentSample.hpp
 * @brief Per-step environment snapshot at particle positions
 *
 * The drift model needs, at every particle position:
 * - horizontal sea water velocity (x, y)
 * - 10 m wind (x, y)
 * - upward sea water velocity
 * - vertical diffusivity profile over [-120, 0] m
 * - sea floor depth below sea level
 * - land binary mask
 *
 * A FieldSampler evaluates these at arbitrary points. EnvironmentSample holds
 * one snapshot per particle, taken before the step, and is read-only to the
 * step orchestrator. Values a sampler cannot provide are stored as NaN and
 * replaced by fixed fallbacks in applyFallbacks().
 */

#include <vector>
#include <array>
#include <string>
#include <cstddef>

namespace PDRIFT {

class ParticleEnsemble;
class ConfigReader;

/**
 * @brief Fallback values used when a field is unavailable at a position
 */
namespace Fallback {
    constexpr double x_sea_water_velocity = 0.0;
    constexpr double y_sea_water_velocity = 0.0;
    constexpr double x_wind = 0.0;
    constexpr double y_wind = 0.0;
    constexpr double upward_sea_water_velocity = 0.0;
    constexpr double ocean_vertical_diffusivity = 0.02;          ///< m²/s
    constexpr double sea_floor_depth_below_sea_level = 10000.0;  ///< m
    constexpr double land_binary_mask = 0.0;
}

/// Depth range (m) covered by the vertical diffusivity profile
constexpr double PROFILE_Z_MIN = -120.0;
constexpr double PROFILE_Z_MAX = 0.0;

/**
 * @brief Point values of all scalar environment fields
 */
struct FieldValues {
    double x_sea_water_velocity;
    double y_sea_water_velocity;
    double x_wind;
    double y_wind;
    double upward_sea_water_velocity;
    double sea_floor_depth_below_sea_level;
    double land_binary_mask;

    FieldValues();
};

/**
 * @brief Evaluates environment fields at arbitrary positions
 */
class FieldSampler {
public:
    virtual ~FieldSampler() = default;

    /// Scalar fields at (x, y, z); NaN marks an unavailable field
    virtual FieldValues sample(double x, double y, double z) const = 0;

    /// Vertical diffusivity (m²/s) at each of the given depth levels
    virtual std::vector<double> diffusivityProfile(
        double x, double y, const std::vector<double>& levels) const = 0;
};

/**
 * @brief Spatially uniform fields with optional rectangular land areas
 */
class UniformFieldSampler : public FieldSampler {
public:
    UniformFieldSampler();

    void setCurrent(double u, double v) { values_.x_sea_water_velocity = u; values_.y_sea_water_velocity = v; }
    void setWind(double u, double v) { values_.x_wind = u; values_.y_wind = v; }
    void setVerticalVelocity(double w) { values_.upward_sea_water_velocity = w; }
    void setSeaFloorDepth(double depth) { values_.sea_floor_depth_below_sea_level = depth; }
    void setDiffusivity(double K) { diffusivity_ = K; }

    /// Mark [xmin, xmax] x [ymin, ymax] as land
    void addLandBox(double xmin, double xmax, double ymin, double ymax);

    /**
     * @brief Read values from the [environment] section
     *
     * Keys match the CF standard names of the fields; land areas are given
     * as land_box or land_box_<suffix> = xmin, xmax, ymin, ymax. Suffixes
     * need not be contiguous.
     */
    void configure(const ConfigReader& reader);

    FieldValues sample(double x, double y, double z) const override;
    std::vector<double> diffusivityProfile(
        double x, double y, const std::vector<double>& levels) const override;

    bool isLand(double x, double y) const;
    std::size_t numLandBoxes() const { return land_boxes_.size(); }

private:
    FieldValues values_;
    double diffusivity_;
    std::vector<std::array<double, 4>> land_boxes_;
};

/**
 * @brief Environment snapshot, one entry per particle
 */
class EnvironmentSample {
public:
    EnvironmentSample();

    /// Evenly spaced levels from PROFILE_Z_MAX down to PROFILE_Z_MIN
    static std::vector<double> defaultProfileLevels(double spacing = 1.0);

    /// Resize all per-particle arrays to n, marking every value unavailable
    void resize(std::size_t n);
    std::size_t size() const { return land_binary_mask.size(); }

    void setProfileLevels(const std::vector<double>& levels);
    const std::vector<double>& profileLevels() const { return profile_z_; }

    /**
     * @brief Fill the snapshot from a sampler at current particle positions
     *
     * Only active particles are sampled; entries for inactive particles are
     * left unavailable and later take fallback values.
     */
    void sample(const ParticleEnsemble& ensemble, const FieldSampler& sampler);

    /// Set every particle to the same values and a depth-uniform diffusivity
    void fill(const FieldValues& values, double diffusivity);

    /**
     * @brief Replace unavailable (NaN) values with the fallback table
     * @return Number of values replaced
     */
    std::size_t applyFallbacks();

    /// Diffusivity for particle i at depth z, linear in depth and clamped to the profile range
    double diffusivityAt(std::size_t i, double z) const;

    std::vector<double> x_sea_water_velocity;
    std::vector<double> y_sea_water_velocity;
    std::vector<double> x_wind;
    std::vector<double> y_wind;
    std::vector<double> upward_sea_water_velocity;
    std::vector<double> sea_floor_depth_below_sea_level;
    std::vector<double> land_binary_mask;
    std::vector<std::vector<double>> ocean_vertical_diffusivity;  ///< [particle][level]

private:
    std::vector<double> profile_z_;  ///< Descending: 0 first, deepest last
};

} // namespace PDRIFT

#endif // ENVIRONMENT_SAMPLE_HPP
