#ifndef POINT_SOURCE_GAS_DIFFUSION_HPP
#define POINT_SOURCE_GAS_DIFFUSION_HPP

#include "AtmosphericDispersion.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace HAZCON {

/**
 * @brief Region above one target concentration
 *
 * The region is approximated by an ellipse along the downwind axis. All
 * fields are absent when the target is not below the axis maximum.
 */
struct ConcentrationRegion {
    double target = 0.0;                   ///< Target concentration [mg/m^3]
    std::optional<double> semi_major;      ///< Half the downwind extent [m]
    std::optional<double> semi_minor;      ///< Crosswind half-width [m]
    std::optional<double> start;           ///< Nearest downwind distance [m]
    std::optional<double> end;             ///< Farthest downwind distance [m]

    bool bounded() const { return semi_major.has_value(); }
};

/**
 * @brief Result of a downwind distribution search
 */
struct ConcentrationDistribution {
    std::vector<ConcentrationRegion> regions;   ///< One per requested target, same order
    double peak_distance = 0.0;                 ///< Where the axis maximum occurs [m]
    double peak_concentration = 0.0;            ///< Axis maximum [mg/m^3]

    /// (distance, concentration) samples; filled only on request
    std::vector<std::pair<double, double>> axis_profile;
};

/**
 * @brief Continuous point release, steady Gaussian plume with ground reflection
 *
 * Environment parameters, in addition to those of GasDiffusionModel:
 *   - source_strength [mg/s]
 *
 * With Q the source strength, u the wind speed and H the effective source
 * height, the concentration at (x, y, z) is
 *
 *   C = Q / (2 pi u sy sz) exp(-y^2 / 2sy^2)
 *       [exp(-(z-H)^2 / 2sz^2) + exp(-(z+H)^2 / 2sz^2)]
 *
 * and reduces to simpler forms when y, z or H vanish.
 */
class PointSourceGasDiffusion : public GasDiffusionModel {
public:
    PointSourceGasDiffusion(const std::string& material,
                            const ParameterList& material_params,
                            const ParameterList& environment_params,
                            const std::string& start_datetime = "");

    ModelType getType() const override { return ModelType::POINT_SOURCE_GAS_DIFFUSION; }

    /**
     * @brief Emission rate [mg/s]; std::nullopt unless supplied and positive
     */
    std::optional<double> sourceStrength() const;

    /**
     * @brief Concentration at a receptor [mg/m^3]
     *
     * @param point Receptor position, used when no downwind distance is given
     * @param downwind_distance Distance along the wind [m]
     * @param crosswind_offset Distance from the plume axis [m], >= 0
     * @param ground_height Receptor height [m], >= 0
     * @param source_height Effective source height [m], >= 0
     * @param keep Record the value in the result log
     * @return Concentration; values below 1e-6 are reported as 0
     * @throws ComputationError if a dispersion width is zero
     */
    double concentrationAt(const std::optional<GeoPoint>& point,
                           std::optional<double> downwind_distance,
                           double crosswind_offset = 0.0,
                           double ground_height = 0.0,
                           double source_height = 0.0,
                           bool keep = true);

    /// Concentration at a downwind distance
    double concentrationAt(double downwind_distance,
                           double crosswind_offset = 0.0,
                           double ground_height = 0.0,
                           double source_height = 0.0) {
        return concentrationAt(std::nullopt, downwind_distance,
                               crosswind_offset, ground_height, source_height);
    }

    /**
     * @brief Crosswind half-width at which a target concentration is reached [m]
     *
     * Inverts the plume cross-section for the mass W = Q t released after
     * @p elapsed_time seconds. Returns 0 when the target is not reached at
     * that distance.
     *
     * @param concentration Target concentration [mg/m^3], >= 0
     * @param elapsed_time Time since release start [s], > 0
     * @param downwind_distance Distance along the wind [m]
     * @param source_height Effective source height [m]
     * @throws ComputationError if the target concentration is zero
     */
    double verticalExtentFor(double concentration, double elapsed_time,
                             double downwind_distance, double source_height = 0.0);

    /**
     * @brief Regions above target concentrations along the downwind axis
     *
     * Samples the axis from 0 to ceil(u t) every @p step metres, locates the
     * maximum, and bounds the samples at or above each target below it.
     *
     * @param targets Target concentrations [mg/m^3], each >= 0
     * @param elapsed_time Time since release start [s], > 0
     * @param ground_height Receptor height [m]
     * @param source_height Effective source height [m], >= 0
     * @param step Sampling interval [m], 0 < step < ceil(u t)
     * @param include_axis_profile Return the sampled profile as well
     */
    ConcentrationDistribution distributionFor(const std::vector<double>& targets,
                                              double elapsed_time,
                                              double ground_height = 0.0,
                                              double source_height = 0.0,
                                              double step = 10.0,
                                              bool include_axis_profile = false);

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();
    static ParameterSchema schema();

protected:
    std::string reportTitle() const override { return "point source gas diffusion model reports"; }

private:
    double requireSourceStrength() const;
};

} // namespace HAZCON

#endif // POINT_SOURCE_GAS_DIFFUSION_HPP
