/**
 * @file ExplosionModel.hpp
 * @brief Blast overpressure of the 1000 kg TNT reference charge
 *
 * The reference curve is tabulated at 22 distances between 5 m and 75 m.
 * A not-a-knot cubic spline through the table gives overpressure at a
 * distance; a second spline through the same points ordered by pressure
 * gives the inverse. Outside the table both directions are clamped to
 * fixed values instead of extrapolating.
 *
 * Explosion models scale an arbitrary charge onto this curve through the
 * cube-root scaling law.
 */

#ifndef EXPLOSION_MODEL_HPP
#define EXPLOSION_MODEL_HPP

#include "CubicSpline.hpp"
#include "HazardModel.hpp"
#include <memory>
#include <vector>

namespace HAZCON {

// =============================================================================
// Reference Overpressure Curve
// =============================================================================

/**
 * @brief Fitted overpressure-distance relation of 1000 kg TNT
 *
 * Built once per process and shared read-only by every explosion model.
 */
class OverpressureCurve {
public:
    static std::shared_ptr<const OverpressureCurve> reference();

    /// Tabulated distances [m], ascending
    static const std::vector<double>& referenceDistances();
    /// Tabulated overpressures [MPa], same order as the distances
    static const std::vector<double>& referencePressures();

    /**
     * @brief Overpressure at a distance from the charge
     * @param distance Distance [m]
     * @return Overpressure [MPa]; 0 beyond 75 m, 3.0 closer than 5 m
     * @throws ValidationError if distance < 0
     */
    double overpressureAt(double distance) const;

    /**
     * @brief Distance at which an overpressure is reached
     * @param overpressure Overpressure [MPa]
     * @return Distance [m]; 4 m above 3.0 MPa, 80 m below 0.01 MPa
     * @throws ValidationError if overpressure < 0
     */
    double distanceAt(double overpressure) const;

    static constexpr double MIN_DISTANCE = 5.0;
    static constexpr double MAX_DISTANCE = 75.0;
    static constexpr double CEILING_PRESSURE = 3.0;
    static constexpr double FLOOR_PRESSURE = 0.01;
    static constexpr double NEAR_DISTANCE = 4.0;
    static constexpr double FAR_DISTANCE = 80.0;

private:
    OverpressureCurve();

    CubicSpline forward_;
    CubicSpline inverse_;
};

// =============================================================================
// Explosion Model Family
// =============================================================================

/**
 * @brief Base of models that reduce an explosion to a TNT-equivalent charge
 */
class ExplosionModel : public HazardModel {
public:
    ExplosionModel(const std::string& material,
                   const ParameterList& material_params,
                   const ParameterList& environment_params);

    /// @copydoc OverpressureCurve::overpressureAt
    double overpressureAtDistance(double distance) const;

    /// @copydoc OverpressureCurve::distanceAt
    double distanceAtOverpressure(double overpressure) const;

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();

protected:
    std::string reportTitle() const override { return "explosion reports"; }

    std::shared_ptr<const OverpressureCurve> curve_;
};

} // namespace HAZCON

#endif // EXPLOSION_MODEL_HPP
