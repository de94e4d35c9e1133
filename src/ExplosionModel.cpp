#include "ExplosionModel.hpp"
#include "HazardErrors.hpp"
#include <algorithm>
#include <numeric>

namespace HAZCON {

// =============================================================================
// OverpressureCurve Implementation
// =============================================================================

const std::vector<double>& OverpressureCurve::referenceDistances() {
    static const std::vector<double> distances = {
        5, 6, 7, 8, 9, 10, 12, 14, 16, 18, 20,
        25, 30, 35, 40, 45, 50, 55, 60, 65, 70, 75
    };
    return distances;
}

const std::vector<double>& OverpressureCurve::referencePressures() {
    static const std::vector<double> pressures = {
        2.94, 2.06, 1.67, 1.27, 0.95, 0.76, 0.50, 0.33, 0.235, 0.17, 0.126,
        0.079, 0.057, 0.043, 0.033, 0.027, 0.0235, 0.0205, 0.018, 0.016, 0.0143, 0.013
    };
    return pressures;
}

namespace {

// Reference table reordered by ascending overpressure
CubicSpline buildInverse() {
    const auto& d = OverpressureCurve::referenceDistances();
    const auto& p = OverpressureCurve::referencePressures();

    std::vector<size_t> order(p.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&p](size_t a, size_t b) { return p[a] < p[b]; });

    std::vector<double> x, y;
    x.reserve(order.size());
    y.reserve(order.size());
    for (size_t i : order) {
        x.push_back(p[i]);
        y.push_back(d[i]);
    }
    return CubicSpline(x, y);
}

} // anonymous namespace

OverpressureCurve::OverpressureCurve()
    : forward_(referenceDistances(), referencePressures()),
      inverse_(buildInverse()) {}

std::shared_ptr<const OverpressureCurve> OverpressureCurve::reference() {
    static const std::shared_ptr<const OverpressureCurve> curve(new OverpressureCurve());
    return curve;
}

double OverpressureCurve::overpressureAt(double distance) const {
    if (distance < 0.0) {
        throw ValidationError(parameterError("distance"));
    }
    if (distance > MAX_DISTANCE) return 0.0;
    if (distance < MIN_DISTANCE) return CEILING_PRESSURE;
    return forward_(distance);
}

double OverpressureCurve::distanceAt(double overpressure) const {
    if (overpressure < 0.0) {
        throw ValidationError(parameterError("overpressure"));
    }
    if (overpressure > CEILING_PRESSURE) return NEAR_DISTANCE;
    if (overpressure < FLOOR_PRESSURE) return FAR_DISTANCE;
    return inverse_(overpressure);
}

// =============================================================================
// ExplosionModel Implementation
// =============================================================================

ExplosionModel::ExplosionModel(const std::string& material,
                               const ParameterList& material_params,
                               const ParameterList& environment_params)
    : HazardModel(material, material_params, environment_params),
      curve_(OverpressureCurve::reference()) {}

double ExplosionModel::overpressureAtDistance(double distance) const {
    return curve_->overpressureAt(distance);
}

double ExplosionModel::distanceAtOverpressure(double overpressure) const {
    return curve_->distanceAt(overpressure);
}

std::vector<ParameterSpec> ExplosionModel::necessaryMaterialParams() {
    return unite(HazardModel::necessaryMaterialParams(), {});
}

std::vector<ParameterSpec> ExplosionModel::necessaryEnvironmentParams() {
    return unite(HazardModel::necessaryEnvironmentParams(), {});
}

} // namespace HAZCON
