#include "PointSourceGasDiffusion.hpp"
#include "HazardErrors.hpp"
#include <cmath>

namespace HAZCON {

using namespace HazardConstants;

PointSourceGasDiffusion::PointSourceGasDiffusion(const std::string& material,
                                                 const ParameterList& material_params,
                                                 const ParameterList& environment_params,
                                                 const std::string& start_datetime)
    : GasDiffusionModel(material, material_params, environment_params, start_datetime) {}

std::optional<double> PointSourceGasDiffusion::sourceStrength() const {
    auto q = environmentValue("source_strength");
    if (q && *q > 0.0) return q;
    return std::nullopt;
}

double PointSourceGasDiffusion::requireSourceStrength() const {
    auto q = sourceStrength();
    if (!q) throw ValidationError(parameterError("source_strength"));
    return *q;
}

double PointSourceGasDiffusion::concentrationAt(const std::optional<GeoPoint>& point,
                                                std::optional<double> downwind_distance,
                                                double crosswind_offset,
                                                double ground_height,
                                                double source_height,
                                                bool keep) {
    if (ground_height < 0.0) throw ValidationError(parameterError("ddis"));
    if (source_height < 0.0) throw ValidationError(parameterError("srch"));
    if (crosswind_offset < 0.0) throw ValidationError(parameterError("vdis"));

    const double u = windSpeed();
    const double y = crosswind_offset;
    const double z = ground_height;
    const double H = source_height;

    const double x = resolveDistance(point, downwind_distance);
    DiffusionWidths w = widthsAt(x, DEFAULT_SAMPLING_MINUTES, keep);
    if (w.sigma_y == 0.0 || w.sigma_z == 0.0) {
        throw ComputationError("dispersion width is zero at " + formatLabelValue(x) + " m");
    }

    const double q = requireSourceStrength();
    const double a1 = q / (PI * u * w.sigma_y * w.sigma_z);
    const double a2 = -0.5 * std::pow(y / w.sigma_y, 2);
    const double a3 = -0.5 * std::pow((z - H) / w.sigma_z, 2);
    const double a4 = -0.5 * std::pow((z + H) / w.sigma_z, 2);

    double concentration = 0.0;
    if ((H == 0.0 || z == 0.0) && y != 0.0) {
        concentration = a1 * std::exp(a2 + a4);
    } else if (y == 0.0 && z == 0.0 && H != 0.0) {
        concentration = a1 * std::exp(a4);
    } else if (y == 0.0 && z == 0.0 && H == 0.0) {
        concentration = a1;
    } else {
        concentration = 0.5 * a1 * (std::exp(a2 + a3) + std::exp(a2 + a4));
    }

    if (concentration < CONCENTRATION_FLOOR) concentration = 0.0;

    if (keep) {
        recordResult("concentration(" + formatLabelValue(x) + ", " + formatLabelValue(y) + ", " +
                     formatLabelValue(z) + ", " + formatLabelValue(H) + ")", concentration);
    }
    return concentration;
}

double PointSourceGasDiffusion::verticalExtentFor(double concentration, double elapsed_time,
                                                  double downwind_distance, double source_height) {
    if (concentration < 0.0) throw ValidationError(parameterError("c"));
    if (!(elapsed_time > 0.0)) throw ValidationError(parameterError("t"));
    if (concentration == 0.0) {
        throw ComputationError("target concentration is zero");
    }

    const double u = windSpeed();
    const double weight = requireSourceStrength() * elapsed_time;
    DiffusionWidths w = widthsAt(downwind_distance, DEFAULT_SAMPLING_MINUTES, false);
    if (w.sigma_y == 0.0 || w.sigma_z == 0.0) {
        throw ComputationError("dispersion width is zero at " +
                               formatLabelValue(downwind_distance) + " m");
    }

    double term = std::log(weight / (u * concentration * PI * w.sigma_y * w.sigma_z)) -
                  0.5 * std::pow(source_height / w.sigma_z, 2);
    double half_width = term > 0.0 ? std::sqrt(2.0 * w.sigma_y * w.sigma_y * term) : 0.0;

    recordResult("area(" + formatLabelValue(concentration) + "mg/m3) b", half_width);
    return half_width;
}

ConcentrationDistribution PointSourceGasDiffusion::distributionFor(const std::vector<double>& targets,
                                                                   double elapsed_time,
                                                                   double ground_height,
                                                                   double source_height,
                                                                   double step,
                                                                   bool include_axis_profile) {
    if (source_height < 0.0) throw ValidationError(parameterError("srch"));
    if (!(elapsed_time > 0.0)) throw ValidationError(parameterError("t"));

    const double u = windSpeed();
    const double x_max = std::ceil(u * elapsed_time);
    if (!(step > 0.0 && x_max > step)) {
        throw ValidationError(parameterError("step"));
    }
    for (double c : targets) {
        if (c < 0.0) throw ValidationError(parameterError("c"));
    }

    // Evenly spaced samples 0 .. x_max; the source point itself has no plume
    const long count = static_cast<long>(std::floor(x_max / step));
    std::vector<std::pair<double, double>> profile;
    profile.reserve(count);
    for (long i = 1; i <= count; ++i) {
        double x = x_max * static_cast<double>(i) / static_cast<double>(count);
        double c = concentrationAt(std::nullopt, x, 0.0, ground_height, source_height, false);
        profile.emplace_back(x, c);
    }

    ConcentrationDistribution result;
    result.peak_distance = profile.front().first;
    result.peak_concentration = profile.front().second;
    for (const auto& sample : profile) {
        if (sample.second > result.peak_concentration) {
            result.peak_distance = sample.first;
            result.peak_concentration = sample.second;
        }
    }
    recordResult("peak distance(m)", result.peak_distance);
    recordResult("peak concentration(mg/m3)", result.peak_concentration);

    for (double c : targets) {
        ConcentrationRegion region;
        region.target = c;
        if (c < result.peak_concentration) {
            double x1 = 0.0, x2 = 0.0;
            bool found = false;
            for (const auto& sample : profile) {
                if (sample.second >= c) {
                    if (!found) x1 = sample.first;
                    x2 = sample.first;
                    found = true;
                }
            }
            double a = (x2 - x1) / 2.0;
            recordResult("area(" + formatLabelValue(c) + "mg/m3) a", a);

            region.start = x1;
            region.end = x2;
            region.semi_major = a;
            // Crosswind half-width taken at the semi-major distance from the source
            region.semi_minor = verticalExtentFor(c, elapsed_time, a, source_height);
        }
        result.regions.push_back(region);
    }

    if (include_axis_profile) {
        result.axis_profile = std::move(profile);
    }
    return result;
}

std::vector<ParameterSpec> PointSourceGasDiffusion::necessaryMaterialParams() {
    return unite(GasDiffusionModel::necessaryMaterialParams(), {});
}

std::vector<ParameterSpec> PointSourceGasDiffusion::necessaryEnvironmentParams() {
    return unite(GasDiffusionModel::necessaryEnvironmentParams(), {
        {"source_strength", "mg/s", "Emission rate of the release"},
        {"wind_speed", "m/s", "Mean wind speed"}
    });
}

ParameterSchema PointSourceGasDiffusion::schema() {
    return {necessaryMaterialParams(), necessaryEnvironmentParams()};
}

} // namespace HAZCON
