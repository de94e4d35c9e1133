#include "VaporCloudExplosion.hpp"
#include "HazardErrors.hpp"
#include <cmath>

namespace HAZCON {

using namespace HazardConstants;

namespace {

// Label suffix naming the coefficients when they differ from the defaults
std::string coefficientSuffix(double alpha, double beta) {
    if (alpha == DEFAULT_TNT_ALPHA && beta == DEFAULT_GROUND_BETA) return "";
    return " (alpha=" + formatLabelValue(alpha) + ", beta=" + formatLabelValue(beta) + ")";
}

void checkCoefficients(double alpha, double beta) {
    if (!(alpha > 0.0) || !(beta > 0.0)) {
        throw ValidationError(parameterError("alpha, beta"));
    }
}

} // anonymous namespace

VaporCloudExplosion::VaporCloudExplosion(const std::string& material,
                                         const ParameterList& material_params,
                                         const ParameterList& environment_params)
    : ExplosionModel(material, material_params, environment_params) {}

double VaporCloudExplosion::materialWeight() {
    if (auto hit = cached("material_weight")) return *hit;

    auto supplied = environmentValue("material_weight");
    if (supplied && *supplied > 0.0) {
        return *supplied;
    }

    auto volume = environmentValue("material_volume");
    auto density = materialValue("material_density");
    if (!volume || !(*volume > 0.0)) {
        throw ValidationError(parameterError("material_volume"));
    }
    if (!density || !(*density > 0.0)) {
        throw ValidationError(parameterError("material_density"));
    }

    double weight = (*volume) * (*density);
    recordResult("material_weight", weight);
    return storeDerived("material_weight", weight);
}

double VaporCloudExplosion::explosiveEnergy(double alpha, double beta) {
    checkCoefficients(alpha, beta);

    const std::string label = "explosive_energy" + coefficientSuffix(alpha, beta);
    if (auto hit = cached(label)) return *hit;

    auto combustion_heat = materialValue("combustion_heat");
    if (!combustion_heat || !(*combustion_heat > 0.0)) {
        throw ValidationError(parameterError("combustion_heat"));
    }

    double energy = alpha * beta * (*combustion_heat) * materialWeight();
    recordResult(label, energy);
    return storeDerived(label, energy);
}

double VaporCloudExplosion::turnToTnt(double alpha, double beta) {
    checkCoefficients(alpha, beta);

    const std::string label = "tnt_weight" + coefficientSuffix(alpha, beta);
    if (auto hit = cached(label)) return *hit;

    double tnt_energy = TNT_EXPLOSIVE_ENERGY;
    if (!isAbsent("tnt_explosive_energy")) {
        tnt_energy = requireEnvironment("tnt_explosive_energy");
        if (!(tnt_energy > 0.0)) {
            throw ValidationError(parameterError("tnt_explosive_energy"));
        }
    }

    double tnt_weight = explosiveEnergy(alpha, beta) / tnt_energy;
    recordResult(label, tnt_weight);
    return storeDerived(label, tnt_weight);
}

double VaporCloudExplosion::scaledLength(double alpha, double beta) {
    double tnt_weight = turnToTnt(alpha, beta);
    double length = 0.1 * std::cbrt(tnt_weight);
    if (length == 0.0) {
        throw ComputationError("TNT-equivalent mass is zero");
    }
    return length;
}

double VaporCloudExplosion::waveOverpressureAt(double distance, double alpha, double beta) {
    if (!(distance > 0.0)) {
        throw ValidationError(parameterError("x"));
    }
    checkCoefficients(alpha, beta);

    const std::string suffix = coefficientSuffix(alpha, beta);
    const std::string label = "overpressure at " + formatLabelValue(distance) + " m" + suffix;
    if (auto hit = cached(label)) return *hit;

    double scaled = distance / scaledLength(alpha, beta);
    double overpressure = overpressureAtDistance(scaled);
    if (overpressure < 0.0) overpressure = 0.0;

    recordResult("relative distance at " + formatLabelValue(distance) + " m" + suffix, scaled);
    recordResult(label, overpressure);
    return storeDerived(label, overpressure);
}

double VaporCloudExplosion::waveRadiusFor(double overpressure, double alpha, double beta) {
    if (!(overpressure > 0.0)) {
        throw ValidationError(parameterError("p"));
    }
    checkCoefficients(alpha, beta);

    const std::string suffix = coefficientSuffix(alpha, beta);
    const std::string label = "radius at " + formatLabelValue(overpressure) + " MPa" + suffix;
    if (auto hit = cached(label)) return *hit;

    double relative = distanceAtOverpressure(overpressure);
    double radius = scaledLength(alpha, beta) * relative;
    if (radius < 0.0) radius = 0.0;

    recordResult("relative distance at " + formatLabelValue(overpressure) + " MPa" + suffix, relative);
    recordResult(label, radius);
    return storeDerived(label, radius);
}

std::vector<ParameterSpec> VaporCloudExplosion::necessaryMaterialParams() {
    return unite(ExplosionModel::necessaryMaterialParams(), {
        {"material_density", "kg/m3", "Density of the released material"},
        {"combustion_heat", "kJ/kg", "Heat of combustion"}
    });
}

std::vector<ParameterSpec> VaporCloudExplosion::necessaryEnvironmentParams() {
    return unite(ExplosionModel::necessaryEnvironmentParams(), {
        {"tnt_explosive_energy", "kJ/kg", "Blast energy of TNT, 4230 - 4836 (default 4500)"},
        {"material_volume", "m3", "Released volume, used when the weight is absent"},
        {"material_weight", "kg", "Released mass"}
    });
}

ParameterSchema VaporCloudExplosion::schema() {
    return {necessaryMaterialParams(), necessaryEnvironmentParams()};
}

} // namespace HAZCON
