#include "PoolFire.hpp"
#include "HazardErrors.hpp"
#include <cmath>

namespace HAZCON {

using namespace HazardConstants;

// =============================================================================
// FireModel Implementation
// =============================================================================

FireModel::FireModel(const std::string& material,
                     const ParameterList& material_params,
                     const ParameterList& environment_params)
    : HazardModel(material, material_params, environment_params) {}

std::vector<ParameterSpec> FireModel::necessaryMaterialParams() {
    return unite(HazardModel::necessaryMaterialParams(), {});
}

std::vector<ParameterSpec> FireModel::necessaryEnvironmentParams() {
    return unite(HazardModel::necessaryEnvironmentParams(), {});
}

// =============================================================================
// PoolFire Implementation
// =============================================================================

namespace {

std::string radiationSuffix(double eta, double theta) {
    std::string suffix;
    if (eta != DEFAULT_COMBUSTION_EFFICIENCY) {
        suffix += "eta=" + formatLabelValue(eta);
    }
    if (theta != DEFAULT_TRANSMISSIVITY) {
        if (!suffix.empty()) suffix += ", ";
        suffix += "theta=" + formatLabelValue(theta);
    }
    return suffix.empty() ? suffix : " (" + suffix + ")";
}

double requirePositive(std::optional<double> value, const std::string& name) {
    if (!value || !(*value > 0.0)) {
        throw ValidationError(parameterError(name));
    }
    return *value;
}

} // anonymous namespace

PoolFire::PoolFire(const std::string& material,
                   const ParameterList& material_params,
                   const ParameterList& environment_params)
    : FireModel(material, material_params, environment_params) {}

double PoolFire::burningSpeed() {
    auto supplied = materialValue("burning_speed");
    if (supplied && *supplied > 0.0) {
        return *supplied;
    }
    if (auto hit = cached("burning_speed")) return *hit;

    double combustion_heat = requirePositive(materialValue("combustion_heat"), "combustion_heat");
    double heat_capacity = requirePositive(materialValue("specific_heat_capacity"),
                                           "specific_heat_capacity");
    double gasification_heat = requirePositive(materialValue("gasification_heat"),
                                               "gasification_heat");
    double boiling_point = requireMaterial("boiling_point");
    double env_temp = requireEnvironment("env_temp");

    double delta_temp = boiling_point - env_temp;
    double burning_speed = 0.0;
    if (delta_temp > 0.0) {
        burning_speed = (1e-3 * combustion_heat) / (heat_capacity * delta_temp + gasification_heat);
    } else {
        burning_speed = (1e-3 * combustion_heat) / gasification_heat;
    }

    recordResult("burning_speed", burning_speed);
    return storeDerived("burning_speed", burning_speed);
}

double PoolFire::flameHeight() {
    if (auto hit = cached("flame_height")) return *hit;

    double air_density = requirePositive(environmentValue("air_density"), "air_density");
    double pool_radius = requirePositive(environmentValue("pool_radius"), "pool_radius");
    double burning_speed = burningSpeed();

    double ratio = burning_speed / (air_density * std::sqrt(TWICE_GRAVITY * pool_radius));
    double flame_height = 84.0 * pool_radius * std::pow(ratio, 0.6);

    recordResult("flame_height", flame_height);
    return storeDerived("flame_height", flame_height);
}

double PoolFire::heatRadiation(double eta) {
    if (!(eta > 0.0)) {
        throw ValidationError(parameterError("eta"));
    }
    const std::string label = "heat_radiation" + radiationSuffix(eta, DEFAULT_TRANSMISSIVITY);
    if (auto hit = cached(label)) return *hit;

    double combustion_heat = requirePositive(materialValue("combustion_heat"), "combustion_heat");
    double pool_radius = requirePositive(environmentValue("pool_radius"), "pool_radius");
    double burning_speed = burningSpeed();
    double flame_height = flameHeight();

    double emitted = PI * pool_radius * (pool_radius + 2.0 * flame_height) *
                     burning_speed * eta * combustion_heat;
    double heat_radiation = emitted / (72.0 * std::pow(burning_speed, 0.6) + 1.0);

    recordResult(label, heat_radiation);
    return storeDerived(label, heat_radiation);
}

double PoolFire::heatRadiationStrengthAt(double distance, double eta, double theta) {
    if (!(distance > 0.0)) {
        throw ValidationError(parameterError("x"));
    }
    if (!(theta > 0.0)) {
        throw ValidationError(parameterError("theta"));
    }
    const std::string label = "strength at " + formatLabelValue(distance) + " m" +
                              radiationSuffix(eta, theta);
    if (auto hit = cached(label)) return *hit;

    double strength = theta * heatRadiation(eta) / (4.0 * PI * distance * distance);

    recordResult(label, strength);
    return storeDerived(label, strength);
}

double PoolFire::heatRadiationRadiusFor(double strength, double eta, double theta) {
    if (!(strength > 0.0)) {
        throw ValidationError(parameterError("strength"));
    }
    if (!(theta > 0.0)) {
        throw ValidationError(parameterError("theta"));
    }
    const std::string label = "radius at " + formatLabelValue(strength) + " W/m2" +
                              radiationSuffix(eta, theta);
    if (auto hit = cached(label)) return *hit;

    double radius = std::sqrt(theta * heatRadiation(eta) / (4.0 * PI * strength));

    recordResult(label, radius);
    return storeDerived(label, radius);
}

std::vector<ParameterSpec> PoolFire::necessaryMaterialParams() {
    return unite(FireModel::necessaryMaterialParams(), {
        {"boiling_point", "degC", "Boiling point of the liquid"},
        {"combustion_heat", "J/kg", "Heat of combustion"},
        {"specific_heat_capacity", "J/(kg*K)", "Specific heat capacity of the liquid"},
        {"gasification_heat", "J/kg", "Heat of vaporization"},
        {"burning_speed", "kg/(m2*s)", "Mass burning rate, computed when absent"}
    });
}

std::vector<ParameterSpec> PoolFire::necessaryEnvironmentParams() {
    return unite(FireModel::necessaryEnvironmentParams(), {
        {"pool_radius", "m", "Radius of the burning pool"},
        {"env_temp", "degC", "Ambient temperature"},
        {"air_density", "kg/m3", "Ambient air density"}
    });
}

ParameterSchema PoolFire::schema() {
    return {necessaryMaterialParams(), necessaryEnvironmentParams()};
}

} // namespace HAZCON
