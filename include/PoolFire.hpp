/**
 * @file PoolFire.hpp
 * @brief Thermal radiation of a burning liquid pool
 *
 * Point-source radiation model: the mass burning rate follows the
 * Burgess-Hertzberg correlation, the flame height the Thomas correlation,
 * and the radiative output is spread over a sphere around the pool centre
 * (inverse-square law).
 */

#ifndef POOL_FIRE_HPP
#define POOL_FIRE_HPP

#include "HAZCON.hpp"
#include "HazardModel.hpp"

namespace HAZCON {

// =============================================================================
// Fire Model Family
// =============================================================================

/**
 * @brief Base of fire models
 */
class FireModel : public HazardModel {
public:
    FireModel(const std::string& material,
              const ParameterList& material_params,
              const ParameterList& environment_params);

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();

protected:
    std::string reportTitle() const override { return "fire reports"; }
};

// =============================================================================
// Pool Fire
// =============================================================================

/**
 * @brief Pool fire of a flammable liquid
 *
 * Material parameters:
 *   - boiling_point [degC]
 *   - combustion_heat [J/kg]
 *   - specific_heat_capacity [J/(kg K)]
 *   - gasification_heat [J/kg]
 *   - burning_speed [kg/(m^2 s)], computed from the others when absent
 *
 * Environment parameters:
 *   - pool_radius [m]
 *   - env_temp [degC]
 *   - air_density [kg/m^3]
 */
class PoolFire : public FireModel {
public:
    PoolFire(const std::string& material,
             const ParameterList& material_params,
             const ParameterList& environment_params);

    ModelType getType() const override { return ModelType::POOL_FIRE; }

    /**
     * @brief Mass burning rate per unit pool area [kg/(m^2 s)]
     *
     * A supplied positive burning_speed is returned unchanged. Otherwise
     *   m = 0.001 Hc / (Cp (Tb - Ta) + Hv)   when Tb > Ta
     *   m = 0.001 Hc / Hv                    otherwise
     */
    double burningSpeed();

    /**
     * @brief Flame height [m], L = 84 r (m / (rho sqrt(2 g r)))^0.6
     */
    double flameHeight();

    /**
     * @brief Total radiative output [W]
     * @param eta Radiative fraction of the combustion heat (0.13 - 0.35)
     */
    double heatRadiation(double eta = HazardConstants::DEFAULT_COMBUSTION_EFFICIENCY);

    /**
     * @brief Incident radiant flux at a distance [W/m^2]
     * @param distance Distance from the pool centre [m], > 0
     * @param eta Radiative fraction
     * @param theta Atmospheric transmissivity, > 0
     */
    double heatRadiationStrengthAt(double distance,
                                   double eta = HazardConstants::DEFAULT_COMBUSTION_EFFICIENCY,
                                   double theta = HazardConstants::DEFAULT_TRANSMISSIVITY);

    /**
     * @brief Distance at which the incident flux falls to a target [m]
     * @param strength Target flux [W/m^2], > 0
     */
    double heatRadiationRadiusFor(double strength,
                                  double eta = HazardConstants::DEFAULT_COMBUSTION_EFFICIENCY,
                                  double theta = HazardConstants::DEFAULT_TRANSMISSIVITY);

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();
    static ParameterSchema schema();

protected:
    std::string reportTitle() const override { return "pool fire model reports"; }
};

} // namespace HAZCON

#endif // POOL_FIRE_HPP
