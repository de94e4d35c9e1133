#ifndef VAPOR_CLOUD_EXPLOSION_HPP
#define VAPOR_CLOUD_EXPLOSION_HPP

#include "ExplosionModel.hpp"
#include "HAZCON.hpp"

namespace HAZCON {

/**
 * @brief Vapor cloud explosion by TNT equivalence
 *
 * Material parameters:
 *   - material_density [kg/m^3]
 *   - combustion_heat [kJ/kg]
 *
 * Environment parameters:
 *   - tnt_explosive_energy [kJ/kg], absent means 4500 kJ/kg
 *   - material_volume [m^3], used only when material_weight is absent
 *   - material_weight [kg]
 *
 * The explosion energy E = alpha * beta * Hc * W is converted to a TNT mass
 * W_TNT = E / Q_TNT, and distances are scaled onto the 1000 kg reference
 * curve by x' = x / (0.1 * W_TNT^(1/3)).
 */
class VaporCloudExplosion : public ExplosionModel {
public:
    VaporCloudExplosion(const std::string& material,
                        const ParameterList& material_params,
                        const ParameterList& environment_params);

    ModelType getType() const override { return ModelType::VAPOR_CLOUD_EXPLOSION; }

    /**
     * @brief Mass of the vapor cloud [kg]
     *
     * A supplied positive material_weight wins; otherwise the mass is
     * material_volume * material_density.
     * @throws ValidationError if the fallback lacks a positive volume or density
     */
    double materialWeight();

    /**
     * @brief Explosion energy [kJ]
     * @param alpha TNT equivalence yield factor (0.0002 - 0.149)
     * @param beta Ground reflection factor
     */
    double explosiveEnergy(double alpha = HazardConstants::DEFAULT_TNT_ALPHA,
                           double beta = HazardConstants::DEFAULT_GROUND_BETA);

    /**
     * @brief TNT-equivalent mass [kg]
     */
    double turnToTnt(double alpha = HazardConstants::DEFAULT_TNT_ALPHA,
                     double beta = HazardConstants::DEFAULT_GROUND_BETA);

    /**
     * @brief Blast overpressure at a distance [MPa]
     * @param distance Distance from the cloud centre [m], must be > 0
     */
    double waveOverpressureAt(double distance,
                              double alpha = HazardConstants::DEFAULT_TNT_ALPHA,
                              double beta = HazardConstants::DEFAULT_GROUND_BETA);

    /**
     * @brief Radius at which an overpressure is reached [m]
     * @param overpressure Overpressure [MPa], must be > 0
     */
    double waveRadiusFor(double overpressure,
                         double alpha = HazardConstants::DEFAULT_TNT_ALPHA,
                         double beta = HazardConstants::DEFAULT_GROUND_BETA);

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();
    static ParameterSchema schema();

protected:
    std::string reportTitle() const override { return "vapor cloud explosion model reports"; }

private:
    double scaledLength(double alpha, double beta);
};

} // namespace HAZCON

#endif // VAPOR_CLOUD_EXPLOSION_HPP
