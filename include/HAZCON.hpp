#ifndef HAZCON_HPP
#define HAZCON_HPP

#include <string>
#include <vector>

namespace HAZCON {

// Forward declarations
class HazardModel;
class ExplosionModel;
class FireModel;
class GasDiffusionModel;
class VaporCloudExplosion;
class PoolFire;
class PointSourceGasDiffusion;
class ConfigReader;
class ScenarioRunner;

constexpr const char* HAZCON_VERSION = "1.0.0";

/**
 * @brief Concrete hazard models a scenario can be built from
 *
 * Each model type owns its necessary-parameter declaration and computes
 * the consequence metrics of one accident mechanism.
 */
enum class ModelType {
    VAPOR_CLOUD_EXPLOSION,       ///< Blast overpressure / radius (TNT equivalence)
    POOL_FIRE,                   ///< Thermal radiation from a burning liquid pool
    POINT_SOURCE_GAS_DIFFUSION   ///< Gaussian plume from a continuous point release
};

/**
 * @brief Physical constants shared by the hazard models
 *
 * Units follow the conventions of the individual models: explosion energies
 * in kJ, overpressures in MPa, pool-fire heats in J/kg, plume concentrations
 * in mg/m^3.
 */
namespace HazardConstants {
    constexpr double PI = 3.14159265358979323846;
    constexpr double DEG_TO_RAD = PI / 180.0;
    constexpr double RAD_TO_DEG = 180.0 / PI;

    // TNT equivalence
    constexpr double TNT_REFERENCE_MASS = 1000.0;           // kg, reference curve charge
    constexpr double TNT_EXPLOSIVE_ENERGY = 4500.0;         // kJ/kg, default blast energy of TNT
    constexpr double DEFAULT_TNT_ALPHA = 0.04;              // TNT equivalence yield factor
    constexpr double DEFAULT_GROUND_BETA = 1.8;             // Ground reflection factor

    // Pool fire
    constexpr double DEFAULT_COMBUSTION_EFFICIENCY = 0.24;  // Radiative fraction (0.13 - 0.35)
    constexpr double DEFAULT_TRANSMISSIVITY = 1.0;          // Atmospheric transmissivity
    constexpr double TWICE_GRAVITY = 19.6;                  // m/s^2, 2g in the Thomas correlation

    // Gaussian plume
    constexpr double DEFAULT_SAMPLING_MINUTES = 30.0;       // Averaging time of the coefficients
    constexpr double CONCENTRATION_FLOOR = 1e-6;            // mg/m^3, clamped to zero below

    // Reference ellipsoid of the geodesic utility
    constexpr double ELLIPSOID_MAJOR_KM = 6378.140;
    constexpr double ELLIPSOID_MINOR_KM = 6356.755;
}

/**
 * @brief Convert a model type to its configuration keyword
 */
std::string modelTypeName(ModelType type);

/**
 * @brief Parse a configuration keyword (case-insensitive)
 * @throws ValidationError for an unknown keyword
 */
ModelType parseModelType(const std::string& name);

/**
 * @brief All model types, in declaration order
 */
std::vector<ModelType> allModelTypes();

} // namespace HAZCON

#endif // HAZCON_HPP
