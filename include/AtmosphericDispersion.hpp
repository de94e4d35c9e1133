/**
 * @file AtmosphericDispersion.hpp
 * @brief Atmospheric stability classification and plume dispersion widths
 *
 * Implements the Pasquill-Gifford scheme as tabulated in GB/T 13201-91:
 * - Solar declination from the day of year
 * - Local solar elevation from latitude, longitude and hour
 * - Solar radiation level from cloud cover and elevation
 * - Stability class (A to F) from wind speed and radiation level
 * - Power-law dispersion coefficients by class and downwind distance
 * - sigma_y / sigma_z with a sampling-time correction
 *
 * Every classification is memoized per model instance and recorded in the
 * result log, so repeated calls return the same value.
 */

#ifndef ATMOSPHERIC_DISPERSION_HPP
#define ATMOSPHERIC_DISPERSION_HPP

#include "GeodesicUtils.hpp"
#include "HAZCON.hpp"
#include "HazardModel.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace HAZCON {

// =============================================================================
// Enumerations and tables
// =============================================================================

/**
 * @brief Pasquill stability class, including the transitional classes
 */
enum class StabilityClass {
    A,      // Extremely unstable
    A_B,
    B,      // Moderately unstable
    B_C,
    C,      // Slightly unstable
    C_D,
    D,      // Neutral
    D_E,
    E,      // Slightly stable
    E_F,
    F       // Moderately stable
};

/// Table spelling of a class ("A~B")
std::string stabilityClassName(StabilityClass cls);

/**
 * @brief Parse the table spelling of a class
 * @throws ValidationError for an unknown code
 */
StabilityClass parseStabilityClass(const std::string& name);

/**
 * @brief One row of the dispersion coefficient table
 *
 * sigma_y = gamma1 * x^alpha1, sigma_z = gamma2 * x^alpha2 (x in metres).
 */
struct CoefficientRow {
    double alpha1;
    double gamma1;
    double alpha2;
    double gamma2;
};

/**
 * @brief Process-wide classification tables
 */
struct DispersionTables {
    /// Solar radiation level, row = cloud cover band, column = elevation band
    int radiation_level[5][5];

    /// Stability, row = wind band, column = 3 - radiation level
    StabilityClass stability[5][6];

    /// Coefficient rows per class, addressed by position
    std::map<StabilityClass, std::vector<CoefficientRow>> coefficients;

    static const DispersionTables& instance();
};

/**
 * @brief Parsed "yyyy-mm-dd hh:mm:ss" timestamp
 */
struct SiteTime {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    /**
     * @throws ValidationError on a malformed timestamp
     */
    static SiteTime parse(const std::string& text);

    /// Current local time
    static SiteTime now();

    int dayOfYear() const;
    std::string toString() const;
};

/**
 * @brief Coefficients selected for one downwind distance
 */
struct DiffusionCoefficients {
    CoefficientRow row;       ///< alpha1/gamma1 from the horizontal row, alpha2/gamma2 from the vertical
    int horizontal_row = 0;   ///< Position of the horizontal row within the class
    int vertical_row = 0;
    double distance = 0.0;    ///< Downwind distance used [m]
};

/**
 * @brief Crosswind and vertical plume standard deviations [m]
 */
struct DiffusionWidths {
    double sigma_y = 0.0;
    double sigma_z = 0.0;
};

// =============================================================================
// Gas Diffusion Model Family
// =============================================================================

/**
 * @brief Base of gas dispersion models
 *
 * Environment parameters:
 *   - center_longitude, center_latitude [deg], accident site
 *   - total_cloudiness, low_cloudiness [tenths]
 *   - wind_speed [m/s]
 *   - start_datetime, text "yyyy-mm-dd hh:mm:ss", defaults to now
 */
class GasDiffusionModel : public HazardModel {
public:
    /**
     * @param start_datetime Accident start time; empty means the current time
     */
    GasDiffusionModel(const std::string& material,
                      const ParameterList& material_params,
                      const ParameterList& environment_params,
                      const std::string& start_datetime = "");

    /// Accident start time as given (or defaulted)
    std::string getStartDatetime() const;

    /**
     * @brief Solar declination [deg]
     */
    double calcDeclination();

    /**
     * @brief Local solar elevation angle [deg]
     * @throws ValidationError if the site coordinates are absent or negative
     */
    double calcSolarAngle();

    /**
     * @brief Solar radiation level, -2 to 3
     * @throws ValidationError unless total >= low >= 0 cloud cover
     */
    int solarRadiationLevel();

    /**
     * @brief Pasquill stability class
     * @throws ValidationError if wind speed is not positive
     */
    StabilityClass atmosphericStability();

    /**
     * @brief Dispersion coefficients for a receptor
     *
     * An explicit downwind distance wins over a receptor position; a
     * position is converted to its geodesic distance from the site.
     * @throws ValidationError if neither is given
     */
    DiffusionCoefficients diffusionParamCoefficients(
        const std::optional<GeoPoint>& point = std::nullopt,
        std::optional<double> downwind_distance = std::nullopt);

    /**
     * @brief sigma_y and sigma_z for a receptor
     * @param sampling_minutes Averaging time, 30 <= minutes < 6000
     */
    DiffusionWidths diffusionParameters(
        const std::optional<GeoPoint>& point = std::nullopt,
        std::optional<double> downwind_distance = std::nullopt,
        double sampling_minutes = HazardConstants::DEFAULT_SAMPLING_MINUTES);

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();

protected:
    std::string reportTitle() const override { return "gas diffusion report"; }

    /// Positive wind speed [m/s]
    double windSpeed() const;

    DiffusionCoefficients coefficientsAt(double distance, bool keep);
    DiffusionWidths widthsAt(double distance, double sampling_minutes, bool keep);

    /// Explicit distance, else geodesic distance of @p point from the site
    double resolveDistance(const std::optional<GeoPoint>& point,
                           std::optional<double> downwind_distance) const;

private:
    SiteTime siteTime() const;
};

} // namespace HAZCON

#endif // ATMOSPHERIC_DISPERSION_HPP
