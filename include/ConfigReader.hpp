#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "HAZCON.hpp"
#include "HazardModel.hpp"
#include "UnitSystem.hpp"
#include <map>
#include <string>
#include <vector>

namespace HAZCON {

/**
 * @brief INI-style scenario file reader
 *
 * A scenario file names one model and supplies its material properties,
 * site conditions and the calculations to run:
 *
 *   [SCENARIO]     model, material
 *   [MATERIAL]     material-side parameters
 *   [ENVIRONMENT]  environment-side parameters (start_datetime as text)
 *   [CALCULATION]  per-call arguments and query lists
 *
 * Values may carry a unit ("25 degC", "41.03 MJ/kg"); they are converted
 * into the unit the model declares for that parameter. "none", "null",
 * "nan" or an empty value mark a parameter as absent.
 */
class ConfigReader {
public:
    // =========================================================================
    // Parsed sections
    // =========================================================================

    struct ScenarioConfig {
        ModelType model = ModelType::VAPOR_CLOUD_EXPLOSION;
        std::string material;
        ParameterList material_params;
        ParameterList environment_params;
        std::string start_datetime;           // empty: current time
    };

    /**
     * @brief Calculation arguments; each model reads the keys it knows
     */
    struct CalculationConfig {
        // Vapor cloud explosion
        double alpha = HazardConstants::DEFAULT_TNT_ALPHA;
        double beta = HazardConstants::DEFAULT_GROUND_BETA;
        std::vector<double> overpressures;        // MPa

        // Pool fire
        double eta = HazardConstants::DEFAULT_COMBUSTION_EFFICIENCY;
        double theta = HazardConstants::DEFAULT_TRANSMISSIVITY;
        std::vector<double> strengths;            // W/m2

        // Shared by explosion and fire
        std::vector<double> distances;            // m

        // Gas diffusion
        double sampling_minutes = HazardConstants::DEFAULT_SAMPLING_MINUTES;
        std::vector<double> downwind_distances;   // m
        double crosswind_offset = 0.0;            // m
        double ground_height = 0.0;               // m
        double source_height = 0.0;               // m
        std::vector<double> concentrations;       // mg/m3
        double elapsed_time = 0.0;                // s, 0 disables the distribution search
        double step = 10.0;                       // m
        bool axis_profile = false;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    bool loadFile(const std::string& filename);

    /**
     * @brief Parse configuration text directly
     */
    bool loadString(const std::string& content);

    // =========================================================================
    // Scenario parsing
    // =========================================================================

    /**
     * @brief Build the model inputs of [SCENARIO], [MATERIAL] and [ENVIRONMENT]
     * @return false if the model keyword is unknown or a value does not convert
     */
    bool parseScenarioConfig(ScenarioConfig& config) const;

    bool parseCalculationConfig(CalculationConfig& config) const;

    /**
     * @brief Check the file against the schema of its model
     *
     * Missing sections and unknown model keywords are errors; schema
     * parameters not mentioned at all and unrecognised keys are warnings.
     */
    ValidationResult validate() const;

    /**
     * @brief Write a commented scenario template for @p model
     */
    static bool generateTemplate(const std::string& filename,
                                 ModelType model = ModelType::VAPOR_CLOUD_EXPLOSION);

    // =========================================================================
    // Raw value access
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    /**
     * @brief Read a value and express it in @p unit
     *
     * A bare number is taken to be in @p unit already. Returns
     * @p default_val when the key is missing or the value does not convert.
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val, const std::string& unit) const;

    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& unit) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;
    std::map<std::string, std::string> getSectionData(const std::string& section) const;

    /// True for "none", "null", "nan" and empty text
    static bool isAbsentText(const std::string& value);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    const UnitSystem& unit_system_;

    bool parseParameters(const std::string& section,
                         const std::vector<ParameterSpec>& specs,
                         ParameterList& params) const;
    bool toDouble(const std::string& text, double& value) const;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace HAZCON

#endif // CONFIG_READER_HPP
