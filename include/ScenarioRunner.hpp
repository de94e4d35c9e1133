/**
 * @file ScenarioRunner.hpp
 * @brief Builds one hazard model per scenario and runs the requested calculations
 *
 * The runner is the only layer that catches model errors. Whatever goes
 * wrong inside a model is returned as a failure envelope (code 1 plus the
 * error text) instead of propagating to the caller.
 *
 * @author HAZCON Development Team
 */

#ifndef SCENARIO_RUNNER_HPP
#define SCENARIO_RUNNER_HPP

#include "ConfigReader.hpp"
#include "HAZCON.hpp"
#include "HazardModel.hpp"
#include "PointSourceGasDiffusion.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace HAZCON {

/**
 * @brief Outcome of one scenario
 */
struct ScenarioResponse {
    int code = 0;                       ///< 0 on success, 1 on failure
    std::string message = "Success";
    std::vector<std::pair<std::string, double>> outputs;             ///< Result log, in order
    std::vector<std::pair<std::string, std::string>> text_outputs;   ///< Categorical results
    std::vector<std::pair<double, double>> axis_profile;             ///< Downwind profile on request
    std::vector<ConcentrationRegion> regions;   ///< One per target; unbounded when not reached
    std::string report;                 ///< Audit report of the model

    bool ok() const { return code == 0; }
};

class ScenarioRunner {
public:
    ScenarioRunner() = default;

    /**
     * @brief Run the scenario described by a loaded configuration
     */
    ScenarioResponse run(const ConfigReader& config) const;

    /**
     * @brief Run an already parsed scenario
     */
    ScenarioResponse run(const ConfigReader::ScenarioConfig& scenario,
                         const ConfigReader::CalculationConfig& calculation) const;

    /**
     * @brief Construct the model a scenario names
     * @throws ValidationError on duplicate parameter names
     */
    static std::unique_ptr<HazardModel> createModel(const ConfigReader::ScenarioConfig& scenario);

    /**
     * @brief Necessary parameters of a model type
     */
    static ParameterSchema schemaFor(ModelType model);

    /**
     * @brief Failure envelope for an error message
     */
    static ScenarioResponse failure(const std::string& message);
};

} // namespace HAZCON

#endif // SCENARIO_RUNNER_HPP
