/**
 * @file HazardModel.hpp
 * @brief Shared parameter and result bookkeeping of every hazard model
 *
 * A hazard model is built once per scenario from a material name and two
 * parameter mappings (material properties and site conditions). Calculation
 * methods read those inputs, record what they produce in an ordered result
 * log, and memoize intermediate derivations in a per-instance cache so that
 * the inputs themselves are never modified.
 *
 * Each model type declares the parameters it needs. Declarations compose
 * explicitly: a concrete model unites its family's list with its own.
 *
 * @author HAZCON Development Team
 */

#ifndef HAZARD_MODEL_HPP
#define HAZARD_MODEL_HPP

#include "HAZCON.hpp"
#include "ParameterSet.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace HAZCON {

// =============================================================================
// Parameter Schema
// =============================================================================

/**
 * @brief One required parameter of a model
 */
struct ParameterSpec {
    std::string name;
    std::string unit;             ///< Unit the model expects the value in
    std::string description;
    bool textual = false;         ///< Supplied as text rather than a number
};

/**
 * @brief Material-side and environment-side requirements of a model type
 */
struct ParameterSchema {
    std::vector<ParameterSpec> material;
    std::vector<ParameterSpec> environment;

    const ParameterSpec* find(const std::string& name) const;
};

/**
 * @brief Concatenate two declarations, dropping repeated names
 *
 * Order is preserved: every entry of @p parent first, then the entries of
 * @p own not already present.
 */
std::vector<ParameterSpec> unite(const std::vector<ParameterSpec>& parent,
                                 const std::vector<ParameterSpec>& own);

ParameterSchema unite(const ParameterSchema& parent, const ParameterSchema& own);

/**
 * @brief Required names that a payload does not mention at all
 *
 * A name supplied with an absent value counts as present; whether the model
 * can proceed without it is decided at the point of use. Textual entries are
 * supplied outside the numeric mappings and are not checked here.
 */
std::vector<std::string> missingParameters(const ParameterSchema& schema,
                                           const ParameterSet& material_params,
                                           const ParameterSet& environment_params);

// =============================================================================
// Model State
// =============================================================================

/**
 * @brief Everything one model instance owns
 */
struct ModelState {
    std::string material;
    ParameterSet material_params;
    ParameterSet environment_params;
    std::vector<std::pair<std::string, std::string>> text_params;

    std::set<std::string> absent;            ///< Supplied without a value
    ResultLog results;
    std::vector<std::pair<std::string, std::string>> text_results;
    std::map<std::string, double> derived;   ///< Memoized derivations
};

// =============================================================================
// Hazard Model Base
// =============================================================================

/**
 * @brief Base class of all hazard models
 */
class HazardModel {
public:
    /**
     * @brief Construct from raw parameter lists
     * @throws ValidationError if either list names a parameter twice
     */
    HazardModel(const std::string& material,
                const ParameterList& material_params,
                const ParameterList& environment_params);
    virtual ~HazardModel() = default;

    virtual ModelType getType() const = 0;

    // Accessors return copies; callers never touch the live state
    std::string getMaterial() const { return state_.material; }
    void setMaterial(const std::string& material) { state_.material = material; }

    ParameterSet getMaterialParams() const { return state_.material_params; }
    void setMaterialParams(const ParameterSet& params);

    ParameterSet getEnvironmentParams() const { return state_.environment_params; }
    void setEnvironmentParams(const ParameterSet& params);

    ResultLog getResults() const { return state_.results; }

    /**
     * @brief Append a result, or overwrite the entry with the same label
     */
    void recordResult(const std::string& label, double value);

    /// Categorical results (e.g. a stability class), in recording order
    std::vector<std::pair<std::string, std::string>> getTextResults() const {
        return state_.text_results;
    }
    void recordTextResult(const std::string& label, const std::string& value);

    /**
     * @brief True if @p name was supplied without a value, or not at all
     */
    bool isAbsent(const std::string& name) const;

    /**
     * @brief Fixed-width audit report of inputs and results
     * @param width Total line width
     * @param value_width Width of the right-aligned value column
     */
    std::string getInfo(int width = 80, int value_width = 40) const;

    static std::vector<ParameterSpec> necessaryMaterialParams();
    static std::vector<ParameterSpec> necessaryEnvironmentParams();

protected:
    /// Title of the audit report, lower case
    virtual std::string reportTitle() const { return "reports"; }

    std::optional<double> materialValue(const std::string& name) const;
    std::optional<double> environmentValue(const std::string& name) const;

    /**
     * @brief Supplied value of a parameter
     * @throws ValidationError if the parameter is absent
     */
    double requireMaterial(const std::string& name) const;
    double requireEnvironment(const std::string& name) const;

    /// Text parameter, std::nullopt if not supplied
    std::optional<std::string> textValue(const std::string& name) const;
    void setTextValue(const std::string& name, const std::string& value);

    std::optional<double> cached(const std::string& key) const;
    double storeDerived(const std::string& key, double value);

    ModelState state_;

private:
    void refreshAbsentSet();
};

} // namespace HAZCON

#endif // HAZARD_MODEL_HPP
