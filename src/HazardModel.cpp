#include "HazardModel.hpp"
#include "HazardErrors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace HAZCON {

// =============================================================================
// Model type keywords
// =============================================================================

std::string modelTypeName(ModelType type) {
    switch (type) {
        case ModelType::VAPOR_CLOUD_EXPLOSION:      return "VAPOR_CLOUD_EXPLOSION";
        case ModelType::POOL_FIRE:                  return "POOL_FIRE";
        case ModelType::POINT_SOURCE_GAS_DIFFUSION: return "POINT_SOURCE_GAS_DIFFUSION";
    }
    return "UNKNOWN";
}

ModelType parseModelType(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "VAPOR_CLOUD_EXPLOSION" || upper == "VCE") {
        return ModelType::VAPOR_CLOUD_EXPLOSION;
    }
    if (upper == "POOL_FIRE") {
        return ModelType::POOL_FIRE;
    }
    if (upper == "POINT_SOURCE_GAS_DIFFUSION" || upper == "GAS_DIFFUSION") {
        return ModelType::POINT_SOURCE_GAS_DIFFUSION;
    }
    throw ValidationError("Unknown model type: " + name);
}

std::vector<ModelType> allModelTypes() {
    return {ModelType::VAPOR_CLOUD_EXPLOSION,
            ModelType::POOL_FIRE,
            ModelType::POINT_SOURCE_GAS_DIFFUSION};
}

// =============================================================================
// Parameter Schema
// =============================================================================

const ParameterSpec* ParameterSchema::find(const std::string& name) const {
    for (const auto& spec : material) {
        if (spec.name == name) return &spec;
    }
    for (const auto& spec : environment) {
        if (spec.name == name) return &spec;
    }
    return nullptr;
}

std::vector<ParameterSpec> unite(const std::vector<ParameterSpec>& parent,
                                 const std::vector<ParameterSpec>& own) {
    std::vector<ParameterSpec> result;
    auto seen = [&result](const std::string& name) {
        return std::any_of(result.begin(), result.end(),
                           [&name](const ParameterSpec& s) { return s.name == name; });
    };
    for (const auto& spec : parent) {
        if (!seen(spec.name)) result.push_back(spec);
    }
    for (const auto& spec : own) {
        if (!seen(spec.name)) result.push_back(spec);
    }
    return result;
}

ParameterSchema unite(const ParameterSchema& parent, const ParameterSchema& own) {
    ParameterSchema result;
    result.material = unite(parent.material, own.material);
    result.environment = unite(parent.environment, own.environment);
    return result;
}

std::vector<std::string> missingParameters(const ParameterSchema& schema,
                                           const ParameterSet& material_params,
                                           const ParameterSet& environment_params) {
    std::vector<std::string> missing;
    for (const auto& spec : schema.material) {
        if (!spec.textual && !material_params.contains(spec.name)) {
            missing.push_back(spec.name);
        }
    }
    for (const auto& spec : schema.environment) {
        if (!spec.textual && !environment_params.contains(spec.name)) {
            missing.push_back(spec.name);
        }
    }
    return missing;
}

// =============================================================================
// HazardModel Implementation
// =============================================================================

HazardModel::HazardModel(const std::string& material,
                         const ParameterList& material_params,
                         const ParameterList& environment_params) {
    state_.material = material;
    state_.material_params = ParameterSet(material_params);
    state_.environment_params = ParameterSet(environment_params);
    refreshAbsentSet();
}

void HazardModel::setMaterialParams(const ParameterSet& params) {
    state_.material_params = params;
    state_.derived.clear();
    refreshAbsentSet();
}

void HazardModel::setEnvironmentParams(const ParameterSet& params) {
    state_.environment_params = params;
    state_.derived.clear();
    refreshAbsentSet();
}

void HazardModel::refreshAbsentSet() {
    state_.absent.clear();
    for (const auto& name : state_.material_params.absentNames()) {
        state_.absent.insert(name);
    }
    for (const auto& name : state_.environment_params.absentNames()) {
        state_.absent.insert(name);
    }
}

void HazardModel::recordResult(const std::string& label, double value) {
    state_.results.record(label, value);
}

void HazardModel::recordTextResult(const std::string& label, const std::string& value) {
    for (auto& entry : state_.text_results) {
        if (entry.first == label) {
            entry.second = value;
            return;
        }
    }
    state_.text_results.emplace_back(label, value);
}

bool HazardModel::isAbsent(const std::string& name) const {
    if (state_.absent.count(name)) return true;
    return !state_.material_params.contains(name) &&
           !state_.environment_params.contains(name);
}

std::optional<double> HazardModel::materialValue(const std::string& name) const {
    return state_.material_params.get(name);
}

std::optional<double> HazardModel::environmentValue(const std::string& name) const {
    return state_.environment_params.get(name);
}

double HazardModel::requireMaterial(const std::string& name) const {
    auto value = state_.material_params.get(name);
    if (!value) throw ValidationError(parameterError(name));
    return *value;
}

double HazardModel::requireEnvironment(const std::string& name) const {
    auto value = state_.environment_params.get(name);
    if (!value) throw ValidationError(parameterError(name));
    return *value;
}

std::optional<std::string> HazardModel::textValue(const std::string& name) const {
    for (const auto& entry : state_.text_params) {
        if (entry.first == name) return entry.second;
    }
    return std::nullopt;
}

void HazardModel::setTextValue(const std::string& name, const std::string& value) {
    for (auto& entry : state_.text_params) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    state_.text_params.emplace_back(name, value);
}

std::optional<double> HazardModel::cached(const std::string& key) const {
    auto it = state_.derived.find(key);
    if (it == state_.derived.end()) return std::nullopt;
    return it->second;
}

double HazardModel::storeDerived(const std::string& key, double value) {
    state_.derived[key] = value;
    return value;
}

std::vector<ParameterSpec> HazardModel::necessaryMaterialParams() {
    return {};
}

std::vector<ParameterSpec> HazardModel::necessaryEnvironmentParams() {
    return {};
}

// =============================================================================
// Audit report
// =============================================================================

namespace {

std::string titleCase(const std::string& text) {
    std::string result = text;
    bool start = true;
    for (auto& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(start ? std::toupper(uc) : std::tolower(uc));
            start = false;
        } else {
            start = true;
        }
    }
    return result;
}

std::string centered(const std::string& text, int width) {
    int pad = width - static_cast<int>(text.size());
    if (pad <= 0) return text;
    int left = pad / 2;
    return std::string(left, ' ') + text + std::string(pad - left, ' ');
}

std::string row(const std::string& name, const std::string& value,
                int name_width, int value_width) {
    std::string left = name;
    if (static_cast<int>(left.size()) < name_width) {
        left.append(name_width - left.size(), ' ');
    }
    std::string right = value;
    if (static_cast<int>(right.size()) < value_width) {
        right.insert(0, value_width - right.size(), ' ');
    }
    return left + right;
}

std::string valueText(const ParameterValue& value) {
    return value ? formatLabelValue(*value) : "None";
}

} // anonymous namespace

std::string HazardModel::getInfo(int width, int value_width) const {
    const int name_width = width - value_width;
    const std::string heavy(width, '=');
    const std::string light(width, '-');
    std::ostringstream info;

    info << centered(titleCase(reportTitle()), width) << "\n";
    info << heavy << "\n";
    info << row("Material", state_.material, name_width, value_width) << "\n";
    info << heavy << "\n";

    info << row("Material Parameter", "Value", name_width, value_width) << "\n";
    info << light << "\n";
    for (const auto& entry : state_.material_params.entries()) {
        info << row(entry.first, valueText(entry.second), name_width, value_width) << "\n";
    }
    info << heavy << "\n";

    info << row("Environment Parameter", "Value", name_width, value_width) << "\n";
    info << light << "\n";
    for (const auto& entry : state_.environment_params.entries()) {
        info << row(entry.first, valueText(entry.second), name_width, value_width) << "\n";
    }
    for (const auto& entry : state_.text_params) {
        info << row(entry.first, entry.second, name_width, value_width) << "\n";
    }
    info << heavy << "\n";

    info << row("Result", "Value", name_width, value_width) << "\n";
    info << light << "\n";
    for (const auto& entry : state_.results.entries()) {
        info << row(entry.first, formatLabelValue(entry.second), name_width, value_width) << "\n";
    }
    for (const auto& entry : state_.text_results) {
        info << row(entry.first, entry.second, name_width, value_width) << "\n";
    }
    info << heavy << "\n";

    return info.str();
}

} // namespace HAZCON
