#include "ConfigReader.hpp"
#include "HazardErrors.hpp"
#include "ScenarioRunner.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace HAZCON {

ConfigReader::ConfigReader()
    : unit_system_(UnitSystemManager::getInstance()) {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadString(buffer.str());
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

bool ConfigReader::toDouble(const std::string& text, double& value) const {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;
    const char* begin = trimmed.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;
    value = parsed;
    return true;
}

bool ConfigReader::isAbsentText(const std::string& value) {
    std::string lower;
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return lower.empty() || lower == "none" || lower == "null" || lower == "nan";
}

// =============================================================================
// Raw value access
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    if (!hasKey(section, key)) return default_val;

    std::string val = getString(section, key);
    double value = 0.0;
    if (!toDouble(val, value)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key << " = '" << val
                  << "' as double, using default " << default_val << std::endl;
        return default_val;
    }
    return value;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    for (const auto& token : split(getString(section, key), ',')) {
        double value = 0.0;
        if (toDouble(token, value)) {
            result.push_back(value);
        } else {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }
    return result;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    try {
        return unit_system_.parseAndConvert(val, unit);
    } catch (const ValidationError& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& unit) const {
    std::vector<double> result;
    for (const auto& token : split(getString(section, key), ',')) {
        try {
            result.push_back(unit_system_.parseAndConvert(token, unit));
        } catch (const ValidationError& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                      << e.what() << std::endl;
        }
    }
    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

// =============================================================================
// Scenario parsing
// =============================================================================

bool ConfigReader::parseParameters(const std::string& section,
                                   const std::vector<ParameterSpec>& specs,
                                   ParameterList& params) const {
    params.clear();
    bool ok = true;

    // Declared parameters first, in declaration order
    for (const auto& spec : specs) {
        if (spec.textual || !hasKey(section, spec.name)) continue;

        std::string text = getString(section, spec.name);
        if (isAbsentText(text)) {
            params.emplace_back(spec.name, std::nullopt);
            continue;
        }
        try {
            params.emplace_back(spec.name, unit_system_.parseAndConvert(text, spec.unit));
        } catch (const ValidationError& e) {
            std::cerr << "Error: [" << section << "]:" << spec.name << " = " << text
                      << " - " << e.what() << std::endl;
            ok = false;
        }
    }

    // Anything else is passed through as a plain number
    for (const auto& entry : getSectionData(section)) {
        bool declared = std::any_of(specs.begin(), specs.end(),
                                    [&entry](const ParameterSpec& s) { return s.name == entry.first; });
        if (declared) continue;

        if (isAbsentText(entry.second)) {
            params.emplace_back(entry.first, std::nullopt);
            continue;
        }
        double value = 0.0;
        std::string unit;
        if (unit_system_.parseValueWithUnit(entry.second, value, unit) && unit.empty()) {
            params.emplace_back(entry.first, value);
        } else {
            std::cerr << "Warning: Ignoring [" << section << "]:" << entry.first
                      << " = " << entry.second << std::endl;
        }
    }

    return ok;
}

bool ConfigReader::parseScenarioConfig(ScenarioConfig& config) const {
    std::string model = getString("SCENARIO", "model");
    if (model.empty()) {
        std::cerr << "Error: [SCENARIO] model is not set" << std::endl;
        return false;
    }
    try {
        config.model = parseModelType(model);
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    config.material = getString("SCENARIO", "material");
    config.start_datetime = getString("ENVIRONMENT", "start_datetime");
    if (isAbsentText(config.start_datetime)) {
        config.start_datetime.clear();
    }

    ParameterSchema schema = ScenarioRunner::schemaFor(config.model);
    bool ok = parseParameters("MATERIAL", schema.material, config.material_params);
    ok = parseParameters("ENVIRONMENT", schema.environment, config.environment_params) && ok;
    return ok;
}

bool ConfigReader::parseCalculationConfig(CalculationConfig& config) const {
    const std::string s = "CALCULATION";

    config.alpha = getDouble(s, "alpha", config.alpha);
    config.beta = getDouble(s, "beta", config.beta);
    config.overpressures = getDoubleArrayWithUnit(s, "overpressures", "MPa");

    config.eta = getDouble(s, "eta", config.eta);
    config.theta = getDouble(s, "theta", config.theta);
    config.strengths = getDoubleArrayWithUnit(s, "strengths", "W/m2");

    config.distances = getDoubleArrayWithUnit(s, "distances", "m");

    config.sampling_minutes = getDoubleWithUnit(s, "sampling_minutes", config.sampling_minutes, "min");
    config.downwind_distances = getDoubleArrayWithUnit(s, "downwind_distances", "m");
    config.crosswind_offset = getDoubleWithUnit(s, "crosswind_offset", config.crosswind_offset, "m");
    config.ground_height = getDoubleWithUnit(s, "ground_height", config.ground_height, "m");
    config.source_height = getDoubleWithUnit(s, "source_height", config.source_height, "m");
    config.concentrations = getDoubleArrayWithUnit(s, "concentrations", "mg/m3");
    config.elapsed_time = getDoubleWithUnit(s, "elapsed_time", config.elapsed_time, "s");
    config.step = getDoubleWithUnit(s, "step", config.step, "m");
    config.axis_profile = getBool(s, "axis_profile", config.axis_profile);

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("SCENARIO")) {
        result.errors.push_back("No [SCENARIO] section found");
        result.valid = false;
        return result;
    }

    ModelType model = ModelType::VAPOR_CLOUD_EXPLOSION;
    try {
        model = parseModelType(getString("SCENARIO", "model"));
    } catch (const ValidationError& e) {
        result.errors.push_back(e.what());
        result.valid = false;
        return result;
    }

    if (!hasSection("CALCULATION")) {
        result.warnings.push_back("No [CALCULATION] section found - nothing will be computed");
    }

    ParameterSchema schema = ScenarioRunner::schemaFor(model);
    auto check = [&](const std::string& section, const std::vector<ParameterSpec>& specs) {
        for (const auto& spec : specs) {
            if (!spec.textual && !hasKey(section, spec.name)) {
                result.warnings.push_back("[" + section + "] does not mention " + spec.name);
            }
        }
        for (const auto& key : getKeys(section)) {
            bool declared = std::any_of(specs.begin(), specs.end(),
                                        [&key](const ParameterSpec& s) { return s.name == key; });
            if (!declared) {
                result.warnings.push_back("[" + section + "] " + key + " is not used by " +
                                          modelTypeName(model));
            }
        }
    };
    check("MATERIAL", schema.material);
    check("ENVIRONMENT", schema.environment);

    return result;
}

// =============================================================================
// Template generation
// =============================================================================

namespace {

// Values of the reference scenarios, written into generated templates
std::string sampleValue(ModelType model, const std::string& name) {
    if (model == ModelType::POOL_FIRE && name == "combustion_heat") return "41030000";
    static const std::map<std::string, std::string> samples = {
        {"material_density", "790"},
        {"combustion_heat", "45980"},
        {"tnt_explosive_energy", "4675"},
        {"material_volume", "none"},
        {"material_weight", "23700"},
        {"boiling_point", "none"},
        {"specific_heat_capacity", "none"},
        {"gasification_heat", "none"},
        {"burning_speed", "0.0781"},
        {"pool_radius", "24.7"},
        {"env_temp", "25"},
        {"air_density", "1.293"},
        {"center_longitude", "121.0583333"},
        {"center_latitude", "30.62083333"},
        {"total_cloudiness", "5"},
        {"low_cloudiness", "4"},
        {"wind_speed", "1.5"},
        {"source_strength", "25000"},
        {"start_datetime", "2019-01-01 00:00:00"}
    };
    auto it = samples.find(name);
    return it == samples.end() ? "none" : it->second;
}

void writeParameters(std::ofstream& file, ModelType model, const std::vector<ParameterSpec>& specs) {
    for (const auto& spec : specs) {
        std::string line = spec.name + " = " + sampleValue(model, spec.name);
        if (line.size() < 40) line.append(40 - line.size(), ' ');
        file << line << "# " << spec.unit << ", " << spec.description << "\n";
    }
}

} // anonymous namespace

bool ConfigReader::generateTemplate(const std::string& filename, ModelType model) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template: " << filename << std::endl;
        return false;
    }

    ParameterSchema schema = ScenarioRunner::schemaFor(model);

    file << "# HAZCON Scenario File\n";
    file << "# Values without a unit are in the unit shown in the comment\n";
    file << "# none / null / nan marks a parameter as absent\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value [unit]\n\n";

    file << "[SCENARIO]\n";
    file << "model = " << modelTypeName(model)
         << "        # VAPOR_CLOUD_EXPLOSION, POOL_FIRE, POINT_SOURCE_GAS_DIFFUSION\n";
    switch (model) {
        case ModelType::VAPOR_CLOUD_EXPLOSION:      file << "material = gasoline\n\n"; break;
        case ModelType::POOL_FIRE:                  file << "material = gasoline\n\n"; break;
        case ModelType::POINT_SOURCE_GAS_DIFFUSION: file << "material = H2\n\n"; break;
    }

    file << "[MATERIAL]\n";
    writeParameters(file, model, schema.material);
    file << "\n";

    file << "[ENVIRONMENT]\n";
    writeParameters(file, model, schema.environment);
    file << "\n";

    file << "[CALCULATION]\n";
    switch (model) {
        case ModelType::VAPOR_CLOUD_EXPLOSION:
            file << "alpha = 0.04                          # TNT equivalence factor\n";
            file << "beta = 1.8                            # Ground reflection factor\n";
            file << "distances = 50, 100                   # m\n";
            file << "overpressures = 0.1, 0.05, 0.02       # MPa\n";
            break;
        case ModelType::POOL_FIRE:
            file << "eta = 0.35                            # Radiative fraction (0.13 - 0.35)\n";
            file << "theta = 1.0                           # Atmospheric transmissivity\n";
            file << "distances = 100                       # m\n";
            file << "strengths = 37500, 25000, 12500       # W/m2\n";
            break;
        case ModelType::POINT_SOURCE_GAS_DIFFUSION:
            file << "sampling_minutes = 30                 # 30 - 6000 min\n";
            file << "downwind_distances = 100, 500         # m\n";
            file << "crosswind_offset = 0                  # m\n";
            file << "ground_height = 0                     # m\n";
            file << "source_height = 5                     # m\n";
            file << "concentrations = 30                   # mg/m3\n";
            file << "elapsed_time = 360                    # s\n";
            file << "step = 10                             # m\n";
            file << "axis_profile = false\n";
            break;
    }

    return true;
}

} // namespace HAZCON
