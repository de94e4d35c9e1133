#include "UnitSystem.hpp"
#include "HAZCON.hpp"
#include "HazardErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace HAZCON {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    auto append = [&](const char* symbol, double exponent) {
        if (std::abs(exponent) <= 1e-10) return;
        if (!first) ss << " ";
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << exponent;
        first = false;
    };

    append("L", L);
    append("M", M);
    append("T", T);
    append("Theta", Theta);

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addLengthUnits();
    addMassUnits();
    addTimeUnits();
    addAreaUnits();
    addVolumeUnits();
    addAngleUnits();
    addVelocityUnits();
    addPressureUnits();
    addEnergyUnits();
    addPowerUnits();
    addDensityUnits();
    addTemperatureUnits();
    addThermalUnits();
    addFluxUnits();
    addConcentrationUnits();
    addDimensionlessUnits();
}

// =============================================================================
// Base quantities
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length", 0.0, {"metre", "meters"}));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));
    registerUnit(Unit("foot", "ft", length, 0.3048, "length", 0.0, {"feet"}));
    registerUnit(Unit("inch", "in", length, 0.0254, "length"));
    registerUnit(Unit("mile", "mi", length, 1609.344, "length"));
}

void UnitSystem::addMassUnits() {
    Dimension mass(0, 1, 0);

    registerUnit(Unit("kilogram", "kg", mass, 1.0, "mass"));
    registerUnit(Unit("gram", "g", mass, 0.001, "mass"));
    registerUnit(Unit("milligram", "mg", mass, 1e-6, "mass"));
    registerUnit(Unit("tonne", "t", mass, 1000.0, "mass", 0.0, {"metric ton"}));
    registerUnit(Unit("pound mass", "lbm", mass, 0.45359237, "mass", 0.0, {"lb"}));
}

void UnitSystem::addTimeUnits() {
    Dimension time(0, 0, 1);

    registerUnit(Unit("second", "s", time, 1.0, "time", 0.0, {"sec"}));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));
    registerUnit(Unit("hour", "hr", time, 3600.0, "time", 0.0, {"h"}));
    registerUnit(Unit("day", "day", time, 86400.0, "time", 0.0, {"d"}));
}

void UnitSystem::addAreaUnits() {
    Dimension area(2, 0, 0);

    registerUnit(Unit("square meter", "m2", area, 1.0, "area", 0.0, {"m^2"}));
    registerUnit(Unit("square centimeter", "cm2", area, 1e-4, "area"));
    registerUnit(Unit("square kilometer", "km2", area, 1e6, "area"));
    registerUnit(Unit("hectare", "ha", area, 1e4, "area"));
    registerUnit(Unit("square foot", "ft2", area, 0.09290304, "area"));
}

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    registerUnit(Unit("cubic meter", "m3", volume, 1.0, "volume", 0.0, {"m^3"}));
    registerUnit(Unit("cubic centimeter", "cm3", volume, 1e-6, "volume"));
    registerUnit(Unit("liter", "L", volume, 0.001, "volume", 0.0, {"litre"}));
    registerUnit(Unit("milliliter", "mL", volume, 1e-6, "volume"));
    registerUnit(Unit("cubic foot", "ft3", volume, 0.028316846592, "volume"));
    registerUnit(Unit("gallon US", "gal", volume, 0.003785411784, "volume"));
    registerUnit(Unit("barrel", "bbl", volume, 0.158987294928, "volume"));
}

// Angles are dimensionless; convert() keeps them apart from other ratios by category
void UnitSystem::addAngleUnits() {
    Dimension angle(0, 0, 0);

    registerUnit(Unit("radian", "rad", angle, 1.0, "angle"));
    registerUnit(Unit("degree", "deg", angle, HazardConstants::DEG_TO_RAD, "angle", 0.0,
                      {"degrees"}));
}

void UnitSystem::addVelocityUnits() {
    Dimension velocity(1, 0, -1);

    registerUnit(Unit("meter per second", "m/s", velocity, 1.0, "velocity"));
    registerUnit(Unit("kilometer per hour", "km/h", velocity, 1000.0 / 3600.0, "velocity",
                      0.0, {"kph"}));
    registerUnit(Unit("mile per hour", "mph", velocity, 0.44704, "velocity"));
    registerUnit(Unit("knot", "kn", velocity, 1852.0 / 3600.0, "velocity", 0.0, {"knots"}));
}

// =============================================================================
// Blast and energy quantities
// =============================================================================

void UnitSystem::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1e3, "pressure"));
    registerUnit(Unit("megapascal", "MPa", pressure, 1e6, "pressure"));
    registerUnit(Unit("bar", "bar", pressure, 1e5, "pressure"));
    registerUnit(Unit("millibar", "mbar", pressure, 100.0, "pressure"));
    registerUnit(Unit("atmosphere", "atm", pressure, 101325.0, "pressure"));
    registerUnit(Unit("pound per square inch", "psi", pressure, 6894.757293168, "pressure"));
}

void UnitSystem::addEnergyUnits() {
    Dimension energy(2, 1, -2);

    registerUnit(Unit("joule", "J", energy, 1.0, "energy"));
    registerUnit(Unit("kilojoule", "kJ", energy, 1e3, "energy"));
    registerUnit(Unit("megajoule", "MJ", energy, 1e6, "energy"));
    registerUnit(Unit("gigajoule", "GJ", energy, 1e9, "energy"));
    registerUnit(Unit("kilocalorie", "kcal", energy, 4184.0, "energy"));
    registerUnit(Unit("kilowatt hour", "kWh", energy, 3.6e6, "energy"));

    Dimension specific_energy(2, 0, -2);

    registerUnit(Unit("joule per kilogram", "J/kg", specific_energy, 1.0, "specific_energy"));
    registerUnit(Unit("kilojoule per kilogram", "kJ/kg", specific_energy, 1e3, "specific_energy"));
    registerUnit(Unit("megajoule per kilogram", "MJ/kg", specific_energy, 1e6, "specific_energy"));
    registerUnit(Unit("kilocalorie per kilogram", "kcal/kg", specific_energy, 4184.0,
                      "specific_energy"));
    registerUnit(Unit("btu per pound", "BTU/lb", specific_energy, 2326.0, "specific_energy"));
}

void UnitSystem::addPowerUnits() {
    Dimension power(2, 1, -3);

    registerUnit(Unit("watt", "W", power, 1.0, "power"));
    registerUnit(Unit("kilowatt", "kW", power, 1e3, "power"));
    registerUnit(Unit("megawatt", "MW", power, 1e6, "power"));
}

void UnitSystem::addDensityUnits() {
    Dimension density(-3, 1, 0);

    registerUnit(Unit("kilogram per cubic meter", "kg/m3", density, 1.0, "density",
                      0.0, {"kg/m^3"}));
    registerUnit(Unit("gram per cubic centimeter", "g/cm3", density, 1000.0, "density",
                      0.0, {"g/cc"}));
    registerUnit(Unit("gram per liter", "g/L", density, 1.0, "density"));
    registerUnit(Unit("pound per cubic foot", "lbm/ft3", density, 16.01846337, "density"));
}

// =============================================================================
// Thermal quantities
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));
    registerUnit(Unit("celsius", "degC", temperature, 1.0, "temperature", 273.15, {"C"}));
    registerUnit(Unit("fahrenheit", "degF", temperature, 5.0 / 9.0, "temperature", 459.67,
                      {"F"}));
    registerUnit(Unit("rankine", "degR", temperature, 5.0 / 9.0, "temperature"));
}

void UnitSystem::addThermalUnits() {
    Dimension heat_capacity(2, 0, -2, -1);

    registerUnit(Unit("joule per kilogram kelvin", "J/(kg*K)", heat_capacity, 1.0,
                      "heat_capacity", 0.0, {"J/kg/K", "J/(kg.K)", "J/kgK"}));
    registerUnit(Unit("kilojoule per kilogram kelvin", "kJ/(kg*K)", heat_capacity, 1e3,
                      "heat_capacity", 0.0, {"kJ/kg/K", "kJ/(kg.K)", "kJ/kgK"}));

    Dimension mass_flux(-2, 1, -1);

    registerUnit(Unit("kilogram per square meter second", "kg/(m2*s)", mass_flux, 1.0,
                      "mass_flux", 0.0, {"kg/m2/s", "kg/(m2.s)", "kg/m2s"}));
    registerUnit(Unit("gram per square meter second", "g/(m2*s)", mass_flux, 1e-3,
                      "mass_flux", 0.0, {"g/m2/s", "g/(m2.s)"}));
}

void UnitSystem::addFluxUnits() {
    Dimension heat_flux(0, 1, -3);

    registerUnit(Unit("watt per square meter", "W/m2", heat_flux, 1.0, "heat_flux",
                      0.0, {"W/m^2"}));
    registerUnit(Unit("kilowatt per square meter", "kW/m2", heat_flux, 1e3, "heat_flux",
                      0.0, {"kW/m^2"}));

    Dimension mass_rate(0, 1, -1);

    registerUnit(Unit("kilogram per second", "kg/s", mass_rate, 1.0, "mass_rate"));
    registerUnit(Unit("gram per second", "g/s", mass_rate, 1e-3, "mass_rate"));
    registerUnit(Unit("milligram per second", "mg/s", mass_rate, 1e-6, "mass_rate"));
    registerUnit(Unit("kilogram per hour", "kg/h", mass_rate, 1.0 / 3600.0, "mass_rate"));
    registerUnit(Unit("tonne per hour", "t/h", mass_rate, 1000.0 / 3600.0, "mass_rate"));
}

// =============================================================================
// Dispersion quantities
// =============================================================================

void UnitSystem::addConcentrationUnits() {
    Dimension concentration(-3, 1, 0);

    registerUnit(Unit("milligram per cubic meter", "mg/m3", concentration, 1e-6,
                      "concentration", 0.0, {"mg/m^3"}));
    registerUnit(Unit("gram per cubic meter", "g/m3", concentration, 1e-3,
                      "concentration", 0.0, {"g/m^3"}));
    registerUnit(Unit("microgram per cubic meter", "ug/m3", concentration, 1e-9,
                      "concentration", 0.0, {"ug/m^3"}));
    registerUnit(Unit("milligram per liter", "mg/L", concentration, 1e-3, "concentration"));
}

void UnitSystem::addDimensionlessUnits() {
    Dimension none(0, 0, 0);

    registerUnit(Unit("fraction", "fraction", none, 1.0, "dimensionless"));
    registerUnit(Unit("percent", "%", none, 0.01, "dimensionless"));
    registerUnit(Unit("tenths", "tenths", none, 0.1, "dimensionless", 0.0, {"tenth"}));
    registerUnit(Unit("oktas", "okta", none, 0.125, "dimensionless", 0.0, {"oktas"}));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Exact symbol first; the lowercase copy only fills a free slot
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_.emplace(toLowerCase(unit.symbol), unit);
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        units_.emplace(toLowerCase(alias), unit);
    }

    if (!unit.category.empty()) {
        auto& names = categories_[unit.category];
        if (std::find(names.begin(), names.end(), key) == names.end()) {
            names.push_back(key);
        }
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    std::string key = trim(name_or_symbol);
    auto it = units_.find(key);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(key));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw ValidationError("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw ValidationError("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw ValidationError("Incompatible dimensions: " +
                              from->dimension.toString() + " vs " +
                              to->dimension.toString());
    }
    if (from->dimension == Dimension() && from->category != to->category) {
        throw ValidationError("Incompatible units: " + from->category + " vs " + to->category);
    }

    return to->convertFromBase(from->convertToBase(value));
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    size_t i = 0;
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        unsigned char c = static_cast<unsigned char>(trimmed[i]);
        if (std::isdigit(c)) {
            has_digits = true;
            i++;
        } else if (c == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((c == 'e' || c == 'E') && has_digits) {
            // Exponent only when a digit follows, so "5 eV"-like text stays a unit
            size_t j = i + 1;
            if (j < trimmed.length() && (trimmed[j] == '+' || trimmed[j] == '-')) j++;
            if (j < trimmed.length() && std::isdigit(static_cast<unsigned char>(trimmed[j]))) {
                i = j;
            } else {
                break;
            }
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    const char* begin = num_str.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;

    value = parsed;
    unit = trim(trimmed.substr(i));
    return true;
}

double UnitSystem::parseAndConvert(const std::string& value_with_unit,
                                   const std::string& target_unit) const {
    double value = 0.0;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw ValidationError("Failed to parse: " + value_with_unit);
    }

    // No unit written: already in the model unit
    if (unit.empty() || target_unit.empty()) {
        return value;
    }

    return convert(value, unit, target_unit);
}

// =============================================================================
// Utility Functions
// =============================================================================

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(34) << std::left << u.name
                   << " [" << std::setw(10) << u.symbol << "] "
                   << " = " << u.to_base << " * base"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace HAZCON
