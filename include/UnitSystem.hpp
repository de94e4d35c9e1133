#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <cmath>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace HAZCON {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature
 *
 * Every quantity the hazard models take can be written as
 * Length^a * Mass^b * Time^c * Temperature^d.
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to the base unit
 *
 * Base units are m, kg, s, K and rad. Values convert to base as
 * (value + offset) * to_base.
 */
struct Unit {
    std::string name;                   // Full name (e.g., "megapascal")
    std::string symbol;                 // Short symbol (e.g., "MPa")
    Dimension dimension;
    double to_base;
    double offset;                      // Affine offset (temperature scales)
    std::string category;
    std::vector<std::string> aliases;

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "",
         double off = 0.0, const std::vector<std::string>& alias_list = {})
        : name(n), symbol(s), dimension(d), to_base(factor), offset(off),
          category(cat), aliases(alias_list) {}

    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database used to bring user input into model units
 *
 * Covers the quantities of the hazard models: lengths and volumes of
 * inventories, pressures of blast waves, heats of combustion, radiant
 * flux, emission rates and gas concentrations, temperatures, angles and
 * cloud cover.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws ValidationError if a unit is unknown or the dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "45980 kJ/kg" into its number and unit
     * @param[out] value Parsed number, in the unit as written
     * @param[out] unit Unit text, empty when none is given
     * @return true if a number was found
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse a value and express it in @p target_unit
     *
     * A value written without a unit is taken to be in the target unit.
     * @throws ValidationError on a malformed number or incompatible unit
     */
    double parseAndConvert(const std::string& value_with_unit,
                           const std::string& target_unit) const;

    // =========================================================================
    // Utility Functions
    // =========================================================================

    /**
     * @brief Print unit database to stream
     */
    void printDatabase(std::ostream& os) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    void initializeDatabase();

    void addLengthUnits();
    void addMassUnits();
    void addTimeUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addAngleUnits();
    void addVelocityUnits();
    void addPressureUnits();
    void addEnergyUnits();
    void addPowerUnits();
    void addDensityUnits();
    void addTemperatureUnits();
    void addThermalUnits();
    void addFluxUnits();
    void addConcentrationUnits();
    void addDimensionlessUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

/**
 * @brief Global unit system instance (singleton pattern)
 */
class UnitSystemManager {
public:
    static UnitSystem& getInstance() {
        static UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

} // namespace HAZCON

#endif // UNIT_SYSTEM_HPP
