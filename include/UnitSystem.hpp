#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>

namespace DislocCore {

/**
 * @brief Unit dimension in terms of Length and Energy (L E)
 *
 * Every quantity the dislocation models consume is a combination
 * Length^a * Energy^b: moduli and stresses are E L^-3, gamma-surface
 * energies are E L^-2.
 */
struct Dimension {
    double L;  // Length exponent
    double E;  // Energy exponent

    Dimension(double length = 0, double energy = 0)
        : L(length), E(energy) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(E - other.E) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to the working units
 *
 * Working units are:
 * - Length: angstrom (Å)
 * - Energy: electronvolt (eV)
 *
 * so moduli are in eV/Å^3 and gamma-surface energies in eV/Å^2.
 */
struct Unit {
    std::string name;           // Full name (e.g., "gigapascal")
    std::string symbol;         // Short symbol (e.g., "GPa")
    Dimension dimension;
    double to_base;             // Multiply to get working units
    std::string category;
    std::vector<std::string> aliases;

    Unit() : to_base(1.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), category(cat) {}

    double convertToBase(double value) const { return value * to_base; }
    double convertFromBase(double value) const { return value / to_base; }
};

/**
 * @brief Unit database for atomistic and continuum input
 *
 * Parses strings such as "110 GPa", "140 mJ/m^2" or "2.86 angstrom" and
 * converts them into the working units (Å, eV).
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
    bool hasUnit(const std::string& name_or_symbol) const;

    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;
    std::vector<std::string> getCategories() const;

    /**
     * @throws std::runtime_error if the unit is unknown
     */
    Dimension getDimension(const std::string& unit_name) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or the dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    // Value in working units
    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "value unit" (e.g., "110 GPa") into its parts
     * @param[out] value Number as written
     * @param[out] unit Unit text, empty if none was given
     * @return true if a number was found
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse and convert to working units
     *
     * A bare number is taken to be in @p default_unit. An explicit unit must
     * have the same dimension as @p default_unit.
     *
     * @throws std::runtime_error on parse failure or dimension mismatch
     */
    double parseToBase(const std::string& value_with_unit,
                       const std::string& default_unit) const;

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    void addUnit(const Unit& unit);
    void addAlias(const std::string& unit_name, const std::string& alias);

    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    void initializeDatabase();

    void addLengthUnits();
    void addEnergyUnits();
    void addPressureUnits();
    void addSurfaceEnergyUnits();
    void addAngleUnits();

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

// Working-unit conversion constants
namespace Units {
    constexpr double EV_PER_ANGSTROM3_IN_GPA = 160.21766208;
    constexpr double EV_PER_ANGSTROM2_IN_MJ_PER_M2 = 16021.766208;
}

inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return UnitSystemManager::getInstance().convert(value, from, to);
}

inline double toWorkingUnits(double value, const std::string& unit) {
    return UnitSystemManager::getInstance().toBase(value, unit);
}

} // namespace DislocCore

#endif // UNIT_SYSTEM_HPP
