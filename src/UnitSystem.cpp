#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace DislocCore {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    if (std::abs(L) > 1e-10) {
        ss << "L";
        if (std::abs(L - 1.0) > 1e-10) ss << "^" << L;
        first = false;
    }

    if (std::abs(E) > 1e-10) {
        if (!first) ss << " ";
        ss << "E";
        if (std::abs(E - 1.0) > 1e-10) ss << "^" << E;
    }

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
    addEnergyUnits();
    addPressureUnits();
    addSurfaceEnergyUnits();
    addAngleUnits();
}

// =============================================================================
// Length Units
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0);

    Unit angstrom("angstrom", "A", length, 1.0, "length");
    angstrom.aliases = {"Å", "ang", "angstroms"};
    registerUnit(angstrom);

    registerUnit(Unit("nanometer", "nm", length, 10.0, "length"));
    registerUnit(Unit("picometer", "pm", length, 0.01, "length"));
    registerUnit(Unit("micrometer", "um", length, 1e4, "length"));
    registerUnit(Unit("meter", "m", length, 1e10, "length"));

    Unit bohr("bohr", "a0", length, 0.52917721067, "length");
    bohr.aliases = {"au_length"};
    registerUnit(bohr);
}

// =============================================================================
// Energy Units
// =============================================================================

void UnitSystem::addEnergyUnits() {
    Dimension energy(0, 1);

    registerUnit(Unit("electronvolt", "eV", energy, 1.0, "energy"));
    registerUnit(Unit("millielectronvolt", "meV", energy, 1e-3, "energy"));
    registerUnit(Unit("joule", "J", energy, 1.0 / 1.6021766208e-19, "energy"));

    Unit hartree("hartree", "Ha", energy, 27.21138602, "energy");
    hartree.aliases = {"Eh"};
    registerUnit(hartree);

    Unit rydberg("rydberg", "Ry", energy, 13.605693009, "energy");
    registerUnit(rydberg);
}

// =============================================================================
// Pressure / Stress / Modulus Units
// =============================================================================

void UnitSystem::addPressureUnits() {
    Dimension pressure(-3, 1);
    const double GPa = 1.0 / Units::EV_PER_ANGSTROM3_IN_GPA;

    Unit ev_a3("electronvolt per cubic angstrom", "eV/A^3", pressure, 1.0, "pressure");
    ev_a3.aliases = {"eV/A3", "eV/Å^3", "eV/Å3", "eV/angstrom^3"};
    registerUnit(ev_a3);

    registerUnit(Unit("pascal", "Pa", pressure, GPa * 1e-9, "pressure"));
    registerUnit(Unit("megapascal", "MPa", pressure, GPa * 1e-3, "pressure"));
    registerUnit(Unit("gigapascal", "GPa", pressure, GPa, "pressure"));
    registerUnit(Unit("bar", "bar", pressure, GPa * 1e-4, "pressure"));
    registerUnit(Unit("kilobar", "kbar", pressure, GPa * 0.1, "pressure"));
}

// =============================================================================
// Energy per Area Units (gamma surfaces, stacking faults)
// =============================================================================

void UnitSystem::addSurfaceEnergyUnits() {
    Dimension per_area(-2, 1);
    const double mJ_m2 = 1.0 / Units::EV_PER_ANGSTROM2_IN_MJ_PER_M2;

    Unit ev_a2("electronvolt per square angstrom", "eV/A^2", per_area, 1.0, "energy_per_area");
    ev_a2.aliases = {"eV/A2", "eV/Å^2", "eV/Å2", "eV/angstrom^2"};
    registerUnit(ev_a2);

    Unit mj("millijoule per square meter", "mJ/m^2", per_area, mJ_m2, "energy_per_area");
    mj.aliases = {"mJ/m2"};
    registerUnit(mj);

    Unit j("joule per square meter", "J/m^2", per_area, 1e3 * mJ_m2, "energy_per_area");
    j.aliases = {"J/m2"};
    registerUnit(j);
}

// =============================================================================
// Angle Units
// =============================================================================

void UnitSystem::addAngleUnits() {
    Dimension angle(0, 0);

    registerUnit(Unit("radian", "rad", angle, 1.0, "angle"));
    Unit degree("degree", "deg", angle, M_PI / 180.0, "angle");
    degree.aliases = {"degrees", "°"};
    registerUnit(degree);
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbols are case-sensitive first ("mJ/m^2" vs "MJ/m^2"), lowercase second
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        if (units_.find(toLowerCase(unit.symbol)) == units_.end()) {
            units_[toLowerCase(unit.symbol)] = unit;
        }
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
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
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
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
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        return unit->dimension;
    }
    throw std::runtime_error("Unit not found: " + unit_name);
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    return to->convertFromBase(from->convertToBase(value));
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + to_unit);
    }
    return unit->convertFromBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    // Find where the number ends and unit begins
    size_t i = 0;
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Exponent, but not the "e" of "eV"
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') i++;
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

double UnitSystem::parseToBase(const std::string& value_with_unit,
                               const std::string& default_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        return toBase(value, default_unit);
    }

    if (!areCompatible(unit, default_unit)) {
        throw std::runtime_error("Unit '" + unit + "' in '" + value_with_unit +
                                 "' is not compatible with " + default_unit);
    }
    return toBase(value, unit);
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const Unit& unit) {
    registerUnit(unit);
}

void UnitSystem::addAlias(const std::string& unit_name, const std::string& alias) {
    const Unit* unit = getUnit(unit_name);
    if (!unit) {
        throw std::runtime_error("Cannot alias unknown unit: " + unit_name);
    }
    Unit modified = *unit;
    modified.aliases.push_back(alias);
    registerUnit(modified);
}

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::stringstream ss;
    ss << std::setprecision(precision) << value << " " << unit;
    return ss.str();
}

} // namespace DislocCore
