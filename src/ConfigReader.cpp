#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace DislocCore {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            std::transform(current_section.begin(), current_section.end(),
                           current_section.begin(), ::toupper);
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

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values in the merged file override existing ones
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }
    return true;
}

void ConfigReader::set(const std::string& section, const std::string& key,
                       const std::string& value) {
    data[section][key] = value;
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

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    for (const auto& token : split(val, ',')) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }
    return result;
}

Vector3 ConfigReader::getVector3(const std::string& section, const std::string& key,
                                 const Vector3& default_val) const {
    if (!hasKey(section, key)) return default_val;

    std::vector<double> values = getDoubleArray(section, key);
    if (values.size() != 3) {
        throw std::invalid_argument("[" + section + "]:" + key + " needs three components");
    }
    return Vector3(values[0], values[1], values[2]);
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    try {
        if (default_unit.empty()) {
            double parsed_value;
            std::string parsed_unit;
            if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
                throw std::runtime_error("Failed to parse: " + val);
            }
            return parsed_unit.empty() ? parsed_value
                                       : unit_system_.toBase(parsed_value, parsed_unit);
        }
        return unit_system_.parseToBase(val, default_unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    // A trailing unit on the last token applies to every token ("0, 0, 2.5 A")
    std::vector<std::string> tokens = split(val, ',');
    std::string shared_unit = default_unit;
    if (!tokens.empty()) {
        double v;
        std::string u;
        if (unit_system_.parseValueWithUnit(tokens.back(), v, u) && !u.empty()) {
            shared_unit = u;
        }
    }

    for (const auto& token : tokens) {
        try {
            result.push_back(shared_unit.empty() ? std::stod(token)
                                                 : unit_system_.parseToBase(token, shared_unit));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                      << e.what() << std::endl;
        }
    }
    return result;
}

// =============================================================================
// Section/Key Queries
// =============================================================================

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
// Domain Parsers
// =============================================================================

ElasticConstants ConfigReader::parseElasticConstants() const {
    if (!hasSection("ELASTIC")) {
        throw std::invalid_argument("Configuration has no [ELASTIC] section");
    }

    std::map<std::string, double> values;
    static const char* moduli[] = {"lambda", "mu", "shear_modulus", "youngs_modulus"};
    for (const char* key : moduli) {
        if (hasKey("ELASTIC", key)) {
            values[key] = getDoubleWithUnit("ELASTIC", key, 0.0, "GPa");
        }
    }
    for (int i = 1; i <= 6; ++i) {
        for (int j = i; j <= 6; ++j) {
            std::string key = "c" + std::to_string(i) + std::to_string(j);
            if (hasKey("ELASTIC", key)) {
                values[key] = getDoubleWithUnit("ELASTIC", key, 0.0, "GPa");
            }
        }
    }
    if (hasKey("ELASTIC", "poisson_ratio")) {
        values["poisson_ratio"] = getDouble("ELASTIC", "poisson_ratio", 0.0);
    }

    std::string symmetry = getString("ELASTIC", "symmetry", "isotropic");
    return ElasticConstants::fromConfig(values, symmetry);
}

DislocationGeometry ConfigReader::parseDislocationGeometry() const {
    std::vector<double> b = getDoubleArrayWithUnit("DISLOCATION", "burgers", "A");
    if (b.size() != 3) {
        throw std::invalid_argument("[DISLOCATION]:burgers needs three components");
    }
    Vector3 burgers(b[0], b[1], b[2]);

    Vector3 n = getVector3("DISLOCATION", "plane_normal", Vector3(0.0, 1.0, 0.0));
    Vector3 m;
    if (hasKey("DISLOCATION", "glide_direction")) {
        m = getVector3("DISLOCATION", "glide_direction", Vector3::UnitX());
    } else if (hasKey("DISLOCATION", "line_direction")) {
        // xi = m × n, so m = n × xi for orthonormal axes
        Vector3 xi = getVector3("DISLOCATION", "line_direction", Vector3::UnitZ());
        m = n.normalized().cross(xi.normalized());
    } else {
        m = Vector3::UnitX();
    }

    double tol = getDouble("DISLOCATION", "axis_tolerance", 1e-8);
    return DislocationGeometry(burgers, m, n, tol);
}

VolterraOptions ConfigReader::parseVolterraOptions() const {
    VolterraOptions options;
    options.configure(getSectionData("DISLOCATION"));
    return options;
}

GammaSurface ConfigReader::parseGammaSurface(const Vector3& burgers_frame) const {
    if (!hasSection("GAMMA_SURFACE")) {
        throw std::invalid_argument("Configuration has no [GAMMA_SURFACE] section");
    }

    // In-plane Burgers vector and its in-plane normal
    Vector3 b_plane(burgers_frame(0), 0.0, burgers_frame(2));
    Vector3 a1 = getVector3("GAMMA_SURFACE", "a1vect", b_plane);
    Vector3 a2_default(a1(2), 0.0, -a1(0));
    Vector3 a2 = getVector3("GAMMA_SURFACE", "a2vect", a2_default);
    if (a1.norm() == 0.0) {
        throw std::invalid_argument("Gamma surface a1vect is zero (pure climb Burgers vector?)");
    }

    int n1 = getInt("GAMMA_SURFACE", "n1", 32);
    int n2 = getInt("GAMMA_SURFACE", "n2", 32);
    bool periodic = getBool("GAMMA_SURFACE", "periodic", true);
    GammaInterpolation mode =
        parseGammaInterpolation(getString("GAMMA_SURFACE", "interpolation", "BICUBIC"));

    std::string model = getString("GAMMA_SURFACE", "model", "sinusoidal");
    std::transform(model.begin(), model.end(), model.begin(), ::tolower);

    if (model == "sinusoidal") {
        double usf = getDoubleWithUnit("GAMMA_SURFACE", "unstable_fault_energy", 0.0, "mJ/m^2");
        if (!(usf > 0.0)) {
            throw std::invalid_argument("[GAMMA_SURFACE]:unstable_fault_energy must be positive");
        }
        return GammaSurface::fromFunction(a1, a2, n1, n2,
            [usf](double f1, double) { return 0.5 * usf * (1.0 - std::cos(2.0 * M_PI * f1)); },
            mode, periodic);
    }

    if (model == "table") {
        std::string unit = getString("GAMMA_SURFACE", "energy_unit", "mJ/m^2");
        std::vector<double> energies = getDoubleArrayWithUnit("GAMMA_SURFACE", "energies", unit);
        return GammaSurface(a1, a2, n1, n2, std::move(energies), mode, periodic);
    }

    throw std::invalid_argument("Unknown gamma surface model: " + model);
}

bool ConfigReader::parseGridConfig(GridConfig& config) const {
    config.xmax = getDoubleWithUnit("GRID", "xmax", 50.0, "A");
    config.npoints = getInt("GRID", "npoints", 401);
    config.boundary = parseBoundaryCondition(getString("GRID", "boundary", "FIXED"));
    config.initial_halfwidth = getDoubleWithUnit("GRID", "initial_halfwidth", 2.0, "A");
    config.initial_shift = getDoubleWithUnit("GRID", "initial_shift", 0.0, "A");
    return hasSection("GRID");
}

bool ConfigReader::parseSolverOptions(SDVPNOptions& options) const {
    options.configure(getSectionData("SOLVER"));
    return hasSection("SOLVER");
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    config.profile_file = getString("OUTPUT", "profile_file", "");
    config.precision = getInt("OUTPUT", "precision", 10);
    config.write_density = getBool("OUTPUT", "write_density", false);
    return hasSection("OUTPUT");
}

Matrix3 ConfigReader::parseAppliedStress() const {
    Matrix3 tau = Matrix3::Zero();
    if (!hasKey("SOLVER", "applied_stress")) return tau;

    std::vector<double> s = getDoubleArrayWithUnit("SOLVER", "applied_stress", "GPa");
    if (s.size() != 6) {
        throw std::invalid_argument("[SOLVER]:applied_stress needs six Voigt components");
    }
    tau << s[0], s[5], s[4],
           s[5], s[1], s[3],
           s[4], s[3], s[2];
    return tau;
}

Matrix3 ConfigReader::parseSurfaceCorrection() const {
    Matrix3 beta = Matrix3::Zero();
    if (!hasKey("SOLVER", "surface_correction")) return beta;

    Vector3 diag = getVector3("SOLVER", "surface_correction", Vector3::Zero());
    beta.diagonal() = diag;
    return beta;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write configuration template: " + filename);
    }

    file << "# DislocCore Configuration File\n";
    file << "# Working units are angstrom and eV; dimensional values accept units\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[ELASTIC]\n";
    file << "symmetry = cubic                      # isotropic, cubic, hexagonal, full\n";
    file << "c11 = 243.3 GPa\n";
    file << "c12 = 145.0 GPa\n";
    file << "c44 = 116.0 GPa\n";
    file << "# Isotropic alternatives:\n";
    file << "# shear_modulus = 80 GPa\n";
    file << "# poisson_ratio = 0.3\n\n";

    file << "[DISLOCATION]\n";
    file << "# Vectors in the Cartesian frame of the elastic constants\n";
    file << "burgers = 2.4855, 0.0, 0.0            # angstrom\n";
    file << "plane_normal = 0, 1, 0                # n\n";
    file << "glide_direction = 1, 0, 0             # m, line direction is m x n\n";
    file << "field_tolerance = 1e-8\n";
    file << "isotropy_tolerance = 1e-6\n";
    file << "force_anisotropic = false\n";
    file << "# branch_cut = 0, -1, 0               # default is -n\n\n";

    file << "[GAMMA_SURFACE]\n";
    file << "model = sinusoidal                    # sinusoidal, table\n";
    file << "unstable_fault_energy = 400 mJ/m^2\n";
    file << "n1 = 32\n";
    file << "n2 = 32\n";
    file << "interpolation = BICUBIC               # BICUBIC, BILINEAR\n";
    file << "periodic = true\n";
    file << "# a1vect = 2.4855, 0, 0               # dislocation frame, default: in-plane b\n";
    file << "# energies = ...                      # n1*n2 values for model = table\n";
    file << "# energy_unit = mJ/m^2\n\n";

    file << "[GRID]\n";
    file << "xmax = 50.0                           # angstrom\n";
    file << "npoints = 401\n";
    file << "boundary = FIXED                      # FIXED, PERIODIC\n";
    file << "initial_halfwidth = 2.0               # angstrom\n";
    file << "initial_shift = 0.0\n\n";

    file << "[SOLVER]\n";
    file << "method = RELAXATION                   # RELAXATION, TAO_LMVM\n";
    file << "tolerance = 1e-6\n";
    file << "max_iterations = 1000\n";
    file << "damping = 1.0\n";
    file << "energy_tolerance = 1e-10\n";
    file << "step_growth = 1.5\n";
    file << "min_step_fraction = 1e-8\n";
    file << "frozen_components = n                 # subset of m, n, xi or none\n";
    file << "time_limit = 0                        # seconds, 0 = none\n";
    file << "verbose = true\n";
    file << "# applied_stress = 0, 0, 0, 0, 0, 0.5 GPa   # Voigt, dislocation frame\n";
    file << "# surface_correction = 0, 0, 0       # eV/angstrom\n\n";

    file << "[OUTPUT]\n";
    file << "profile_file = profile.txt            # empty prints to stdout\n";
    file << "precision = 10\n";
    file << "write_density = false\n";
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("ELASTIC")) {
        result.errors.push_back("No [ELASTIC] section found");
        result.valid = false;
    }
    if (!hasKey("DISLOCATION", "burgers")) {
        result.errors.push_back("No [DISLOCATION] burgers vector given");
        result.valid = false;
    }
    if (!hasSection("GAMMA_SURFACE")) {
        result.errors.push_back("No [GAMMA_SURFACE] section found");
        result.valid = false;
    }
    if (!hasSection("GRID")) {
        result.warnings.push_back("No [GRID] section found - using defaults");
    }
    if (!hasSection("SOLVER")) {
        result.warnings.push_back("No [SOLVER] section found - using defaults");
    }

    if (hasKey("ELASTIC", "poisson_ratio")) {
        double nu = getDouble("ELASTIC", "poisson_ratio", 0.25);
        if (nu <= -1.0 || nu >= 0.5) {
            result.errors.push_back("Invalid Poisson's ratio (must be -1 to 0.5)");
            result.valid = false;
        }
    }

    if (hasSection("GRID")) {
        if (getInt("GRID", "npoints", 401) < 3) {
            result.errors.push_back("[GRID] npoints must be at least 3");
            result.valid = false;
        }
        if (!(getDoubleWithUnit("GRID", "xmax", 50.0, "A") > 0.0)) {
            result.errors.push_back("[GRID] xmax must be positive");
            result.valid = false;
        }
    }

    std::string model = getString("GAMMA_SURFACE", "model", "sinusoidal");
    std::transform(model.begin(), model.end(), model.begin(), ::tolower);
    if (hasSection("GAMMA_SURFACE") && model == "sinusoidal" &&
        !(getDoubleWithUnit("GAMMA_SURFACE", "unstable_fault_energy", 0.0, "mJ/m^2") > 0.0)) {
        result.errors.push_back("[GAMMA_SURFACE] unstable_fault_energy must be positive");
        result.valid = false;
    }

    if (getDouble("SOLVER", "tolerance", 1e-6) <= 0.0) {
        result.errors.push_back("[SOLVER] tolerance must be positive");
        result.valid = false;
    }

    return result;
}

} // namespace DislocCore
