#include "VolterraDislocation.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace DislocCore {

// =============================================================================
// Utility functions
// =============================================================================

static double parseDouble(const std::map<std::string, std::string>& config,
                          const std::string& key, double default_val) {
    auto it = config.find(key);
    if (it != config.end() && !it->second.empty()) {
        try {
            return std::stod(it->second);
        } catch (const std::exception&) {
            throw std::invalid_argument("Cannot parse '" + it->second + "' for " + key);
        }
    }
    return default_val;
}

static bool parseBool(const std::map<std::string, std::string>& config,
                      const std::string& key, bool default_val) {
    auto it = config.find(key);
    if (it == config.end() || it->second.empty()) return default_val;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;
    return default_val;
}

// =============================================================================
// VolterraOptions Implementation
// =============================================================================

void VolterraOptions::configure(const std::map<std::string, std::string>& config) {
    tolerance = parseDouble(config, "field_tolerance", 1e-8);
    isotropy_tolerance = parseDouble(config, "isotropy_tolerance", 1e-6);
    force_anisotropic = parseBool(config, "force_anisotropic", false);

    auto it = config.find("branch_cut");
    if (it != config.end() && !it->second.empty()) {
        std::stringstream ss(it->second);
        std::string item;
        std::vector<double> values;
        while (std::getline(ss, item, ',')) {
            values.push_back(std::stod(item));
        }
        if (values.size() != 3) {
            throw std::invalid_argument("branch_cut needs three components");
        }
        cut_direction = Vector3(values[0], values[1], values[2]);
        has_cut_direction = true;
    }
}

// =============================================================================
// VolterraDislocation Implementation
// =============================================================================

VolterraDislocation::VolterraDislocation(IsotropicVolterraDislocation model)
    : model_(std::move(model)) {}

VolterraDislocation::VolterraDislocation(AnisotropicStrohDislocation model)
    : model_(std::move(model)) {}

Vector3 VolterraDislocation::displacement(const Vector3& position) const {
    return std::visit([&position](const auto& m) { return m.displacement(position); }, model_);
}

Matrix3 VolterraDislocation::stress(const Vector3& position) const {
    return std::visit([&position](const auto& m) { return m.stress(position); }, model_);
}

Matrix3 VolterraDislocation::K_tensor() const {
    return std::visit([](const auto& m) { return m.K_tensor(); }, model_);
}

const DislocationGeometry& VolterraDislocation::geometry() const {
    return std::visit([](const auto& m) -> const DislocationGeometry& { return m.geometry(); },
                      model_);
}

double VolterraDislocation::K_coeff() const {
    Vector3 b = geometry().burgersInFrame();
    Vector3 bhat = b / b.norm();
    return bhat.dot(K_tensor() * bhat);
}

double VolterraDislocation::preln() const {
    Vector3 b = geometry().burgersInFrame();
    return b.dot(K_tensor() * b) / (4.0 * M_PI);
}

VolterraDislocation solveVolterraDislocation(const ElasticConstants& C,
                                             const DislocationGeometry& geometry,
                                             const VolterraOptions& options) {
    BranchCut cut;
    if (options.has_cut_direction) {
        cut = BranchCut(geometry.planeAngle(options.cut_direction));
    }

    if (!options.force_anisotropic && C.isIsotropic(options.isotropy_tolerance)) {
        return VolterraDislocation(IsotropicVolterraDislocation(
            C.shearModulus(), C.poissonRatio(), geometry, cut, options.tolerance));
    }
    return VolterraDislocation(AnisotropicStrohDislocation(C, geometry, cut, options.tolerance));
}

} // namespace DislocCore
