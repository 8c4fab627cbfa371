#include "DislocTypes.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace DislocCore {

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

std::string toString(BoundaryCondition bc) {
    switch (bc) {
        case BoundaryCondition::FIXED:    return "FIXED";
        case BoundaryCondition::PERIODIC: return "PERIODIC";
    }
    return "UNKNOWN";
}

std::string toString(SolverMethod method) {
    switch (method) {
        case SolverMethod::RELAXATION: return "RELAXATION";
        case SolverMethod::TAO_LMVM:   return "TAO_LMVM";
    }
    return "UNKNOWN";
}

std::string toString(SolverStatus status) {
    switch (status) {
        case SolverStatus::INITIALIZED:             return "INITIALIZED";
        case SolverStatus::ITERATING:               return "ITERATING";
        case SolverStatus::CONVERGED:               return "CONVERGED";
        case SolverStatus::MAX_ITERATIONS_EXCEEDED: return "MAX_ITERATIONS_EXCEEDED";
        case SolverStatus::TIME_LIMIT_EXCEEDED:     return "TIME_LIMIT_EXCEEDED";
    }
    return "UNKNOWN";
}

std::string toString(GammaInterpolation mode) {
    switch (mode) {
        case GammaInterpolation::BILINEAR: return "BILINEAR";
        case GammaInterpolation::BICUBIC:  return "BICUBIC";
    }
    return "UNKNOWN";
}

BoundaryCondition parseBoundaryCondition(const std::string& name) {
    std::string key = upper(name);
    if (key == "FIXED") return BoundaryCondition::FIXED;
    if (key == "PERIODIC") return BoundaryCondition::PERIODIC;
    throw std::invalid_argument("Unknown boundary condition: " + name);
}

SolverMethod parseSolverMethod(const std::string& name) {
    std::string key = upper(name);
    if (key == "RELAXATION") return SolverMethod::RELAXATION;
    if (key == "TAO_LMVM" || key == "TAO" || key == "LMVM") return SolverMethod::TAO_LMVM;
    throw std::invalid_argument("Unknown solver method: " + name);
}

GammaInterpolation parseGammaInterpolation(const std::string& name) {
    std::string key = upper(name);
    if (key == "BILINEAR" || key == "LINEAR") return GammaInterpolation::BILINEAR;
    if (key == "BICUBIC" || key == "CUBIC") return GammaInterpolation::BICUBIC;
    throw std::invalid_argument("Unknown gamma surface interpolation: " + name);
}

} // namespace DislocCore
