#ifndef DISLOC_TYPES_HPP
#define DISLOC_TYPES_HPP

#include <Eigen/Dense>

#include <array>
#include <complex>
#include <string>

namespace DislocCore {

// Dense small-matrix types shared by every module
using Vector3 = Eigen::Vector3d;
using Matrix3 = Eigen::Matrix3d;
using Matrix6 = Eigen::Matrix<double, 6, 6>;
using Complex = std::complex<double>;
using ComplexVector3 = Eigen::Matrix<Complex, 3, 1>;

/**
 * @brief Boundary treatment of the slip-plane discretization
 *
 * FIXED pins the first and last disregistry to 0 and b (isolated dislocation),
 * PERIODIC treats the grid as one period of a dislocation array with
 * delta(x + L) = delta(x) + b.
 */
enum class BoundaryCondition {
    FIXED,
    PERIODIC
};

/**
 * @brief Minimization strategy used by the SDVPN solver
 */
enum class SolverMethod {
    RELAXATION,     ///< Preconditioned fixed-point relaxation with adaptive damping
    TAO_LMVM        ///< PETSc TAO limited-memory variable metric
};

/**
 * @brief SDVPN solver state machine
 */
enum class SolverStatus {
    INITIALIZED,
    ITERATING,
    CONVERGED,
    MAX_ITERATIONS_EXCEEDED,
    TIME_LIMIT_EXCEEDED
};

/**
 * @brief Interpolation scheme of the gamma surface
 */
enum class GammaInterpolation {
    BILINEAR,
    BICUBIC
};

std::string toString(BoundaryCondition bc);
std::string toString(SolverMethod method);
std::string toString(SolverStatus status);
std::string toString(GammaInterpolation mode);

BoundaryCondition parseBoundaryCondition(const std::string& name);
SolverMethod parseSolverMethod(const std::string& name);
GammaInterpolation parseGammaInterpolation(const std::string& name);

} // namespace DislocCore

#endif // DISLOC_TYPES_HPP
