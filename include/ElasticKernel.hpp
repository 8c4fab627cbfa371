#ifndef ELASTIC_KERNEL_HPP
#define ELASTIC_KERNEL_HPP

#include "DislocTypes.hpp"
#include <vector>

namespace DislocCore {

class VolterraDislocation;

/**
 * @brief Discretized elastic interaction of a dislocation density on the slip plane
 *
 * The disregistry lives on N grid points x_i = x_0 + i h. Each cell between
 * consecutive points carries a constant density rho_i = (delta_{i+1} - delta_i) / h
 * and the elastic energy per unit length is
 *
 *   E_el = -(1/4π) Σ_ij I_|i-j| rho_i · K · rho_j
 *
 * where I_k is the exact double integral of ln|x - x'| over two cells k apart.
 * With PERIODIC boundaries the grid is one period L = N h, the last cell closes
 * onto delta_0 + b and the kernel becomes ln|2 sin(π(x - x')/L)|.
 *
 * K is the energy coefficient tensor in the dislocation frame (m, n, xi).
 */
class ElasticKernel {
public:
    /**
     * @param K Energy coefficient tensor (symmetric positive definite)
     * @param spacing Grid spacing h
     * @param npoints Number of disregistry points N (>= 3)
     * @param bc Boundary treatment
     * @throws std::invalid_argument on a bad grid
     * @throws IllConditionedElasticityError if K is not symmetric positive definite
     */
    ElasticKernel(const Matrix3& K, double spacing, int npoints,
                  BoundaryCondition bc = BoundaryCondition::FIXED);

    static ElasticKernel fromDislocation(const VolterraDislocation& dislocation,
                                         double spacing, int npoints,
                                         BoundaryCondition bc = BoundaryCondition::FIXED);

    int numPoints() const { return npoints_; }
    int numCells() const { return static_cast<int>(coeff_.size()); }
    double spacing() const { return h_; }
    double period() const { return h_ * npoints_; }
    BoundaryCondition boundary() const { return bc_; }
    const Matrix3& K() const { return K_; }

    // Interaction integral I between two cells @p separation apart
    double coefficient(int separation) const;

    /**
     * @brief Cell densities of a disregistry profile
     * @param burgers Frame Burgers vector, closes the last cell when periodic
     */
    std::vector<Vector3> density(const std::vector<Vector3>& disregistry,
                                 const Vector3& burgers) const;

    double energy(const std::vector<Vector3>& density) const;

    // Energy and its derivative with respect to each cell density
    double energyAndGradient(const std::vector<Vector3>& density,
                             std::vector<Vector3>& gradient) const;

    // Chain rule from density derivatives to disregistry derivatives
    std::vector<Vector3> disregistryGradient(const std::vector<Vector3>& density_gradient) const;

    /**
     * @brief Hessian of -(1/4π) Σ I_ij rho_i rho_j with respect to scalar disregistries
     *
     * The elastic Hessian of component c is K_cc times this matrix when K is
     * diagonal. Diagonal entries are 2 ln2 / π in the interior.
     */
    Eigen::MatrixXd scalarHessian() const;

private:
    // I_k for the free logarithmic kernel
    double freeCoefficient(int k) const;
    // Correction for the periodic kernel ln|2 sin(πu/L)| - ln|u|
    double periodicCorrection(int k) const;

    Matrix3 K_;
    double h_;
    int npoints_;
    BoundaryCondition bc_;
    std::vector<double> coeff_;
};

} // namespace DislocCore

#endif // ELASTIC_KERNEL_HPP
