#ifndef STROH_HPP
#define STROH_HPP

#include "DislocTypes.hpp"
#include "ElasticConstants.hpp"
#include "DislocationGeometry.hpp"
#include <array>

namespace DislocCore {

/**
 * @brief Solution of the Stroh sextic eigenvalue problem
 *
 * With Q_ik = C_ijkl m_j m_l, R_ik = C_ijkl m_j n_l and T_ik = C_ijkl n_j n_l
 * the eigenproblem N ξ = p ξ with
 *
 *     N = | -T⁻¹Rᵀ          T⁻¹    |
 *         | R T⁻¹ Rᵀ - Q    -R T⁻¹ |
 *
 * yields six roots p_α and eigenvectors ξ_α = (A_α, L_α).
 *
 * Canonical ordering: members 0..2 have Im p > 0 and are sorted by
 * (Re p, Im p); member α + 3 is the exact complex conjugate of member α.
 * Each eigenvector is scaled so its largest A component is real positive,
 * and k_α = 1 / (2 A_α·L_α).
 */
struct StrohSolution {
    std::array<Complex, 6> p;
    std::array<ComplexVector3, 6> A;
    std::array<ComplexVector3, 6> L;
    std::array<Complex, 6> k;

    // Energy coefficient tensor in the input Cartesian frame
    Matrix3 K;

    // +1 for Im p > 0, -1 otherwise
    static double sign(int alpha) { return alpha < 3 ? 1.0 : -1.0; }
};

/**
 * @brief Solve the Stroh eigenproblem for the orientation in @p geometry
 * @param tol Relative tolerance used to detect degenerate roots
 * @throws IllConditionedElasticityError when T is singular, a root is real,
 *         the roots do not form three conjugate pairs, or A·L vanishes
 *         (the degenerate isotropic case)
 */
StrohSolution solveStroh(const ElasticConstants& C, const DislocationGeometry& geometry,
                         double tol = 1e-8);

/**
 * @brief Volterra dislocation in an anisotropic medium (Stroh formalism)
 *
 * u(r)    = Re[ 1/(2πi) Σ_α s_α k_α A_α (L_α·b) log(η_α) ]
 * σ_ij(r) = Re[ 1/(2πi) Σ_α s_α k_α (L_α·b) C_ijkl (m_l + p_α n_l) A_αk / η_α ]
 *
 * with η_α = x + p_α y. The logarithm is cut along the image of the
 * branch-cut ray, so the displacement jumps by exactly b across that ray
 * and is continuous everywhere else.
 */
class AnisotropicStrohDislocation {
public:
    AnisotropicStrohDislocation(const ElasticConstants& C, const DislocationGeometry& geometry,
                                BranchCut cut = BranchCut(), double tol = 1e-8);

    Vector3 displacement(const Vector3& position) const;
    Matrix3 stress(const Vector3& position) const;

    // K in the dislocation frame (m, n, xi)
    Matrix3 K_tensor() const { return geometry_.toFrame(solution_.K); }

    const StrohSolution& solution() const { return solution_; }
    const DislocationGeometry& geometry() const { return geometry_; }
    const ElasticConstants& elasticConstants() const { return C_; }
    const BranchCut& branchCut() const { return cut_; }

private:
    // Logarithm of eta for root alpha with its cut on the branch-cut ray
    Complex cutLog(int alpha, const Complex& eta) const;
    void checkPosition(double x, double y) const;

    ElasticConstants C_;
    DislocationGeometry geometry_;
    BranchCut cut_;
    double tol_;
    StrohSolution solution_;

    // s_α k_α (L_α·b), precomputed per root
    std::array<Complex, 6> weight_;
    // Image of the cut direction for each root, log(-w_α)
    std::array<Complex, 6> cut_w_;
    std::array<Complex, 6> cut_offset_;
};

} // namespace DislocCore

#endif // STROH_HPP
