#ifndef ISOTROPIC_VOLTERRA_DISLOCATION_HPP
#define ISOTROPIC_VOLTERRA_DISLOCATION_HPP

#include "DislocTypes.hpp"
#include "DislocationGeometry.hpp"

namespace DislocCore {

/**
 * @brief Volterra dislocation in an isotropic medium (closed form)
 *
 * Screw part along xi:
 *   u_z = b_s θ / 2π
 *   σ_xz = -μ b_s y / (2π r²),  σ_yz = μ b_s x / (2π r²)
 *
 * Edge part with b_e along x (other edge directions are rotated into this frame):
 *   u_x = b_e/2π [θ + x y / (2(1-ν) r²)]
 *   u_y = -b_e/2π [(1-2ν)/(4(1-ν)) ln r² + (x² - y²) / (4(1-ν) r²)]
 *   σ_xx = -D y (3x² + y²) / r⁴,  σ_yy = D y (x² - y²) / r⁴
 *   σ_xy = D x (x² - y²) / r⁴,    σ_zz = ν (σ_xx + σ_yy),  D = μ b_e / (2π(1-ν))
 *
 * θ is measured continuously except across the branch-cut ray.
 */
class IsotropicVolterraDislocation {
public:
    IsotropicVolterraDislocation(double mu, double nu, const DislocationGeometry& geometry,
                                 BranchCut cut = BranchCut(), double tol = 1e-8);

    Vector3 displacement(const Vector3& position) const;
    Matrix3 stress(const Vector3& position) const;

    // diag(μ/(1-ν), μ/(1-ν), μ) in the dislocation frame (m, n, xi)
    Matrix3 K_tensor() const;

    double shearModulus() const { return mu_; }
    double poissonRatio() const { return nu_; }
    const DislocationGeometry& geometry() const { return geometry_; }
    const BranchCut& branchCut() const { return cut_; }

private:
    void checkPosition(double x, double y) const;

    double mu_;
    double nu_;
    DislocationGeometry geometry_;
    BranchCut cut_;
    double tol_;

    // Burgers vector in the dislocation frame
    Vector3 b_frame_;
};

} // namespace DislocCore

#endif // ISOTROPIC_VOLTERRA_DISLOCATION_HPP
