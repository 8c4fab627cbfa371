#include "Stroh.hpp"
#include "DislocErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace DislocCore {

// =============================================================================
// Utility functions
// =============================================================================

static Matrix3 contract(const ElasticConstants& C, const Vector3& a, const Vector3& b) {
    // M_ik = C_ijkl a_j b_l
    Matrix3 M = Matrix3::Zero();
    for (int i = 0; i < 3; ++i) {
        for (int k = 0; k < 3; ++k) {
            double sum = 0.0;
            for (int j = 0; j < 3; ++j) {
                for (int l = 0; l < 3; ++l) {
                    sum += C.Cijkl(i, j, k, l) * a(j) * b(l);
                }
            }
            M(i, k) = sum;
        }
    }
    return M;
}

static Complex bilinearDot(const ComplexVector3& a, const ComplexVector3& b) {
    return a(0) * b(0) + a(1) * b(1) + a(2) * b(2);
}

// =============================================================================
// Stroh eigenproblem
// =============================================================================

StrohSolution solveStroh(const ElasticConstants& C, const DislocationGeometry& geometry,
                         double tol) {
    const Vector3& m = geometry.m();
    const Vector3& n = geometry.n();

    Matrix3 Q = contract(C, m, m);
    Matrix3 R = contract(C, m, n);
    Matrix3 T = contract(C, n, n);

    Eigen::JacobiSVD<Matrix3> svd(T);
    double smax = svd.singularValues()(0);
    double smin = svd.singularValues()(2);
    if (!(smin > tol * smax)) {
        throw IllConditionedElasticityError("Stroh matrix T is singular for this orientation");
    }
    Matrix3 Tinv = T.inverse();

    Matrix6 N;
    N.block<3, 3>(0, 0) = -Tinv * R.transpose();
    N.block<3, 3>(0, 3) = Tinv;
    N.block<3, 3>(3, 0) = R * Tinv * R.transpose() - Q;
    N.block<3, 3>(3, 3) = -R * Tinv;

    Eigen::EigenSolver<Matrix6> es(N, true);
    if (es.info() != Eigen::Success) {
        throw IllConditionedElasticityError("Stroh eigenvalue problem did not converge");
    }
    auto roots = es.eigenvalues();
    auto vectors = es.eigenvectors();

    double scale = std::max(1.0, roots.cwiseAbs().maxCoeff());

    // Collect the roots with positive imaginary part
    std::vector<int> upper;
    int lower_count = 0;
    for (int i = 0; i < 6; ++i) {
        double im = roots(i).imag();
        if (std::abs(im) <= tol * scale) {
            std::ostringstream msg;
            msg << "Stroh root " << roots(i) << " is real; no dislocation solution";
            throw IllConditionedElasticityError(msg.str());
        }
        if (im > 0.0) {
            upper.push_back(i);
        } else {
            ++lower_count;
        }
    }
    if (upper.size() != 3 || lower_count != 3) {
        throw IllConditionedElasticityError("Stroh roots do not form three conjugate pairs");
    }

    // Every upper root must have its conjugate among the lower roots
    std::vector<bool> used(6, false);
    double pair_tol = std::sqrt(tol) * scale;
    for (int idx : upper) {
        int match = -1;
        double best = 0.0;
        for (int j = 0; j < 6; ++j) {
            if (used[j] || roots(j).imag() > 0.0) continue;
            double d = std::abs(roots(j) - std::conj(roots(idx)));
            if (match < 0 || d < best) {
                match = j;
                best = d;
            }
        }
        if (match < 0 || best > pair_tol) {
            throw IllConditionedElasticityError("Stroh roots do not form three conjugate pairs");
        }
        used[match] = true;
    }

    std::sort(upper.begin(), upper.end(), [&roots](int a, int b) {
        if (roots(a).real() != roots(b).real()) return roots(a).real() < roots(b).real();
        return roots(a).imag() < roots(b).imag();
    });

    // Coincident roots mean a defective N (isotropic limit)
    for (int a = 0; a < 3; ++a) {
        for (int b = a + 1; b < 3; ++b) {
            if (std::abs(roots(upper[a]) - roots(upper[b])) < std::sqrt(tol) * scale) {
                throw IllConditionedElasticityError(
                    "Stroh roots are degenerate (isotropic limit); use the isotropic solution");
            }
        }
    }

    StrohSolution sol;
    for (int alpha = 0; alpha < 3; ++alpha) {
        Eigen::Matrix<Complex, 6, 1> v = vectors.col(upper[alpha]);

        int jmax = 0;
        for (int j = 1; j < 3; ++j) {
            if (std::abs(v(j)) > std::abs(v(jmax))) jmax = j;
        }
        v *= std::conj(v(jmax)) / std::abs(v(jmax));

        ComplexVector3 A = v.head<3>();
        ComplexVector3 L = v.tail<3>();
        Complex AL = bilinearDot(A, L);
        if (std::abs(AL) < std::sqrt(tol) * A.norm() * L.norm()) {
            throw IllConditionedElasticityError(
                "Stroh eigenvectors are degenerate (A·L = 0); use the isotropic solution");
        }

        sol.p[alpha] = roots(upper[alpha]);
        sol.A[alpha] = A;
        sol.L[alpha] = L;
        sol.k[alpha] = 1.0 / (2.0 * AL);

        sol.p[alpha + 3] = std::conj(sol.p[alpha]);
        sol.A[alpha + 3] = A.conjugate();
        sol.L[alpha + 3] = L.conjugate();
        sol.k[alpha + 3] = std::conj(sol.k[alpha]);
    }

    // K_ij = Re(-i Σ_α s_α k_α L_αi L_αj) = 2 Im(Σ_{α<3} k_α L_αi L_αj)
    Matrix3 K = Matrix3::Zero();
    for (int alpha = 0; alpha < 3; ++alpha) {
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                K(i, j) += 2.0 * (sol.k[alpha] * sol.L[alpha](i) * sol.L[alpha](j)).imag();
            }
        }
    }
    sol.K = 0.5 * (K + K.transpose());

    Eigen::SelfAdjointEigenSolver<Matrix3> kcheck(sol.K);
    if (kcheck.eigenvalues().minCoeff() <= 0.0) {
        throw IllConditionedElasticityError("Stroh energy coefficient tensor is not positive definite");
    }

    return sol;
}

// =============================================================================
// AnisotropicStrohDislocation Implementation
// =============================================================================

AnisotropicStrohDislocation::AnisotropicStrohDislocation(const ElasticConstants& C,
                                                         const DislocationGeometry& geometry,
                                                         BranchCut cut, double tol)
    : C_(C),
      geometry_(geometry),
      cut_(cut),
      tol_(tol),
      solution_(solveStroh(C, geometry, tol)) {

    const Vector3& b = geometry_.burgers();
    for (int alpha = 0; alpha < 6; ++alpha) {
        Complex Lb = solution_.L[alpha](0) * b(0) +
                     solution_.L[alpha](1) * b(1) +
                     solution_.L[alpha](2) * b(2);
        weight_[alpha] = StrohSolution::sign(alpha) * solution_.k[alpha] * Lb;

        // x + p y along the cut ray is t * w with t > 0
        cut_w_[alpha] = cut_.dm() + solution_.p[alpha] * cut_.dn();
        cut_offset_[alpha] = std::log(-cut_w_[alpha]);
    }
}

Complex AnisotropicStrohDislocation::cutLog(int alpha, const Complex& eta) const {
    // log(-eta/w) is cut where eta/w is real positive, i.e. on the ray itself
    return std::log(-eta / cut_w_[alpha]) + cut_offset_[alpha];
}

void AnisotropicStrohDislocation::checkPosition(double x, double y) const {
    if (std::hypot(x, y) <= tol_ * std::max(1.0, geometry_.burgers().norm())) {
        std::ostringstream msg;
        msg << "Field evaluated on the dislocation line (x = " << x << ", y = " << y << ")";
        throw SingularFieldError(msg.str());
    }
}

Vector3 AnisotropicStrohDislocation::displacement(const Vector3& position) const {
    double x = position.dot(geometry_.m());
    double y = position.dot(geometry_.n());
    checkPosition(x, y);

    ComplexVector3 sum = ComplexVector3::Zero();
    for (int alpha = 0; alpha < 6; ++alpha) {
        Complex eta = x + solution_.p[alpha] * y;
        sum += solution_.A[alpha] * (weight_[alpha] * cutLog(alpha, eta));
    }

    const Complex factor = 1.0 / (2.0 * M_PI * Complex(0.0, 1.0));
    Vector3 u;
    for (int i = 0; i < 3; ++i) {
        u(i) = (factor * sum(i)).real();
    }
    return u;
}

Matrix3 AnisotropicStrohDislocation::stress(const Vector3& position) const {
    double x = position.dot(geometry_.m());
    double y = position.dot(geometry_.n());
    checkPosition(x, y);

    const Vector3& m = geometry_.m();
    const Vector3& n = geometry_.n();

    // Accumulate the displacement gradient G_kl = ∂u_k/∂r_l as engineering Voigt strain
    Eigen::Matrix<Complex, 6, 1> strain = Eigen::Matrix<Complex, 6, 1>::Zero();
    for (int alpha = 0; alpha < 6; ++alpha) {
        Complex eta = x + solution_.p[alpha] * y;
        Complex coeff = weight_[alpha] / eta;
        ComplexVector3 g;
        for (int l = 0; l < 3; ++l) {
            g(l) = m(l) + solution_.p[alpha] * n(l);
        }
        const ComplexVector3& A = solution_.A[alpha];
        strain(0) += coeff * A(0) * g(0);
        strain(1) += coeff * A(1) * g(1);
        strain(2) += coeff * A(2) * g(2);
        strain(3) += coeff * (A(1) * g(2) + A(2) * g(1));
        strain(4) += coeff * (A(0) * g(2) + A(2) * g(0));
        strain(5) += coeff * (A(0) * g(1) + A(1) * g(0));
    }

    const Complex factor = 1.0 / (2.0 * M_PI * Complex(0.0, 1.0));
    Eigen::Matrix<double, 6, 1> e;
    for (int i = 0; i < 6; ++i) {
        e(i) = (factor * strain(i)).real();
    }
    Eigen::Matrix<double, 6, 1> s = C_.Cij() * e;

    Matrix3 sigma;
    sigma << s(0), s(5), s(4),
             s(5), s(1), s(3),
             s(4), s(3), s(2);
    return sigma;
}

} // namespace DislocCore
