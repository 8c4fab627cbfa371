#include "ElasticConstants.hpp"
#include "DislocErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace DislocCore {

// =============================================================================
// Utility functions
// =============================================================================

static double requireValue(const std::map<std::string, double>& values,
                           const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        throw std::invalid_argument("Missing elastic constant: " + key);
    }
    return it->second;
}

static double valueOr(const std::map<std::string, double>& values,
                      const std::string& key, double default_val) {
    auto it = values.find(key);
    return it != values.end() ? it->second : default_val;
}

// =============================================================================
// ElasticConstants Implementation
// =============================================================================

ElasticConstants::ElasticConstants(const Matrix6& Cij, double tol)
    : C_(Cij) {
    double scale = C_.cwiseAbs().maxCoeff();
    if (!(scale > 0.0) || !std::isfinite(scale)) {
        throw IllConditionedElasticityError("Stiffness matrix is zero or not finite");
    }

    double asym = (C_ - C_.transpose()).cwiseAbs().maxCoeff();
    if (asym > tol * scale) {
        std::ostringstream msg;
        msg << "Stiffness matrix is not symmetric (max asymmetry " << asym << ")";
        throw IllConditionedElasticityError(msg.str());
    }
    C_ = 0.5 * (C_ + C_.transpose());

    if (!isPositiveDefinite(C_, tol)) {
        throw IllConditionedElasticityError("Stiffness matrix is not positive definite");
    }
}

ElasticConstants ElasticConstants::isotropic(double lambda, double mu) {
    Matrix6 C = Matrix6::Zero();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            C(i, j) = lambda;
        }
        C(i, i) = lambda + 2.0 * mu;
        C(i + 3, i + 3) = mu;
    }
    return ElasticConstants(C);
}

ElasticConstants ElasticConstants::fromYoungPoisson(double E, double nu) {
    double lambda = E * nu / ((1.0 + nu) * (1.0 - 2.0 * nu));
    double mu = E / (2.0 * (1.0 + nu));
    return isotropic(lambda, mu);
}

ElasticConstants ElasticConstants::fromShearPoisson(double mu, double nu) {
    double lambda = 2.0 * mu * nu / (1.0 - 2.0 * nu);
    return isotropic(lambda, mu);
}

ElasticConstants ElasticConstants::cubic(double C11, double C12, double C44) {
    Matrix6 C = Matrix6::Zero();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            C(i, j) = (i == j) ? C11 : C12;
        }
        C(i + 3, i + 3) = C44;
    }
    return ElasticConstants(C);
}

ElasticConstants ElasticConstants::hexagonal(double C11, double C12, double C13,
                                             double C33, double C44) {
    Matrix6 C = Matrix6::Zero();
    C(0, 0) = C11;  C(0, 1) = C12;  C(0, 2) = C13;
    C(1, 0) = C12;  C(1, 1) = C11;  C(1, 2) = C13;
    C(2, 0) = C13;  C(2, 1) = C13;  C(2, 2) = C33;
    C(3, 3) = C44;
    C(4, 4) = C44;
    C(5, 5) = 0.5 * (C11 - C12);
    return ElasticConstants(C);
}

ElasticConstants ElasticConstants::fromConfig(const std::map<std::string, double>& values,
                                              const std::string& symmetry) {
    std::string sym = symmetry;
    std::transform(sym.begin(), sym.end(), sym.begin(), ::tolower);

    if (sym == "isotropic") {
        if (values.count("lambda") && values.count("mu")) {
            return isotropic(values.at("lambda"), values.at("mu"));
        }
        if (values.count("youngs_modulus")) {
            return fromYoungPoisson(values.at("youngs_modulus"),
                                    requireValue(values, "poisson_ratio"));
        }
        if (values.count("shear_modulus")) {
            return fromShearPoisson(values.at("shear_modulus"),
                                    requireValue(values, "poisson_ratio"));
        }
        if (values.count("c11") && values.count("c12")) {
            double C11 = values.at("c11");
            double C12 = values.at("c12");
            return isotropic(C12, 0.5 * (C11 - C12));
        }
        throw std::invalid_argument(
            "Isotropic elastic constants need lambda/mu, youngs_modulus/poisson_ratio, "
            "shear_modulus/poisson_ratio or c11/c12");
    }

    if (sym == "cubic") {
        return cubic(requireValue(values, "c11"), requireValue(values, "c12"),
                     requireValue(values, "c44"));
    }

    if (sym == "hexagonal") {
        return hexagonal(requireValue(values, "c11"), requireValue(values, "c12"),
                         requireValue(values, "c13"), requireValue(values, "c33"),
                         requireValue(values, "c44"));
    }

    if (sym == "full" || sym == "triclinic") {
        Matrix6 C = Matrix6::Zero();
        for (int i = 0; i < 6; ++i) {
            for (int j = i; j < 6; ++j) {
                std::string key = "c" + std::to_string(i + 1) + std::to_string(j + 1);
                C(i, j) = valueOr(values, key, 0.0);
                C(j, i) = C(i, j);
            }
        }
        return ElasticConstants(C);
    }

    throw std::invalid_argument("Unknown elastic symmetry: " + symmetry);
}

int ElasticConstants::voigtIndex(int i, int j) {
    if (i == j) return i;
    if ((i == 1 && j == 2) || (i == 2 && j == 1)) return 3;
    if ((i == 0 && j == 2) || (i == 2 && j == 0)) return 4;
    return 5;
}

double ElasticConstants::Cijkl(int i, int j, int k, int l) const {
    return C_(voigtIndex(i, j), voigtIndex(k, l));
}

Matrix6 ElasticConstants::Sij() const {
    return C_.inverse();
}

ElasticConstants ElasticConstants::rotated(const Matrix3& R) const {
    // C'_ijkl = R_ip R_jq R_kr R_ls C_pqrs, evaluated only for the Voigt pairs
    static const int pair_i[6] = {0, 1, 2, 1, 0, 0};
    static const int pair_j[6] = {0, 1, 2, 2, 2, 1};

    Matrix6 Cr = Matrix6::Zero();
    for (int I = 0; I < 6; ++I) {
        int i = pair_i[I], j = pair_j[I];
        for (int J = I; J < 6; ++J) {
            int k = pair_i[J], l = pair_j[J];
            double sum = 0.0;
            for (int p = 0; p < 3; ++p) {
                for (int q = 0; q < 3; ++q) {
                    double rpq = R(i, p) * R(j, q);
                    if (rpq == 0.0) continue;
                    for (int r = 0; r < 3; ++r) {
                        for (int s = 0; s < 3; ++s) {
                            sum += rpq * R(k, r) * R(l, s) * Cijkl(p, q, r, s);
                        }
                    }
                }
            }
            Cr(I, J) = sum;
            Cr(J, I) = sum;
        }
    }
    return ElasticConstants(Cr);
}

bool ElasticConstants::isIsotropic(double tol) const {
    double scale = C_.cwiseAbs().maxCoeff();
    double C11 = C_(0, 0);
    double C12 = C_(0, 1);
    double C44 = 0.5 * (C11 - C12);

    Matrix6 iso = Matrix6::Zero();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            iso(i, j) = (i == j) ? C11 : C12;
        }
        iso(i + 3, i + 3) = C44;
    }
    return (C_ - iso).cwiseAbs().maxCoeff() <= tol * scale;
}

double ElasticConstants::shearModulus() const {
    double a = C_(0, 0) + C_(1, 1) + C_(2, 2);
    double b = C_(0, 1) + C_(0, 2) + C_(1, 2);
    double c = C_(3, 3) + C_(4, 4) + C_(5, 5);
    return (a - b + 3.0 * c) / 15.0;
}

double ElasticConstants::bulkModulus() const {
    double a = C_(0, 0) + C_(1, 1) + C_(2, 2);
    double b = C_(0, 1) + C_(0, 2) + C_(1, 2);
    return (a + 2.0 * b) / 9.0;
}

double ElasticConstants::poissonRatio() const {
    double K = bulkModulus();
    double G = shearModulus();
    return (3.0 * K - 2.0 * G) / (2.0 * (3.0 * K + G));
}

bool ElasticConstants::isPositiveDefinite(const Matrix6& C, double tol) {
    Eigen::SelfAdjointEigenSolver<Matrix6> solver(C);
    if (solver.info() != Eigen::Success) return false;
    double scale = solver.eigenvalues().cwiseAbs().maxCoeff();
    return solver.eigenvalues().minCoeff() > tol * scale;
}

} // namespace DislocCore
