#ifndef ELASTIC_CONSTANTS_HPP
#define ELASTIC_CONSTANTS_HPP

#include "DislocTypes.hpp"
#include <map>
#include <string>

namespace DislocCore {

/**
 * @brief Anisotropic elastic stiffness tensor
 *
 * Stored in Voigt notation, which maps tensor index pairs to vector indices:
 * 11→0, 22→1, 33→2, 23→3, 13→4, 12→5
 *
 * Stiffness matrix (6x6 symmetric):
 * | c11 c12 c13 c14 c15 c16 |
 * |     c22 c23 c24 c25 c26 |
 * |         c33 c34 c35 c36 |
 * |             c44 c45 c46 |
 * |                 c55 c56 |
 * |                     c66 |
 *
 * Instances are immutable. Construction rejects matrices that are not
 * symmetric or not positive definite with IllConditionedElasticityError.
 * Units are whatever the caller uses consistently (the CLI works in eV/Å³).
 */
class ElasticConstants {
public:
    /**
     * @brief Construct from a full 6x6 Voigt matrix
     * @param Cij Voigt stiffness
     * @param tol Relative tolerance for the symmetry and definiteness checks
     * @throws IllConditionedElasticityError
     */
    explicit ElasticConstants(const Matrix6& Cij, double tol = 1e-8);

    // Isotropic from Lamé parameters
    static ElasticConstants isotropic(double lambda, double mu);
    static ElasticConstants fromYoungPoisson(double E, double nu);
    static ElasticConstants fromShearPoisson(double mu, double nu);

    // Cubic (3 constants)
    static ElasticConstants cubic(double C11, double C12, double C44);

    // Hexagonal / transversely isotropic about x3 (5 constants)
    static ElasticConstants hexagonal(double C11, double C12, double C13,
                                      double C33, double C44);

    /**
     * @brief Build from "key = value" pairs
     *
     * Recognized keys: symmetry (isotropic, cubic, hexagonal, full) and the
     * matching constants (lambda/mu, youngs_modulus/poisson_ratio,
     * shear_modulus/poisson_ratio, c11..c66). Values are already in working units.
     */
    static ElasticConstants fromConfig(const std::map<std::string, double>& values,
                                       const std::string& symmetry);

    const Matrix6& Cij() const { return C_; }
    double Cij(int i, int j) const { return C_(i, j); }

    // Full rank-4 component C_ijkl
    double Cijkl(int i, int j, int k, int l) const;

    // Compliance in Voigt form (inverse of Cij)
    Matrix6 Sij() const;

    /**
     * @brief Stiffness expressed in a rotated Cartesian frame
     * @param R Rotation whose rows are the new axes in old coordinates
     */
    ElasticConstants rotated(const Matrix3& R) const;

    bool isIsotropic(double tol = 1e-6) const;

    // Voigt averages (exact for isotropic tensors)
    double shearModulus() const;
    double bulkModulus() const;
    double poissonRatio() const;

    static int voigtIndex(int i, int j);
    static bool isPositiveDefinite(const Matrix6& C, double tol = 1e-8);

private:
    Matrix6 C_;
};

} // namespace DislocCore

#endif // ELASTIC_CONSTANTS_HPP
