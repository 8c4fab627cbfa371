#ifndef VOLTERRA_DISLOCATION_HPP
#define VOLTERRA_DISLOCATION_HPP

#include "DislocTypes.hpp"
#include "ElasticConstants.hpp"
#include "DislocationGeometry.hpp"
#include "IsotropicVolterraDislocation.hpp"
#include "Stroh.hpp"
#include <map>
#include <string>
#include <variant>

namespace DislocCore {

/**
 * @brief Options for building a Volterra dislocation
 */
struct VolterraOptions {
    double tolerance;             // Singular-point and Stroh degeneracy tolerance
    double isotropy_tolerance;    // Relative tolerance for selecting the closed form
    bool force_anisotropic;       // Always use the Stroh solution
    bool has_cut_direction;
    Vector3 cut_direction;        // Cartesian direction of the branch cut

    VolterraOptions() :
        tolerance(1e-8),
        isotropy_tolerance(1e-6),
        force_anisotropic(false),
        has_cut_direction(false),
        cut_direction(Vector3::Zero()) {}

    void configure(const std::map<std::string, std::string>& config);
};

/**
 * @brief Straight Volterra dislocation, isotropic or anisotropic
 *
 * A closed set of two models chosen at construction. All queries are pure
 * functions of the immutable state.
 */
class VolterraDislocation {
public:
    using Model = std::variant<IsotropicVolterraDislocation, AnisotropicStrohDislocation>;

    explicit VolterraDislocation(IsotropicVolterraDislocation model);
    explicit VolterraDislocation(AnisotropicStrohDislocation model);

    /**
     * @brief Displacement at a Cartesian position
     * @throws SingularFieldError on the dislocation line
     */
    Vector3 displacement(const Vector3& position) const;

    /**
     * @brief Stress at a Cartesian position (Cartesian components)
     * @throws SingularFieldError on the dislocation line
     */
    Matrix3 stress(const Vector3& position) const;

    // Energy coefficient tensor in the dislocation frame (m, n, xi)
    Matrix3 K_tensor() const;

    // b̂·K·b̂ using the frame Burgers vector
    double K_coeff() const;

    // Prefactor of the logarithmic line energy, b·K·b / 4π
    double preln() const;

    const DislocationGeometry& geometry() const;
    bool isIsotropic() const { return std::holds_alternative<IsotropicVolterraDislocation>(model_); }
    const Model& model() const { return model_; }

private:
    Model model_;
};

/**
 * @brief Build the dislocation field for @p C and @p geometry
 *
 * Isotropic stiffness (within options.isotropy_tolerance) uses the closed
 * form; everything else goes through the Stroh solution.
 *
 * @throws IllConditionedElasticityError when the Stroh problem is degenerate
 */
VolterraDislocation solveVolterraDislocation(const ElasticConstants& C,
                                             const DislocationGeometry& geometry,
                                             const VolterraOptions& options = VolterraOptions());

} // namespace DislocCore

#endif // VOLTERRA_DISLOCATION_HPP
