#ifndef SDVPN_HPP
#define SDVPN_HPP

#include "DislocTypes.hpp"
#include "DisregistryProfile.hpp"
#include "ElasticKernel.hpp"
#include "GammaSurface.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace DislocCore {

/**
 * @brief Controls of the SDVPN minimization
 */
struct SDVPNOptions {
    double tolerance;                   // Converged when max per-point undamped |Δdelta| falls below
    int max_iterations;
    double damping;                     // Initial (and largest) relaxation step
    double energy_tolerance;            // Relative energy rise tolerated by a step
    double step_growth;                 // Step multiplier after an accepted step
    double min_step_fraction;           // Step floor relative to damping
    std::array<bool, 3> frozen;         // Components (m, n, xi) held at their initial value
    SolverMethod method;
    bool verbose;
    double time_limit;                  // Wall seconds, <= 0 for none

    SDVPNOptions() :
        tolerance(1e-6),
        max_iterations(1000),
        damping(1.0),
        energy_tolerance(1e-10),
        step_growth(1.5),
        min_step_fraction(1e-8),
        frozen{{false, true, false}},
        method(SolverMethod::RELAXATION),
        verbose(false),
        time_limit(0.0) {}

    void configure(const std::map<std::string, std::string>& config);
};

/**
 * @brief Mutable state of one relaxation run
 *
 * Created by SDVPN::initialize and advanced in place by SDVPN::iterate.
 */
struct SDVPNSolverState {
    DisregistryProfile profile;
    std::vector<Vector3> gradient;      // dE/d(delta) at profile, zero on fixed entries
    int iteration = 0;
    double step = 0.0;
    double energy = 0.0;
    double residual = 0.0;
    std::vector<double> energy_history;
    std::vector<double> residual_history;
    SolverStatus status = SolverStatus::INITIALIZED;
};

/**
 * @brief Outcome of SDVPN::solve
 *
 * Hitting the iteration cap or the time limit is not an error: converged is
 * false and the profile holds the last accepted state. An accepted step may
 * raise the energy by at most energy_tolerance * max(1, |E|).
 */
struct SDVPNResult {
    DisregistryProfile profile;
    bool converged = false;
    int iterations = 0;
    double residual = 0.0;
    double energy = 0.0;
    std::vector<double> energy_history;
    SolverStatus status = SolverStatus::INITIALIZED;
};

/**
 * @brief Semi-discrete variational Peierls-Nabarro solver
 *
 * Minimizes the energy per unit length of a disregistry profile on the slip
 * plane,
 *
 *   E = E_elastic + h Σ γ(delta_i) - h Σ (τ·n)·delta_i + (h/2) Σ rho_i·β·rho_i
 *
 * over the free entries of the profile. All vectors and tensors are in the
 * dislocation frame (m, n, xi). The gamma surface and kernel are referenced,
 * not copied, and must outlive the solver.
 */
class SDVPN {
public:
    /**
     * @param gamma Misfit energy surface
     * @param kernel Elastic interaction on the solver grid
     * @param burgers Burgers vector in the dislocation frame
     * @param options Minimization controls
     */
    SDVPN(const GammaSurface& gamma, const ElasticKernel& kernel, const Vector3& burgers,
          const SDVPNOptions& options = SDVPNOptions());

    // Applied stress tensor; only its traction on the slip plane does work
    void setAppliedStress(const Matrix3& tau) { tau_ = tau; }

    // Gradient energy coefficients beta (energy per length times length)
    void setSurfaceCorrection(const Matrix3& beta);

    // @throws std::invalid_argument on out-of-range controls
    void setOptions(const SDVPNOptions& options);
    const SDVPNOptions& options() const { return options_; }
    const Vector3& burgers() const { return burgers_; }
    const GammaSurface& gammaSurface() const { return gamma_; }
    const ElasticKernel& kernel() const { return kernel_; }

    std::vector<Vector3> dislocationDensity(const DisregistryProfile& profile) const;

    double misfitEnergy(const DisregistryProfile& profile) const;
    double elasticEnergy(const DisregistryProfile& profile) const;
    double stressEnergy(const DisregistryProfile& profile) const;
    double surfaceEnergy(const DisregistryProfile& profile) const;
    double totalEnergy(const DisregistryProfile& profile) const;

    /**
     * @brief Total energy and its gradient with respect to the disregistry
     *
     * Gradient entries of frozen components and pinned end points are zero.
     * @throws OutOfDomainError if a disregistry leaves a non-periodic gamma surface
     */
    double energyGradient(const DisregistryProfile& profile, std::vector<Vector3>& gradient) const;

    // True when entry (point, component) is varied by the minimization
    bool isFree(int point, int component) const;

    /**
     * @brief Start a relaxation run from @p initial
     *
     * Pins the end points for FIXED boundaries and evaluates the starting energy.
     * @throws std::invalid_argument if the profile does not match the kernel grid
     */
    SDVPNSolverState initialize(const DisregistryProfile& initial) const;

    /**
     * @brief One preconditioned relaxation step with adaptive damping
     *
     * A step that raises the energy by more than energy_tolerance, or leaves a
     * non-periodic gamma surface, is halved until it does not. The residual is
     * the largest entry of the undamped update. Terminal states are left untouched.
     *
     * @throws OutOfDomainError if the step falls below min_step_fraction * damping
     *         after a trial left the gamma surface
     * @throws DivergedError if the step falls below the floor otherwise
     */
    void iterate(SDVPNSolverState& state) const;

    /**
     * @brief Relax @p initial to the minimum-energy profile
     * @throws DivergedError when adaptive damping fails
     * @throws OutOfDomainError when the minimization is driven off a non-periodic
     *         gamma surface
     */
    SDVPNResult solve(const DisregistryProfile& initial) const;
    SDVPNResult solve(const DisregistryProfile& initial, const SDVPNOptions& options);

private:
    SDVPNResult solveRelaxation(const DisregistryProfile& initial) const;
    SDVPNResult solveTao(const DisregistryProfile& initial) const;

    void buildPreconditioner();
    std::vector<Vector3> precondition(const std::vector<Vector3>& gradient) const;

    const GammaSurface& gamma_;
    const ElasticKernel& kernel_;
    Vector3 burgers_;
    Matrix3 tau_;
    Matrix3 beta_;
    SDVPNOptions options_;

    // Grid indices varied by the solver, and one factorized block per component
    std::vector<int> free_points_;
    std::array<Eigen::LLT<Eigen::MatrixXd>, 3> preconditioner_;
};

/**
 * @brief Convenience wrapper: relax with default options, given tolerance and cap
 *
 * The Burgers vector is read from the end points of @p initial as
 * delta_last - delta_first.
 * @throws std::invalid_argument for a PERIODIC kernel, whose Burgers vector
 *         cannot be inferred; use the SDVPN class
 */
SDVPNResult solveSDVPN(const DisregistryProfile& initial, const GammaSurface& gamma,
                       const ElasticKernel& kernel, double tolerance, int max_iterations);

} // namespace DislocCore

#endif // SDVPN_HPP
