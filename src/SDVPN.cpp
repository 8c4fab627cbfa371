#include "SDVPN.hpp"
#include "DislocErrors.hpp"
#include <petsctime.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace DislocCore {

// =============================================================================
// Utility functions
// =============================================================================

static double parseDouble(const std::map<std::string, std::string>& config,
                          const std::string& key, double default_val) {
    auto it = config.find(key);
    if (it != config.end() && !it->second.empty()) {
        try {
            return std::stod(it->second);
        } catch (const std::exception&) {
            throw std::invalid_argument("Cannot parse '" + it->second + "' for " + key);
        }
    }
    return default_val;
}

static int parseInt(const std::map<std::string, std::string>& config,
                    const std::string& key, int default_val) {
    auto it = config.find(key);
    if (it != config.end() && !it->second.empty()) {
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            throw std::invalid_argument("Cannot parse '" + it->second + "' for " + key);
        }
    }
    return default_val;
}

static bool parseBool(const std::map<std::string, std::string>& config,
                      const std::string& key, bool default_val) {
    auto it = config.find(key);
    if (it == config.end() || it->second.empty()) return default_val;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;
    return default_val;
}

static bool isTerminal(SolverStatus status) {
    return status == SolverStatus::CONVERGED ||
           status == SolverStatus::MAX_ITERATIONS_EXCEEDED ||
           status == SolverStatus::TIME_LIMIT_EXCEEDED;
}

static void validateOptions(const SDVPNOptions& options) {
    if (!(options.tolerance > 0.0)) {
        throw std::invalid_argument("SDVPN tolerance must be positive");
    }
    if (!(options.damping > 0.0)) {
        throw std::invalid_argument("SDVPN damping must be positive");
    }
    if (options.step_growth < 1.0) {
        throw std::invalid_argument("SDVPN step_growth must be at least 1");
    }
    if (!(options.min_step_fraction > 0.0) || options.min_step_fraction > 1.0) {
        throw std::invalid_argument("SDVPN min_step_fraction must lie in (0, 1]");
    }
    if (options.energy_tolerance < 0.0) {
        throw std::invalid_argument("SDVPN energy_tolerance must not be negative");
    }
}

// =============================================================================
// SDVPNOptions Implementation
// =============================================================================

void SDVPNOptions::configure(const std::map<std::string, std::string>& config) {
    tolerance = parseDouble(config, "tolerance", 1e-6);
    max_iterations = parseInt(config, "max_iterations", 1000);
    damping = parseDouble(config, "damping", 1.0);
    energy_tolerance = parseDouble(config, "energy_tolerance", 1e-10);
    step_growth = parseDouble(config, "step_growth", 1.5);
    min_step_fraction = parseDouble(config, "min_step_fraction", 1e-8);
    verbose = parseBool(config, "verbose", false);
    time_limit = parseDouble(config, "time_limit", 0.0);

    auto it = config.find("method");
    if (it != config.end() && !it->second.empty()) {
        method = parseSolverMethod(it->second);
    }

    // Comma-separated subset of m, n, xi; "none" frees everything
    it = config.find("frozen_components");
    if (it != config.end() && !it->second.empty()) {
        frozen = {{false, false, false}};
        std::stringstream ss(it->second);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item.erase(std::remove_if(item.begin(), item.end(), ::isspace), item.end());
            std::transform(item.begin(), item.end(), item.begin(), ::tolower);
            if (item == "m" || item == "x") {
                frozen[0] = true;
            } else if (item == "n" || item == "y") {
                frozen[1] = true;
            } else if (item == "xi" || item == "z") {
                frozen[2] = true;
            } else if (item != "none" && !item.empty()) {
                throw std::invalid_argument("Unknown frozen component: " + item);
            }
        }
    }
}

// =============================================================================
// SDVPN Implementation
// =============================================================================

SDVPN::SDVPN(const GammaSurface& gamma, const ElasticKernel& kernel, const Vector3& burgers,
             const SDVPNOptions& options)
    : gamma_(gamma),
      kernel_(kernel),
      burgers_(burgers),
      tau_(Matrix3::Zero()),
      beta_(Matrix3::Zero()),
      options_(options) {

    validateOptions(options_);
    if (burgers_.norm() == 0.0) {
        throw std::invalid_argument("SDVPN needs a nonzero Burgers vector");
    }

    int npoints = kernel_.numPoints();
    if (kernel_.boundary() == BoundaryCondition::FIXED) {
        for (int i = 1; i < npoints - 1; ++i) free_points_.push_back(i);
    } else {
        for (int i = 0; i < npoints; ++i) free_points_.push_back(i);
    }
    buildPreconditioner();
}

void SDVPN::setOptions(const SDVPNOptions& options) {
    validateOptions(options);
    options_ = options;
}

void SDVPN::setSurfaceCorrection(const Matrix3& beta) {
    beta_ = 0.5 * (beta + beta.transpose());
    buildPreconditioner();
}

void SDVPN::buildPreconditioner() {
    const int npoints = kernel_.numPoints();
    const int nfree = static_cast<int>(free_points_.size());
    const double h = kernel_.spacing();
    const bool periodic = kernel_.boundary() == BoundaryCondition::PERIODIC;

    Eigen::MatrixXd H = kernel_.scalarHessian();

    // Second-difference operator of the gradient correction on the point grid
    Eigen::MatrixXd lap = Eigen::MatrixXd::Zero(npoints, npoints);
    int ncells = kernel_.numCells();
    for (int c = 0; c < ncells; ++c) {
        int a = c;
        int b = (c + 1) % npoints;
        lap(a, a) += 1.0;
        lap(b, b) += 1.0;
        lap(a, b) -= 1.0;
        lap(b, a) -= 1.0;
    }

    Eigen::MatrixXd Hf(nfree, nfree);
    Eigen::MatrixXd Lf(nfree, nfree);
    for (int i = 0; i < nfree; ++i) {
        for (int j = 0; j < nfree; ++j) {
            Hf(i, j) = H(free_points_[i], free_points_[j]);
            Lf(i, j) = lap(free_points_[i], free_points_[j]);
        }
    }

    // Misfit curvature is bounded by the gamma surface; the small elastic
    // shift keeps the uniform mode of periodic grids positive definite
    const double diag_el = 2.0 * std::log(2.0) / M_PI;
    const double misfit = gamma_.curvatureBound() * h;

    for (int c = 0; c < 3; ++c) {
        double Kcc = kernel_.K()(c, c);
        Eigen::MatrixXd P = Kcc * Hf;
        P.diagonal().array() += misfit + 0.01 * Kcc * diag_el;
        if (beta_(c, c) > 0.0) {
            P += (beta_(c, c) / h) * Lf;
        }
        preconditioner_[c].compute(P);
        if (preconditioner_[c].info() != Eigen::Success) {
            std::ostringstream msg;
            msg << "SDVPN preconditioner for component " << c << " is not positive definite"
                << (periodic ? " (periodic grid)" : "");
            throw std::runtime_error(msg.str());
        }
    }
}

std::vector<Vector3> SDVPN::precondition(const std::vector<Vector3>& gradient) const {
    const int nfree = static_cast<int>(free_points_.size());
    std::vector<Vector3> direction(gradient.size(), Vector3::Zero());
    Eigen::VectorXd rhs(nfree);

    for (int c = 0; c < 3; ++c) {
        if (options_.frozen[c]) continue;
        for (int i = 0; i < nfree; ++i) {
            rhs(i) = gradient[free_points_[i]](c);
        }
        Eigen::VectorXd d = preconditioner_[c].solve(rhs);
        for (int i = 0; i < nfree; ++i) {
            direction[free_points_[i]](c) = d(i);
        }
    }
    return direction;
}

bool SDVPN::isFree(int point, int component) const {
    if (options_.frozen[component]) return false;
    if (kernel_.boundary() == BoundaryCondition::FIXED) {
        return point > 0 && point < kernel_.numPoints() - 1;
    }
    return true;
}

std::vector<Vector3> SDVPN::dislocationDensity(const DisregistryProfile& profile) const {
    return kernel_.density(profile.disregistry(), burgers_);
}

double SDVPN::misfitEnergy(const DisregistryProfile& profile) const {
    double E = 0.0;
    for (int i = 0; i < profile.size(); ++i) {
        E += gamma_.energy(profile[i]);
    }
    return kernel_.spacing() * E;
}

double SDVPN::elasticEnergy(const DisregistryProfile& profile) const {
    return kernel_.energy(dislocationDensity(profile));
}

double SDVPN::stressEnergy(const DisregistryProfile& profile) const {
    Vector3 traction = tau_.col(1);
    double E = 0.0;
    for (int i = 0; i < profile.size(); ++i) {
        E -= traction.dot(profile[i]);
    }
    return kernel_.spacing() * E;
}

double SDVPN::surfaceEnergy(const DisregistryProfile& profile) const {
    std::vector<Vector3> rho = dislocationDensity(profile);
    double E = 0.0;
    for (const auto& r : rho) {
        E += r.dot(beta_ * r);
    }
    return 0.5 * kernel_.spacing() * E;
}

double SDVPN::totalEnergy(const DisregistryProfile& profile) const {
    return misfitEnergy(profile) + elasticEnergy(profile) +
           stressEnergy(profile) + surfaceEnergy(profile);
}

double SDVPN::energyGradient(const DisregistryProfile& profile,
                             std::vector<Vector3>& gradient) const {
    const double h = kernel_.spacing();
    const int npoints = profile.size();
    if (npoints != kernel_.numPoints()) {
        throw std::invalid_argument("Profile size does not match the elastic kernel");
    }

    std::vector<Vector3> rho = dislocationDensity(profile);
    std::vector<Vector3> grad_rho;
    double E = kernel_.energyAndGradient(rho, grad_rho);

    for (size_t c = 0; c < rho.size(); ++c) {
        Vector3 br = beta_ * rho[c];
        E += 0.5 * h * rho[c].dot(br);
        grad_rho[c] += h * br;
    }
    gradient = kernel_.disregistryGradient(grad_rho);

    Vector3 traction = tau_.col(1);
    for (int i = 0; i < npoints; ++i) {
        Vector3 g;
        E += h * (gamma_.energyAndGradient(profile[i], g) - traction.dot(profile[i]));
        gradient[i] += h * (g - traction);
    }

    for (int i = 0; i < npoints; ++i) {
        for (int c = 0; c < 3; ++c) {
            if (!isFree(i, c)) gradient[i](c) = 0.0;
        }
    }
    return E;
}

SDVPNSolverState SDVPN::initialize(const DisregistryProfile& initial) const {
    if (initial.size() != kernel_.numPoints()) {
        std::ostringstream msg;
        msg << "Initial profile has " << initial.size() << " points, elastic kernel expects "
            << kernel_.numPoints();
        throw std::invalid_argument(msg.str());
    }
    if (std::abs(initial.spacing() - kernel_.spacing()) > 1e-6 * kernel_.spacing()) {
        throw std::invalid_argument("Initial profile spacing does not match the elastic kernel");
    }

    SDVPNSolverState state;
    state.profile = initial;
    if (kernel_.boundary() == BoundaryCondition::FIXED) {
        int last = initial.size() - 1;
        for (int c = 0; c < 3; ++c) {
            if (options_.frozen[c]) continue;
            state.profile[0](c) = 0.0;
            state.profile[last](c) = burgers_(c);
        }
    }

    state.energy = energyGradient(state.profile, state.gradient);
    state.step = options_.damping;
    state.energy_history.push_back(state.energy);
    state.status = SolverStatus::INITIALIZED;
    return state;
}

void SDVPN::iterate(SDVPNSolverState& state) const {
    if (isTerminal(state.status)) return;
    state.status = SolverStatus::ITERATING;

    std::vector<Vector3> direction = precondition(state.gradient);
    double dmax = 0.0;
    for (const auto& d : direction) {
        dmax = std::max(dmax, d.cwiseAbs().maxCoeff());
    }

    const double floor = options_.min_step_fraction * options_.damping;
    const double allowed = state.energy +
                           options_.energy_tolerance * std::max(1.0, std::abs(state.energy));

    DisregistryProfile trial = state.profile;
    std::vector<Vector3> trial_gradient;
    double trial_energy = state.energy;
    std::string domain_error;
    while (true) {
        for (int i = 0; i < trial.size(); ++i) {
            trial[i] = state.profile[i] - state.step * direction[i];
        }

        bool accepted = false;
        try {
            trial_energy = energyGradient(trial, trial_gradient);
            accepted = std::isfinite(trial_energy) && trial_energy <= allowed;
        } catch (const OutOfDomainError& e) {
            // Retried at half length; surfaces if the step collapses against the edge
            domain_error = e.what();
        }
        if (accepted) break;

        state.step *= 0.5;
        if (state.step < floor) {
            std::ostringstream msg;
            if (!domain_error.empty()) {
                msg << "SDVPN relaxation left the gamma surface at iteration " << state.iteration
                    << " (step " << state.step << " below " << floor << "): " << domain_error;
                throw OutOfDomainError(msg.str());
            }
            msg << "SDVPN relaxation diverged at iteration " << state.iteration
                << ": step " << state.step << " fell below " << floor
                << " without lowering the energy " << state.energy;
            throw DivergedError(msg.str(), state.iteration);
        }
    }

    // Undamped update size, so backtracking cannot fake a fixed point
    state.residual = dmax;
    state.profile = std::move(trial);
    state.gradient = std::move(trial_gradient);
    state.energy = trial_energy;
    state.iteration++;
    state.energy_history.push_back(state.energy);
    state.residual_history.push_back(state.residual);

    DISLOCCORE_CHECK_PETSC(PetscInfo(NULL, "SDVPN iteration %d: energy %.12g residual %.4g step %.4g\n",
                                     state.iteration, state.energy, state.residual, state.step));

    state.step = std::min(state.step * options_.step_growth, options_.damping);

    if (state.residual < options_.tolerance) {
        state.status = SolverStatus::CONVERGED;
    } else if (state.iteration >= options_.max_iterations) {
        state.status = SolverStatus::MAX_ITERATIONS_EXCEEDED;
    }
}

SDVPNResult SDVPN::solve(const DisregistryProfile& initial) const {
    if (options_.method == SolverMethod::TAO_LMVM) {
        return solveTao(initial);
    }
    return solveRelaxation(initial);
}

SDVPNResult SDVPN::solve(const DisregistryProfile& initial, const SDVPNOptions& options) {
    setOptions(options);
    return solve(initial);
}

SDVPNResult SDVPN::solveRelaxation(const DisregistryProfile& initial) const {
    SDVPNSolverState state = initialize(initial);

    PetscLogDouble start_time, now;
    DISLOCCORE_CHECK_PETSC(PetscTime(&start_time));

    if (options_.verbose) {
        PetscPrintf(PETSC_COMM_SELF, "SDVPN relaxation: %d points, %s boundaries, initial energy %.10g\n",
                    initial.size(), toString(kernel_.boundary()).c_str(), state.energy);
    }

    while (!isTerminal(state.status)) {
        if (state.iteration >= options_.max_iterations) {
            state.status = SolverStatus::MAX_ITERATIONS_EXCEEDED;
            break;
        }
        iterate(state);

        if (options_.time_limit > 0.0 && !isTerminal(state.status)) {
            DISLOCCORE_CHECK_PETSC(PetscTime(&now));
            if (now - start_time > options_.time_limit) {
                state.status = SolverStatus::TIME_LIMIT_EXCEEDED;
            }
        }
    }

    if (options_.verbose) {
        PetscPrintf(PETSC_COMM_SELF, "SDVPN relaxation %s after %d iterations: energy %.10g residual %.4g\n",
                    toString(state.status).c_str(), state.iteration, state.energy, state.residual);
    }

    SDVPNResult result;
    result.profile = std::move(state.profile);
    result.converged = state.status == SolverStatus::CONVERGED;
    result.iterations = state.iteration;
    result.residual = state.residual;
    result.energy = state.energy;
    result.energy_history = std::move(state.energy_history);
    result.status = state.status;
    return result;
}

SDVPNResult solveSDVPN(const DisregistryProfile& initial, const GammaSurface& gamma,
                       const ElasticKernel& kernel, double tolerance, int max_iterations) {
    if (kernel.boundary() == BoundaryCondition::PERIODIC) {
        throw std::invalid_argument("solveSDVPN cannot infer the Burgers vector of a periodic grid");
    }

    SDVPNOptions options;
    options.tolerance = tolerance;
    options.max_iterations = max_iterations;

    Vector3 burgers = initial[initial.size() - 1] - initial[0];
    SDVPN solver(gamma, kernel, burgers, options);
    return solver.solve(initial);
}

} // namespace DislocCore
