#include "SDVPN.hpp"
#include "DislocErrors.hpp"
#include <petsctao.h>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace DislocCore {

namespace {

// Maps TAO's flat vector of free entries onto the disregistry profile
struct TaoContext {
    const SDVPN* solver;
    DisregistryProfile profile;
    std::vector<std::pair<int, int>> dofs;      // (point, component)
    std::vector<double> energy_history;
    bool out_of_domain;
};

void scatter(TaoContext& ctx, const PetscScalar* x) {
    for (size_t k = 0; k < ctx.dofs.size(); ++k) {
        ctx.profile[ctx.dofs[k].first](ctx.dofs[k].second) = PetscRealPart(x[k]);
    }
}

} // namespace

static PetscErrorCode formEnergyGradient(Tao tao, Vec x, PetscReal* f, Vec g, void* ptr) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    (void)tao;
    TaoContext* ctx = static_cast<TaoContext*>(ptr);

    const PetscScalar* xa = nullptr;
    ierr = VecGetArrayRead(x, &xa); CHKERRQ(ierr);
    scatter(*ctx, xa);
    ierr = VecRestoreArrayRead(x, &xa); CHKERRQ(ierr);

    std::vector<Vector3> gradient;
    double energy = 0.0;
    try {
        energy = ctx->solver->energyGradient(ctx->profile, gradient);
    } catch (const OutOfDomainError&) {
        // Reported as an infinite objective so the line search backs off
        ctx->out_of_domain = true;
        energy = PETSC_INFINITY;
        gradient.assign(ctx->profile.size(), Vector3::Zero());
    }
    *f = energy;

    PetscScalar* ga = nullptr;
    ierr = VecGetArray(g, &ga); CHKERRQ(ierr);
    for (size_t k = 0; k < ctx->dofs.size(); ++k) {
        ga[k] = gradient[ctx->dofs[k].first](ctx->dofs[k].second);
    }
    ierr = VecRestoreArray(g, &ga); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

static PetscErrorCode monitorEnergy(Tao tao, void* ptr) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    TaoContext* ctx = static_cast<TaoContext*>(ptr);

    PetscInt its;
    PetscReal f, gnorm, cnorm, xdiff;
    TaoConvergedReason reason;
    ierr = TaoGetSolutionStatus(tao, &its, &f, &gnorm, &cnorm, &xdiff, &reason); CHKERRQ(ierr);
    ctx->energy_history.push_back(f);
    ierr = PetscInfo(tao, "SDVPN LMVM iteration %d: energy %.12g gradient norm %.4g\n",
                     static_cast<int>(its), static_cast<double>(f),
                     static_cast<double>(gnorm)); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

static PetscErrorCode configureAndSolve(Tao tao, TaoContext& ctx, const SDVPNOptions& options,
                                        Vec x, PetscInt& iterations, PetscReal& energy,
                                        PetscReal& gnorm, TaoConvergedReason& reason) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ierr = TaoSetType(tao, TAOLMVM); CHKERRQ(ierr);
    ierr = TaoSetSolution(tao, x); CHKERRQ(ierr);
    ierr = TaoSetObjectiveAndGradient(tao, NULL, formEnergyGradient, &ctx); CHKERRQ(ierr);
    ierr = TaoSetTolerances(tao, options.tolerance, 0.0, 0.0); CHKERRQ(ierr);
    ierr = TaoSetMaximumIterations(tao, options.max_iterations); CHKERRQ(ierr);
    ierr = TaoMonitorSet(tao, monitorEnergy, &ctx, NULL); CHKERRQ(ierr);
    ierr = TaoSetOptionsPrefix(tao, "sdvpn_"); CHKERRQ(ierr);
    ierr = TaoSetFromOptions(tao); CHKERRQ(ierr);

    ierr = TaoSolve(tao); CHKERRQ(ierr);

    PetscReal cnorm, xdiff;
    ierr = TaoGetSolutionStatus(tao, &iterations, &energy, &gnorm, &cnorm, &xdiff, &reason); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

static PetscErrorCode runTao(TaoContext& ctx, const SDVPNOptions& options, Vec x,
                             PetscInt& iterations, PetscReal& energy, PetscReal& gnorm,
                             TaoConvergedReason& reason) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    Tao tao;

    ierr = TaoCreate(PETSC_COMM_SELF, &tao); CHKERRQ(ierr);
    ierr = configureAndSolve(tao, ctx, options, x, iterations, energy, gnorm, reason);

    // Destroyed before any error from the solve is passed up
    PetscErrorCode destroy_ierr = TaoDestroy(&tao);
    CHKERRQ(ierr);
    CHKERRQ(destroy_ierr);
    PetscFunctionReturn(0);
}

// =============================================================================
// SDVPN::solveTao Implementation
// =============================================================================

SDVPNResult SDVPN::solveTao(const DisregistryProfile& initial) const {
    SDVPNSolverState state = initialize(initial);

    TaoContext ctx;
    ctx.solver = this;
    ctx.profile = state.profile;
    ctx.out_of_domain = false;
    for (int i = 0; i < state.profile.size(); ++i) {
        for (int c = 0; c < 3; ++c) {
            if (isFree(i, c)) ctx.dofs.emplace_back(i, c);
        }
    }

    SDVPNResult result;
    result.energy_history.push_back(state.energy);

    if (ctx.dofs.empty()) {
        result.profile = state.profile;
        result.converged = true;
        result.energy = state.energy;
        result.status = SolverStatus::CONVERGED;
        return result;
    }

    Vec x;
    DISLOCCORE_CHECK_PETSC(VecCreateSeq(PETSC_COMM_SELF, static_cast<PetscInt>(ctx.dofs.size()), &x));
    PetscScalar* xa = nullptr;
    DISLOCCORE_CHECK_PETSC(VecGetArray(x, &xa));
    for (size_t k = 0; k < ctx.dofs.size(); ++k) {
        xa[k] = state.profile[ctx.dofs[k].first](ctx.dofs[k].second);
    }
    DISLOCCORE_CHECK_PETSC(VecRestoreArray(x, &xa));

    if (options_.verbose) {
        PetscPrintf(PETSC_COMM_SELF, "SDVPN LMVM: %d unknowns, initial energy %.10g\n",
                    static_cast<int>(ctx.dofs.size()), state.energy);
    }

    PetscInt iterations = 0;
    PetscReal energy = 0.0, gnorm = 0.0;
    TaoConvergedReason reason;
    PetscErrorCode ierr = runTao(ctx, options_, x, iterations, energy, gnorm, reason);
    if (ierr) {
        VecDestroy(&x);
        if (ctx.out_of_domain) {
            throw OutOfDomainError("SDVPN LMVM failed after the disregistry left the gamma surface "
                                   "(PETSc error " + std::to_string(ierr) + ")");
        }
        throw std::runtime_error("PETSc TAO solve failed with error " + std::to_string(ierr));
    }

    const PetscScalar* xr = nullptr;
    DISLOCCORE_CHECK_PETSC(VecGetArrayRead(x, &xr));
    scatter(ctx, xr);
    DISLOCCORE_CHECK_PETSC(VecRestoreArrayRead(x, &xr));
    DISLOCCORE_CHECK_PETSC(VecDestroy(&x));

    // A minimum the line search can only approach from inside the table
    if (ctx.out_of_domain &&
        (!std::isfinite(static_cast<double>(energy)) || !(gnorm < options_.tolerance))) {
        std::ostringstream msg;
        msg << "SDVPN LMVM was driven off the gamma surface after " << iterations
            << " iterations (" << TaoConvergedReasons[reason] << ", gradient norm "
            << gnorm << ")";
        throw OutOfDomainError(msg.str());
    }

    if (!std::isfinite(static_cast<double>(energy))) {
        std::ostringstream msg;
        msg << "SDVPN LMVM diverged after " << iterations << " iterations ("
            << TaoConvergedReasons[reason] << ")";
        throw DivergedError(msg.str(), static_cast<int>(iterations));
    }

    result.profile = ctx.profile;
    result.iterations = static_cast<int>(iterations);
    result.energy = static_cast<double>(energy);
    result.residual = static_cast<double>(gnorm);
    result.energy_history.insert(result.energy_history.end(),
                                 ctx.energy_history.begin(), ctx.energy_history.end());
    result.converged = reason > 0;
    if (result.converged) {
        result.status = SolverStatus::CONVERGED;
    } else if (reason == TAO_DIVERGED_MAXITS) {
        result.status = SolverStatus::MAX_ITERATIONS_EXCEEDED;
    } else {
        // Line-search breakdown is the LMVM counterpart of the step floor
        std::ostringstream msg;
        msg << "SDVPN LMVM stopped without converging (" << TaoConvergedReasons[reason] << ")";
        throw DivergedError(msg.str(), static_cast<int>(iterations));
    }

    if (options_.verbose) {
        PetscPrintf(PETSC_COMM_SELF, "SDVPN LMVM %s after %d iterations: energy %.10g gradient norm %.4g\n",
                    TaoConvergedReasons[reason], result.iterations, result.energy, result.residual);
    }
    return result;
}

} // namespace DislocCore
