/**
 * @file test_sdvpn.cpp
 * @brief SDVPN relaxation against the Peierls-Nabarro solution
 */

#include <gtest/gtest.h>
#include "SDVPN.hpp"
#include "ConfigReader.hpp"
#include "DislocErrors.hpp"
#include <petscsys.h>
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace DislocCore;

class SDVPNTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

        // K = 1 and γ_us = 1/(8π²) give a PN half width ζ = K b²/(4π² γ_us) = 2
        burgers = Vector3(1.0, 0.0, 0.0);
        gamma_us = 1.0 / (8.0 * M_PI * M_PI);
        zeta = 2.0;
    }

    GammaSurface sinusoidalSurface(double usf) const {
        return GammaSurface::fromFunction(Vector3(1.0, 0.0, 0.0), Vector3(0.0, 0.0, 1.0), 64, 4,
            [usf](double f1, double) { return 0.5 * usf * (1.0 - std::cos(2.0 * M_PI * f1)); });
    }

    // Same surface sampled on [0, 1] along a1 without wrapping
    GammaSurface boundedSurface(double usf) const {
        return GammaSurface::fromFunction(Vector3(1.0, 0.0, 0.0), Vector3(0.0, 0.0, 1.0), 64, 4,
            [usf](double f1, double) { return 0.5 * usf * (1.0 - std::cos(2.0 * M_PI * f1)); },
            GammaInterpolation::BICUBIC, false);
    }

    // σ_mn large enough to push every free point past b
    static Matrix3 glideStress(double tau) {
        Matrix3 sigma = Matrix3::Zero();
        sigma(0, 1) = tau;
        sigma(1, 0) = tau;
        return sigma;
    }

    // 10-90% width of the arctan profile with half width ζ
    static double pnWidth(double halfwidth) {
        return 2.0 * halfwidth * std::tan(0.4 * M_PI);
    }

    int rank;
    Vector3 burgers;
    double gamma_us;
    double zeta;
};

// ============================================================================
// Peierls-Nabarro limit
// ============================================================================

TEST_F(SDVPNTest, RecoversPeierlsNabarroWidth) {
    DisregistryProfile initial = pnArctanDisregistry(100.0, 801, burgers, 5.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPN solver(gamma, kernel, burgers, options);
    SDVPNResult result = solver.solve(initial);

    ASSERT_TRUE(result.converged) << "residual " << result.residual;
    EXPECT_EQ(result.status, SolverStatus::CONVERGED);
    EXPECT_LT(result.residual, options.tolerance);

    double width = coreWidth(result.profile, burgers, 0);
    EXPECT_NEAR(width, pnWidth(zeta), 0.05 * pnWidth(zeta));
    EXPECT_NEAR(coreCenter(result.profile, burgers, 0), 0.0, 0.05);

    // Pinned end points and untouched frozen normal component
    EXPECT_DOUBLE_EQ(result.profile[0](0), 0.0);
    EXPECT_DOUBLE_EQ(result.profile[800](0), 1.0);
    for (int i = 0; i < result.profile.size(); ++i) {
        EXPECT_DOUBLE_EQ(result.profile[i](1), 0.0);
    }
}

TEST_F(SDVPNTest, EnergyNeverRises) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 6.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPN solver(gamma, kernel, burgers, options);
    SDVPNResult result = solver.solve(initial);

    ASSERT_GE(result.energy_history.size(), 2u);
    EXPECT_EQ(result.energy_history.size(), static_cast<size_t>(result.iterations) + 1);
    for (size_t k = 1; k < result.energy_history.size(); ++k) {
        double slack = options.energy_tolerance * std::max(1.0, std::abs(result.energy_history[k - 1]));
        EXPECT_LE(result.energy_history[k], result.energy_history[k - 1] + slack) << "iteration " << k;
    }
    EXPECT_LT(result.energy_history.back(), result.energy_history.front());
    EXPECT_NEAR(result.energy, solver.totalEnergy(result.profile), 1e-10);
}

TEST_F(SDVPNTest, ConvergedProfileIsStationary) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 1.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPN solver(gamma, kernel, burgers, options);
    SDVPNResult first = solver.solve(initial);
    ASSERT_TRUE(first.converged);

    SDVPNResult second = solver.solve(first.profile);
    EXPECT_TRUE(second.converged);
    EXPECT_LE(second.iterations, 10);
    EXPECT_LT(first.profile.maxDifference(second.profile), 1e-3);
    EXPECT_NEAR(coreWidth(first.profile, burgers, 0), coreWidth(second.profile, burgers, 0), 1e-3);
}

TEST_F(SDVPNTest, SofterSurfaceWidensCore) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 2.0);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;

    GammaSurface soft = sinusoidalSurface(gamma_us);
    GammaSurface hard = sinusoidalSurface(2.0 * gamma_us);
    SDVPNResult wide = SDVPN(soft, kernel, burgers, options).solve(initial);
    SDVPNResult narrow = SDVPN(hard, kernel, burgers, options).solve(initial);
    ASSERT_TRUE(wide.converged);
    ASSERT_TRUE(narrow.converged);

    // ζ ∝ 1/γ_us
    double ratio = coreWidth(wide.profile, burgers, 0) / coreWidth(narrow.profile, burgers, 0);
    EXPECT_NEAR(ratio, 2.0, 0.2);

    // The stiffer elastic medium spreads the core the same way
    ElasticKernel stiff(2.0 * Matrix3::Identity(), initial.spacing(), initial.size());
    SDVPNResult spread = SDVPN(hard, stiff, burgers, options).solve(initial);
    ASSERT_TRUE(spread.converged);
    EXPECT_NEAR(coreWidth(spread.profile, burgers, 0), coreWidth(wide.profile, burgers, 0), 0.05);
}

TEST_F(SDVPNTest, HarmonicWellSpreadsWithoutConverging) {
    // γ = k δ²/2 around zero disregistry, with no barrier to cross
    auto harmonicSurface = [](double k) {
        return GammaSurface::fromFunction(Vector3(4.0, 0.0, 0.0), Vector3(0.0, 0.0, 1.0), 64, 4,
            [k](double f1, double) {
                double u = f1 < 0.5 ? f1 : f1 - 1.0;
                return 0.5 * k * (4.0 * u) * (4.0 * u);
            });
    };

    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 2.0);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 5000;
    GammaSurface stiff = harmonicSurface(0.05);
    GammaSurface weak = harmonicSurface(0.0125);
    SDVPNResult narrow = SDVPN(stiff, kernel, burgers, options).solve(initial);
    SDVPNResult wide = SDVPN(weak, kernel, burgers, options).solve(initial);
    EXPECT_GT(coreWidth(wide.profile, burgers, 0), 1.5 * coreWidth(narrow.profile, burgers, 0));

    // A vanishing restoring force is reported at the cap instead of hanging
    GammaSurface flat = harmonicSurface(1e-6);
    options.tolerance = 1e-12;
    options.max_iterations = 50;
    SDVPNResult result = SDVPN(flat, kernel, burgers, options).solve(initial);
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.status, SolverStatus::MAX_ITERATIONS_EXCEEDED);
    EXPECT_EQ(result.iterations, 50);
}

// ============================================================================
// Periodic array
// ============================================================================

TEST_F(SDVPNTest, PeriodicArrayMatchesIsolatedCore) {
    // 800 points with spacing 0.25: one period of 200
    DisregistryProfile initial = pnArctanDisregistry(99.875, 800, burgers, 4.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size(),
                         BoundaryCondition::PERIODIC);

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPN solver(gamma, kernel, burgers, options);
    EXPECT_TRUE(solver.isFree(0, 0));
    EXPECT_FALSE(solver.isFree(0, 1));

    SDVPNResult result = solver.solve(initial);
    ASSERT_TRUE(result.converged);
    EXPECT_NEAR(coreWidth(result.profile, burgers, 0), pnWidth(zeta), 0.05 * pnWidth(zeta));
    EXPECT_NEAR(coreCenter(result.profile, burgers, 0), 0.0, 0.05);

    // One period carries exactly one Burgers vector
    std::vector<Vector3> rho = solver.dislocationDensity(result.profile);
    Vector3 total = Vector3::Zero();
    for (const auto& r : rho) total += kernel.spacing() * r;
    EXPECT_LT((total - burgers).norm(), 1e-12);
}

// ============================================================================
// Solver states and failures
// ============================================================================

TEST_F(SDVPNTest, IterationCapIsNotAnError) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 6.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.tolerance = 1e-12;
    options.max_iterations = 3;
    SDVPN solver(gamma, kernel, burgers, options);

    SDVPNResult result;
    ASSERT_NO_THROW(result = solver.solve(initial));
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.status, SolverStatus::MAX_ITERATIONS_EXCEEDED);
    EXPECT_EQ(result.iterations, 3);
    EXPECT_EQ(result.energy_history.size(), 4u);
}

TEST_F(SDVPNTest, StepwiseIteration) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 6.0);
    initial[0] = Vector3(0.2, 0.3, 0.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 2;
    SDVPN solver(gamma, kernel, burgers, options);

    // End points are pinned except along the frozen normal
    SDVPNSolverState state = solver.initialize(initial);
    EXPECT_EQ(state.status, SolverStatus::INITIALIZED);
    EXPECT_DOUBLE_EQ(state.profile[0](0), 0.0);
    EXPECT_DOUBLE_EQ(state.profile[0](1), 0.3);
    EXPECT_DOUBLE_EQ(state.profile[100](0), 1.0);
    EXPECT_DOUBLE_EQ(state.step, options.damping);

    for (int i : {0, 100}) {
        EXPECT_DOUBLE_EQ(state.gradient[i].norm(), 0.0);
    }

    solver.iterate(state);
    EXPECT_EQ(state.status, SolverStatus::ITERATING);
    EXPECT_EQ(state.iteration, 1);
    EXPECT_GT(state.residual, 0.0);
    EXPECT_EQ(state.residual_history.size(), 1u);

    solver.iterate(state);
    EXPECT_EQ(state.status, SolverStatus::MAX_ITERATIONS_EXCEEDED);

    // Terminal states are left untouched
    double energy = state.energy;
    solver.iterate(state);
    EXPECT_EQ(state.iteration, 2);
    EXPECT_DOUBLE_EQ(state.energy, energy);
}

TEST_F(SDVPNTest, OversizedStepDiverges) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 8.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    // Only four halvings are allowed before the step floor
    SDVPNOptions options;
    options.damping = 1e6;
    options.min_step_fraction = 0.1;
    SDVPN solver(gamma, kernel, burgers, options);

    try {
        solver.solve(initial);
        FAIL() << "Expected DivergedError";
    } catch (const DivergedError& e) {
        EXPECT_EQ(e.iteration(), 0);
    }
    EXPECT_THROW(solver.solve(initial), DislocCoreError);
}

TEST_F(SDVPNTest, TimeLimitStopsWithoutError) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 6.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;
    options.time_limit = 1e-9;
    SDVPN solver(gamma, kernel, burgers, options);

    SDVPNResult result;
    ASSERT_NO_THROW(result = solver.solve(initial));
    EXPECT_EQ(result.status, SolverStatus::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(result.converged);
    EXPECT_GE(result.iterations, 1);
    EXPECT_LT(result.iterations, options.max_iterations);
    EXPECT_EQ(result.energy_history.size(), static_cast<size_t>(result.iterations) + 1);
    EXPECT_GT(result.residual, options.tolerance);
    EXPECT_NEAR(result.energy, solver.totalEnergy(result.profile), 1e-10);
}

// ============================================================================
// Bounded gamma surfaces
// ============================================================================

TEST_F(SDVPNTest, RelaxationDrivenOffBoundedSurface) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 2.0);
    GammaSurface gamma = boundedSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());
    ASSERT_FALSE(gamma.isPeriodic());

    // The glide stress exceeds the largest restoring stress π γ_us
    SDVPNOptions options;
    options.max_iterations = 5000;
    SDVPN solver(gamma, kernel, burgers, options);
    solver.setAppliedStress(glideStress(0.2));

    // Backtracked steps against the table edge are never a fixed point
    SDVPNSolverState state = solver.initialize(initial);
    bool left_surface = false;
    try {
        while (state.status != SolverStatus::CONVERGED &&
               state.status != SolverStatus::MAX_ITERATIONS_EXCEEDED) {
            solver.iterate(state);
        }
    } catch (const OutOfDomainError&) {
        left_surface = true;
    }
    EXPECT_TRUE(left_surface) << "status " << toString(state.status)
                              << " after " << state.iteration << " iterations";
    EXPECT_NE(state.status, SolverStatus::CONVERGED);
    for (double r : state.residual_history) {
        EXPECT_GT(r, options.tolerance);
    }
    for (int i = 0; i < state.profile.size(); ++i) {
        EXPECT_LE(state.profile[i](0), 1.0 + 1e-12);
    }

    EXPECT_THROW(solver.solve(initial), OutOfDomainError);
}

TEST_F(SDVPNTest, TaoDrivenOffBoundedSurface) {
    // Built the way the CLI builds it, with wrapping switched off
    std::ostringstream usf;
    usf << std::setprecision(17) << gamma_us << " eV/A^2";
    ConfigReader reader;
    reader.set("GAMMA_SURFACE", "model", "sinusoidal");
    reader.set("GAMMA_SURFACE", "unstable_fault_energy", usf.str());
    reader.set("GAMMA_SURFACE", "n1", "64");
    reader.set("GAMMA_SURFACE", "n2", "4");
    reader.set("GAMMA_SURFACE", "periodic", "false");
    GammaSurface gamma = reader.parseGammaSurface(burgers);
    ASSERT_FALSE(gamma.isPeriodic());
    EXPECT_NEAR(gamma.maxEnergy(), gamma_us, 1e-3 * gamma_us);

    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 2.0);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.method = SolverMethod::TAO_LMVM;
    options.max_iterations = 5000;
    SDVPN solver(gamma, kernel, burgers, options);
    solver.setAppliedStress(glideStress(0.2));
    EXPECT_THROW(solver.solve(initial), OutOfDomainError);
}

TEST_F(SDVPNTest, RejectsInconsistentSetup) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 2.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    EXPECT_THROW(SDVPN(gamma, kernel, Vector3::Zero()), std::invalid_argument);

    SDVPN solver(gamma, kernel, burgers);
    DisregistryProfile coarse = pnArctanDisregistry(25.0, 51, burgers, 2.0);
    EXPECT_THROW(solver.initialize(coarse), std::invalid_argument);
    DisregistryProfile stretched = pnArctanDisregistry(30.0, 101, burgers, 2.0);
    EXPECT_THROW(solver.initialize(stretched), std::invalid_argument);

    SDVPNOptions bad;
    bad.tolerance = 0.0;
    EXPECT_THROW(solver.setOptions(bad), std::invalid_argument);
    bad = SDVPNOptions();
    bad.damping = -1.0;
    EXPECT_THROW(solver.setOptions(bad), std::invalid_argument);
    bad = SDVPNOptions();
    bad.step_growth = 0.5;
    EXPECT_THROW(solver.setOptions(bad), std::invalid_argument);
    bad = SDVPNOptions();
    bad.min_step_fraction = 2.0;
    EXPECT_THROW(solver.setOptions(bad), std::invalid_argument);
}

TEST_F(SDVPNTest, OptionsFromConfig) {
    SDVPNOptions options;
    options.configure({{"tolerance", "1e-9"},
                       {"max_iterations", "50"},
                       {"method", "lmvm"},
                       {"frozen_components", "none"},
                       {"verbose", "on"},
                       {"time_limit", "30"}});

    EXPECT_DOUBLE_EQ(options.tolerance, 1e-9);
    EXPECT_EQ(options.max_iterations, 50);
    EXPECT_EQ(options.method, SolverMethod::TAO_LMVM);
    EXPECT_FALSE(options.frozen[0] || options.frozen[1] || options.frozen[2]);
    EXPECT_TRUE(options.verbose);
    EXPECT_DOUBLE_EQ(options.damping, 1.0);
    EXPECT_DOUBLE_EQ(options.time_limit, 30.0);

    SDVPNOptions bad;
    EXPECT_THROW(bad.configure({{"tolerance", "small"}}), std::invalid_argument);
    EXPECT_THROW(bad.configure({{"method", "newton"}}), std::invalid_argument);
}

// ============================================================================
// Energy functional
// ============================================================================

TEST_F(SDVPNTest, GradientMatchesFiniteDifference) {
    Matrix3 K;
    K << 1.6, 0.0, 0.2,
         0.0, 1.6, 0.0,
         0.2, 0.0, 1.0;
    Vector3 b(1.0, 0.0, 0.4);
    GammaSurface gamma = GammaSurface::fromFunction(Vector3(1.0, 0.0, 0.0), Vector3(0.5, 0.0, 0.9),
                                                    32, 32,
        [this](double f1, double f2) {
            return gamma_us * (1.5 - std::cos(2.0 * M_PI * f1) - 0.5 * std::cos(2.0 * M_PI * f2));
        });

    DisregistryProfile profile = pnArctanDisregistry(10.0, 41, b, 2.0);
    for (int i = 0; i < profile.size(); ++i) {
        profile[i](1) = 0.05 * std::sin(0.4 * i);
    }
    ElasticKernel kernel(K, profile.spacing(), profile.size());

    SDVPNOptions options;
    options.frozen = {{false, false, false}};
    SDVPN solver(gamma, kernel, b, options);

    Matrix3 tau = Matrix3::Zero();
    tau(0, 1) = tau(1, 0) = 0.01;
    tau(1, 2) = tau(2, 1) = -0.005;
    solver.setAppliedStress(tau);

    Matrix3 beta = Matrix3::Zero();
    beta.diagonal() = Vector3(0.1, 0.05, 0.2);
    solver.setSurfaceCorrection(beta);

    std::vector<Vector3> grad;
    double E = solver.energyGradient(profile, grad);
    EXPECT_NEAR(E, solver.totalEnergy(profile), 1e-12 * std::max(1.0, std::abs(E)));

    // Pinned end points carry no gradient
    EXPECT_DOUBLE_EQ(grad[0].norm(), 0.0);
    EXPECT_DOUBLE_EQ(grad[40].norm(), 0.0);

    double eps = 1e-6;
    for (int i : {1, 17, 20, 39}) {
        for (int c = 0; c < 3; ++c) {
            DisregistryProfile plus = profile, minus = profile;
            plus[i](c) += eps;
            minus[i](c) -= eps;
            double fd = (solver.totalEnergy(plus) - solver.totalEnergy(minus)) / (2.0 * eps);
            EXPECT_NEAR(grad[i](c), fd, 1e-6 * std::max(1.0, std::abs(fd)))
                << "point " << i << " component " << c;
        }
    }
}

TEST_F(SDVPNTest, EnergyDecomposition) {
    DisregistryProfile profile = pnArctanDisregistry(10.0, 41, burgers, 2.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), profile.spacing(), profile.size());
    SDVPN solver(gamma, kernel, burgers);

    EXPECT_DOUBLE_EQ(solver.stressEnergy(profile), 0.0);
    EXPECT_DOUBLE_EQ(solver.surfaceEnergy(profile), 0.0);

    // Only the traction on the slip plane does work
    Matrix3 tau = Matrix3::Zero();
    tau(0, 0) = 5.0;
    tau(0, 1) = tau(1, 0) = 0.02;
    solver.setAppliedStress(tau);

    double sum = 0.0;
    for (int i = 0; i < profile.size(); ++i) sum += profile[i](0);
    EXPECT_NEAR(solver.stressEnergy(profile), -0.02 * profile.spacing() * sum, 1e-14);

    double total = solver.misfitEnergy(profile) + solver.elasticEnergy(profile) +
                   solver.stressEnergy(profile) + solver.surfaceEnergy(profile);
    EXPECT_DOUBLE_EQ(solver.totalEnergy(profile), total);
    EXPECT_GT(solver.misfitEnergy(profile), 0.0);
}

// ============================================================================
// Convenience wrapper and TAO
// ============================================================================

TEST_F(SDVPNTest, ConvenienceWrapper) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 3.0);
    initial[0] = Vector3::Zero();
    initial[400] = burgers;
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNResult wrapped = solveSDVPN(initial, gamma, kernel, 1e-6, 20000);

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPNResult direct = SDVPN(gamma, kernel, burgers, options).solve(initial);

    ASSERT_TRUE(wrapped.converged);
    EXPECT_EQ(wrapped.iterations, direct.iterations);
    EXPECT_LT(wrapped.profile.maxDifference(direct.profile), 1e-12);

    ElasticKernel periodic(Matrix3::Identity(), initial.spacing(), initial.size(),
                           BoundaryCondition::PERIODIC);
    EXPECT_THROW(solveSDVPN(initial, gamma, periodic, 1e-6, 100), std::invalid_argument);
}

TEST_F(SDVPNTest, TaoMatchesRelaxation) {
    DisregistryProfile initial = pnArctanDisregistry(50.0, 401, burgers, 4.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.max_iterations = 20000;
    SDVPN solver(gamma, kernel, burgers, options);
    SDVPNResult relaxed = solver.solve(initial);
    ASSERT_TRUE(relaxed.converged);

    SDVPNOptions tao_options;
    tao_options.method = SolverMethod::TAO_LMVM;
    tao_options.tolerance = 1e-5;
    tao_options.max_iterations = 5000;
    SDVPNResult lmvm = solver.solve(initial, tao_options);

    ASSERT_TRUE(lmvm.converged) << toString(lmvm.status);
    EXPECT_EQ(solver.options().method, SolverMethod::TAO_LMVM);
    double width = coreWidth(relaxed.profile, burgers, 0);
    EXPECT_NEAR(coreWidth(lmvm.profile, burgers, 0), width, 0.03 * width);
    EXPECT_NEAR(lmvm.energy, relaxed.energy, 1e-6 * std::max(1.0, std::abs(relaxed.energy)));
    EXPECT_DOUBLE_EQ(lmvm.profile[0](0), 0.0);
    EXPECT_DOUBLE_EQ(lmvm.profile[400](0), 1.0);
}

TEST_F(SDVPNTest, TaoSetupErrorIsReported) {
    DisregistryProfile initial = pnArctanDisregistry(25.0, 101, burgers, 2.0);
    GammaSurface gamma = sinusoidalSurface(gamma_us);
    ElasticKernel kernel(Matrix3::Identity(), initial.spacing(), initial.size());

    SDVPNOptions options;
    options.method = SolverMethod::TAO_LMVM;
    options.tolerance = 1e-5;
    options.max_iterations = 5000;
    SDVPN solver(gamma, kernel, burgers, options);

    // TaoSetFromOptions fails after the Tao object exists
    ASSERT_EQ(PetscOptionsSetValue(NULL, "-sdvpn_tao_type", "no_such_method"), 0);
    EXPECT_THROW(solver.solve(initial), std::runtime_error);
    ASSERT_EQ(PetscOptionsClearValue(NULL, "-sdvpn_tao_type"), 0);

    SDVPNResult result;
    ASSERT_NO_THROW(result = solver.solve(initial));
    EXPECT_TRUE(result.converged) << toString(result.status);
}
