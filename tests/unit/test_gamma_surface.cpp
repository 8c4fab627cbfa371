/**
 * @file test_gamma_surface.cpp
 * @brief Unit tests for the interpolated gamma surface
 */

#include <gtest/gtest.h>
#include "GammaSurface.hpp"
#include "DislocErrors.hpp"
#include <cmath>

using namespace DislocCore;

class GammaSurfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // fcc {111}-like oblique cell in the (m, xi) plane
        a1 = Vector3(2.55, 0.0, 0.0);
        a2 = Vector3(1.275, 0.0, 2.208);
        gamma_us = 0.011;

        energy = [this](double f1, double f2) {
            return gamma_us * (1.5 - std::cos(2.0 * M_PI * f1) - 0.5 * std::cos(2.0 * M_PI * f2) +
                               0.2 * std::sin(2.0 * M_PI * f1) * std::sin(2.0 * M_PI * f2));
        };
    }

    Vector3 a1, a2;
    double gamma_us;
    GammaSurface::EnergyFunction energy;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(GammaSurfaceTest, RejectsInconsistentInput) {
    EXPECT_THROW(GammaSurface(a1, a2, 4, 4, std::vector<double>(15, 0.0)), std::invalid_argument);
    EXPECT_THROW(GammaSurface(a1, 2.0 * a1, 4, 4, std::vector<double>(16, 0.0)),
                 std::invalid_argument);
    EXPECT_THROW(GammaSurface(a1, a2, 1, 4, std::vector<double>(4, 0.0)), std::invalid_argument);

    std::vector<double> bad(16, 0.0);
    bad[3] = std::nan("");
    EXPECT_THROW(GammaSurface(a1, a2, 4, 4, bad), std::invalid_argument);
}

TEST_F(GammaSurfaceTest, PlaneNormalAndCoordinates) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 16, 16, energy);

    EXPECT_LT(std::abs(gamma.planeNormal().dot(a1)), 1e-12);
    EXPECT_LT(std::abs(gamma.planeNormal().dot(a2)), 1e-12);

    auto f = gamma.fractionalCoordinates(gamma.position(0.3, 0.7));
    EXPECT_NEAR(f[0], 0.3, 1e-12);
    EXPECT_NEAR(f[1], 0.7, 1e-12);

    // The normal component does not change the lattice coordinates
    auto g = gamma.fractionalCoordinates(gamma.position(0.3, 0.7) + 5.0 * gamma.planeNormal());
    EXPECT_NEAR(g[0], 0.3, 1e-12);
    EXPECT_NEAR(g[1], 0.7, 1e-12);
}

// ============================================================================
// Interpolation
// ============================================================================

TEST_F(GammaSurfaceTest, ReproducesNodes) {
    const int n1 = 12, n2 = 10;
    for (GammaInterpolation mode : {GammaInterpolation::BILINEAR, GammaInterpolation::BICUBIC}) {
        GammaSurface gamma = GammaSurface::fromFunction(a1, a2, n1, n2, energy, mode);
        for (int i = 0; i < n1; ++i) {
            for (int j = 0; j < n2; ++j) {
                double f1 = static_cast<double>(i) / n1;
                double f2 = static_cast<double>(j) / n2;
                EXPECT_NEAR(gamma.energyAt(f1, f2), energy(f1, f2), 1e-14);
            }
        }
    }
}

TEST_F(GammaSurfaceTest, BicubicAccuracy) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 64, 64, energy);

    double err = 0.0;
    for (int k = 0; k < 50; ++k) {
        double f1 = 0.0137 + 0.0191 * k;
        double f2 = 0.9 - 0.0173 * k;
        err = std::max(err, std::abs(gamma.energyAt(f1, f2) - energy(f1, f2)));
    }
    EXPECT_LT(err, 1e-4 * gamma_us);
}

TEST_F(GammaSurfaceTest, ExtremaOfSamples) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 8, 8,
        [](double f1, double) { return 0.5 * (1.0 - std::cos(2.0 * M_PI * f1)); });

    EXPECT_NEAR(gamma.minEnergy(), 0.0, 1e-14);
    EXPECT_NEAR(gamma.maxEnergy(), 1.0, 1e-14);
    EXPECT_GT(gamma.curvatureBound(), 0.0);
}

TEST_F(GammaSurfaceTest, PeriodicWrapping) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 32, 32, energy);
    Vector3 d = gamma.position(0.21, 0.64);

    double E = gamma.energy(d);
    EXPECT_NEAR(gamma.energy(d + a1), E, 1e-14);
    EXPECT_NEAR(gamma.energy(d - 3.0 * a2), E, 1e-14);
    EXPECT_NEAR(gamma.energy(d + 2.0 * a1 - a2), E, 1e-14);

    Vector3 g = gamma.gradient(d);
    EXPECT_LT((gamma.gradient(d - a1 + a2) - g).norm(), 1e-12);
}

TEST_F(GammaSurfaceTest, NonPeriodicDomain) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 9, 9, energy,
                                                    GammaInterpolation::BICUBIC, false);
    EXPECT_FALSE(gamma.isPeriodic());

    // Inclusive sampling reaches both edges
    EXPECT_NEAR(gamma.energyAt(1.0, 1.0), energy(1.0, 1.0), 1e-14);
    EXPECT_NEAR(gamma.energyAt(0.0, 0.5), energy(0.0, 0.5), 1e-14);

    EXPECT_THROW(gamma.energy(1.5 * a1), OutOfDomainError);
    EXPECT_THROW(gamma.gradient(-0.1 * a2), OutOfDomainError);
    EXPECT_NO_THROW(gamma.energy(gamma.position(0.5, 0.5)));
}

// ============================================================================
// Gradient
// ============================================================================

TEST_F(GammaSurfaceTest, GradientMatchesFiniteDifference) {
    for (GammaInterpolation mode : {GammaInterpolation::BILINEAR, GammaInterpolation::BICUBIC}) {
        GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 24, 20, energy, mode);

        // Inside a cell so the bilinear form is differentiable
        Vector3 d = gamma.position(0.3712, 0.5841) + 0.4 * gamma.planeNormal();
        Vector3 grad;
        double E = gamma.energyAndGradient(d, grad);
        EXPECT_DOUBLE_EQ(E, gamma.energy(d));

        double h = 1e-6;
        for (int c = 0; c < 3; ++c) {
            Vector3 dh = Vector3::Zero();
            dh(c) = h;
            double fd = (gamma.energy(d + dh) - gamma.energy(d - dh)) / (2.0 * h);
            EXPECT_NEAR(grad(c), fd, 1e-7) << "component " << c << " mode " << toString(mode);
        }
    }
}

TEST_F(GammaSurfaceTest, GradientHasNoNormalComponent) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 16, 16, energy);

    for (int k = 0; k < 10; ++k) {
        Vector3 d = gamma.position(0.09 * k + 0.01, 0.5 - 0.07 * k) + 0.3 * k * gamma.planeNormal();
        EXPECT_NEAR(gamma.gradient(d).dot(gamma.planeNormal()), 0.0, 1e-12);
    }
}

TEST_F(GammaSurfaceTest, BicubicGradientContinuousAcrossCells) {
    GammaSurface gamma = GammaSurface::fromFunction(a1, a2, 16, 16, energy);

    // Node line f1 = 4/16
    double f1 = 0.25;
    Vector3 left = gamma.gradient(gamma.position(f1 - 1e-10, 0.33));
    Vector3 right = gamma.gradient(gamma.position(f1 + 1e-10, 0.33));
    EXPECT_LT((left - right).norm(), 1e-8);
}
