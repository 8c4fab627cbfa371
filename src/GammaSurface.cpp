#include "GammaSurface.hpp"
#include "DislocErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace DislocCore {

// =============================================================================
// Cubic Hermite basis
// =============================================================================

namespace {

struct HermiteBasis {
    double value[2];        // h00, h01
    double slope[2];        // h10, h11
    double dvalue[2];
    double dslope[2];

    explicit HermiteBasis(double t) {
        double t2 = t * t;
        double t3 = t2 * t;
        value[0] = 2.0 * t3 - 3.0 * t2 + 1.0;
        value[1] = -2.0 * t3 + 3.0 * t2;
        slope[0] = t3 - 2.0 * t2 + t;
        slope[1] = t3 - t2;
        dvalue[0] = 6.0 * t2 - 6.0 * t;
        dvalue[1] = -6.0 * t2 + 6.0 * t;
        dslope[0] = 3.0 * t2 - 4.0 * t + 1.0;
        dslope[1] = 3.0 * t2 - 2.0 * t;
    }
};

} // namespace

// =============================================================================
// GammaSurface Implementation
// =============================================================================

GammaSurface::GammaSurface(const Vector3& a1vect, const Vector3& a2vect, int n1, int n2,
                           std::vector<double> energies, GammaInterpolation mode,
                           bool periodic)
    : a1_(a1vect),
      a2_(a2vect),
      n1_(n1),
      n2_(n2),
      energies_(std::move(energies)),
      mode_(mode),
      periodic_(periodic) {

    if (n1_ < 2 || n2_ < 2) {
        throw std::invalid_argument("Gamma surface needs at least 2 samples along each vector");
    }
    if (energies_.size() != static_cast<size_t>(n1_) * static_cast<size_t>(n2_)) {
        std::ostringstream msg;
        msg << "Gamma surface expects " << n1_ * n2_ << " energies, got " << energies_.size();
        throw std::invalid_argument(msg.str());
    }
    for (double e : energies_) {
        if (!std::isfinite(e)) {
            throw std::invalid_argument("Gamma surface energies must be finite");
        }
    }

    normal_ = a1_.cross(a2_);
    if (normal_.norm() <= 1e-12 * a1_.norm() * a2_.norm()) {
        throw std::invalid_argument("Gamma surface lattice vectors must not be parallel");
    }
    normal_.normalize();

    Eigen::Matrix2d G;
    G << a1_.dot(a1_), a1_.dot(a2_),
         a2_.dot(a1_), a2_.dot(a2_);
    Eigen::Matrix2d Ginv = G.inverse();
    dual1_ = Ginv(0, 0) * a1_ + Ginv(0, 1) * a2_;
    dual2_ = Ginv(1, 0) * a1_ + Ginv(1, 1) * a2_;

    h1_ = periodic_ ? 1.0 / n1_ : 1.0 / (n1_ - 1);
    h2_ = periodic_ ? 1.0 / n2_ : 1.0 / (n2_ - 1);

    computeDerivatives();
}

GammaSurface GammaSurface::fromFunction(const Vector3& a1vect, const Vector3& a2vect,
                                        int n1, int n2, const EnergyFunction& energy,
                                        GammaInterpolation mode, bool periodic) {
    if (n1 < 2 || n2 < 2) {
        throw std::invalid_argument("Gamma surface needs at least 2 samples along each vector");
    }
    double h1 = periodic ? 1.0 / n1 : 1.0 / (n1 - 1);
    double h2 = periodic ? 1.0 / n2 : 1.0 / (n2 - 1);

    std::vector<double> values(static_cast<size_t>(n1) * n2);
    for (int i = 0; i < n1; ++i) {
        for (int j = 0; j < n2; ++j) {
            values[static_cast<size_t>(i) * n2 + j] = energy(i * h1, j * h2);
        }
    }
    return GammaSurface(a1vect, a2vect, n1, n2, std::move(values), mode, periodic);
}

int GammaSurface::wrapIndex(int i, int n) const {
    i %= n;
    return i < 0 ? i + n : i;
}

double GammaSurface::node(int i1, int i2) const {
    return energies_[static_cast<size_t>(i1) * n2_ + i2];
}

void GammaSurface::computeDerivatives() {
    size_t count = energies_.size();
    dE1_.assign(count, 0.0);
    dE2_.assign(count, 0.0);
    dE12_.assign(count, 0.0);

    // Central differences, one-sided at the edges of a non-periodic table
    auto diff = [this](const std::vector<double>& f, int i1, int i2, int axis) {
        int n = axis == 0 ? n1_ : n2_;
        double h = axis == 0 ? h1_ : h2_;
        int i = axis == 0 ? i1 : i2;
        auto at = [&](int k) {
            return axis == 0 ? f[static_cast<size_t>(k) * n2_ + i2]
                             : f[static_cast<size_t>(i1) * n2_ + k];
        };
        if (periodic_) {
            return (at(wrapIndex(i + 1, n)) - at(wrapIndex(i - 1, n))) / (2.0 * h);
        }
        if (i == 0) return (at(1) - at(0)) / h;
        if (i == n - 1) return (at(n - 1) - at(n - 2)) / h;
        return (at(i + 1) - at(i - 1)) / (2.0 * h);
    };

    for (int i1 = 0; i1 < n1_; ++i1) {
        for (int i2 = 0; i2 < n2_; ++i2) {
            size_t idx = static_cast<size_t>(i1) * n2_ + i2;
            dE1_[idx] = diff(energies_, i1, i2, 0);
            dE2_[idx] = diff(energies_, i1, i2, 1);
        }
    }
    for (int i1 = 0; i1 < n1_; ++i1) {
        for (int i2 = 0; i2 < n2_; ++i2) {
            dE12_[static_cast<size_t>(i1) * n2_ + i2] = diff(dE2_, i1, i2, 0);
        }
    }
}

std::array<double, 2> GammaSurface::fractionalCoordinates(const Vector3& disregistry) const {
    return {dual1_.dot(disregistry), dual2_.dot(disregistry)};
}

Vector3 GammaSurface::position(double a1, double a2) const {
    return a1 * a1_ + a2 * a2_;
}

GammaSurface::Lookup GammaSurface::locate(double f1, double f2) const {
    Lookup cell;
    if (periodic_) {
        f1 -= std::floor(f1);
        f2 -= std::floor(f2);
        double t1 = f1 / h1_;
        double t2 = f2 / h2_;
        cell.i1 = static_cast<int>(std::floor(t1));
        cell.i2 = static_cast<int>(std::floor(t2));
        cell.u = t1 - cell.i1;
        cell.v = t2 - cell.i2;
        cell.i1 = wrapIndex(cell.i1, n1_);
        cell.i2 = wrapIndex(cell.i2, n2_);
        return cell;
    }

    const double eps = 1e-12;
    if (f1 < -eps || f1 > 1.0 + eps || f2 < -eps || f2 > 1.0 + eps) {
        std::ostringstream msg;
        msg << "Disregistry (" << f1 << ", " << f2
            << ") in lattice coordinates is outside the sampled gamma surface";
        throw OutOfDomainError(msg.str());
    }
    f1 = std::min(std::max(f1, 0.0), 1.0);
    f2 = std::min(std::max(f2, 0.0), 1.0);
    double t1 = f1 / h1_;
    double t2 = f2 / h2_;
    cell.i1 = std::min(static_cast<int>(std::floor(t1)), n1_ - 2);
    cell.i2 = std::min(static_cast<int>(std::floor(t2)), n2_ - 2);
    cell.u = t1 - cell.i1;
    cell.v = t2 - cell.i2;
    return cell;
}

double GammaSurface::interpolate(double f1, double f2, double& d1, double& d2) const {
    Lookup cell = locate(f1, f2);
    int i[2] = {cell.i1, periodic_ ? wrapIndex(cell.i1 + 1, n1_) : cell.i1 + 1};
    int j[2] = {cell.i2, periodic_ ? wrapIndex(cell.i2 + 1, n2_) : cell.i2 + 1};

    if (mode_ == GammaInterpolation::BILINEAR) {
        double E00 = node(i[0], j[0]);
        double E10 = node(i[1], j[0]);
        double E01 = node(i[0], j[1]);
        double E11 = node(i[1], j[1]);
        double u = cell.u, v = cell.v;
        d1 = ((1.0 - v) * (E10 - E00) + v * (E11 - E01)) / h1_;
        d2 = ((1.0 - u) * (E01 - E00) + u * (E11 - E10)) / h2_;
        return (1.0 - u) * (1.0 - v) * E00 + u * (1.0 - v) * E10 +
               (1.0 - u) * v * E01 + u * v * E11;
    }

    HermiteBasis bu(cell.u);
    HermiteBasis bv(cell.v);

    double value = 0.0;
    double du = 0.0;
    double dv = 0.0;
    for (int a = 0; a < 2; ++a) {
        for (int b = 0; b < 2; ++b) {
            size_t idx = static_cast<size_t>(i[a]) * n2_ + j[b];
            double F = energies_[idx];
            double F1 = dE1_[idx] * h1_;
            double F2 = dE2_[idx] * h2_;
            double F12 = dE12_[idx] * h1_ * h2_;

            value += bu.value[a] * bv.value[b] * F + bu.slope[a] * bv.value[b] * F1 +
                     bu.value[a] * bv.slope[b] * F2 + bu.slope[a] * bv.slope[b] * F12;
            du += bu.dvalue[a] * bv.value[b] * F + bu.dslope[a] * bv.value[b] * F1 +
                  bu.dvalue[a] * bv.slope[b] * F2 + bu.dslope[a] * bv.slope[b] * F12;
            dv += bu.value[a] * bv.dvalue[b] * F + bu.slope[a] * bv.dvalue[b] * F1 +
                  bu.value[a] * bv.dslope[b] * F2 + bu.slope[a] * bv.dslope[b] * F12;
        }
    }
    d1 = du / h1_;
    d2 = dv / h2_;
    return value;
}

double GammaSurface::energyAt(double a1, double a2) const {
    double d1, d2;
    return interpolate(a1, a2, d1, d2);
}

double GammaSurface::energy(const Vector3& disregistry) const {
    auto f = fractionalCoordinates(disregistry);
    return energyAt(f[0], f[1]);
}

Vector3 GammaSurface::gradient(const Vector3& disregistry) const {
    Vector3 grad;
    energyAndGradient(disregistry, grad);
    return grad;
}

double GammaSurface::energyAndGradient(const Vector3& disregistry, Vector3& gradient) const {
    auto f = fractionalCoordinates(disregistry);
    double d1, d2;
    double E = interpolate(f[0], f[1], d1, d2);
    gradient = d1 * dual1_ + d2 * dual2_;
    return E;
}

double GammaSurface::maxEnergy() const {
    return *std::max_element(energies_.begin(), energies_.end());
}

double GammaSurface::minEnergy() const {
    return *std::min_element(energies_.begin(), energies_.end());
}

double GammaSurface::curvatureBound() const {
    double w1 = dual1_.norm();
    double w2 = dual2_.norm();
    double bound = 0.0;

    for (int i1 = 0; i1 < n1_; ++i1) {
        for (int i2 = 0; i2 < n2_; ++i2) {
            bool interior1 = periodic_ || (i1 > 0 && i1 < n1_ - 1);
            bool interior2 = periodic_ || (i2 > 0 && i2 < n2_ - 1);
            double E0 = node(i1, i2);

            double E11 = 0.0;
            if (interior1) {
                E11 = (node(wrapIndex(i1 + 1, n1_), i2) - 2.0 * E0 +
                       node(wrapIndex(i1 - 1, n1_), i2)) / (h1_ * h1_);
            }
            double E22 = 0.0;
            if (interior2) {
                E22 = (node(i1, wrapIndex(i2 + 1, n2_)) - 2.0 * E0 +
                       node(i1, wrapIndex(i2 - 1, n2_))) / (h2_ * h2_);
            }
            double E12 = dE12_[static_cast<size_t>(i1) * n2_ + i2];

            double c = std::abs(E11) * w1 * w1 + 2.0 * std::abs(E12) * w1 * w2 +
                       std::abs(E22) * w2 * w2;
            bound = std::max(bound, c);
        }
    }
    return bound;
}

} // namespace DislocCore
