#include "ElasticKernel.hpp"
#include "DislocErrors.hpp"
#include "VolterraDislocation.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace DislocCore {

namespace {

// Five-point Gauss-Legendre rule on [-1, 1]
const double GL_NODES[5] = {
    -0.9061798459386640, -0.5384693101056831, 0.0,
     0.5384693101056831,  0.9061798459386640
};
const double GL_WEIGHTS[5] = {
    0.2369268850561891, 0.4786286704993665, 0.5688888888888889,
    0.4786286704993665, 0.2369268850561891
};

// Second antiderivative of ln|u|
double logAntiderivative(double u) {
    if (u == 0.0) return 0.0;
    return 0.5 * u * u * std::log(std::abs(u)) - 0.75 * u * u;
}

double logSinc(double z) {
    if (std::abs(z) < 1e-8) return -z * z / 6.0;
    return std::log(std::sin(z) / z);
}

} // namespace

// =============================================================================
// ElasticKernel Implementation
// =============================================================================

ElasticKernel::ElasticKernel(const Matrix3& K, double spacing, int npoints, BoundaryCondition bc)
    : K_(K), h_(spacing), npoints_(npoints), bc_(bc) {

    if (!(h_ > 0.0)) {
        throw std::invalid_argument("Elastic kernel spacing must be positive");
    }
    if (npoints_ < 3) {
        throw std::invalid_argument("Elastic kernel needs at least 3 grid points");
    }
    if ((K_ - K_.transpose()).cwiseAbs().maxCoeff() > 1e-8 * K_.cwiseAbs().maxCoeff()) {
        throw IllConditionedElasticityError("Energy coefficient tensor K is not symmetric");
    }
    K_ = 0.5 * (K_ + K_.transpose());
    Eigen::LLT<Matrix3> llt(K_);
    if (llt.info() != Eigen::Success) {
        throw IllConditionedElasticityError("Energy coefficient tensor K is not positive definite");
    }

    int ncells = (bc_ == BoundaryCondition::PERIODIC) ? npoints_ : npoints_ - 1;
    coeff_.resize(ncells);
    for (int k = 0; k < ncells; ++k) {
        if (bc_ == BoundaryCondition::PERIODIC) {
            // Minimum image of the separation within one period
            int kk = (k > ncells / 2) ? k - ncells : k;
            coeff_[k] = freeCoefficient(std::abs(kk)) + periodicCorrection(kk);
        } else {
            coeff_[k] = freeCoefficient(k);
        }
    }
}

ElasticKernel ElasticKernel::fromDislocation(const VolterraDislocation& dislocation,
                                             double spacing, int npoints,
                                             BoundaryCondition bc) {
    return ElasticKernel(dislocation.K_tensor(), spacing, npoints, bc);
}

double ElasticKernel::freeCoefficient(int k) const {
    double u = k * h_;
    return logAntiderivative(u + h_) - 2.0 * logAntiderivative(u) + logAntiderivative(u - h_);
}

double ElasticKernel::periodicCorrection(int k) const {
    // ln|2 sin(πu/L)| = ln|u| + ln(2π/L) + ln sinc(πu/L) for |u| < L
    double L = period();
    double value = h_ * h_ * std::log(2.0 * M_PI / L);

    // ∫_{-h}^{h} (h - |s|) ln sinc(π(kh + s)/L) ds, split at s = 0
    double integral = 0.0;
    for (int q = 0; q < 5; ++q) {
        double t = 0.5 * h_ * (GL_NODES[q] + 1.0);    // t in [0, h]
        double w = 0.5 * h_ * GL_WEIGHTS[q] * (h_ - t);
        integral += w * logSinc(M_PI * (k * h_ + t) / L);
        integral += w * logSinc(M_PI * (k * h_ - t) / L);
    }
    return value + integral;
}

double ElasticKernel::coefficient(int separation) const {
    int ncells = numCells();
    if (bc_ == BoundaryCondition::PERIODIC) {
        int k = separation % ncells;
        if (k < 0) k += ncells;
        return coeff_[k];
    }
    int k = std::abs(separation);
    if (k >= ncells) {
        std::ostringstream msg;
        msg << "Cell separation " << separation << " exceeds the kernel size " << ncells;
        throw std::out_of_range(msg.str());
    }
    return coeff_[k];
}

std::vector<Vector3> ElasticKernel::density(const std::vector<Vector3>& disregistry,
                                            const Vector3& burgers) const {
    if (static_cast<int>(disregistry.size()) != npoints_) {
        std::ostringstream msg;
        msg << "Disregistry has " << disregistry.size() << " points, kernel expects " << npoints_;
        throw std::invalid_argument(msg.str());
    }

    int ncells = numCells();
    std::vector<Vector3> rho(ncells);
    for (int i = 0; i < npoints_ - 1; ++i) {
        rho[i] = (disregistry[i + 1] - disregistry[i]) / h_;
    }
    if (bc_ == BoundaryCondition::PERIODIC) {
        rho[ncells - 1] = (disregistry[0] + burgers - disregistry[npoints_ - 1]) / h_;
    }
    return rho;
}

double ElasticKernel::energy(const std::vector<Vector3>& density) const {
    std::vector<Vector3> gradient;
    return energyAndGradient(density, gradient);
}

double ElasticKernel::energyAndGradient(const std::vector<Vector3>& density,
                                        std::vector<Vector3>& gradient) const {
    int ncells = numCells();
    if (static_cast<int>(density.size()) != ncells) {
        throw std::invalid_argument("Density size does not match the kernel");
    }

    // Toeplitz (circulant when periodic) convolution, the dominant O(N²) step
    gradient.assign(ncells, Vector3::Zero());
    const double scale = -1.0 / (2.0 * M_PI);
    for (int i = 0; i < ncells; ++i) {
        Vector3 sum = Vector3::Zero();
        for (int j = 0; j < ncells; ++j) {
            int k = (bc_ == BoundaryCondition::PERIODIC)
                        ? ((i - j) % ncells + ncells) % ncells
                        : std::abs(i - j);
            sum += coeff_[k] * density[j];
        }
        gradient[i] = scale * (K_ * sum);
    }

    double E = 0.0;
    for (int i = 0; i < ncells; ++i) {
        E += 0.5 * density[i].dot(gradient[i]);
    }
    return E;
}

std::vector<Vector3> ElasticKernel::disregistryGradient(
    const std::vector<Vector3>& density_gradient) const {

    int ncells = numCells();
    std::vector<Vector3> grad(npoints_, Vector3::Zero());
    for (int i = 0; i < ncells; ++i) {
        int right = (i + 1) % npoints_;
        grad[right] += density_gradient[i] / h_;
        grad[i] -= density_gradient[i] / h_;
    }
    return grad;
}

Eigen::MatrixXd ElasticKernel::scalarHessian() const {
    int ncells = numCells();
    bool periodic = (bc_ == BoundaryCondition::PERIODIC);

    // Interaction between cells a and b, zero for cells outside a fixed grid
    auto cellCoeff = [&](int a, int b) {
        if (periodic) {
            a = (a + ncells) % ncells;
            b = (b + ncells) % ncells;
            return coeff_[((a - b) % ncells + ncells) % ncells];
        }
        if (a < 0 || b < 0 || a >= ncells || b >= ncells) return 0.0;
        return coeff_[std::abs(a - b)];
    };

    // Point k is the right end of cell k-1 and the left end of cell k
    Eigen::MatrixXd H(npoints_, npoints_);
    const double scale = -1.0 / (2.0 * M_PI * h_ * h_);
    for (int k = 0; k < npoints_; ++k) {
        for (int l = 0; l < npoints_; ++l) {
            H(k, l) = scale * (cellCoeff(k - 1, l - 1) - cellCoeff(k - 1, l) -
                               cellCoeff(k, l - 1) + cellCoeff(k, l));
        }
    }
    return H;
}

} // namespace DislocCore
