#ifndef GAMMA_SURFACE_HPP
#define GAMMA_SURFACE_HPP

#include "DislocTypes.hpp"
#include <array>
#include <functional>
#include <vector>

namespace DislocCore {

/**
 * @brief Generalized stacking fault (gamma) surface
 *
 * Misfit energy per unit area as a function of the in-plane disregistry.
 * The surface is tabulated on a regular grid of fractional coordinates
 * (a1, a2) along two in-plane lattice vectors a1vect and a2vect:
 *
 *   delta_plane = a1 * a1vect + a2 * a2vect
 *
 * Periodic surfaces sample [0, 1) with n1 x n2 nodes (node i at i/n1) and
 * wrap any input; non-periodic surfaces sample [0, 1] inclusive (node i at
 * i/(n1-1)) and reject input outside it.
 *
 * The component of the disregistry along the plane normal a1vect × a2vect
 * does not enter the energy and the gradient has no normal component.
 */
class GammaSurface {
public:
    using EnergyFunction = std::function<double(double, double)>;

    /**
     * @param a1vect First in-plane lattice vector
     * @param a2vect Second in-plane lattice vector
     * @param n1 Number of samples along a1
     * @param n2 Number of samples along a2
     * @param energies Samples, index i1 * n2 + i2
     * @param mode Interpolation scheme
     * @param periodic Wrap inputs modulo the lattice vectors
     * @throws std::invalid_argument on inconsistent sizes or parallel lattice vectors
     */
    GammaSurface(const Vector3& a1vect, const Vector3& a2vect, int n1, int n2,
                 std::vector<double> energies,
                 GammaInterpolation mode = GammaInterpolation::BICUBIC,
                 bool periodic = true);

    /**
     * @brief Tabulate an energy function of the fractional coordinates
     */
    static GammaSurface fromFunction(const Vector3& a1vect, const Vector3& a2vect,
                                     int n1, int n2, const EnergyFunction& energy,
                                     GammaInterpolation mode = GammaInterpolation::BICUBIC,
                                     bool periodic = true);

    /**
     * @brief Energy per area at a disregistry vector
     * @throws OutOfDomainError when not periodic and outside [0, 1]²
     */
    double energy(const Vector3& disregistry) const;

    /**
     * @brief Gradient of the energy with respect to the disregistry
     * @throws OutOfDomainError when not periodic and outside [0, 1]²
     */
    Vector3 gradient(const Vector3& disregistry) const;

    // Energy and gradient from one lookup
    double energyAndGradient(const Vector3& disregistry, Vector3& gradient) const;

    // Energy at fractional coordinates
    double energyAt(double a1, double a2) const;

    std::array<double, 2> fractionalCoordinates(const Vector3& disregistry) const;
    Vector3 position(double a1, double a2) const;

    double maxEnergy() const;
    double minEnergy() const;

    /**
     * @brief Upper bound of the energy curvature along any in-plane direction
     *
     * Estimated from second differences of the samples; used by the SDVPN
     * preconditioner.
     */
    double curvatureBound() const;

    const Vector3& a1vect() const { return a1_; }
    const Vector3& a2vect() const { return a2_; }
    const Vector3& planeNormal() const { return normal_; }
    int n1() const { return n1_; }
    int n2() const { return n2_; }
    bool isPeriodic() const { return periodic_; }
    GammaInterpolation interpolation() const { return mode_; }

private:
    struct Lookup {
        int i1, i2;       // lower-left node
        double u, v;      // local cell coordinates in [0, 1]
    };

    Lookup locate(double f1, double f2) const;
    int wrapIndex(int i, int n) const;
    double node(int i1, int i2) const;
    void computeDerivatives();

    // Value and derivatives with respect to the fractional coordinates
    double interpolate(double f1, double f2, double& d1, double& d2) const;

    Vector3 a1_;
    Vector3 a2_;
    Vector3 normal_;
    // Dual vectors: f_k = dual_k · delta
    Vector3 dual1_;
    Vector3 dual2_;

    int n1_;
    int n2_;
    double h1_;     // node spacing in fractional units
    double h2_;
    std::vector<double> energies_;
    std::vector<double> dE1_;
    std::vector<double> dE2_;
    std::vector<double> dE12_;
    GammaInterpolation mode_;
    bool periodic_;
};

} // namespace DislocCore

#endif // GAMMA_SURFACE_HPP
