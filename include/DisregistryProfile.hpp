#ifndef DISREGISTRY_PROFILE_HPP
#define DISREGISTRY_PROFILE_HPP

#include "DislocTypes.hpp"
#include <vector>

namespace DislocCore {

/**
 * @brief Disregistry sampled on a uniform grid along the slip plane
 *
 * Coordinates x_i run along m; disregistry vectors are expressed in the
 * dislocation frame (m, n, xi).
 */
class DisregistryProfile {
public:
    DisregistryProfile() = default;

    /**
     * @throws std::invalid_argument if sizes differ, fewer than 3 points are
     *         given, or the spacing is not uniform and increasing
     */
    DisregistryProfile(std::vector<double> x, std::vector<Vector3> disregistry);

    int size() const { return static_cast<int>(x_.size()); }
    double spacing() const { return spacing_; }
    double length() const { return spacing_ * (size() - 1); }

    const std::vector<double>& x() const { return x_; }
    const std::vector<Vector3>& disregistry() const { return disregistry_; }
    std::vector<Vector3>& disregistry() { return disregistry_; }

    const Vector3& operator[](int i) const { return disregistry_[i]; }
    Vector3& operator[](int i) { return disregistry_[i]; }

    // Largest per-point change between two profiles on the same grid
    double maxDifference(const DisregistryProfile& other) const;

private:
    std::vector<double> x_;
    std::vector<Vector3> disregistry_;
    double spacing_ = 0.0;
};

/**
 * @brief Classic Peierls-Nabarro arctan disregistry
 *
 *   delta(x) = b/π [arctan((x - shift) / halfwidth) + π/2]
 *
 * sampled at @p npoints evenly spaced points in [-xmax, xmax]. Goes from 0 at
 * -∞ to b at +∞; used as the starting guess for SDVPN.
 */
DisregistryProfile pnArctanDisregistry(double xmax, int npoints, const Vector3& burgers,
                                       double halfwidth, double shift = 0.0);

/**
 * @brief Distance between the points where delta_c/b_c crosses @p low and @p high
 *
 * Crossings are located by linear interpolation, scanning from the left.
 * @throws std::invalid_argument if b_c is zero or a crossing does not exist
 */
double coreWidth(const DisregistryProfile& profile, const Vector3& burgers, int component,
                 double low = 0.1, double high = 0.9);

/**
 * @brief Position where delta_c/b_c crosses one half
 */
double coreCenter(const DisregistryProfile& profile, const Vector3& burgers, int component);

} // namespace DislocCore

#endif // DISREGISTRY_PROFILE_HPP
