#ifndef DISLOCATION_GEOMETRY_HPP
#define DISLOCATION_GEOMETRY_HPP

#include "DislocTypes.hpp"
#include <cmath>

namespace DislocCore {

/**
 * @brief Ray in the m-n plane across which the displacement jumps by b
 *
 * The angle is measured from m towards n. The default ray runs along -n.
 */
struct BranchCut {
    double angle;

    BranchCut() : angle(-0.5 * M_PI) {}
    explicit BranchCut(double a) : angle(a) {}

    // Polar angle of (x, y) taken in (angle, angle + 2π], continuous off the cut
    double continuousAngle(double x, double y) const;

    // Direction of the ray in (m, n) coordinates
    double dm() const { return std::cos(angle); }
    double dn() const { return std::sin(angle); }
};

/**
 * @brief Orientation of a straight dislocation
 *
 * All vectors are given in one Cartesian frame (typically the crystal or
 * simulation frame). The dislocation frame is spanned by
 *   m  - in the slip plane, perpendicular to the line (x axis)
 *   n  - slip-plane normal (y axis)
 *   xi - line direction, m × n (z axis)
 * so that a point has in-plane coordinates x = r·m, y = r·n.
 */
class DislocationGeometry {
public:
    /**
     * @param burgers Burgers vector (Cartesian)
     * @param m In-plane direction perpendicular to the line
     * @param n Slip-plane normal
     * @param tol Tolerance on the orthogonality of m and n
     * @throws std::invalid_argument for zero or non-orthogonal axes, or a zero Burgers vector
     */
    DislocationGeometry(const Vector3& burgers, const Vector3& m, const Vector3& n,
                        double tol = 1e-8);

    const Vector3& burgers() const { return burgers_; }
    const Vector3& m() const { return m_; }
    const Vector3& n() const { return n_; }
    const Vector3& xi() const { return xi_; }

    // Rows are m, n, xi: v_frame = frame() * v_cartesian
    const Matrix3& frame() const { return frame_; }

    Vector3 toFrame(const Vector3& v) const { return frame_ * v; }
    Vector3 fromFrame(const Vector3& v) const { return frame_.transpose() * v; }
    Matrix3 toFrame(const Matrix3& t) const { return frame_ * t * frame_.transpose(); }
    Matrix3 fromFrame(const Matrix3& t) const { return frame_.transpose() * t * frame_; }

    // Burgers vector components along (m, n, xi)
    Vector3 burgersInFrame() const { return toFrame(burgers_); }

    // Screw and edge parts of the Burgers vector
    double screwComponent() const { return burgers_.dot(xi_); }
    Vector3 edgeComponent() const { return burgers_ - screwComponent() * xi_; }

    // Angle in the m-n plane of a Cartesian direction, measured from m towards n
    double planeAngle(const Vector3& direction) const;

private:
    Vector3 burgers_;
    Vector3 m_;
    Vector3 n_;
    Vector3 xi_;
    Matrix3 frame_;
};

} // namespace DislocCore

#endif // DISLOCATION_GEOMETRY_HPP
