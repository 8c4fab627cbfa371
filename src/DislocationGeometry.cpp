#include "DislocationGeometry.hpp"
#include <cmath>
#include <stdexcept>

namespace DislocCore {

double BranchCut::continuousAngle(double x, double y) const {
    double theta = std::atan2(y, x) - angle;
    theta = std::fmod(theta, 2.0 * M_PI);
    if (theta <= 0.0) theta += 2.0 * M_PI;
    return angle + theta;
}

DislocationGeometry::DislocationGeometry(const Vector3& burgers, const Vector3& m,
                                         const Vector3& n, double tol)
    : burgers_(burgers) {
    if (m.norm() == 0.0 || n.norm() == 0.0) {
        throw std::invalid_argument("Dislocation axes m and n must be nonzero");
    }
    m_ = m.normalized();
    n_ = n.normalized();
    if (std::abs(m_.dot(n_)) > tol) {
        throw std::invalid_argument("Dislocation axes m and n must be orthogonal");
    }
    if (burgers_.norm() == 0.0) {
        throw std::invalid_argument("Burgers vector must be nonzero");
    }
    xi_ = m_.cross(n_);

    frame_.row(0) = m_.transpose();
    frame_.row(1) = n_.transpose();
    frame_.row(2) = xi_.transpose();
}

double DislocationGeometry::planeAngle(const Vector3& direction) const {
    double dm = direction.dot(m_);
    double dn = direction.dot(n_);
    if (std::hypot(dm, dn) < 1e-12 * direction.norm() || direction.norm() == 0.0) {
        throw std::invalid_argument("Direction has no component in the m-n plane");
    }
    return std::atan2(dn, dm);
}

} // namespace DislocCore
