#include "IsotropicVolterraDislocation.hpp"
#include "DislocErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace DislocCore {

IsotropicVolterraDislocation::IsotropicVolterraDislocation(double mu, double nu,
                                                           const DislocationGeometry& geometry,
                                                           BranchCut cut, double tol)
    : mu_(mu),
      nu_(nu),
      geometry_(geometry),
      cut_(cut),
      tol_(tol),
      b_frame_(geometry.burgersInFrame()) {
    if (!(mu > 0.0) || !(nu > -1.0 && nu < 0.5)) {
        std::ostringstream msg;
        msg << "Invalid isotropic moduli mu = " << mu << ", nu = " << nu;
        throw IllConditionedElasticityError(msg.str());
    }
}

void IsotropicVolterraDislocation::checkPosition(double x, double y) const {
    if (std::hypot(x, y) <= tol_ * std::max(1.0, b_frame_.norm())) {
        std::ostringstream msg;
        msg << "Field evaluated on the dislocation line (x = " << x << ", y = " << y << ")";
        throw SingularFieldError(msg.str());
    }
}

Matrix3 IsotropicVolterraDislocation::K_tensor() const {
    Matrix3 K = Matrix3::Zero();
    K(0, 0) = mu_ / (1.0 - nu_);
    K(1, 1) = mu_ / (1.0 - nu_);
    K(2, 2) = mu_;
    return K;
}

Vector3 IsotropicVolterraDislocation::displacement(const Vector3& position) const {
    double x = position.dot(geometry_.m());
    double y = position.dot(geometry_.n());
    checkPosition(x, y);

    double theta = cut_.continuousAngle(x, y);
    double r2 = x * x + y * y;

    Vector3 u = Vector3::Zero();

    // Screw part
    u(2) = b_frame_(2) * theta / (2.0 * M_PI);

    // Edge part, evaluated with the edge Burgers component along x'
    double be = std::hypot(b_frame_(0), b_frame_(1));
    if (be > 0.0) {
        double phi = std::atan2(b_frame_(1), b_frame_(0));
        double c = std::cos(phi);
        double s = std::sin(phi);
        double xp = x * c + y * s;
        double yp = -x * s + y * c;
        double thetap = theta - phi;

        double ux = be / (2.0 * M_PI) *
                    (thetap + xp * yp / (2.0 * (1.0 - nu_) * r2));
        double uy = -be / (2.0 * M_PI) *
                    ((1.0 - 2.0 * nu_) / (4.0 * (1.0 - nu_)) * std::log(r2) +
                     (xp * xp - yp * yp) / (4.0 * (1.0 - nu_) * r2));

        u(0) = c * ux - s * uy;
        u(1) = s * ux + c * uy;
    }

    return geometry_.fromFrame(u);
}

Matrix3 IsotropicVolterraDislocation::stress(const Vector3& position) const {
    double x = position.dot(geometry_.m());
    double y = position.dot(geometry_.n());
    checkPosition(x, y);

    double r2 = x * x + y * y;
    Matrix3 sigma = Matrix3::Zero();

    // Screw part
    double bs = b_frame_(2);
    sigma(0, 2) = -mu_ * bs * y / (2.0 * M_PI * r2);
    sigma(1, 2) = mu_ * bs * x / (2.0 * M_PI * r2);
    sigma(2, 0) = sigma(0, 2);
    sigma(2, 1) = sigma(1, 2);

    // Edge part
    double be = std::hypot(b_frame_(0), b_frame_(1));
    if (be > 0.0) {
        double phi = std::atan2(b_frame_(1), b_frame_(0));
        double c = std::cos(phi);
        double s = std::sin(phi);
        double xp = x * c + y * s;
        double yp = -x * s + y * c;
        double r4 = r2 * r2;
        double D = mu_ * be / (2.0 * M_PI * (1.0 - nu_));

        Eigen::Matrix2d sp;
        sp(0, 0) = -D * yp * (3.0 * xp * xp + yp * yp) / r4;
        sp(1, 1) = D * yp * (xp * xp - yp * yp) / r4;
        sp(0, 1) = D * xp * (xp * xp - yp * yp) / r4;
        sp(1, 0) = sp(0, 1);

        Eigen::Matrix2d rot;
        rot << c, -s,
               s,  c;
        Eigen::Matrix2d se = rot * sp * rot.transpose();

        sigma(0, 0) += se(0, 0);
        sigma(1, 1) += se(1, 1);
        sigma(0, 1) += se(0, 1);
        sigma(1, 0) += se(1, 0);
        sigma(2, 2) += nu_ * (sp(0, 0) + sp(1, 1));
    }

    return geometry_.fromFrame(sigma);
}

} // namespace DislocCore
