#include "DisregistryProfile.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace DislocCore {

DisregistryProfile::DisregistryProfile(std::vector<double> x, std::vector<Vector3> disregistry)
    : x_(std::move(x)), disregistry_(std::move(disregistry)) {
    if (x_.size() != disregistry_.size()) {
        throw std::invalid_argument("Coordinates and disregistry must have the same length");
    }
    if (x_.size() < 3) {
        throw std::invalid_argument("Disregistry profile needs at least 3 points");
    }

    spacing_ = (x_.back() - x_.front()) / static_cast<double>(x_.size() - 1);
    if (!(spacing_ > 0.0)) {
        throw std::invalid_argument("Profile coordinates must be increasing");
    }
    for (size_t i = 1; i < x_.size(); ++i) {
        double dx = x_[i] - x_[i - 1];
        if (std::abs(dx - spacing_) > 1e-6 * spacing_) {
            std::ostringstream msg;
            msg << "Profile coordinates must be uniformly spaced (step " << i
                << " is " << dx << ", expected " << spacing_ << ")";
            throw std::invalid_argument(msg.str());
        }
    }
}

double DisregistryProfile::maxDifference(const DisregistryProfile& other) const {
    if (other.size() != size()) {
        throw std::invalid_argument("Profiles have different sizes");
    }
    double diff = 0.0;
    for (int i = 0; i < size(); ++i) {
        diff = std::max(diff, (disregistry_[i] - other.disregistry_[i]).cwiseAbs().maxCoeff());
    }
    return diff;
}

DisregistryProfile pnArctanDisregistry(double xmax, int npoints, const Vector3& burgers,
                                       double halfwidth, double shift) {
    if (npoints < 3 || !(xmax > 0.0)) {
        throw std::invalid_argument("pnArctanDisregistry needs xmax > 0 and at least 3 points");
    }
    if (!(halfwidth > 0.0)) {
        throw std::invalid_argument("pnArctanDisregistry needs a positive halfwidth");
    }

    std::vector<double> x(npoints);
    std::vector<Vector3> delta(npoints);
    double dx = 2.0 * xmax / (npoints - 1);
    for (int i = 0; i < npoints; ++i) {
        x[i] = -xmax + i * dx;
        double s = (std::atan((x[i] - shift) / halfwidth) + 0.5 * M_PI) / M_PI;
        delta[i] = s * burgers;
    }
    return DisregistryProfile(std::move(x), std::move(delta));
}

static double crossing(const DisregistryProfile& profile, double bc, int component,
                       double level) {
    const auto& x = profile.x();
    for (int i = 1; i < profile.size(); ++i) {
        double s0 = profile[i - 1](component) / bc;
        double s1 = profile[i](component) / bc;
        if ((s0 - level) * (s1 - level) <= 0.0 && s0 != s1) {
            return x[i - 1] + (level - s0) / (s1 - s0) * (x[i] - x[i - 1]);
        }
    }
    std::ostringstream msg;
    msg << "Disregistry never crosses " << level << " of the Burgers component";
    throw std::invalid_argument(msg.str());
}

double coreWidth(const DisregistryProfile& profile, const Vector3& burgers, int component,
                 double low, double high) {
    double bc = burgers(component);
    if (bc == 0.0) {
        throw std::invalid_argument("Burgers component is zero; core width undefined");
    }
    return std::abs(crossing(profile, bc, component, high) -
                    crossing(profile, bc, component, low));
}

double coreCenter(const DisregistryProfile& profile, const Vector3& burgers, int component) {
    double bc = burgers(component);
    if (bc == 0.0) {
        throw std::invalid_argument("Burgers component is zero; core center undefined");
    }
    return crossing(profile, bc, component, 0.5);
}

} // namespace DislocCore
