// src_cpp/src/KineticMaxwellian_cpp.cpp
#include "KineticMaxwellian_cpp.h"
#include <algorithm>

namespace KineticCore {

namespace {
    const double kPi = 3.14159265358979323846;
}

double kinetic_weight(double omega, double gravity) {
    const double inside = std::max(2.0 * gravity - omega * omega, 0.0); // 支集外取0
    return (1.0 / (kPi * gravity)) * std::sqrt(inside);
}

std::vector<double> kinetic_weight(const std::vector<double>& omega, double gravity) {
    std::vector<double> weights(omega.size());
    for (size_t k = 0; k < omega.size(); ++k) {
        weights[k] = kinetic_weight(omega[k], gravity);
    }
    return weights;
}

MaxwellianMapper_cpp::MaxwellianMapper_cpp(double gravity, double min_depth_param)
    : g(gravity), min_depth(min_depth_param) {
}

std::vector<double> MaxwellianMapper_cpp::evaluate(double h, double u, const KineticVelocityGrid_cpp& grid) const {
    std::vector<double> M(grid.size(), 0.0); // 干单元直接返回零向量
    if (h <= min_depth) {
        return M;
    }
    const double sqrt_h = std::sqrt(h);
    for (size_t k = 0; k < grid.size(); ++k) {
        M[k] = sqrt_h * kinetic_weight((grid.xi[k] - u) / sqrt_h, g);
    }
    return M;
}

} // namespace KineticCore
