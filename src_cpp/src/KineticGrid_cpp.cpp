// src_cpp/src/KineticGrid_cpp.cpp
#include "KineticGrid_cpp.h"
#include <stdexcept>
#include <string>
#include <cmath>

namespace KineticCore {

KineticVelocityGrid_cpp KineticVelocityGrid_cpp::build(double xi_max_param, int num_points) {
    if (num_points < 2) { // 至少两个点才能定义间距
        throw std::invalid_argument("KineticVelocityGrid_cpp: need at least 2 kinetic velocity points, got "
                                    + std::to_string(num_points) + ".");
    }
    if (!(xi_max_param > 0.0) || !std::isfinite(xi_max_param)) {
        throw std::invalid_argument("KineticVelocityGrid_cpp: xi_max must be a positive finite value.");
    }

    KineticVelocityGrid_cpp grid;
    grid.xi_max = xi_max_param;
    grid.dxi = 2.0 * xi_max_param / static_cast<double>(num_points - 1); // 与linspace相同的间距
    grid.xi.resize(num_points);

    // 先填左半部分, 再镜像得到右半部分, 保证逐位对称
    const int half = num_points / 2;
    for (int k = 0; k < half; ++k) {
        grid.xi[k] = -xi_max_param + static_cast<double>(k) * grid.dxi;
        grid.xi[num_points - 1 - k] = -grid.xi[k];
    }
    if (num_points % 2 == 1) {
        grid.xi[half] = 0.0; // 奇数点时中心节点为0
    }
    return grid;
}

KineticVelocityGrid_cpp KineticVelocityGrid_cpp::build_from_depth(double max_depth, double xi_max_factor,
                                                                  int num_points, double gravity) {
    if (!(max_depth > 0.0)) { // 全干的初始场无法确定速度尺度
        throw std::invalid_argument("KineticVelocityGrid_cpp: initial maximum depth must be positive to size the kinetic grid.");
    }
    if (!(xi_max_factor > 0.0)) {
        throw std::invalid_argument("KineticVelocityGrid_cpp: xi_max_factor must be positive.");
    }
    if (!(gravity > 0.0)) {
        throw std::invalid_argument("KineticVelocityGrid_cpp: gravity must be positive.");
    }
    const double c0 = std::sqrt(2.0 * gravity * max_depth); // 初始特征速度
    return build(xi_max_factor * c0, num_points);
}

} // namespace KineticCore
