// src_cpp/include/KineticGrid_cpp.h
#ifndef KINETICGRID_CPP_H
#define KINETICGRID_CPP_H

#include <cstddef>
#include <vector>

namespace KineticCore {

// 动理学速度网格 xi: [-xi_max, xi_max] 上的对称均匀网格, 仅作为积分求积的辅助变量
struct KineticVelocityGrid_cpp {
    std::vector<double> xi; // 动理学速度节点
    double dxi = 0.0;       // 节点间距
    double xi_max = 0.0;    // 网格半宽

    std::size_t size() const { return xi.size(); }
    bool empty() const { return xi.empty(); }

    // 按给定半宽和点数构建网格 (xi[k] 与 xi[n-1-k] 严格互为相反数)
    static KineticVelocityGrid_cpp build(double xi_max_param, int num_points);

    // 按初始最大水深构建: xi_max = factor * sqrt(2 g h_max)
    static KineticVelocityGrid_cpp build_from_depth(double max_depth, double xi_max_factor,
                                                    int num_points, double gravity);
};

} // namespace KineticCore
#endif // KINETICGRID_CPP_H
