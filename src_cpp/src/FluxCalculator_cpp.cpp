// src_cpp/src/FluxCalculator_cpp.cpp
#include "FluxCalculator_cpp.h" // 包含对应的头文件
#include "Profiler.h"

namespace KineticCore { // 定义KineticCore命名空间

KineticFluxCalculator_cpp::KineticFluxCalculator_cpp(double gravity, double min_depth_param) // 构造函数实现
    : g(gravity), min_depth(min_depth_param), maxwellian(gravity, min_depth_param) { // 初始化列表
} // 结束构造函数

std::array<double, 2> KineticFluxCalculator_cpp::calculate_kinetic_flux(
    const PrimitiveVars_cpp& W_L,
    const PrimitiveVars_cpp& W_R,
    const KineticVelocityGrid_cpp& grid
) const {

    // PROFILE_FUNCTION(); // 每个界面调用一次, 开启计时会严重影响性能

    const bool dryL = (W_L.h <= min_depth); // 左侧干
    const bool dryR = (W_R.h <= min_depth); // 右侧干
    if (dryL && dryR) {
        return {0.0, 0.0}; // 两侧都干, 分布全为零
    }

    double sum_mass = 0.0; // 一阶矩累加
    double sum_mom = 0.0;  // 二阶矩累加

    const size_t n_xi = grid.size();
    for (size_t k = 0; k < n_xi; ++k) { // 遍历动理学速度
        const double xi = grid.xi[k];
        // 迎风选择: 正速度携带左侧信息, 负速度携带右侧信息
        const double M_up = (xi >= 0.0) ? maxwellian.evaluate_at(W_L.h, W_L.u, xi)
                                        : maxwellian.evaluate_at(W_R.h, W_R.u, xi);
        sum_mass += xi * M_up;
        sum_mom += xi * xi * M_up;
    }

    // 求积: 求和乘以网格间距
    return {sum_mass * grid.dxi, sum_mom * grid.dxi};
}

} // namespace KineticCore
