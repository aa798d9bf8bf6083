// src_cpp/include/KineticMaxwellian_cpp.h
#ifndef KINETICMAXWELLIAN_CPP_H // 防止头文件重复包含
#define KINETICMAXWELLIAN_CPP_H

#include <vector>
#include <cmath>

#include "KineticGrid_cpp.h"

namespace KineticCore {

    // 动理学权函数 chi(omega) = 1/(pi g) * sqrt(max(0, 2g - omega^2))
    // 非负, 对称, 紧支集 |omega| <= sqrt(2g); 零阶矩为1, 二阶矩为g/2
    double kinetic_weight(double omega, double gravity);

    // 逐元素版本
    std::vector<double> kinetic_weight(const std::vector<double>& omega, double gravity);

    // 将单元宏观状态 (h, u) 映射为动理学速度网格上的Maxwellian分布
    // M(xi) = sqrt(h) * chi((xi - u) / sqrt(h))
    class MaxwellianMapper_cpp {
    public:
        MaxwellianMapper_cpp(double gravity, double min_depth_param);

        // 在整个xi网格上求值; h <= min_depth 时返回全零向量
        std::vector<double> evaluate(double h, double u, const KineticVelocityGrid_cpp& grid) const;

        // 单点求值 (通量求积的内层循环使用, 避免分配临时数组)
        double evaluate_at(double h, double u, double xi) const {
            if (h <= min_depth) return 0.0; // 干单元
            const double sqrt_h = std::sqrt(h);
            return sqrt_h * kinetic_weight((xi - u) / sqrt_h, g);
        }

        double get_gravity() const { return g; }
        double get_min_depth() const { return min_depth; }

    private:
        double g;         // 重力加速度
        double min_depth; // 干湿判断阈值 h_eps
    };

} // namespace KineticCore
#endif // KINETICMAXWELLIAN_CPP_H
