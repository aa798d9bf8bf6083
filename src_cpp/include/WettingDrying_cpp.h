// src_cpp/include/WettingDrying_cpp.h
#ifndef WETTINGDRYING_CPP_H // 防止头文件重复包含
#define WETTINGDRYING_CPP_H // 定义头文件宏

#include <vector> // 包含vector容器

#include "TimeIntegrator_cpp.h" // StateVector

namespace KineticCore { // 定义KineticCore命名空间

class DryCellHandler_cpp { // 定义干单元处理器类
public: // 公有成员
    explicit DryCellHandler_cpp(double min_depth_param = 1e-8); // 构造函数

    // 由守恒量求流速 u = hu / max(h, h_eps)
    std::vector<double> compute_velocities(const StateVector& U_state_all) const;

    // 除法用的安全水深 max(h, h_eps)
    std::vector<double> compute_floored_depths(const StateVector& U_state_all) const;

    // 步后修正: h 截断到非负, h < h_eps 的单元动量严格置零
    StateVector enforce_dry_cell_invariants(const StateVector& U_state_all) const;

    // 统计当前干单元数量 (h < h_eps)
    int count_dry_cells(const StateVector& U_state_all) const;

    double get_min_depth() const { return min_depth; }

private: // 私有成员
    double min_depth; // 最小水深阈值
}; // 结束类定义

} // namespace KineticCore
#endif //WETTINGDRYING_CPP_H // 结束头文件宏
