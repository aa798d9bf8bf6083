// src_cpp/src/WettingDrying_cpp.cpp
#include "WettingDrying_cpp.h" // 包含对应的头文件
#include "Profiler.h"
#include <algorithm> // 包含算法如 std::max
#include <omp.h>

namespace KineticCore { // 定义KineticCore命名空间

DryCellHandler_cpp::DryCellHandler_cpp(double min_depth_param) // 构造函数实现
    : min_depth(min_depth_param) {
}

std::vector<double> DryCellHandler_cpp::compute_velocities(const StateVector& U_state_all) const {
    std::vector<double> velocity(U_state_all.size());
    for (size_t i = 0; i < U_state_all.size(); ++i) {
        velocity[i] = U_state_all[i][1] / std::max(U_state_all[i][0], min_depth); // 干单元安全除法
    }
    return velocity;
}

std::vector<double> DryCellHandler_cpp::compute_floored_depths(const StateVector& U_state_all) const {
    std::vector<double> h_pos(U_state_all.size());
    for (size_t i = 0; i < U_state_all.size(); ++i) {
        h_pos[i] = std::max(U_state_all[i][0], min_depth);
    }
    return h_pos;
}

StateVector DryCellHandler_cpp::enforce_dry_cell_invariants(const StateVector& U_state_all) const {
    PROFILE_FUNCTION();
    StateVector U_out(U_state_all.size());

#pragma omp parallel for schedule(static)
    for (long long i = 0; i < static_cast<long long>(U_state_all.size()); ++i) {
        const double h_new = std::max(U_state_all[i][0], 0.0); // 水深非负
        U_out[i][0] = h_new;
        U_out[i][1] = (h_new < min_depth) ? 0.0 : U_state_all[i][1]; // 干单元动量清零
    }
    return U_out;
}

int DryCellHandler_cpp::count_dry_cells(const StateVector& U_state_all) const {
    int count = 0;
    for (const auto& U_cell : U_state_all) {
        if (U_cell[0] < min_depth) ++count;
    }
    return count;
}

} // namespace KineticCore
