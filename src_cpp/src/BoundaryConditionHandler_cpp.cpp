// src_cpp/src/BoundaryConditionHandler_cpp.cpp
#include "BoundaryConditionHandler_cpp.h" // 包含对应的头文件
#include <stdexcept> // 包含标准异常

namespace KineticCore { // 定义KineticCore命名空间

std::string boundary_type_to_string(BoundaryType_cpp type) {
    switch (type) {
        case BoundaryType_cpp::WALL: return "WALL";
        case BoundaryType_cpp::FREE_OUTFLOW: return "FREE_OUTFLOW";
    }
    return "UNKNOWN";
}

BoundaryConditionHandler_cpp::BoundaryConditionHandler_cpp( // 构造函数实现
    BoundaryType_cpp left_type,
    BoundaryType_cpp right_type)
    : left_type_internal(left_type), right_type_internal(right_type) { // 初始化列表
} // 结束构造函数

void BoundaryConditionHandler_cpp::set_boundary_types(BoundaryType_cpp left_type, BoundaryType_cpp right_type) { // 设置边界类型
    left_type_internal = left_type;
    right_type_internal = right_type;
}

PrimitiveVars_cpp BoundaryConditionHandler_cpp::make_ghost_state(const PrimitiveVars_cpp& adjacent, BoundaryType_cpp type) const {
    switch (type) {
        case BoundaryType_cpp::WALL:
            return {adjacent.h, -adjacent.u}; // 镜像: 水深相同, 速度取反, 界面净通量为零
        case BoundaryType_cpp::FREE_OUTFLOW:
            return adjacent; // 零梯度外推
    }
    throw std::runtime_error("BoundaryConditionHandler_cpp: unknown boundary type."); // 未知类型
}

std::vector<PrimitiveVars_cpp> BoundaryConditionHandler_cpp::build_padded_states(
    const std::vector<double>& depth,
    const std::vector<double>& velocity
) const {
    const size_t num_cells = depth.size();
    if (num_cells == 0) {
        throw std::invalid_argument("BoundaryConditionHandler_cpp: cannot pad an empty state.");
    }
    if (velocity.size() != num_cells) {
        throw std::invalid_argument("BoundaryConditionHandler_cpp: depth and velocity sizes do not match.");
    }

    std::vector<PrimitiveVars_cpp> padded(num_cells + 2);
    for (size_t i = 0; i < num_cells; ++i) {
        padded[i + 1] = {depth[i], velocity[i]}; // 内部单元原样复制
    }
    padded[0] = make_ghost_state(padded[1], left_type_internal);                   // 左虚拟单元
    padded[num_cells + 1] = make_ghost_state(padded[num_cells], right_type_internal); // 右虚拟单元
    return padded;
}

} // namespace KineticCore
