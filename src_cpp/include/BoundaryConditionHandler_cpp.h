// src_cpp/include/BoundaryConditionHandler_cpp.h
#ifndef BOUNDARYCONDITIONHANDLER_CPP_H // 防止头文件重复包含
#define BOUNDARYCONDITIONHANDLER_CPP_H // 定义头文件宏

#include <vector> // 包含vector容器
#include <string> // 包含string类

#include "FluxCalculator_cpp.h" // PrimitiveVars_cpp

namespace KineticCore { // 定义KineticCore命名空间

// 定义边界类型枚举
enum class BoundaryType_cpp { // 定义边界类型枚举
    WALL,         // 反射墙体边界 (镜像水深, 速度取反)
    FREE_OUTFLOW  // 自由出流边界 (复制相邻单元)
}; // 结束枚举定义

std::string boundary_type_to_string(BoundaryType_cpp type); // 用于日志输出

// 用两个虚拟单元扩展状态数组, 使所有 N+1 个界面使用同一套通量计算
class BoundaryConditionHandler_cpp { // 定义边界条件处理器类
public: // 公有成员
    BoundaryConditionHandler_cpp( // 构造函数
        BoundaryType_cpp left_type = BoundaryType_cpp::WALL,  // 左边界类型
        BoundaryType_cpp right_type = BoundaryType_cpp::WALL  // 右边界类型
    ); // 结束构造函数声明

    void set_boundary_types(BoundaryType_cpp left_type, BoundaryType_cpp right_type); // 设置边界类型

    // 返回长度 N+2 的原始变量数组: [ghost_L, cell_0, ..., cell_{N-1}, ghost_R]
    // 界面 i 的左状态为 padded[i], 右状态为 padded[i+1]
    std::vector<PrimitiveVars_cpp> build_padded_states(
        const std::vector<double>& depth,   // 单元水深
        const std::vector<double>& velocity // 单元流速
    ) const;

    BoundaryType_cpp get_left_type() const { return left_type_internal; }
    BoundaryType_cpp get_right_type() const { return right_type_internal; }

private: // 私有成员
    PrimitiveVars_cpp make_ghost_state(const PrimitiveVars_cpp& adjacent, BoundaryType_cpp type) const; // 构造虚拟单元状态

    BoundaryType_cpp left_type_internal;  // 左边界类型
    BoundaryType_cpp right_type_internal; // 右边界类型
}; // 结束类定义

} // namespace KineticCore
#endif //BOUNDARYCONDITIONHANDLER_CPP_H // 结束头文件宏
