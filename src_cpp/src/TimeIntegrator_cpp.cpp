// src_cpp/src/TimeIntegrator_cpp.cpp
#include "TimeIntegrator_cpp.h" // 包含对应的头文件
#include <stdexcept> // 包含标准异常
#include <utility>

namespace KineticCore { // 定义KineticCore命名空间

TimeIntegrator_cpp::TimeIntegrator_cpp(TimeScheme_cpp scheme, // 构造函数实现
                                       RHSFunction rhs_func,
                                       PostStepFunction post_step_func)
    : scheme_internal(scheme), calculate_rhs_explicit_part(std::move(rhs_func)), // 初始化列表
      apply_post_step_correction(std::move(post_step_func)) {
    if (!calculate_rhs_explicit_part || !apply_post_step_correction) { // 检查函数是否有效
        throw std::invalid_argument("RHSFunction and PostStepFunction must be valid callables."); // 抛出无效参数异常
    }
} // 结束构造函数

StateVector TimeIntegrator_cpp::step(const StateVector& U_current, // 执行一步时间积分的方法实现
                                     double dt,
                                     double time_current) const {
    if (U_current.empty()) { // 如果当前状态为空
        return {}; // 返回空状态
    }
    const size_t num_cells = U_current.size(); // 获取单元数量
    StateVector U_next; // 下一步状态

    switch (scheme_internal) { // 根据方案选择执行逻辑
        case TimeScheme_cpp::FORWARD_EULER: { // 前向欧拉法
            // 1. 计算显式 RHS
            StateVector RHS_expl = calculate_rhs_explicit_part(U_current, time_current); // 计算显式RHS
            if (RHS_expl.size() != num_cells) { // 检查RHS大小是否一致
                throw std::runtime_error("RHS size mismatch in Forward Euler."); // 抛出运行时错误
            }

            // 2. 显式更新
            StateVector U_intermediate(num_cells); // 初始化中间状态
            for (size_t i = 0; i < num_cells; ++i) { // 遍历所有单元
                for (size_t j = 0; j < 2; ++j) { // 遍历每个变量
                    U_intermediate[i][j] = U_current[i][j] + dt * RHS_expl[i][j]; // 计算中间状态
                }
            }

            // 3. 步后修正 (非负水深与干单元动量清零)
            U_next = apply_post_step_correction(U_intermediate); // 应用修正
            if (U_next.size() != num_cells) { // 检查修正后状态大小是否一致
                throw std::runtime_error("Post-step correction output size mismatch in Forward Euler."); // 抛出运行时错误
            }
            break; // 结束当前case
        }
    }
    return U_next; // 返回下一步状态
} // 结束方法体

} // namespace KineticCore
