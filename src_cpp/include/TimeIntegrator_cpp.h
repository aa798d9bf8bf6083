// src_cpp/include/TimeIntegrator_cpp.h
#ifndef TIMEINTEGRATOR_CPP_H // 防止头文件重复包含
#define TIMEINTEGRATOR_CPP_H // 定义头文件宏

#include <vector> // 包含vector容器
#include <array>  // 包含array容器
#include <functional> // 包含std::function，用于存储可调用对象 (成员函数或lambda)

namespace KineticCore { // 定义KineticCore命名空间

// 定义时间积分方案枚举 (只提供一阶显式格式)
enum class TimeScheme_cpp { // 定义时间积分方案枚举
    FORWARD_EULER // 前向欧拉法
}; // 结束枚举定义

// 定义状态类型别名: 每个单元 [h, hu]
using StateVector = std::vector<std::array<double, 2>>; // 定义状态向量类型别名

class TimeIntegrator_cpp { // 定义时间积分器类
public: // 公有成员
    // RHS函数类型: (输入当前状态U, 当前时间t) -> 返回 dU/dt
    using RHSFunction = std::function<StateVector(const StateVector&, double)>; // 定义RHS函数类型

    // 步后修正函数类型: (输入显式更新后的状态) -> 返回修正后的状态 (干单元处理)
    using PostStepFunction = std::function<StateVector(const StateVector&)>; // 定义步后修正函数类型

    TimeIntegrator_cpp( // 构造函数
        TimeScheme_cpp scheme, // 时间积分方案
        RHSFunction rhs_func, // RHS计算函数
        PostStepFunction post_step_func // 步后修正函数
    ); // 结束构造函数声明

    // 执行一个时间积分步骤, 返回下一时刻的状态
    StateVector step( // 执行一步时间积分的方法
        const StateVector& U_current, // 当前状态
        double dt, // 时间步长
        double time_current // 当前时间
    ) const; // const成员函数

    TimeScheme_cpp get_scheme() const { return scheme_internal; }

private: // 私有成员
    TimeScheme_cpp scheme_internal; // 内部存储的时间积分方案
    RHSFunction calculate_rhs_explicit_part; // 存储的RHS计算函数
    PostStepFunction apply_post_step_correction; // 存储的步后修正函数
}; // 结束类定义

} // namespace KineticCore
#endif //TIMEINTEGRATOR_CPP_H // 结束头文件宏
