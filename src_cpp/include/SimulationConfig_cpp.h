// src_cpp/include/SimulationConfig_cpp.h
#ifndef SIMULATIONCONFIG_CPP_H
#define SIMULATIONCONFIG_CPP_H

#include "BoundaryConditionHandler_cpp.h" // BoundaryType_cpp

namespace KineticCore {

// 模拟参数 (默认值对应溃坝算例)
struct SimulationConfig_cpp {
    int num_cells = 200;            // 单元数 N
    double domain_length = 10.0;    // 计算域长度 L
    double total_time = 1.0;        // 终止时间 T
    double cfl = 0.5;               // Courant数, (0, 1]
    double rain_rate = 0.0;         // 均匀降雨强度, 0 时退化为普通溃坝
    double xi_max_factor = 4.0;     // 动理学网格半宽系数 xi_max = factor * sqrt(2 g max(h0))
    int num_xi = 64;                // 动理学网格点数
    int output_interval = 10;       // 进度回调间隔 (步), <= 0 表示不回调

    double gravity = 9.81;          // 重力加速度
    double min_depth = 1e-8;        // 干湿阈值 h_eps

    double dam_break_h_left = 2.0;  // 溃坝左侧初始水深 (x < L/2)
    double dam_break_h_right = 1.0; // 溃坝右侧初始水深

    BoundaryType_cpp left_boundary = BoundaryType_cpp::WALL;
    BoundaryType_cpp right_boundary = BoundaryType_cpp::WALL;

    long long max_steps = 10000000; // 步数上限, 防止退化配置无限循环
    int num_threads = 0;            // OpenMP线程数, <= 0 使用默认值
    bool verbose = true;            // 是否打印初始化与结束信息

    // 在任何计算开始之前检查参数, 不合法时抛出 std::invalid_argument
    void validate() const;
};

} // namespace KineticCore
#endif // SIMULATIONCONFIG_CPP_H
