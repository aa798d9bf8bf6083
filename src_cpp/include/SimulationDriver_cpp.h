// src_cpp/include/SimulationDriver_cpp.h
#ifndef SIMULATIONDRIVER_CPP_H
#define SIMULATIONDRIVER_CPP_H

#include <vector>
#include <iosfwd>

#include "SimulationConfig_cpp.h"
#include "KineticModelCore_cpp.h" // StateVector, ProgressCallback

namespace KineticCore {

// 溃坝 + 降雨算例的最终结果
struct SimulationResult_cpp {
    std::vector<double> x;      // 单元中心
    std::vector<double> z_bed;  // 底高程
    std::vector<double> h;      // 水深, 下限为 h_eps
    std::vector<double> u;      // 流速 hu / h
    double final_time = 0.0;
    long long step_count = 0;
};

// 溃坝初始场: x < L/2 取 h_left, 否则取 h_right, 流速为零
StateVector make_dam_break_initial_state(const Mesh1D_cpp& mesh, double h_left, double h_right);

// 默认进度输出: "t = ..., step = ..."
ProgressCallback make_console_progress_reporter(std::ostream& out);

// 平底, 均匀降雨 rain_rate, 零入渗, 反射边界 (默认) 下运行到 total_time.
// progress_callback 为空且 verbose 时使用控制台输出
SimulationResult_cpp run_kinetic_simulation(const SimulationConfig_cpp& config,
                                            ProgressCallback progress_callback = nullptr);

// 由模型当前状态组装结果
SimulationResult_cpp collect_result(const KineticModelCore_cpp& model);

} // namespace KineticCore
#endif // SIMULATIONDRIVER_CPP_H
