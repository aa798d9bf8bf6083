// src_cpp/include/KineticModelCore_cpp.h
#ifndef KINETICMODELCORE_CPP_H
#define KINETICMODELCORE_CPP_H

#include <vector> // 包含vector容器
#include <array>  // 包含array容器
#include <string> // 包含string类
#include <memory> // 包含智能指针
#include <functional> // 包含std::function

#include "MeshData_cpp.h" // 网格数据结构
#include "KineticGrid_cpp.h" // 动理学速度网格
#include "FluxCalculator_cpp.h" // 通量计算器
#include "WaveSpeed_cpp.h" // 波速估计
#include "SourceTerms_cpp.h"    // 源项计算器
#include "WettingDrying_cpp.h"  // 干单元处理器
#include "TimeIntegrator_cpp.h" // 时间积分器
#include "BoundaryConditionHandler_cpp.h" // 边界条件处理器
#include "SimulationConfig_cpp.h" // 模拟参数

namespace KineticCore { // KineticCore命名空间开始

// 进度回调收到的快照
struct ProgressInfo_cpp {
    long long step = 0;       // 已完成步数
    double time = 0.0;        // 当前时间
    double dt = 0.0;          // 本步时间步长
    double total_mass = 0.0;  // sum(h) * dx
    double max_depth = 0.0;   // 最大水深
};

using ProgressCallback = std::function<void(const ProgressInfo_cpp&)>; // 进度观察者

class KineticModelCore_cpp { // 动理学模型核心类
public: // 公有成员
    KineticModelCore_cpp(); // 构造函数
    ~KineticModelCore_cpp(); // 析构函数

    void set_num_threads(int num_threads); // 设置OpenMP线程数

    // 校验参数, 构建网格并创建计算组件. 底高程为零, 补给场为零
    void initialize(const SimulationConfig_cpp& config);

    void set_initial_conditions(const StateVector& U_initial); // 设置初始守恒量 [h, hu]
    void set_bed_elevation(const std::vector<double>& z_bed_values); // 设置底高程
    void set_recharge_fields( // 设置补给场; 入渗为空时视为零
        const std::vector<double>& rainfall_rate,
        const std::vector<double>& infiltration_rate = {}
    );
    void set_rainfall_timeseries(const std::vector<TimeseriesPoint_cpp>& series); // 降雨过程线, 覆盖均匀降雨场
    void clear_rainfall_timeseries() { rainfall_timeseries_internal.clear(); }

    // 按当前最大水深构建动理学速度网格 (整个模拟期间只构建一次)
    void build_kinetic_grid(double xi_max_factor, int num_xi);
    void set_kinetic_grid(const KineticVelocityGrid_cpp& grid); // 直接指定网格

    void set_progress_callback(ProgressCallback callback) { progress_callback_internal = std::move(callback); }

    bool advance_one_step(); // 执行一个完整的时间步, 返回是否继续
    void run_simulation_to_end(); // 执行整个模拟循环

    // 显式右端项 dU/dt (时间积分器回调, 也供测试使用)
    StateVector calculate_rhs_explicit_part(const StateVector& U_current, double time_current) const;

    double calculate_dt() const; // CFL时间步长 (未按终止时间截断)

    double get_current_time() const { return current_time_internal; } // 获取当前时间
    long long get_step_count() const { return step_count_internal; } // 获取步数
    double get_total_time() const { return config_internal.total_time; } // 获取总模拟时长
    double get_last_dt() const { return last_calculated_dt_internal; } // 获取上一个计算的dt
    bool is_simulation_finished() const { return current_time_internal >= config_internal.total_time - epsilon; } // 判断模拟是否结束
    bool is_initialized() const { return model_fully_initialized_flag; }
    bool coverage_warning_issued() const { return coverage_warning_issued_flag; }

    const SimulationConfig_cpp& get_config() const { return config_internal; }
    const Mesh1D_cpp& get_mesh() const { return mesh_internal; }
    const KineticVelocityGrid_cpp& get_kinetic_grid() const { return kinetic_grid_internal; }
    const std::vector<double>& get_rainfall_field() const { return rainfall_internal; }
    const std::vector<double>& get_infiltration_field() const { return infiltration_internal; }

    StateVector get_U_state_all_copy() const { return U_state_all_internal; } // 获取内部守恒量副本
    std::vector<double> get_depths() const; // 水深 h
    std::vector<double> get_velocities() const; // u = hu / max(h, h_eps)
    double get_total_mass() const; // sum(h) * dx
    double get_max_depth() const;

private: // 私有成员
    void require_ready(const char* caller) const; // 生命周期检查
    std::vector<double> current_rainfall(double time_current) const; // 本步降雨场
    void log_info(const std::string& message) const;

    SimulationConfig_cpp config_internal; // 模拟参数
    Mesh1D_cpp mesh_internal; // 一维网格
    KineticVelocityGrid_cpp kinetic_grid_internal; // 动理学速度网格

    std::unique_ptr<KineticFluxCalculator_cpp> flux_calculator_ptr; // 通量计算器指针
    std::unique_ptr<WaveSpeedEstimator_cpp> wave_speed_ptr; // 波速估计器指针
    std::unique_ptr<SourceTermCalculator_cpp> source_term_calculator_ptr; // 源项计算器指针
    std::unique_ptr<DryCellHandler_cpp> dry_cell_handler_ptr; // 干单元处理器指针
    std::unique_ptr<BoundaryConditionHandler_cpp> boundary_handler_ptr; // 边界条件处理器指针
    std::unique_ptr<TimeIntegrator_cpp> time_integrator_ptr; // 时间积分器指针

    StateVector U_state_all_internal; // 内部存储的守恒量
    std::vector<double> rainfall_internal; // 降雨场 R
    std::vector<double> infiltration_internal; // 入渗场 I (始终存在, 默认为零)
    std::vector<TimeseriesPoint_cpp> rainfall_timeseries_internal; // 可选降雨过程线

    ProgressCallback progress_callback_internal; // 进度回调

    double current_time_internal; // 当前模拟时间
    long long step_count_internal; // 当前步数
    double epsilon; // 终止时间容差
    double last_calculated_dt_internal; // 上一个计算的dt

    bool model_fully_initialized_flag; // 标记模型是否已完全初始化
    bool initial_conditions_set_flag; // 标记初始条件是否已设置
    bool coverage_warning_issued_flag; // 波速超出xi_max的警告只打印一次
}; // 结束类定义

} // namespace KineticCore
#endif //KINETICMODELCORE_CPP_H
