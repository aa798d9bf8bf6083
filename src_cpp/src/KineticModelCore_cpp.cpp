// src_cpp/src/KineticModelCore_cpp.cpp
// --- 编译时检查 ---
#ifdef _OPENMP
#include <omp.h>
#else
    // CMakeLists.txt 链接了 OpenMP::OpenMP_CXX, 这里不应该被触发。
    // 如果触发了，说明编译器没有收到OpenMP标志，直接报错可以防止生成错误的单线程版本。
    #error "OpenMP is not enabled. Please check compiler flags (e.g., -fopenmp or /openmp)."
#endif

#include "KineticModelCore_cpp.h" // 包含对应的头文件
#include "Profiler.h"
#include <stdexcept> // 包含标准异常
#include <iostream>  // 包含输入输出流
#include <algorithm> // 包含算法
#include <cmath>     // 包含数学函数
#include <utility>

namespace KineticCore { // KineticCore命名空间开始

namespace {
constexpr double kWaveSpeedFloor = 1e-12; // dt = cfl dx / (s_max + kWaveSpeedFloor)
}

KineticModelCore_cpp::KineticModelCore_cpp() // 构造函数实现 (无参数)
    : current_time_internal(0.0), step_count_internal(0), epsilon(1e-12),
      last_calculated_dt_internal(0.0),
      model_fully_initialized_flag(false), // 初始化为未完成
      initial_conditions_set_flag(false),
      coverage_warning_issued_flag(false) {
    // 指针成员默认为 nullptr (由 unique_ptr 自动处理)
} // 结束构造函数

KineticModelCore_cpp::~KineticModelCore_cpp() = default; // std::unique_ptr 会自动管理内存

void KineticModelCore_cpp::set_num_threads(int num_threads) {
    if (num_threads > 0) {
        omp_set_num_threads(num_threads);
        // 使用 omp_get_max_threads() 来获取将要使用的线程数
        log_info("Number of OpenMP threads has been set to " + std::to_string(omp_get_max_threads()) + ".");
    }
    else {
        // 传入0或负数时恢复为处理器核心数
        int default_threads = omp_get_num_procs(); // 获取处理器核心数
        omp_set_num_threads(default_threads); // 设置为核心数
        log_info("num_threads <= 0. OpenMP threads set to default (available cores: "
                 + std::to_string(omp_get_max_threads()) + ").");
    }
}

void KineticModelCore_cpp::log_info(const std::string& message) const {
    if (config_internal.verbose) {
        std::cout << "C++ Info: " << message << std::endl;
    }
}

void KineticModelCore_cpp::initialize(const SimulationConfig_cpp& config) {
    PROFILE_FUNCTION(); // 记录整个初始化函数的耗时

    config.validate(); // 参数不合法时抛出 std::invalid_argument, 不修改任何内部状态
    config_internal = config;

    // 1. 构建网格 (平底)
    mesh_internal = Mesh1D_cpp();
    mesh_internal.build_uniform(config_internal.num_cells, config_internal.domain_length);

    // 2. 创建计算组件
    flux_calculator_ptr = std::make_unique<KineticFluxCalculator_cpp>(config_internal.gravity, config_internal.min_depth); // 创建通量计算器
    wave_speed_ptr = std::make_unique<WaveSpeedEstimator_cpp>(config_internal.gravity, config_internal.min_depth); // 创建波速估计器
    source_term_calculator_ptr = std::make_unique<SourceTermCalculator_cpp>(config_internal.gravity); // 创建源项计算器
    dry_cell_handler_ptr = std::make_unique<DryCellHandler_cpp>(config_internal.min_depth); // 创建干单元处理器
    boundary_handler_ptr = std::make_unique<BoundaryConditionHandler_cpp>(config_internal.left_boundary,
                                                                          config_internal.right_boundary); // 创建边界条件处理器
    time_integrator_ptr = std::make_unique<TimeIntegrator_cpp>( // 创建时间积分器
        TimeScheme_cpp::FORWARD_EULER, // 时间积分方案
        [this](const StateVector& U, double t) { return this->calculate_rhs_explicit_part(U, t); }, // RHS函数
        [this](const StateVector& U) { return this->dry_cell_handler_ptr->enforce_dry_cell_invariants(U); } // 步后修正
    ); // 结束创建

    // 3. 补给场: 均匀降雨, 入渗为零
    const size_t num_cells = static_cast<size_t>(config_internal.num_cells);
    rainfall_internal.assign(num_cells, config_internal.rain_rate);
    infiltration_internal.assign(num_cells, 0.0);
    rainfall_timeseries_internal.clear();

    // 4. 重置运行状态
    U_state_all_internal.clear();
    kinetic_grid_internal = KineticVelocityGrid_cpp();
    current_time_internal = 0.0;
    step_count_internal = 0;
    last_calculated_dt_internal = 0.0;
    initial_conditions_set_flag = false;
    coverage_warning_issued_flag = false;

    model_fully_initialized_flag = true; // 标记模型已完全初始化
    log_info("KineticModelCore_cpp initialized: N = " + std::to_string(config_internal.num_cells)
             + ", L = " + std::to_string(config_internal.domain_length)
             + ", T = " + std::to_string(config_internal.total_time)
             + ", cfl = " + std::to_string(config_internal.cfl)
             + ", boundaries = " + boundary_type_to_string(config_internal.left_boundary)
             + "/" + boundary_type_to_string(config_internal.right_boundary) + ".");
} // 结束函数

void KineticModelCore_cpp::set_initial_conditions(const StateVector& U_initial) { // 设置初始条件实现
    if (!model_fully_initialized_flag) { // 如果模型未完全初始化
        throw std::runtime_error("Model core not initialized before setting initial conditions."); // 抛出运行时错误
    }
    if (U_initial.size() != static_cast<size_t>(mesh_internal.num_cells)) { // 如果初始条件大小与单元数量不符
        throw std::invalid_argument("Initial conditions size mismatch with number of cells."); // 抛出无效参数异常
    }
    for (const auto& U_cell : U_initial) {
        if (!std::isfinite(U_cell[0]) || !std::isfinite(U_cell[1]) || U_cell[0] < 0.0) {
            throw std::invalid_argument("Initial conditions must be finite with non-negative depth.");
        }
    }
    U_state_all_internal = U_initial; // 设置内部守恒量 (h, hu)
    initial_conditions_set_flag = true; // 标记初始条件已设置
}

void KineticModelCore_cpp::set_bed_elevation(const std::vector<double>& z_bed_values) {
    if (!model_fully_initialized_flag) {
        throw std::runtime_error("Model core not initialized before setting bed elevation.");
    }
    mesh_internal.set_bed_elevation(z_bed_values); // 大小不符时抛出 std::invalid_argument
}

void KineticModelCore_cpp::set_recharge_fields(const std::vector<double>& rainfall_rate,
                                               const std::vector<double>& infiltration_rate) {
    if (!model_fully_initialized_flag) {
        throw std::runtime_error("Model core not initialized before setting recharge fields.");
    }
    const size_t num_cells = static_cast<size_t>(mesh_internal.num_cells);
    if (rainfall_rate.size() != num_cells) {
        throw std::invalid_argument("Rainfall field size mismatch with number of cells.");
    }
    if (!infiltration_rate.empty() && infiltration_rate.size() != num_cells) {
        throw std::invalid_argument("Infiltration field size mismatch with number of cells.");
    }
    rainfall_internal = rainfall_rate;
    if (infiltration_rate.empty()) {
        infiltration_internal.assign(num_cells, 0.0); // 未提供入渗时视为零
    } else {
        infiltration_internal = infiltration_rate;
    }
}

void KineticModelCore_cpp::set_rainfall_timeseries(const std::vector<TimeseriesPoint_cpp>& series) {
    if (!model_fully_initialized_flag) {
        throw std::runtime_error("Model core not initialized before setting rainfall timeseries.");
    }
    for (const auto& point : series) {
        if (!std::isfinite(point.time) || !std::isfinite(point.value)) {
            throw std::invalid_argument("Rainfall timeseries contains non-finite entries.");
        }
    }
    rainfall_timeseries_internal = series;
    std::sort(rainfall_timeseries_internal.begin(), rainfall_timeseries_internal.end(),
              [](const TimeseriesPoint_cpp& a, const TimeseriesPoint_cpp& b) {
                  return a.time < b.time; // 按时间排序, 插值依赖有序序列
              });
    log_info("Rainfall timeseries set with " + std::to_string(rainfall_timeseries_internal.size()) + " points.");
}

void KineticModelCore_cpp::build_kinetic_grid(double xi_max_factor, int num_xi) {
    if (!model_fully_initialized_flag || !initial_conditions_set_flag) {
        throw std::runtime_error("Kinetic grid is sized from the initial depth; set initial conditions first.");
    }
    kinetic_grid_internal = KineticVelocityGrid_cpp::build_from_depth(get_max_depth(), xi_max_factor,
                                                                      num_xi, config_internal.gravity);
    coverage_warning_issued_flag = false;
    log_info("Kinetic velocity grid built: " + std::to_string(kinetic_grid_internal.size())
             + " points, xi_max = " + std::to_string(kinetic_grid_internal.xi_max) + ".");
}

void KineticModelCore_cpp::set_kinetic_grid(const KineticVelocityGrid_cpp& grid) {
    if (grid.size() < 2 || !(grid.dxi > 0.0)) {
        throw std::invalid_argument("Kinetic grid must contain at least 2 points with positive spacing.");
    }
    kinetic_grid_internal = grid;
    coverage_warning_issued_flag = false;
}

void KineticModelCore_cpp::require_ready(const char* caller) const {
    if (!model_fully_initialized_flag || !initial_conditions_set_flag || kinetic_grid_internal.empty()) {
        std::string error_msg = std::string("Model not fully initialized/configured before calling ") + caller + ". Flags: ";
        error_msg += "model_fully_initialized=" + std::string(model_fully_initialized_flag ? "true" : "false");
        error_msg += ", initial_conditions_set=" + std::string(initial_conditions_set_flag ? "true" : "false");
        error_msg += ", kinetic_grid_built=" + std::string(kinetic_grid_internal.empty() ? "false" : "true");
        throw std::runtime_error(error_msg);
    }
}

std::vector<double> KineticModelCore_cpp::current_rainfall(double time_current) const {
    if (rainfall_timeseries_internal.empty()) {
        return rainfall_internal;
    }
    // 过程线给出全场均匀降雨强度
    const double rate = interpolate_timeseries(rainfall_timeseries_internal, time_current);
    return std::vector<double>(rainfall_internal.size(), rate);
}

StateVector KineticModelCore_cpp::calculate_rhs_explicit_part(const StateVector& U_current, double time_current) const {
    PROFILE_FUNCTION();
    require_ready("calculate_rhs_explicit_part");

    const int num_cells = mesh_internal.num_cells;
    if (U_current.size() != static_cast<size_t>(num_cells)) {
        throw std::invalid_argument("State size mismatch with number of cells in calculate_rhs_explicit_part.");
    }

    // 1. 原始变量
    std::vector<double> depth(num_cells);
    for (int i = 0; i < num_cells; ++i) {
        depth[i] = U_current[i][0];
    }
    const std::vector<double> velocity = dry_cell_handler_ptr->compute_velocities(U_current);

    // 2. 补给源项 S = R - I
    const std::vector<double> recharge =
        source_term_calculator_ptr->compute_recharge_source(current_rainfall(time_current), infiltration_internal);

    // 3. 虚拟单元扩展后的界面状态
    const std::vector<PrimitiveVars_cpp> padded = boundary_handler_ptr->build_padded_states(depth, velocity);

    // 4. 所有 N+1 个界面的动理学通量, 每个界面只写自己的位置
    const int num_interfaces = mesh_internal.get_num_interfaces();
    std::vector<std::array<double, 2>> interface_flux(num_interfaces);
    {
        PROFILE_SCOPE("InterfaceFluxLoop");
#pragma omp parallel for schedule(static)
        for (int i = 0; i < num_interfaces; ++i) {
            interface_flux[i] = flux_calculator_ptr->calculate_kinetic_flux(padded[i], padded[i + 1], kinetic_grid_internal);
        }
    }

    // 5. 源项 (补给 + 底坡)
    const std::vector<double> bed_slope =
        source_term_calculator_ptr->compute_bed_slope_gradient(mesh_internal.z_bed, mesh_internal.dx);
    const StateVector sources =
        source_term_calculator_ptr->calculate_source_terms_all_cells(U_current, velocity, recharge, bed_slope);

    // 6. 组装 dU/dt = -(F_{i+1} - F_i) / dx + source
    StateVector RHS(num_cells);
    const double inv_dx = 1.0 / mesh_internal.dx;
#pragma omp parallel for schedule(static)
    for (int i = 0; i < num_cells; ++i) {
        RHS[i][0] = -(interface_flux[i + 1][0] - interface_flux[i][0]) * inv_dx + sources[i][0];
        RHS[i][1] = -(interface_flux[i + 1][1] - interface_flux[i][1]) * inv_dx + sources[i][1];
    }
    return RHS;
}

double KineticModelCore_cpp::calculate_dt() const {
    require_ready("calculate_dt");
    const double s_max = wave_speed_ptr->max_wave_speed(get_depths(), get_velocities());
    return config_internal.cfl * mesh_internal.dx / (s_max + kWaveSpeedFloor);
}

bool KineticModelCore_cpp::advance_one_step() {
    PROFILE_FUNCTION(); // 计时整个 advance_one_step 函数

    require_ready("advance_one_step");
    if (is_simulation_finished()) {
        return false; // 已到达终止时间
    }
    if (step_count_internal >= config_internal.max_steps) {
        throw std::runtime_error("Step ceiling of " + std::to_string(config_internal.max_steps)
                                 + " steps exceeded at t = " + std::to_string(current_time_internal)
                                 + " before reaching total_time = " + std::to_string(config_internal.total_time) + ".");
    }

    double s_max = 0.0;
    double dt = 0.0;
    { // 为 dt 计算添加计时作用域
        PROFILE_SCOPE("CalculateDtInternal");
        s_max = wave_speed_ptr->max_wave_speed(get_depths(), get_velocities());
        dt = config_internal.cfl * mesh_internal.dx / (s_max + kWaveSpeedFloor);
    }
    if (!std::isfinite(dt)) {
        throw std::runtime_error("Non-finite time step at t = " + std::to_string(current_time_internal)
                                 + " (max wave speed = " + std::to_string(s_max) + ").");
    }

    // 不越过终止时间
    if (current_time_internal + dt > config_internal.total_time) {
        dt = config_internal.total_time - current_time_internal;
    }

    // 动理学网格只在开始时构建一次, 波速超出覆盖范围时只警告
    if (s_max > kinetic_grid_internal.xi_max && !coverage_warning_issued_flag) {
        std::cerr << "C++ Warning: max wave speed " << s_max << " exceeds kinetic grid half-width xi_max = "
                  << kinetic_grid_internal.xi_max << " at t = " << current_time_internal
                  << ". Fluxes may be under-resolved; consider a larger xi_max_factor." << std::endl;
        coverage_warning_issued_flag = true;
    }

    {
        PROFILE_SCOPE("TimeIntegrator_Step");
        U_state_all_internal = time_integrator_ptr->step(U_state_all_internal, dt, current_time_internal);
    }

    this->last_calculated_dt_internal = dt;
    current_time_internal += dt;
    step_count_internal++;

    if (progress_callback_internal && config_internal.output_interval > 0
        && step_count_internal % config_internal.output_interval == 0) {
        ProgressInfo_cpp info;
        info.step = step_count_internal;
        info.time = current_time_internal;
        info.dt = dt;
        info.total_mass = get_total_mass();
        info.max_depth = get_max_depth();
        progress_callback_internal(info);
    }

    bool simulation_should_continue = !is_simulation_finished();

    if (!simulation_should_continue) { // 如果模拟在本步之后结束了
        log_info("Simulation finished. Final time: " + std::to_string(current_time_internal)
                 + ", Total steps: " + std::to_string(step_count_internal));
#ifdef KINETICCORE_ENABLE_PROFILING
        if (!Profiler::results().empty()) { // 仅当有分析结果时才打印和重置
            Profiler::print_summary();
            Profiler::reset_summary(); // 重置以便下次运行或单元测试
        }
#endif
    }
    return simulation_should_continue; // 返回模拟是否应该继续
}

void KineticModelCore_cpp::run_simulation_to_end() {
    PROFILE_FUNCTION(); // 记录整个模拟循环的总时间
    require_ready("run_simulation_to_end");
    log_info("Simulation starting (via run_simulation_to_end)...");
    while (advance_one_step()) {
        // 进度通过回调报告
    }
}

std::vector<double> KineticModelCore_cpp::get_depths() const {
    std::vector<double> depth(U_state_all_internal.size());
    for (size_t i = 0; i < U_state_all_internal.size(); ++i) {
        depth[i] = U_state_all_internal[i][0];
    }
    return depth;
}

std::vector<double> KineticModelCore_cpp::get_velocities() const {
    if (!dry_cell_handler_ptr) {
        throw std::runtime_error("Model core not initialized before querying velocities.");
    }
    return dry_cell_handler_ptr->compute_velocities(U_state_all_internal);
}

double KineticModelCore_cpp::get_total_mass() const {
    double sum_h = 0.0;
    for (const auto& U_cell : U_state_all_internal) {
        sum_h += U_cell[0];
    }
    return sum_h * mesh_internal.dx;
}

double KineticModelCore_cpp::get_max_depth() const {
    double max_h = 0.0;
    for (const auto& U_cell : U_state_all_internal) {
        max_h = std::max(max_h, U_cell[0]);
    }
    return max_h;
}

} // namespace KineticCore
