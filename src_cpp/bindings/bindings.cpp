// bindings.cpp
#include <pybind11/pybind11.h> // 包含pybind11核心库
#include <pybind11/stl.h>       // 用于自动转换STL容器如 std::vector, std::array
#include <pybind11/functional.h> // 用于自动转换 std::function
#include <pybind11/numpy.h>     // 用于处理NumPy数组

#include <cstring> // std::memcpy

// 包含所有相关的C++头文件
#include "MeshData_cpp.h"
#include "KineticGrid_cpp.h"
#include "KineticMaxwellian_cpp.h"
#include "FluxCalculator_cpp.h"
#include "WaveSpeed_cpp.h"
#include "SourceTerms_cpp.h"
#include "WettingDrying_cpp.h"
#include "TimeIntegrator_cpp.h"
#include "BoundaryConditionHandler_cpp.h"
#include "SimulationConfig_cpp.h"
#include "KineticModelCore_cpp.h"
#include "SimulationDriver_cpp.h"

namespace py = pybind11; // 定义pybind11命名空间别名
using namespace KineticCore; // 使用核心命名空间

namespace {

// std::vector<double> -> 一维 C 风格 NumPy 数组 (拷贝)
py::array_t<double, py::array::c_style> to_numpy(const std::vector<double>& values) {
    py::array_t<double, py::array::c_style> result_np(static_cast<py::ssize_t>(values.size()));
    if (!values.empty()) {
        std::memcpy(result_np.mutable_data(), values.data(), values.size() * sizeof(double)); // 内存拷贝
    }
    return result_np;
}

// StateVector -> Nx2 NumPy 数组 [h, hu]
py::array_t<double, py::array::c_style> state_to_numpy(const StateVector& u_vec) {
    py::array_t<double, py::array::c_style> result_np({static_cast<py::ssize_t>(u_vec.size()), static_cast<py::ssize_t>(2)});
    if (!u_vec.empty()) {
        std::memcpy(result_np.mutable_data(), u_vec.data()->data(), u_vec.size() * 2 * sizeof(double));
    }
    return result_np;
}

// Nx2 NumPy 数组 -> StateVector
StateVector state_from_numpy(const py::array_t<double>& U_np) {
    if (U_np.ndim() != 2 || U_np.shape(1) != 2) { // 检查输入维度和形状
        throw std::invalid_argument("State NumPy array must be Nx2 ([h, hu] per cell).");
    }
    StateVector U_vec(U_np.shape(0));
    auto r = U_np.unchecked<2>(); // 获取NumPy数组访问器
    for (py::ssize_t i = 0; i < U_np.shape(0); i++) {
        U_vec[i] = {r(i, 0), r(i, 1)};
    }
    return U_vec;
}

} // namespace

PYBIND11_MODULE(kinetic_sw_cpp, m) { // 定义Python模块，名称为 kinetic_sw_cpp
    m.doc() = "Python bindings for the C++ kinetic shallow-water core with rainfall/infiltration recharge"; // 模块文档字符串

    // --- 枚举与数据结构 ---
    py::enum_<BoundaryType_cpp>(m, "BoundaryType_cpp") // 绑定边界类型枚举
        .value("WALL", BoundaryType_cpp::WALL) // 反射墙体
        .value("FREE_OUTFLOW", BoundaryType_cpp::FREE_OUTFLOW) // 自由出流
        .export_values(); // 导出枚举值到模块

    py::enum_<TimeScheme_cpp>(m, "TimeScheme_cpp") // 绑定时间积分方案枚举
        .value("FORWARD_EULER", TimeScheme_cpp::FORWARD_EULER) // 前向欧拉
        .export_values();

    py::class_<PrimitiveVars_cpp>(m, "PrimitiveVars_cpp") // 绑定 PrimitiveVars_cpp 结构体
        .def(py::init([](double h, double u) { return PrimitiveVars_cpp{h, u}; }), // 聚合类型用工厂函数构造
             py::arg("h") = 0.0, py::arg("u") = 0.0)
        .def_readwrite("h", &PrimitiveVars_cpp::h) // 绑定 h 属性
        .def_readwrite("u", &PrimitiveVars_cpp::u); // 绑定 u 属性

    py::class_<TimeseriesPoint_cpp>(m, "TimeseriesPoint_cpp") // 绑定时间序列点结构体
        .def(py::init<>()) // 默认构造函数
        .def(py::init([](double time, double value) { return TimeseriesPoint_cpp{time, value}; }),
             py::arg("time"), py::arg("value"))
        .def_readwrite("time", &TimeseriesPoint_cpp::time) // 绑定 time 属性
        .def_readwrite("value", &TimeseriesPoint_cpp::value); // 绑定 value 属性

    m.def("interpolate_timeseries", &interpolate_timeseries, py::arg("series"), py::arg("time_current"),
          "Linear interpolation of a sorted timeseries, clamped to the end values.");

    py::class_<Mesh1D_cpp>(m, "Mesh1D_cpp") // 绑定一维网格
        .def(py::init<>())
        .def("build_uniform", &Mesh1D_cpp::build_uniform, py::arg("num_cells"), py::arg("length"))
        .def("set_bed_elevation", &Mesh1D_cpp::set_bed_elevation, py::arg("z_bed_values"))
        .def_readonly("num_cells", &Mesh1D_cpp::num_cells)
        .def_readonly("length", &Mesh1D_cpp::length)
        .def_readonly("dx", &Mesh1D_cpp::dx)
        .def_property_readonly("cell_centers", [](const Mesh1D_cpp& self) { return to_numpy(self.cell_centers); })
        .def_property_readonly("z_bed", [](const Mesh1D_cpp& self) { return to_numpy(self.z_bed); });

    py::class_<KineticVelocityGrid_cpp>(m, "KineticVelocityGrid_cpp") // 绑定动理学速度网格
        .def(py::init<>())
        .def_static("build", &KineticVelocityGrid_cpp::build, py::arg("xi_max"), py::arg("num_points"))
        .def_static("build_from_depth", &KineticVelocityGrid_cpp::build_from_depth,
                    py::arg("max_depth"), py::arg("xi_max_factor"), py::arg("num_points"), py::arg("gravity") = 9.81)
        .def_property_readonly("xi", [](const KineticVelocityGrid_cpp& self) { return to_numpy(self.xi); })
        .def_readonly("dxi", &KineticVelocityGrid_cpp::dxi)
        .def_readonly("xi_max", &KineticVelocityGrid_cpp::xi_max)
        .def("__len__", &KineticVelocityGrid_cpp::size);

    // --- 绑定计算组件 (主要由Core内部使用，绑定它们有助于测试) ---
    m.def("kinetic_weight", py::overload_cast<double, double>(&kinetic_weight),
          py::arg("omega"), py::arg("gravity") = 9.81, "Kinetic weight chi(omega).");
    m.def("kinetic_weight", py::overload_cast<const std::vector<double>&, double>(&kinetic_weight),
          py::arg("omega"), py::arg("gravity") = 9.81, "Element-wise kinetic weight chi(omega).");

    py::class_<MaxwellianMapper_cpp>(m, "MaxwellianMapper_cpp")
        .def(py::init<double, double>(), py::arg("gravity") = 9.81, py::arg("min_depth") = 1e-8)
        .def("evaluate", [](const MaxwellianMapper_cpp& self, double h, double u, const KineticVelocityGrid_cpp& grid) {
                 return to_numpy(self.evaluate(h, u, grid));
             }, py::arg("h"), py::arg("u"), py::arg("grid"),
             "Maxwellian M(xi) on the kinetic grid; zeros for a dry cell.");

    py::class_<KineticFluxCalculator_cpp>(m, "KineticFluxCalculator_cpp") // 绑定通量计算器
        .def(py::init<double, double>(), py::arg("gravity") = 9.81, py::arg("min_depth") = 1e-8)
        .def("calculate_kinetic_flux", &KineticFluxCalculator_cpp::calculate_kinetic_flux,
             py::arg("W_L"), py::arg("W_R"), py::arg("grid"),
             "Kinetic upwind flux [mass, momentum] across one interface.");

    py::class_<WaveSpeedEstimator_cpp>(m, "WaveSpeedEstimator_cpp")
        .def(py::init<double, double>(), py::arg("gravity") = 9.81, py::arg("min_depth") = 1e-8)
        .def("max_wave_speed", &WaveSpeedEstimator_cpp::max_wave_speed, py::arg("h"), py::arg("u"));

    py::class_<SourceTermCalculator_cpp>(m, "SourceTermCalculator_cpp") // 绑定源项计算器
        .def(py::init<double>(), py::arg("gravity") = 9.81)
        .def("compute_recharge_source", &SourceTermCalculator_cpp::compute_recharge_source,
             py::arg("rainfall_rate"), py::arg("infiltration_rate"))
        .def("compute_bed_slope_gradient", &SourceTermCalculator_cpp::compute_bed_slope_gradient,
             py::arg("z_bed"), py::arg("dx"));

    py::class_<DryCellHandler_cpp>(m, "DryCellHandler_cpp") // 绑定干单元处理器
        .def(py::init<double>(), py::arg("min_depth") = 1e-8)
        .def("enforce_dry_cell_invariants", [](const DryCellHandler_cpp& self, py::array_t<double> U_np) {
                 return state_to_numpy(self.enforce_dry_cell_invariants(state_from_numpy(U_np)));
             }, py::arg("U_np"))
        .def("count_dry_cells", [](const DryCellHandler_cpp& self, py::array_t<double> U_np) {
                 return self.count_dry_cells(state_from_numpy(U_np));
             }, py::arg("U_np"));

    py::class_<BoundaryConditionHandler_cpp>(m, "BoundaryConditionHandler_cpp") // 绑定边界条件处理器
        .def(py::init<BoundaryType_cpp, BoundaryType_cpp>(),
             py::arg("left_type") = BoundaryType_cpp::WALL, py::arg("right_type") = BoundaryType_cpp::WALL)
        .def("set_boundary_types", &BoundaryConditionHandler_cpp::set_boundary_types,
             py::arg("left_type"), py::arg("right_type"))
        .def("build_padded_states", &BoundaryConditionHandler_cpp::build_padded_states,
             py::arg("depth"), py::arg("velocity"));

    // --- 配置与结果 ---
    py::class_<SimulationConfig_cpp>(m, "SimulationConfig_cpp")
        .def(py::init<>())
        .def_readwrite("num_cells", &SimulationConfig_cpp::num_cells)
        .def_readwrite("domain_length", &SimulationConfig_cpp::domain_length)
        .def_readwrite("total_time", &SimulationConfig_cpp::total_time)
        .def_readwrite("cfl", &SimulationConfig_cpp::cfl)
        .def_readwrite("rain_rate", &SimulationConfig_cpp::rain_rate)
        .def_readwrite("xi_max_factor", &SimulationConfig_cpp::xi_max_factor)
        .def_readwrite("num_xi", &SimulationConfig_cpp::num_xi)
        .def_readwrite("output_interval", &SimulationConfig_cpp::output_interval)
        .def_readwrite("gravity", &SimulationConfig_cpp::gravity)
        .def_readwrite("min_depth", &SimulationConfig_cpp::min_depth)
        .def_readwrite("dam_break_h_left", &SimulationConfig_cpp::dam_break_h_left)
        .def_readwrite("dam_break_h_right", &SimulationConfig_cpp::dam_break_h_right)
        .def_readwrite("left_boundary", &SimulationConfig_cpp::left_boundary)
        .def_readwrite("right_boundary", &SimulationConfig_cpp::right_boundary)
        .def_readwrite("max_steps", &SimulationConfig_cpp::max_steps)
        .def_readwrite("num_threads", &SimulationConfig_cpp::num_threads)
        .def_readwrite("verbose", &SimulationConfig_cpp::verbose)
        .def("validate", &SimulationConfig_cpp::validate, "Raises ValueError for an invalid configuration.");

    py::class_<ProgressInfo_cpp>(m, "ProgressInfo_cpp")
        .def_readonly("step", &ProgressInfo_cpp::step)
        .def_readonly("time", &ProgressInfo_cpp::time)
        .def_readonly("dt", &ProgressInfo_cpp::dt)
        .def_readonly("total_mass", &ProgressInfo_cpp::total_mass)
        .def_readonly("max_depth", &ProgressInfo_cpp::max_depth);

    py::class_<SimulationResult_cpp>(m, "SimulationResult_cpp")
        .def_property_readonly("x", [](const SimulationResult_cpp& self) { return to_numpy(self.x); })
        .def_property_readonly("z_bed", [](const SimulationResult_cpp& self) { return to_numpy(self.z_bed); })
        .def_property_readonly("h", [](const SimulationResult_cpp& self) { return to_numpy(self.h); })
        .def_property_readonly("u", [](const SimulationResult_cpp& self) { return to_numpy(self.u); })
        .def_readonly("final_time", &SimulationResult_cpp::final_time)
        .def_readonly("step_count", &SimulationResult_cpp::step_count);

    // --- 绑定核心模型类 KineticModelCore_cpp ---
    py::class_<KineticModelCore_cpp>(m, "KineticModelCore_cpp")
        .def(py::init<>()) // 绑定无参构造函数
        .def("set_num_threads", &KineticModelCore_cpp::set_num_threads, py::arg("num_threads"),
             "Sets the number of OpenMP threads; <= 0 restores the default.")
        .def("initialize", &KineticModelCore_cpp::initialize, py::arg("config"),
             "Validates the configuration, builds the mesh and creates the computational components.")
        .def("set_initial_conditions_py",
            [](KineticModelCore_cpp &self, py::array_t<double> U_initial_np) { // lambda函数包装
                self.set_initial_conditions(state_from_numpy(U_initial_np));
            }, py::arg("U_initial_np"), "Sets initial conditions from an Nx2 NumPy array [h, hu].")
        .def("set_bed_elevation", &KineticModelCore_cpp::set_bed_elevation, py::arg("z_bed_values"))
        .def("set_recharge_fields", &KineticModelCore_cpp::set_recharge_fields,
             py::arg("rainfall_rate"), py::arg("infiltration_rate") = std::vector<double>())
        .def("set_rainfall_timeseries", &KineticModelCore_cpp::set_rainfall_timeseries, py::arg("series"))
        .def("build_kinetic_grid", &KineticModelCore_cpp::build_kinetic_grid,
             py::arg("xi_max_factor") = 4.0, py::arg("num_xi") = 64)
        .def("set_progress_callback", &KineticModelCore_cpp::set_progress_callback, py::arg("callback"))
        .def("advance_one_step", &KineticModelCore_cpp::advance_one_step, // 执行一步积分
            "Advances the simulation by one time step, returns True if simulation should continue.")
        .def("run_simulation_to_end", &KineticModelCore_cpp::run_simulation_to_end, // 运行到结束
            "Runs the simulation until the total time is reached.")
        .def("get_current_time", &KineticModelCore_cpp::get_current_time)
        .def("get_step_count", &KineticModelCore_cpp::get_step_count)
        .def("get_total_time", &KineticModelCore_cpp::get_total_time)
        .def("get_last_dt", &KineticModelCore_cpp::get_last_dt,
            "Returns the actual time step used in the last call to advance_one_step.")
        .def("is_simulation_finished", &KineticModelCore_cpp::is_simulation_finished)
        .def("get_total_mass", &KineticModelCore_cpp::get_total_mass)
        .def("get_mesh", &KineticModelCore_cpp::get_mesh, py::return_value_policy::reference_internal)
        .def("get_kinetic_grid", &KineticModelCore_cpp::get_kinetic_grid, py::return_value_policy::reference_internal)
        .def("get_U_state_all_py", [](const KineticModelCore_cpp &self) {
                return state_to_numpy(self.get_U_state_all_copy());
            }, "Returns a NumPy array copy of the current U state [h, hu].")
        .def("get_depths_py", [](const KineticModelCore_cpp &self) { return to_numpy(self.get_depths()); })
        .def("get_velocities_py", [](const KineticModelCore_cpp &self) { return to_numpy(self.get_velocities()); });

    // --- 溃坝 + 降雨驱动 ---
    m.def("run_kinetic_simulation", &run_kinetic_simulation,
          py::arg("config"), py::arg("progress_callback") = py::none(),
          "Runs the dam-break + rainfall scenario and returns a SimulationResult_cpp.");

    m.def("run_simulation",
          [](int N, double L, double T, double cfl, double rain_rate, double xi_max_factor,
             int N_xi, int output_interval, bool verbose) {
              SimulationConfig_cpp config;
              config.num_cells = N;
              config.domain_length = L;
              config.total_time = T;
              config.cfl = cfl;
              config.rain_rate = rain_rate;
              config.xi_max_factor = xi_max_factor;
              config.num_xi = N_xi;
              config.output_interval = output_interval;
              config.verbose = verbose;
              SimulationResult_cpp result = run_kinetic_simulation(config);
              return py::make_tuple(to_numpy(result.x), to_numpy(result.z_bed),
                                    to_numpy(result.h), to_numpy(result.u));
          },
          py::arg("N") = 200, py::arg("L") = 10.0, py::arg("T") = 1.0, py::arg("cfl") = 0.5,
          py::arg("rain_rate") = 0.0, py::arg("xi_max_factor") = 4.0, py::arg("N_xi") = 64,
          py::arg("output_interval") = 10, py::arg("verbose") = true,
          "Runs the dam-break + rainfall scenario and returns numpy arrays (x, Z, h, u).");
}
