// src_cpp/src/SimulationDriver_cpp.cpp
#include "SimulationDriver_cpp.h"
#include "Profiler.h"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>
#include <utility>

namespace KineticCore {

StateVector make_dam_break_initial_state(const Mesh1D_cpp& mesh, double h_left, double h_right) {
    if (!mesh.is_built()) {
        throw std::runtime_error("make_dam_break_initial_state: mesh is not built.");
    }
    StateVector U_initial(mesh.num_cells);
    const double x_dam = 0.5 * mesh.length; // 坝址位于域中点
    for (int i = 0; i < mesh.num_cells; ++i) {
        U_initial[i][0] = (mesh.cell_centers[i] < x_dam) ? h_left : h_right;
        U_initial[i][1] = 0.0; // 初始静止
    }
    return U_initial;
}

ProgressCallback make_console_progress_reporter(std::ostream& out) {
    return [&out](const ProgressInfo_cpp& info) {
        const std::ios_base::fmtflags flags = out.flags();
        const std::streamsize precision = out.precision();
        out << "t = " << std::fixed << std::setprecision(3) << info.time << ", step = " << info.step << std::endl;
        out.flags(flags);
        out.precision(precision); // 恢复调用方的流格式
    };
}

SimulationResult_cpp collect_result(const KineticModelCore_cpp& model) {
    const Mesh1D_cpp& mesh = model.get_mesh();
    const double min_depth = model.get_config().min_depth;
    const StateVector U = model.get_U_state_all_copy();

    SimulationResult_cpp result;
    result.x = mesh.cell_centers;
    result.z_bed = mesh.z_bed;
    result.h.resize(U.size());
    result.u.resize(U.size());
    for (size_t i = 0; i < U.size(); ++i) {
        const double h_pos = std::max(U[i][0], min_depth); // 输出水深以 h_eps 为下限
        result.h[i] = h_pos;
        result.u[i] = U[i][1] / h_pos;
    }
    result.final_time = model.get_current_time();
    result.step_count = model.get_step_count();
    return result;
}

SimulationResult_cpp run_kinetic_simulation(const SimulationConfig_cpp& config,
                                            ProgressCallback progress_callback) {
    PROFILE_FUNCTION();

    KineticModelCore_cpp model;
    model.initialize(config); // 参数不合法时在任何计算之前抛出
    if (config.num_threads > 0) {
        model.set_num_threads(config.num_threads);
    }

    model.set_initial_conditions(make_dam_break_initial_state(model.get_mesh(),
                                                              config.dam_break_h_left,
                                                              config.dam_break_h_right));
    model.build_kinetic_grid(config.xi_max_factor, config.num_xi);

    if (!progress_callback && config.verbose) {
        progress_callback = make_console_progress_reporter(std::cout);
    }
    model.set_progress_callback(std::move(progress_callback));

    model.run_simulation_to_end();
    return collect_result(model);
}

} // namespace KineticCore
