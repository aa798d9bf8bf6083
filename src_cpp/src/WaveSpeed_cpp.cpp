// src_cpp/src/WaveSpeed_cpp.cpp
#include "WaveSpeed_cpp.h"
#include "Profiler.h"
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <omp.h>

namespace KineticCore {

WaveSpeedEstimator_cpp::WaveSpeedEstimator_cpp(double gravity, double min_depth_param)
    : g(gravity), min_depth(min_depth_param) {
}

double WaveSpeedEstimator_cpp::max_wave_speed(const std::vector<double>& h, const std::vector<double>& u) const {
    PROFILE_FUNCTION();
    if (h.empty()) {
        throw std::invalid_argument("WaveSpeedEstimator_cpp: depth field is empty.");
    }
    if (h.size() != u.size()) {
        throw std::invalid_argument("WaveSpeedEstimator_cpp: depth and velocity sizes do not match.");
    }

    double global_max_speed = 0.0; // 全局最大值
    const long long num_cells = static_cast<long long>(h.size());

#pragma omp parallel
    {
        double local_max_speed = 0.0; // 每个线程的局部最大值

#pragma omp for schedule(static) nowait
        for (long long i = 0; i < num_cells; ++i) {
            const double h_pos = std::max(h[i], min_depth); // 干单元按阈值计算
            const double speed = std::abs(u[i]) + std::sqrt(2.0 * g * h_pos);
            if (speed > local_max_speed) {
                local_max_speed = speed;
            }
        }

#pragma omp critical
        {
            if (local_max_speed > global_max_speed) {
                global_max_speed = local_max_speed;
            }
        }
    } // 结束并行区域

    return global_max_speed;
}

} // namespace KineticCore
