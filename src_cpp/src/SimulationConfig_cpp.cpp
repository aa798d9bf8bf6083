// src_cpp/src/SimulationConfig_cpp.cpp
#include "SimulationConfig_cpp.h"
#include <stdexcept>
#include <string>
#include <cmath>
#include <algorithm>

namespace KineticCore {

void SimulationConfig_cpp::validate() const {
    if (num_cells <= 0) {
        throw std::invalid_argument("Invalid configuration: num_cells must be > 0, got " + std::to_string(num_cells) + ".");
    }
    if (!std::isfinite(domain_length) || domain_length <= 0.0) {
        throw std::invalid_argument("Invalid configuration: domain_length must be > 0.");
    }
    if (!std::isfinite(total_time) || total_time < 0.0) {
        throw std::invalid_argument("Invalid configuration: total_time must be >= 0.");
    }
    if (!std::isfinite(cfl) || cfl <= 0.0 || cfl > 1.0) {
        throw std::invalid_argument("Invalid configuration: cfl must lie in (0, 1], got " + std::to_string(cfl) + ".");
    }
    if (!std::isfinite(rain_rate)) {
        throw std::invalid_argument("Invalid configuration: rain_rate must be finite.");
    }
    if (!std::isfinite(xi_max_factor) || xi_max_factor <= 0.0) {
        throw std::invalid_argument("Invalid configuration: xi_max_factor must be > 0.");
    }
    if (num_xi < 2) {
        throw std::invalid_argument("Invalid configuration: num_xi must be >= 2, got " + std::to_string(num_xi) + ".");
    }
    if (!std::isfinite(gravity) || gravity <= 0.0) {
        throw std::invalid_argument("Invalid configuration: gravity must be > 0.");
    }
    if (!std::isfinite(min_depth) || min_depth <= 0.0) {
        throw std::invalid_argument("Invalid configuration: min_depth must be > 0.");
    }
    if (!std::isfinite(dam_break_h_left) || !std::isfinite(dam_break_h_right)
        || dam_break_h_left < 0.0 || dam_break_h_right < 0.0) {
        throw std::invalid_argument("Invalid configuration: dam-break depths must be finite and >= 0.");
    }
    if (std::max(dam_break_h_left, dam_break_h_right) <= 0.0) { // 速度网格按初始最大水深确定
        throw std::invalid_argument("Invalid configuration: at least one dam-break depth must be > 0.");
    }
    if (max_steps <= 0) {
        throw std::invalid_argument("Invalid configuration: max_steps must be > 0.");
    }
}

} // namespace KineticCore
