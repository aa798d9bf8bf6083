// src_cpp/src/MeshData_cpp.cpp
#include "MeshData_cpp.h"
#include <stdexcept>
#include <cmath>

namespace KineticCore {

void Mesh1D_cpp::build_uniform(int num_cells_param, double length_param) {
    if (num_cells_param <= 0) { // 单元数必须为正
        throw std::invalid_argument("Mesh1D_cpp: number of cells must be positive, got " + std::to_string(num_cells_param) + ".");
    }
    if (!(length_param > 0.0) || !std::isfinite(length_param)) { // 域长必须为有限正数
        throw std::invalid_argument("Mesh1D_cpp: domain length must be a positive finite value.");
    }

    num_cells = num_cells_param;
    length = length_param;
    dx = length / static_cast<double>(num_cells); // 网格间距

    cell_centers.resize(num_cells);
    for (int i = 0; i < num_cells; ++i) {
        cell_centers[i] = (static_cast<double>(i) + 0.5) * dx; // 单元中心
    }
    z_bed.assign(num_cells, 0.0); // 默认平底
}

void Mesh1D_cpp::set_bed_elevation(const std::vector<double>& z_bed_values) {
    if (!is_built()) {
        throw std::runtime_error("Mesh1D_cpp: mesh must be built before setting bed elevation.");
    }
    if (z_bed_values.size() != static_cast<size_t>(num_cells)) {
        throw std::invalid_argument("Mesh1D_cpp: bed elevation size (" + std::to_string(z_bed_values.size())
                                    + ") does not match number of cells (" + std::to_string(num_cells) + ").");
    }
    z_bed = z_bed_values;
}

} // namespace KineticCore
