// src_cpp/include/MeshData_cpp.h
#ifndef MESHDATA_CPP_H
#define MESHDATA_CPP_H

#include <vector>
#include <string>

namespace KineticCore {

// 一维均匀网格: N个单元, 区间 [0, L]
class Mesh1D_cpp {
public:
    int num_cells = 0;          // 单元数量 N
    double length = 0.0;        // 计算域长度 L
    double dx = 0.0;            // 网格间距
    std::vector<double> cell_centers; // 单元中心坐标 x_i = (i + 0.5) * dx
    std::vector<double> z_bed;        // 单元中心底高程 Z (整个模拟期间不变)

    Mesh1D_cpp() = default;

    // 构建均匀网格, 底高程初始化为0 (平底)
    void build_uniform(int num_cells_param, double length_param);

    // 设置底高程 (长度必须等于单元数)
    void set_bed_elevation(const std::vector<double>& z_bed_values);

    int get_num_interfaces() const { return num_cells + 1; } // 界面数 N+1
    bool is_built() const { return num_cells > 0; }
};

} // namespace KineticCore
#endif // MESHDATA_CPP_H
