// src_cpp/src/SourceTerms_cpp.cpp
#include "SourceTerms_cpp.h" // 包含对应的头文件
#include <stdexcept> // 包含标准异常
#include <algorithm>
#include <limits>
#include <cmath>
#include <omp.h>

namespace KineticCore { // 定义KineticCore命名空间

double interpolate_timeseries(const std::vector<TimeseriesPoint_cpp>& series, double time_current) {
    if (series.empty()) { // 如果时间序列为空
        return std::numeric_limits<double>::quiet_NaN(); // 返回NaN
    }

    // 假设系列已按时间排序 (设置时已排序)
    auto it_upper = std::lower_bound(series.begin(), series.end(), time_current,
                                     [](const TimeseriesPoint_cpp& p, double val) {
                                         return p.time < val;
                                     });

    if (it_upper == series.begin()) { // time_current 不大于第一个时间点
        return series.front().value; // 返回第一个值 (不外插)
    }
    if (it_upper == series.end()) { // time_current 大于最后一个时间点
        return series.back().value; // 返回最后一个值 (不外插)
    }

    const TimeseriesPoint_cpp& p_upper = *it_upper; // 上界点
    const TimeseriesPoint_cpp& p_lower = *(it_upper - 1); // 下界点

    if (std::abs(p_upper.time - p_lower.time) < 1e-12) { // 两个时间点几乎重合
        return p_upper.value;
    }

    double t_ratio = (time_current - p_lower.time) / (p_upper.time - p_lower.time); // 插值比例
    return p_lower.value + t_ratio * (p_upper.value - p_lower.value);
}

SourceTermCalculator_cpp::SourceTermCalculator_cpp(double gravity) // 构造函数实现
    : g(gravity) { // 初始化列表
} // 结束构造函数

std::vector<double> SourceTermCalculator_cpp::compute_recharge_source(
    const std::vector<double>& rainfall_rate,
    const std::vector<double>& infiltration_rate
) const {
    if (rainfall_rate.size() != infiltration_rate.size()) {
        throw std::invalid_argument("Rainfall and infiltration sizes do not match in compute_recharge_source.");
    }
    std::vector<double> recharge(rainfall_rate.size());
    for (size_t i = 0; i < rainfall_rate.size(); ++i) {
        recharge[i] = rainfall_rate[i] - infiltration_rate[i]; // S = R - I
    }
    return recharge;
}

std::vector<double> SourceTermCalculator_cpp::compute_bed_slope_gradient(
    const std::vector<double>& z_bed,
    double dx
) const {
    const size_t num_cells = z_bed.size();
    std::vector<double> dZdx(num_cells, 0.0);
    if (num_cells < 2) {
        return dZdx; // 单个单元没有坡度
    }
    for (size_t i = 1; i + 1 < num_cells; ++i) {
        dZdx[i] = (z_bed[i + 1] - z_bed[i - 1]) / (2.0 * dx); // 中心差分
    }
    dZdx[0] = (z_bed[1] - z_bed[0]) / dx; // 左端前向差分
    dZdx[num_cells - 1] = (z_bed[num_cells - 1] - z_bed[num_cells - 2]) / dx; // 右端后向差分
    return dZdx;
}

StateVector SourceTermCalculator_cpp::calculate_source_terms_all_cells(
    const StateVector& U_state_all,
    const std::vector<double>& velocity,
    const std::vector<double>& recharge,
    const std::vector<double>& bed_slope
) const {
    const size_t num_cells = U_state_all.size();
    if (num_cells == 0) {
        return {};
    }
    if (velocity.size() != num_cells || recharge.size() != num_cells || bed_slope.size() != num_cells) {
        throw std::invalid_argument("Input array sizes do not match in calculate_source_terms_all_cells.");
    }

    StateVector sources(num_cells);

    // 每个单元的源项互相独立, 直接并行化
#pragma omp parallel for schedule(static)
    for (long long i = 0; i < static_cast<long long>(num_cells); ++i) {
        const double h = U_state_all[i][0];
        sources[i][0] = recharge[i]; // 质量方程: + S
        sources[i][1] = recharge[i] * velocity[i] - g * h * bed_slope[i]; // 动量方程: + S u - g h dZ/dx
    }
    return sources;
}

} // namespace KineticCore
