// src_cpp/include/SourceTerms_cpp.h
#ifndef SOURCETERMS_CPP_H // 防止头文件重复包含
#define SOURCETERMS_CPP_H // 定义头文件宏

#include <vector> // 包含vector容器
#include <array>  // 包含array容器

#include "TimeIntegrator_cpp.h" // StateVector 类型别名

namespace KineticCore { // 定义KineticCore命名空间

    // 时间序列数据点 (降雨过程线)
    struct TimeseriesPoint_cpp { // 定义时间序列数据点结构体
        double time;  // 时间
        double value; // 值 (降雨强度)
    }; // 结束结构体定义

    // 线性插值时间序列; 超出范围时取端点值 (不外插). 序列为空时返回NaN
    double interpolate_timeseries(const std::vector<TimeseriesPoint_cpp>& series, double time_current);

    // 补给源项 S = R - I 以及底坡源项 -g h dZ/dx
    class SourceTermCalculator_cpp { // 定义源项计算器类
    public: // 公有成员
        explicit SourceTermCalculator_cpp(double gravity); // 构造函数

        // 补给源项 S = R - I; 入渗场始终存在 (默认为零)
        std::vector<double> compute_recharge_source( // 计算补给源项
            const std::vector<double>& rainfall_rate,     // 降雨强度 R
            const std::vector<double>& infiltration_rate  // 入渗强度 I
        ) const;

        // 底坡梯度: 内部单元中心差分, 两端单侧差分, 单个单元时为零
        std::vector<double> compute_bed_slope_gradient( // 计算底坡梯度
            const std::vector<double>& z_bed, // 单元中心底高程
            double dx                          // 网格间距
        ) const;

        // 所有单元的源项贡献 [S, S*u - g*h*dZ/dx]
        StateVector calculate_source_terms_all_cells( // 计算源项 (所有单元)
            const StateVector& U_state_all,           // 当前守恒量 [h, hu]
            const std::vector<double>& velocity,      // 当前流速
            const std::vector<double>& recharge,      // 补给源项 S
            const std::vector<double>& bed_slope      // 底坡梯度 dZ/dx
        ) const;

    private: // 私有成员
        double g; // 重力加速度
    }; // 结束类定义

} // namespace KineticCore
#endif //SOURCETERMS_CPP_H // 结束头文件宏
