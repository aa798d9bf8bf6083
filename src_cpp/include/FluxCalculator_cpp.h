// src_cpp/include/FluxCalculator_cpp.h
#ifndef FLUXCALCULATOR_CPP_H // 防止头文件重复包含
#define FLUXCALCULATOR_CPP_H // 定义头文件宏

#include <vector> // 包含vector容器
#include <array>  // 包含array容器

#include "KineticGrid_cpp.h"
#include "KineticMaxwellian_cpp.h"

namespace KineticCore { // 定义KineticCore命名空间

    // 界面左右两侧的原始变量, 可以被Pybind11绑定层转换为Python对象
    struct PrimitiveVars_cpp { // 定义原始变量结构体
        double h; // 水深
        double u; // 流速
    }; // 结束结构体定义

    class KineticFluxCalculator_cpp { // 定义动理学通量计算器类
    public: // 公有成员
        KineticFluxCalculator_cpp(double gravity, double min_depth_param); // 构造函数

        // 动理学迎风通量, 返回 [F_mass, F_mom]
        // xi >= 0 取左侧Maxwellian, xi < 0 取右侧Maxwellian, 再对 xi 和 xi^2 求积
        std::array<double, 2> calculate_kinetic_flux( // 计算界面通量方法
            const PrimitiveVars_cpp& W_L,          // 左侧原始变量
            const PrimitiveVars_cpp& W_R,          // 右侧原始变量
            const KineticVelocityGrid_cpp& grid    // 动理学速度网格
        ) const; // 结束方法声明

        const MaxwellianMapper_cpp& get_maxwellian_mapper() const { return maxwellian; }
        double get_gravity() const { return g; } // 获取重力加速度
        double get_min_depth() const { return min_depth; } // 获取最小水深

    private: // 私有成员
        double g;         // 重力加速度
        double min_depth; // 最小水深阈值
        MaxwellianMapper_cpp maxwellian; // Maxwellian映射器
    }; // 结束类定义

} // namespace KineticCore
#endif //FLUXCALCULATOR_CPP_H // 结束头文件宏
