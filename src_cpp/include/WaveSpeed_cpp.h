// src_cpp/include/WaveSpeed_cpp.h
#ifndef WAVESPEED_CPP_H
#define WAVESPEED_CPP_H

#include <vector>

namespace KineticCore {

// 全场最大波速估计, 仅用于CFL时间步长
class WaveSpeedEstimator_cpp {
public:
    WaveSpeedEstimator_cpp(double gravity, double min_depth_param);

    // s_max = max_i ( |u_i| + sqrt(2 g max(h_i, h_eps)) )
    double max_wave_speed(const std::vector<double>& h, const std::vector<double>& u) const;

private:
    double g;
    double min_depth;
};

} // namespace KineticCore
#endif // WAVESPEED_CPP_H
