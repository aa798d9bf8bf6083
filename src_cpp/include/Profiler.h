// src_cpp/include/Profiler.h
#ifndef PROFILER_H
#define PROFILER_H

#include <chrono>    // 用于计时
#include <string>    // 用于名称
#include <map>       // 用于存储结果

namespace Profiler {

    struct ProfileResult {
        std::chrono::duration<double, std::micro> total_time{0}; // 总时间，使用微秒存储
        long long call_count = 0;                                // 调用次数
        std::chrono::duration<double, std::micro> min_time{std::chrono::duration<double, std::micro>::max()}; // 最短时间
        std::chrono::duration<double, std::micro> max_time{std::chrono::duration<double, std::micro>::min()}; // 最长时间

        double average_us() const { return call_count > 0 ? total_time.count() / call_count : 0.0; }
    };

    // 所有计时结果的快照 (按名称排序). 记录过程由互斥锁保护, 可以在OpenMP并行区内计时
    std::map<std::string, ProfileResult> results();

    // 某个作用域的调用次数, 未记录时为0
    long long call_count(const std::string& name);

    // 记录一次耗时
    void record_duration(const std::string& name, std::chrono::steady_clock::duration duration);

    // 打印总结报告 (按总时间降序)
    void print_summary();

    // 重置/清空分析数据
    void reset_summary();

    // RAII计时器: 构造时开始, 析构或 stop() 时记录
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        void stop(); // 提前结束计时

    private:
        std::string m_name;
        std::chrono::time_point<std::chrono::steady_clock> m_start_time;
        bool m_stopped; // 防止重复记录
    };

} // namespace Profiler

// 宏定义，方便在代码中启用/禁用分析 (CMake选项 KINETICCORE_ENABLE_PROFILING)
#define PROFILER_CONCAT_INNER(a, b) a##b
#define PROFILER_CONCAT(a, b) PROFILER_CONCAT_INNER(a, b)

#ifdef KINETICCORE_ENABLE_PROFILING
// 基于行号的唯一变量名，防止在同一作用域多次使用宏时重定义
#define PROFILE_SCOPE(name_str) Profiler::ScopedTimer PROFILER_CONCAT(scope_timer_, __LINE__)(name_str)
// __func__ 代表当前函数名
#define PROFILE_FUNCTION() Profiler::ScopedTimer PROFILER_CONCAT(func_timer_, __LINE__)(__func__)
#else
#define PROFILE_SCOPE(name_str)
#define PROFILE_FUNCTION()
#endif

#endif // PROFILER_H
