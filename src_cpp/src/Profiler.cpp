// src_cpp/src/Profiler.cpp
#include "Profiler.h" // 包含头文件
#include <iostream>  // 用于打印总结
#include <iomanip>   // 用于格式化输出 (std::setw, std::fixed, std::setprecision)
#include <algorithm> // 用于排序
#include <vector>
#include <mutex>
#include <utility>

namespace Profiler {

namespace {
    std::map<std::string, ProfileResult>& storage() {
        static std::map<std::string, ProfileResult> instance; // 首次使用时构造
        return instance;
    }

    std::mutex& storage_mutex() {
        static std::mutex instance;
        return instance;
    }
}

std::map<std::string, ProfileResult> results() {
    std::lock_guard<std::mutex> lock(storage_mutex());
    return storage();
}

long long call_count(const std::string& name) {
    std::lock_guard<std::mutex> lock(storage_mutex());
    auto it = storage().find(name);
    return it == storage().end() ? 0 : it->second.call_count;
}

ScopedTimer::ScopedTimer(std::string name) : m_name(std::move(name)), m_stopped(false) {
    m_start_time = std::chrono::steady_clock::now(); // 记录开始时间
}

ScopedTimer::~ScopedTimer() {
    stop();
}

void ScopedTimer::stop() {
    if (!m_stopped) { // 确保只记录一次
        auto end_time = std::chrono::steady_clock::now();          // 记录结束时间
        record_duration(m_name, end_time - m_start_time);
        m_stopped = true;
    }
}

void record_duration(const std::string& name, std::chrono::steady_clock::duration duration_steady) {
    // 转换为 double 微秒，便于累加和显示
    auto duration_us = std::chrono::duration_cast<std::chrono::duration<double, std::micro>>(duration_steady);

    std::lock_guard<std::mutex> lock(storage_mutex());
    ProfileResult& entry = storage()[name];
    entry.total_time += duration_us;
    entry.call_count++;
    entry.min_time = std::min(entry.min_time, duration_us);
    entry.max_time = std::max(entry.max_time, duration_us);
}

void print_summary() {
    std::map<std::string, ProfileResult> snapshot = results();

    std::cout << "\n--- C++ Performance Profiling Summary ---\n";
    std::vector<std::pair<std::string, ProfileResult>> sorted_results(snapshot.begin(), snapshot.end());
    std::sort(sorted_results.begin(), sorted_results.end(),
              [](const auto& a, const auto& b) {
                  return a.second.total_time > b.second.total_time; // 按总时间降序
              });

    const int name_width = 40;
    const int time_width = 18;
    const int count_width = 12;

    std::cout << std::left << std::setw(name_width) << "Function/Scope"
              << std::right << std::setw(time_width) << "Total Time (ms)"
              << std::setw(count_width) << "Calls"
              << std::setw(time_width) << "Avg Time (us)"
              << std::setw(time_width) << "Min Time (us)"
              << std::setw(time_width) << "Max Time (us)" << std::endl;
    std::cout << std::string(name_width + time_width * 4 + count_width, '-') << std::endl;

    for (const auto& [name, entry] : sorted_results) {
        const double total_ms = entry.total_time.count() / 1000.0; // 总时间转换为毫秒
        // 未记录过的 min/max 仍是初始值
        const double min_us = (entry.call_count > 0) ? entry.min_time.count() : 0.0;
        const double max_us = (entry.call_count > 0) ? entry.max_time.count() : 0.0;

        std::cout << std::left << std::setw(name_width) << name
                  << std::right << std::fixed << std::setprecision(3) << std::setw(time_width) << total_ms
                  << std::setw(count_width) << entry.call_count
                  << std::setw(time_width) << entry.average_us()
                  << std::setw(time_width) << min_us
                  << std::setw(time_width) << max_us
                  << std::endl;
    }
    std::cout << "------------------------------------------\n";
}

void reset_summary() {
    std::lock_guard<std::mutex> lock(storage_mutex());
    storage().clear(); // 清空map
}

} // namespace Profiler
