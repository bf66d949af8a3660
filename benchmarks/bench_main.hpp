#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace snaptext::benchmarks {

struct BenchmarkResult {
    std::string label;
    std::size_t output_bytes;
    int iterations;
    double avg_ms;
    double min_ms;
    double max_ms;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        const auto d =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(d.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// output_bytes：一次序列化产出的文本大小，用于换算吞吐。
template <typename Func>
inline void run_benchmark(std::string label,
                          std::size_t output_bytes,
                          int iterations,
                          Func &&func) {
    if (iterations <= 0) {
        return;
    }

    // 先空跑一次，避免首轮分配/缓存冷启动拉高结果。
    func();

    double total_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();

        const double ms = timer.elapsed_ms();
        total_ms += ms;
        min_ms = (i == 0) ? ms : std::min(min_ms, ms);
        max_ms = std::max(max_ms, ms);
    }

    results().push_back({std::move(label),
                         output_bytes,
                         iterations,
                         total_ms / iterations,
                         min_ms,
                         max_ms});
}

inline void print_results() {
    std::cout << "\n" << std::string(96, '=') << "\n";
    std::cout << std::left << std::setw(44) << "Benchmark" << std::setw(12)
              << "Output" << std::setw(12) << "avg (ms)" << std::setw(12)
              << "min (ms)" << std::setw(16) << "MB/s (avg)"
              << "\n";
    std::cout << std::string(96, '-') << "\n";

    for (const auto &r : results()) {
        const double mb = static_cast<double>(r.output_bytes) / (1024.0 * 1024.0);
        const double throughput = r.avg_ms > 0.0 ? mb / (r.avg_ms / 1000.0) : 0.0;

        std::cout << std::left << std::setw(44) << r.label << std::setw(12)
                  << (std::to_string(r.output_bytes / 1024) + " KB")
                  << std::fixed << std::setprecision(3) << std::setw(12)
                  << r.avg_ms << std::setw(12) << r.min_ms << std::setw(16)
                  << throughput << "\n";
    }
    std::cout << std::string(96, '=') << "\n\n";
}

} // namespace snaptext::benchmarks

#define BENCH_RUN(label, size, iterations, code)                               \
    ::snaptext::benchmarks::run_benchmark(label, size, iterations, [&]() { code; })
