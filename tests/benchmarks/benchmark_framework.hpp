#pragma once
// =============================================================================
// Jalali Calendar Engine - Benchmark Harness
// Version: 1.2.0
// =============================================================================

#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <numeric>
#include <algorithm>
#include <type_traits>

namespace jalali::benchmark {

struct BenchmarkResult {
    std::string name;
    double min_ns = 0;
    double max_ns = 0;
    double avg_ns = 0;
    double median_ns = 0;
    double p99_ns = 0;
    size_t iterations = 0;
    size_t failures = 0;
    double ops_per_sec = 0;
};

// Keeps a computed value observable so the timed call is not elided
template<typename T>
void keep(const T& value) {
    static const void* volatile sink = nullptr;
    sink = &value;
}

class Benchmark {
public:
    Benchmark(std::string name, size_t iterations = 10000)
        : name_(std::move(name)), iterations_(iterations) {}
    
    // func may return void, a bool (false counts as a failure) or anything
    // with is_error() such as Result<T>
    template<typename Func>
    BenchmarkResult run(Func&& func) {
        std::vector<double> times;
        times.reserve(iterations_);
        size_t failures = 0;
        
        // Warmup
        for (size_t i = 0; i < std::min(iterations_ / 10, size_t(100)); ++i) {
            invoke(func);
        }
        
        for (size_t i = 0; i < iterations_; ++i) {
            auto start = std::chrono::steady_clock::now();
            bool ok = invoke(func);
            auto end = std::chrono::steady_clock::now();
            times.push_back(std::chrono::duration<double, std::nano>(end - start).count());
            if (!ok) ++failures;
        }
        
        std::sort(times.begin(), times.end());
        
        BenchmarkResult result;
        result.name = name_;
        result.iterations = iterations_;
        result.failures = failures;
        result.min_ns = times.front();
        result.max_ns = times.back();
        result.avg_ns = std::accumulate(times.begin(), times.end(), 0.0) / static_cast<double>(times.size());
        result.median_ns = times[times.size() / 2];
        result.p99_ns = times[std::min(times.size() - 1, times.size() * 99 / 100)];
        result.ops_per_sec = result.avg_ns > 0 ? 1e9 / result.avg_ns : 0;
        
        return result;
    }
    
    static void print_result(const BenchmarkResult& r) {
        std::cout << std::left << std::setw(36) << r.name
                  << " | " << std::right << std::setw(10) << std::fixed << std::setprecision(2)
                  << r.avg_ns << " ns"
                  << " | " << std::setw(10) << r.median_ns << " ns"
                  << " | " << std::setw(10) << r.p99_ns << " ns"
                  << " | " << std::setw(12) << std::setprecision(0) << r.ops_per_sec << " ops/s";
        if (r.failures > 0) {
            std::cout << "  (" << r.failures << " failed)";
        }
        std::cout << "\n";
    }
    
    static void print_header() {
        std::cout << std::left << std::setw(36) << "Benchmark"
                  << " | " << std::right << std::setw(13) << "Avg"
                  << " | " << std::setw(13) << "Median"
                  << " | " << std::setw(13) << "P99"
                  << " | " << std::setw(18) << "Throughput"
                  << "\n";
        std::cout << std::string(104, '-') << "\n";
    }
    
private:
    template<typename Func>
    static bool invoke(Func& func) {
        using Ret = std::invoke_result_t<Func&>;
        if constexpr (std::is_void_v<Ret>) {
            func();
            return true;
        } else if constexpr (std::is_same_v<Ret, bool>) {
            return func();
        } else {
            auto value = func();
            keep(value);
            return !value.is_error();
        }
    }
    
    std::string name_;
    size_t iterations_;
};

} // namespace jalali::benchmark
