#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <map>
#include <string>

namespace fancy {
namespace perf {

// Totals for one kernel name
struct kernel_stats_t {
    std::size_t launches = 0;
    std::size_t elements = 0;
    double seconds = 0.0;
};

using kernel_table_t = std::map<std::string, kernel_stats_t>;

template<typename P>
concept KernelProfiler = requires(P& p, const P& cp, const std::string& name, std::size_t n) {
    p.start();
    p.record(name, n);
    p.clear();
    { cp.data() } -> std::same_as<kernel_table_t>;
};

// =============================================================================
// profiler_t: wall time between start() and record() is charged to a kernel
// =============================================================================
//
// record() restarts the clock, so back-to-back launches can be timed with a
// single start().
//
class profiler_t {
public:
    using clock_t = std::chrono::steady_clock;

    void start() {
        _mark = clock_t::now();
    }

    void record(const std::string& kernel, std::size_t elements = 0) {
        auto now = clock_t::now();
        auto& stats = _kernels[kernel];
        stats.launches += 1;
        stats.elements += elements;
        stats.seconds += std::chrono::duration<double>(now - _mark).count();
        _mark = now;
    }

    void clear() {
        _kernels.clear();
    }

    auto data() const -> kernel_table_t {
        return _kernels;
    }

    auto total_seconds() const -> double {
        auto total = 0.0;
        for (const auto& entry : _kernels) {
            total += entry.second.seconds;
        }
        return total;
    }

private:
    clock_t::time_point _mark = clock_t::now();
    kernel_table_t _kernels;
};

static_assert(KernelProfiler<profiler_t>);

} // namespace perf
} // namespace fancy
