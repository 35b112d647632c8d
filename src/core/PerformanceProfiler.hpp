/**
 * @file PerformanceProfiler.hpp
 * @brief Per-block timing for Processor::pull().
 *
 * Timing is compiled in only when TENDER_ENABLE_PROFILING is set. Without it
 * start() and stop() are empty and stats() stays zero.
 */

#ifndef TENDER_PERFORMANCE_PROFILER_HPP
#define TENDER_PERFORMANCE_PROFILER_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>

namespace tender {

class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using Nanoseconds = std::chrono::nanoseconds;

    struct Stats {
        Nanoseconds last{0};
        Nanoseconds slowest{0};
        size_t blocks{0};
    };

#if TENDER_ENABLE_PROFILING
    void start() { began_ = Clock::now(); }

    // Closes the interval opened by start() and folds it into the totals.
    void stop() {
        stats_.last = std::chrono::duration_cast<Nanoseconds>(Clock::now() - began_);
        stats_.slowest = std::max(stats_.slowest, stats_.last);
        ++stats_.blocks;
    }
#else
    void start() {}
    void stop() {}
#endif

    const Stats& stats() const { return stats_; }

private:
#if TENDER_ENABLE_PROFILING
    Clock::time_point began_{};
#endif
    Stats stats_{};
};

} // namespace tender

#endif // TENDER_PERFORMANCE_PROFILER_HPP
