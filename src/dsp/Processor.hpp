/**
 * @file Processor.hpp
 * @brief Block interface shared by envelopes, voices and the voice pool.
 */

#ifndef TENDER_PROCESSOR_HPP
#define TENDER_PROCESSOR_HPP

#include <chrono>
#include <cstddef>
#include <span>
#include "PerformanceProfiler.hpp"

namespace tender {

/**
 * @brief Something that renders mono blocks on request (pull model).
 *
 * The caller owns the buffer and decides the block length; a processor
 * writes exactly output.size() samples. Wrapping do_pull() lets every
 * processor report block timing when TENDER_ENABLE_PROFILING is on.
 */
class Processor {
public:
    struct PerformanceMetrics {
        std::chrono::nanoseconds last_execution_time{0};
        std::chrono::nanoseconds max_execution_time{0};
        size_t total_blocks_processed{0};
    };

    virtual ~Processor() = default;

    void pull(std::span<float> output) {
        profiler_.start();
        do_pull(output);
        profiler_.stop();
    }

    /**
     * @brief Return to the silent initial state.
     */
    virtual void reset() = 0;

    /**
     * @brief Timing of the most recent and slowest pull().
     *
     * All zero unless built with TENDER_ENABLE_PROFILING.
     */
    PerformanceMetrics get_metrics() const {
        const auto& stats = profiler_.stats();
        return PerformanceMetrics{stats.last, stats.slowest, stats.blocks};
    }

protected:
    virtual void do_pull(std::span<float> output) = 0;

private:
    PerformanceProfiler profiler_;
};

} // namespace tender

#endif // TENDER_PROCESSOR_HPP
