/**
 * @file AudioSettings.hpp
 * @brief Process-wide record of the output format the hardware accepted.
 */

#ifndef TENDER_AUDIO_SETTINGS_HPP
#define TENDER_AUDIO_SETTINGS_HPP

#include <atomic>

namespace tender {

/**
 * @brief Requested defaults until a driver publishes what it negotiated.
 *
 * The driver writes from its setup path; the engine, demo and tests read.
 */
class AudioSettings {
public:
    struct Snapshot {
        int sample_rate;
        int block_size;
        int num_channels;
    };

    static AudioSettings& instance() {
        static AudioSettings inst;
        return inst;
    }

    void publish(int sample_rate, int block_size, int num_channels) {
        sample_rate_.store(sample_rate, std::memory_order_relaxed);
        block_size_.store(block_size, std::memory_order_relaxed);
        num_channels_.store(num_channels, std::memory_order_relaxed);
        generation_.fetch_add(1, std::memory_order_release);
    }

    Snapshot current() const {
        return Snapshot{
            sample_rate_.load(std::memory_order_relaxed),
            block_size_.load(std::memory_order_relaxed),
            num_channels_.load(std::memory_order_relaxed)
        };
    }

    /**
     * @brief Number of publish() calls so far; 0 means nothing negotiated yet.
     */
    unsigned generation() const { return generation_.load(std::memory_order_acquire); }

private:
    AudioSettings() = default;

    std::atomic<int> sample_rate_{48000};
    std::atomic<int> block_size_{512};
    std::atomic<int> num_channels_{2};
    std::atomic<unsigned> generation_{0};
};

} // namespace tender

#endif // TENDER_AUDIO_SETTINGS_HPP
