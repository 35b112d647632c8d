/**
 * @file AudioDriver.hpp
 * @brief Output device interface used by the player and tests.
 */

#ifndef TENDER_AUDIO_DRIVER_HPP
#define TENDER_AUDIO_DRIVER_HPP

#include <functional>
#include <span>
#include "AudioBuffer.hpp"

namespace tender::hal {

/**
 * @brief A playback device that asks for audio one period at a time.
 *
 * Implementations own the thread that calls back. Callbacks get buffers of
 * block_size() frames that the driver allocated up front, and must fill
 * them without blocking.
 */
class AudioDriver {
public:
    /// Mono render; the driver copies the result to every channel.
    using AudioCallback = std::function<void(std::span<float> output)>;
    /// Stereo render; takes precedence over the mono callback when both are set.
    using StereoAudioCallback = std::function<void(AudioBuffer& output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and begin calling back.
     *
     * sample_rate() and block_size() report negotiated values once this
     * returns true.
     */
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // Install before start().
    virtual void set_callback(AudioCallback callback) = 0;
    virtual void set_stereo_callback(StereoAudioCallback callback) = 0;

    virtual int sample_rate() const = 0;
    virtual int block_size() const = 0;
    virtual int channels() const = 0;
};

} // namespace tender::hal

#endif // TENDER_AUDIO_DRIVER_HPP
