/**
 * @file AlsaDriver.hpp
 * @brief Playback through ALSA on Linux.
 */

#ifndef TENDER_HAL_ALSA_DRIVER_HPP
#define TENDER_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace tender::hal {

/**
 * @brief Blocking snd_pcm_writei() loop on a SCHED_FIFO thread.
 *
 * Mono or stereo devices. The render thread converts float blocks to
 * interleaved S32_LE, or S16_LE when the device has no 32 bit format.
 * Rate, channel count and period size are requests; the values the device
 * accepted are published to AudioSettings by start().
 */
class AlsaDriver : public AudioDriver {
public:
    explicit AlsaDriver(int sample_rate = 48000, int block_size = 512, int num_channels = 2,
                        std::string device = "default");
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_.load(); }

    void set_callback(AudioCallback callback) override { mono_callback_ = std::move(callback); }
    void set_stereo_callback(StereoAudioCallback callback) override { stereo_callback_ = std::move(callback); }

    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const override { return channels_; }

private:
    enum class SampleFormat { S32, S16 };

    bool open_device();
    void close_device();
    void render_loop();
    void render_block();
    void write_interleaved();
    void recover(int err);

    std::string device_;
    snd_pcm_t* pcm_ = nullptr;
    int sample_rate_;
    int block_size_;
    int channels_;
    SampleFormat format_ = SampleFormat::S32;

    AudioCallback mono_callback_;
    StereoAudioCallback stereo_callback_;

    std::atomic<bool> running_{false};
    std::thread render_thread_;

    // Sized by open_device(), never reallocated while running
    std::vector<float> left_;
    std::vector<float> right_;
    std::vector<int32_t> out_s32_;
    std::vector<int16_t> out_s16_;
};

} // namespace tender::hal

#endif // TENDER_HAL_ALSA_DRIVER_HPP
