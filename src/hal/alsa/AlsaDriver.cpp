/**
 * @file AlsaDriver.cpp
 * @brief Playback through ALSA on Linux.
 */

#include "AlsaDriver.hpp"
#include "AudioSettings.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <pthread.h>

namespace tender::hal {

namespace {

constexpr int kRenderPriority = 80;
constexpr unsigned int kPeriodsPerBuffer = 4;

// Prints the failure and returns false when err is an ALSA error code.
bool alsa_ok(int err, const char* what) {
    if (err < 0) {
        std::cerr << "[AlsaDriver] " << what << ": " << snd_strerror(err) << std::endl;
        return false;
    }
    return true;
}

struct HwParams {
    snd_pcm_hw_params_t* ptr = nullptr;
    HwParams() { snd_pcm_hw_params_malloc(&ptr); }
    ~HwParams() {
        if (ptr) snd_pcm_hw_params_free(ptr);
    }
    HwParams(const HwParams&) = delete;
    HwParams& operator=(const HwParams&) = delete;
};

template<typename Out>
void interleave(const std::vector<float>& left, const std::vector<float>& right,
                int channels, double full_scale, std::vector<Out>& out) {
    const size_t stride = static_cast<size_t>(channels);
    for (size_t i = 0; i < left.size(); ++i) {
        out[i * stride] = static_cast<Out>(std::clamp(left[i], -1.0f, 1.0f) * full_scale);
        for (size_t c = 1; c < stride; ++c) {
            out[i * stride + c] = static_cast<Out>(std::clamp(right[i], -1.0f, 1.0f) * full_scale);
        }
    }
}

} // namespace

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, std::string device)
    : device_(std::move(device))
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , channels_(num_channels)
{
}

AlsaDriver::~AlsaDriver() {
    stop();
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!open_device()) {
        close_device();
        return false;
    }

    running_ = true;
    render_thread_ = std::thread(&AlsaDriver::render_loop, this);
    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
    close_device();
}

bool AlsaDriver::open_device() {
    if (!alsa_ok(snd_pcm_open(&pcm_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0), "snd_pcm_open")) {
        pcm_ = nullptr;
        return false;
    }

    HwParams hw;
    if (hw.ptr == nullptr) {
        std::cerr << "[AlsaDriver] Out of memory for hardware parameters" << std::endl;
        return false;
    }
    if (!alsa_ok(snd_pcm_hw_params_any(pcm_, hw.ptr), "hw_params_any")) return false;
    if (!alsa_ok(snd_pcm_hw_params_set_access(pcm_, hw.ptr, SND_PCM_ACCESS_RW_INTERLEAVED), "set_access")) return false;

    format_ = SampleFormat::S32;
    if (snd_pcm_hw_params_set_format(pcm_, hw.ptr, SND_PCM_FORMAT_S32_LE) < 0) {
        if (!alsa_ok(snd_pcm_hw_params_set_format(pcm_, hw.ptr, SND_PCM_FORMAT_S16_LE), "set_format")) return false;
        format_ = SampleFormat::S16;
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if (!alsa_ok(snd_pcm_hw_params_set_rate_near(pcm_, hw.ptr, &rate, nullptr), "set_rate_near")) return false;

    unsigned int channels = static_cast<unsigned int>(channels_);
    if (!alsa_ok(snd_pcm_hw_params_set_channels_near(pcm_, hw.ptr, &channels), "set_channels_near")) return false;

    snd_pcm_uframes_t period = static_cast<snd_pcm_uframes_t>(block_size_);
    if (!alsa_ok(snd_pcm_hw_params_set_period_size_near(pcm_, hw.ptr, &period, nullptr), "set_period_size_near")) return false;

    unsigned int periods = kPeriodsPerBuffer;
    // Not fatal: the device keeps its own buffer length
    alsa_ok(snd_pcm_hw_params_set_periods_near(pcm_, hw.ptr, &periods, nullptr), "set_periods_near");

    if (!alsa_ok(snd_pcm_hw_params(pcm_, hw.ptr), "snd_pcm_hw_params")) return false;
    if (!alsa_ok(snd_pcm_prepare(pcm_), "snd_pcm_prepare")) return false;

    sample_rate_ = static_cast<int>(rate);
    channels_ = static_cast<int>(channels);
    block_size_ = static_cast<int>(period);
    AudioSettings::instance().publish(sample_rate_, block_size_, channels_);

    const size_t frames = static_cast<size_t>(block_size_);
    const size_t samples = frames * static_cast<size_t>(channels_);
    left_.assign(frames, 0.0f);
    right_.assign(frames, 0.0f);
    out_s32_.assign(format_ == SampleFormat::S32 ? samples : 0, 0);
    out_s16_.assign(format_ == SampleFormat::S16 ? samples : 0, 0);

    std::cout << "[AlsaDriver] " << device_ << ": " << sample_rate_ << " Hz, "
              << block_size_ << " frames, " << channels_ << " ch, "
              << (format_ == SampleFormat::S32 ? "S32_LE" : "S16_LE") << std::endl;
    return true;
}

void AlsaDriver::close_device() {
    if (pcm_ != nullptr) {
        snd_pcm_drain(pcm_);
        snd_pcm_close(pcm_);
        pcm_ = nullptr;
    }
}

void AlsaDriver::render_loop() {
    sched_param param{};
    param.sched_priority = kRenderPriority;
    const int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    auto& logger = AudioLogger::instance();
    if (res == 0) {
        logger.log_event("ALSA_PRIORITY", static_cast<float>(kRenderPriority));
    } else if (res == EPERM) {
        logger.log_message("ALSA", "SCHED_FIFO denied (EPERM), raise rtprio limit");
    } else {
        logger.log_event("ALSA_PRIORITY_ERR", static_cast<float>(res));
    }

    while (running_) {
        if (!stereo_callback_ && !mono_callback_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        const auto begin = std::chrono::steady_clock::now();
        render_block();
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - begin);
        logger.log_event("PROC_US", static_cast<float>(elapsed.count()));

        write_interleaved();
    }
}

void AlsaDriver::render_block() {
    // A callback that leaves gaps must not replay the previous block
    std::fill(left_.begin(), left_.end(), 0.0f);
    std::fill(right_.begin(), right_.end(), 0.0f);

    AudioBuffer buffer{std::span<float>(left_), std::span<float>(right_)};
    if (stereo_callback_) {
        stereo_callback_(buffer);
    } else {
        mono_callback_(buffer.left);
        std::copy(left_.begin(), left_.end(), right_.begin());
    }
}

void AlsaDriver::write_interleaved() {
    const void* data = nullptr;
    if (format_ == SampleFormat::S32) {
        interleave(left_, right_, channels_, 2147483647.0, out_s32_);
        data = out_s32_.data();
    } else {
        interleave(left_, right_, channels_, 32767.0, out_s16_);
        data = out_s16_.data();
    }

    const snd_pcm_sframes_t written = snd_pcm_writei(pcm_, data, static_cast<snd_pcm_uframes_t>(block_size_));
    if (written < 0) {
        recover(static_cast<int>(written));
    }
}

void AlsaDriver::recover(int err) {
    AudioLogger::instance().log_event("ALSA_XRUN", static_cast<float>(err));
    if (err == -ESTRPIPE) {
        // Suspended: wait for the device to come back
        while ((err = snd_pcm_resume(pcm_)) == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (err == 0) return;
    }
    if (snd_pcm_recover(pcm_, err, 1) < 0) {
        const int prepared = snd_pcm_prepare(pcm_);
        if (prepared < 0) {
            AudioLogger::instance().log_event("ALSA_PREPARE_ERR", static_cast<float>(prepared));
        }
    }
}

} // namespace tender::hal
