/**
 * @file AdsrEnvelopeProcessor.hpp
 * @brief Sample-accurate linear ADSR (Attack, Decay, Sustain, Release) envelope.
 */

#ifndef TENDER_ADSR_ENVELOPE_PROCESSOR_HPP
#define TENDER_ADSR_ENVELOPE_PROCESSOR_HPP

#include "EnvelopeProcessor.hpp"
#include <algorithm>

namespace tender {

/**
 * @brief ADSR Envelope Processor.
 *
 * Stage lengths are kept in fractional samples (ms / 1000 * sample_rate).
 * Every stage is a linear ramp between fixed end points, so a stage lasting
 * N samples always takes exactly ceil(N) process() calls. A zero-length
 * attack or decay is skipped within the same call instead of costing a
 * sample.
 */
class AdsrEnvelopeProcessor : public EnvelopeProcessor {
public:
    /**
     * @brief ADSR stages.
     */
    enum class State {
        Idle,
        Attack,
        Decay,
        Sustain,
        Release
    };

    explicit AdsrEnvelopeProcessor(int sample_rate)
        : sample_rate_(static_cast<float>(sample_rate))
    {
        set_attack_ms(10.0f);
        set_decay_ms(100.0f);
        set_sustain_level(0.7f);
        set_release_ms(100.0f);
    }

    /**
     * @brief Restart from zero in Attack, whatever the current stage.
     */
    void note_on(float velocity) override {
        velocity_ = std::clamp(velocity, 0.0f, 1.0f);
        state_ = State::Attack;
        phase_sample_ = 0.0f;
        current_value_ = 0.0f;
    }

    /**
     * @brief Ramp down from the level reached so far, not from the peak.
     */
    void note_off() override {
        state_ = State::Release;
        phase_sample_ = 0.0f;
        release_start_value_ = current_value_;
    }

    float process() override {
        // Loops only to fall through zero-length stages.
        for (;;) {
            switch (state_) {
                case State::Idle:
                    current_value_ = 0.0f;
                    return current_value_;

                case State::Attack:
                    if (attack_samples_ <= 0.0f) {
                        current_value_ = velocity_;
                        enter(State::Decay);
                        continue;
                    }
                    current_value_ = velocity_ * (phase_sample_ / attack_samples_);
                    phase_sample_ += 1.0f;
                    if (phase_sample_ >= attack_samples_) {
                        current_value_ = velocity_;
                        enter(State::Decay);
                    }
                    return current_value_;

                case State::Decay: {
                    const float target = sustain_level_ * velocity_;
                    if (decay_samples_ <= 0.0f) {
                        current_value_ = target;
                        enter(State::Sustain);
                        return current_value_;
                    }
                    const float progress = phase_sample_ / decay_samples_;
                    current_value_ = velocity_ + (target - velocity_) * progress;
                    phase_sample_ += 1.0f;
                    if (phase_sample_ >= decay_samples_) {
                        current_value_ = target;
                        enter(State::Sustain);
                    }
                    return current_value_;
                }

                case State::Sustain:
                    current_value_ = sustain_level_ * velocity_;
                    return current_value_;

                case State::Release:
                    if (release_samples_ <= 0.0f) {
                        enter(State::Idle);
                        current_value_ = 0.0f;
                        return current_value_;
                    }
                    current_value_ = release_start_value_ * (1.0f - phase_sample_ / release_samples_);
                    phase_sample_ += 1.0f;
                    if (phase_sample_ >= release_samples_) {
                        enter(State::Idle);
                        current_value_ = 0.0f;
                    }
                    return current_value_;
            }
            return current_value_;
        }
    }

    bool is_active() const override {
        return state_ != State::Idle;
    }

    bool is_releasing() const override {
        return state_ == State::Release;
    }

    void reset() override {
        state_ = State::Idle;
        current_value_ = 0.0f;
        phase_sample_ = 0.0f;
    }

    State state() const { return state_; }
    float value() const { return current_value_; }
    float velocity() const { return velocity_; }

    // Setters take effect on the next process() call, mid-stage included.
    void set_attack_ms(float ms) { attack_samples_ = ms_to_samples(ms); }
    void set_decay_ms(float ms) { decay_samples_ = ms_to_samples(ms); }
    void set_sustain_level(float level) { sustain_level_ = std::clamp(level, 0.0f, 1.0f); }
    void set_release_ms(float ms) { release_samples_ = ms_to_samples(ms); }

    float attack_samples() const { return attack_samples_; }
    float decay_samples() const { return decay_samples_; }
    float sustain_level() const { return sustain_level_; }
    float release_samples() const { return release_samples_; }

private:
    float ms_to_samples(float ms) const {
        return std::max(0.0f, ms) / 1000.0f * sample_rate_;
    }

    void enter(State next) {
        state_ = next;
        phase_sample_ = 0.0f;
    }

    float sample_rate_;
    State state_ = State::Idle;
    float current_value_ = 0.0f;
    float velocity_ = 1.0f;
    float release_start_value_ = 0.0f;
    float phase_sample_ = 0.0f;

    float attack_samples_ = 0.0f;
    float decay_samples_ = 0.0f;
    float sustain_level_ = 0.7f;
    float release_samples_ = 0.0f;
};

} // namespace tender

#endif // TENDER_ADSR_ENVELOPE_PROCESSOR_HPP
