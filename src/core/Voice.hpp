/**
 * @file Voice.hpp
 * @brief Represents a single synthesizer voice.
 */

#ifndef TENDER_VOICE_HPP
#define TENDER_VOICE_HPP

#include "Processor.hpp"
#include "oscillator/Oscillator.hpp"
#include "envelope/AdsrEnvelopeProcessor.hpp"
#include <cstdint>

namespace tender {

/**
 * @brief A single synth voice: one oscillator shaped by one ADSR envelope.
 *
 * A Releasing voice becomes Idle in the same process() call that produces
 * the last sample of its release.
 */
class Voice : public Processor {
public:
    enum class State {
        Idle,
        Active,
        Releasing
    };

    explicit Voice(int sample_rate);

    /**
     * @brief Claim the voice for a note, restarting phase and envelope.
     */
    void note_on(int note, float velocity);
    void note_off();

    /**
     * @brief Render one sample: oscillator output times envelope level.
     */
    float process();

    void reset() override;

    State state() const { return state_; }
    bool is_active() const { return state_ != State::Idle; }
    int note() const { return note_; }
    double frequency() const { return frequency_; }

    uint64_t age() const { return age_; }
    void set_age(uint64_t age) { age_ = age; }

    void set_waveform(Waveform waveform) { waveform_ = waveform; }
    Waveform waveform() const { return waveform_; }

    void set_attack_ms(float ms) { envelope_.set_attack_ms(ms); }
    void set_decay_ms(float ms) { envelope_.set_decay_ms(ms); }
    void set_sustain_level(float level) { envelope_.set_sustain_level(level); }
    void set_release_ms(float ms) { envelope_.set_release_ms(ms); }

    const Oscillator& oscillator() const { return oscillator_; }
    const AdsrEnvelopeProcessor& envelope() const { return envelope_; }

    /**
     * @brief Equal-tempered pitch, A4 (MIDI 69) = 440 Hz.
     */
    static double note_to_freq(int note);

protected:
    void do_pull(std::span<float> output) override;

private:
    Oscillator oscillator_;
    AdsrEnvelopeProcessor envelope_;

    int note_;
    double frequency_;
    State state_;
    Waveform waveform_;
    uint64_t age_;
};

} // namespace tender

#endif // TENDER_VOICE_HPP
