/**
 * @file Voice.cpp
 * @brief Implementation of the Voice class.
 */

#include "Voice.hpp"
#include <cmath>

namespace tender {

Voice::Voice(int sample_rate)
    : oscillator_(sample_rate)
    , envelope_(sample_rate)
    , note_(0)
    , frequency_(note_to_freq(0))
    , state_(State::Idle)
    , waveform_(Waveform::Sine)
    , age_(0)
{
}

void Voice::note_on(int note, float velocity) {
    note_ = note;
    frequency_ = note_to_freq(note);
    state_ = State::Active;
    envelope_.note_on(velocity);
    oscillator_.reset();
}

void Voice::note_off() {
    state_ = State::Releasing;
    envelope_.note_off();
}

float Voice::process() {
    if (!envelope_.is_active()) {
        state_ = State::Idle;
        return 0.0f;
    }

    const float sample = oscillator_.process(waveform_, frequency_) * envelope_.process();
    if (!envelope_.is_active()) {
        state_ = State::Idle;
    }
    return sample;
}

void Voice::reset() {
    state_ = State::Idle;
    envelope_.reset();
    oscillator_.reset();
}

void Voice::do_pull(std::span<float> output) {
    for (auto& sample : output) {
        sample = process();
    }
}

double Voice::note_to_freq(int note) {
    return 440.0 * std::pow(2.0, (note - 69) / 12.0);
}

} // namespace tender
