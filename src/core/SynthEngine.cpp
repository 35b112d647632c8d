/**
 * @file SynthEngine.cpp
 * @brief Implementation of the SynthEngine class.
 */

#include "SynthEngine.hpp"
#include <algorithm>

namespace tender {

SynthEngine::SynthEngine(int sample_rate, int num_voices)
    : voices_(sample_rate, num_voices)
    , gain_(1.0f)
    , sample_rate_(sample_rate)
{
    apply_parameters(SynthParams{});
}

void SynthEngine::apply_parameters(const SynthParams& params) {
    voices_.set_waveform(waveform_from_index(params.waveform));
    voices_.set_attack_ms(params.attack_ms);
    voices_.set_decay_ms(params.decay_ms);
    voices_.set_sustain_level(params.sustain_level);
    voices_.set_release_ms(params.release_ms);
    gain_ = params.gain;
}

void SynthEngine::render(std::span<const NoteEvent> events, std::span<float> output) {
    // Pull the pool up to each event's sample, then apply the event.
    size_t pos = 0;
    for (const auto& event : events) {
        const size_t at = std::min<size_t>(event.timing, output.size());
        if (at > pos) {
            voices_.pull(output.subspan(pos, at - pos));
            pos = at;
        }
        handle_event(event);
    }
    if (pos < output.size()) {
        voices_.pull(output.subspan(pos));
    }

    for (auto& sample : output) {
        sample *= gain_;
    }
}

void SynthEngine::render(std::span<const NoteEvent> events, AudioBuffer& output) {
    render(events, output.left);
    std::copy(output.left.begin(), output.left.end(), output.right.begin());
}

size_t SynthEngine::apply_queued(NoteQueue& queue) {
    size_t count = 0;
    while (auto event = queue.pop()) {
        handle_event(*event);
        ++count;
    }
    return count;
}

void SynthEngine::handle_event(const NoteEvent& event) {
    switch (event.type) {
        case NoteEvent::Type::NoteOn:
            voices_.note_on(event.note, event.velocity);
            break;
        case NoteEvent::Type::NoteOff:
            voices_.note_off(event.note);
            break;
        case NoteEvent::Type::Ignored:
            break;
    }
}

void SynthEngine::reset() {
    voices_.reset();
}

} // namespace tender
