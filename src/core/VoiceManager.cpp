/**
 * @file VoiceManager.cpp
 * @brief Voice allocation, retrigger and stealing.
 */

#include "VoiceManager.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace tender {

VoiceManager::VoiceManager(int sample_rate, int max_voices)
    : sample_rate_(sample_rate)
{
    const int count = std::max(1, max_voices);
    voices_.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        voices_.push_back(std::make_unique<Voice>(sample_rate));
    }
}

void VoiceManager::note_on(int note, float velocity) {
    // 1. Retrigger: at most one sounding voice per note
    for (auto& voice : voices_) {
        if (voice->is_active() && voice->note() == note) {
            claim(*voice, note, velocity);
            return;
        }
    }

    // 2. Find an idle voice
    for (auto& voice : voices_) {
        if (!voice->is_active()) {
            claim(*voice, note, velocity);
            return;
        }
    }

    // 3. Voice Stealing
    Voice& candidate = steal_candidate();
    AudioLogger::instance().log_event("VoiceSteal", static_cast<float>(candidate.note()));
    claim(candidate, note, velocity);
}

void VoiceManager::note_off(int note) {
    for (auto& voice : voices_) {
        if (voice->state() == Voice::State::Active && voice->note() == note) {
            voice->note_off();
        }
    }
}

void VoiceManager::claim(Voice& voice, int note, float velocity) {
    voice.note_on(note, velocity);
    voice.set_age(next_timestamp());
}

Voice& VoiceManager::steal_candidate() {
    // Priority 1: the oldest voice that is already fading out
    Voice* oldest_releasing = nullptr;
    for (auto& voice : voices_) {
        if (voice->state() == Voice::State::Releasing &&
            (oldest_releasing == nullptr || voice->age() < oldest_releasing->age())) {
            oldest_releasing = voice.get();
        }
    }
    if (oldest_releasing != nullptr) {
        return *oldest_releasing;
    }

    // Priority 2: the oldest voice overall
    Voice* oldest = voices_.front().get();
    for (auto& voice : voices_) {
        if (voice->age() < oldest->age()) {
            oldest = voice.get();
        }
    }
    return *oldest;
}

float VoiceManager::process_sample() {
    float sum = 0.0f;
    for (auto& voice : voices_) {
        if (voice->is_active()) {
            sum += voice->process();
        }
    }
    return sum;
}

void VoiceManager::do_pull(std::span<float> output) {
    std::fill(output.begin(), output.end(), 0.0f);
    for (auto& sample : output) {
        sample += process_sample();
    }
}

void VoiceManager::reset() {
    for (auto& voice : voices_) {
        voice->reset();
        voice->set_age(0);
    }
    timestamp_counter_ = 0;
    AudioLogger::instance().log_message("VoiceManager", "Reset");
}

void VoiceManager::set_waveform(Waveform waveform) {
    for (auto& voice : voices_) {
        voice->set_waveform(waveform);
    }
}

void VoiceManager::set_attack_ms(float ms) {
    for (auto& voice : voices_) {
        voice->set_attack_ms(ms);
    }
}

void VoiceManager::set_decay_ms(float ms) {
    for (auto& voice : voices_) {
        voice->set_decay_ms(ms);
    }
}

void VoiceManager::set_sustain_level(float level) {
    for (auto& voice : voices_) {
        voice->set_sustain_level(level);
    }
}

void VoiceManager::set_release_ms(float ms) {
    for (auto& voice : voices_) {
        voice->set_release_ms(ms);
    }
}

int VoiceManager::active_voice_count() const {
    return static_cast<int>(std::count_if(voices_.begin(), voices_.end(),
        [](const auto& voice) { return voice->is_active(); }));
}

int VoiceManager::releasing_voice_count() const {
    return static_cast<int>(std::count_if(voices_.begin(), voices_.end(),
        [](const auto& voice) { return voice->state() == Voice::State::Releasing; }));
}

std::vector<int> VoiceManager::active_notes() const {
    std::vector<int> notes;
    for (const auto& voice : voices_) {
        if (voice->state() == Voice::State::Active) {
            notes.push_back(voice->note());
        }
    }
    return notes;
}

std::vector<Voice::State> VoiceManager::voice_states() const {
    std::vector<Voice::State> states;
    states.reserve(voices_.size());
    for (const auto& voice : voices_) {
        states.push_back(voice->state());
    }
    return states;
}

} // namespace tender
