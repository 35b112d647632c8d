/**
 * @file SynthEngine.hpp
 * @brief Host-facing wrapper: per-block parameters, sample-accurate events, gain.
 */

#ifndef TENDER_SYNTH_ENGINE_HPP
#define TENDER_SYNTH_ENGINE_HPP

#include "AudioBuffer.hpp"
#include "LockFreeRingBuffer.hpp"
#include "MidiEvent.hpp"
#include "SynthParams.hpp"
#include "VoiceManager.hpp"
#include <span>

namespace tender {

/**
 * @brief Lock-free handoff of notes from a control thread to the audio thread.
 */
using NoteQueue = LockFreeRingBuffer<NoteEvent, 256>;

/**
 * @brief Drives a VoiceManager from a host's block callback.
 *
 * The voice pool itself knows nothing about blocks, gain or channels. This
 * class applies the parameter snapshot once per block, dispatches each event
 * right before the sample it is timed for, scales by the master gain and
 * fans the mono mix out to stereo.
 */
class SynthEngine {
public:
    explicit SynthEngine(int sample_rate, int num_voices = VoiceManager::DEFAULT_VOICES);

    /**
     * @brief Broadcast a parameter snapshot to every voice.
     *
     * Call from the audio thread before rendering the block.
     */
    void apply_parameters(const SynthParams& params);

    /**
     * @brief Render a mono block.
     *
     * @param events Events for this block, ascending by timing. An event at
     *               timing k is visible from sample k on. Events timed past the
     *               end of the block are applied after its last sample.
     * @param output Block to fill.
     */
    void render(std::span<const NoteEvent> events, std::span<float> output);

    /**
     * @brief Render a block and duplicate it to both channels.
     */
    void render(std::span<const NoteEvent> events, AudioBuffer& output);

    /**
     * @brief Apply every note waiting in the queue, as if timed at sample 0.
     *
     * @return Number of events applied.
     */
    size_t apply_queued(NoteQueue& queue);

    void handle_event(const NoteEvent& event);
    void reset();

    int active_voice_count() const { return voices_.active_voice_count(); }
    float gain() const { return gain_; }
    int sample_rate() const { return sample_rate_; }

    VoiceManager& voices() { return voices_; }
    const VoiceManager& voices() const { return voices_; }

private:
    VoiceManager voices_;
    float gain_;
    int sample_rate_;
};

} // namespace tender

#endif // TENDER_SYNTH_ENGINE_HPP
