/**
 * @file VoiceManager.hpp
 * @brief Fixed-capacity pool of polyphonic voices.
 */

#ifndef TENDER_VOICE_MANAGER_HPP
#define TENDER_VOICE_MANAGER_HPP

#include "Processor.hpp"
#include "Voice.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace tender {

/**
 * @brief Manages a pool of voices for polyphonic playback.
 *
 * All voices are allocated in the constructor; note handling and rendering
 * only reuse them. Note-on allocation order:
 *   1. retrigger a sounding voice that already plays the note,
 *   2. the lowest-index idle voice,
 *   3. steal the oldest releasing voice, else the oldest voice.
 * "Oldest" is decided by a counter stamped on every claim.
 */
class VoiceManager : public Processor {
public:
    static constexpr int DEFAULT_VOICES = 16;

    /**
     * @brief Construct a new Voice Manager object.
     *
     * @param sample_rate Sample rate in Hz.
     * @param max_voices Pool capacity (at least 1).
     */
    explicit VoiceManager(int sample_rate, int max_voices = DEFAULT_VOICES);

    /**
     * @brief Trigger a note on.
     *
     * @param note MIDI note number (not range checked).
     * @param velocity Note velocity (0.0 to 1.0).
     */
    void note_on(int note, float velocity);

    /**
     * @brief Release every Active voice playing the note.
     */
    void note_off(int note);

    /**
     * @brief Render one mixed sample from every sounding voice.
     */
    float process_sample();

    void reset() override;

    // Parameter broadcast, applied to every voice.
    void set_waveform(Waveform waveform);
    void set_attack_ms(float ms);
    void set_decay_ms(float ms);
    void set_sustain_level(float level);
    void set_release_ms(float ms);

    int active_voice_count() const;
    int releasing_voice_count() const;
    std::vector<int> active_notes() const;
    std::vector<Voice::State> voice_states() const;
    int max_voice_count() const { return static_cast<int>(voices_.size()); }
    int sample_rate() const { return sample_rate_; }

    const Voice& voice(int index) const { return *voices_[static_cast<size_t>(index)]; }

protected:
    /**
     * @brief Zero the block, then sum every sounding voice sample by sample.
     */
    void do_pull(std::span<float> output) override;

private:
    uint64_t next_timestamp() { return ++timestamp_counter_; }

    void claim(Voice& voice, int note, float velocity);
    Voice& steal_candidate();

    std::vector<std::unique_ptr<Voice>> voices_;
    uint64_t timestamp_counter_ = 0;
    int sample_rate_;
};

} // namespace tender

#endif // TENDER_VOICE_MANAGER_HPP
