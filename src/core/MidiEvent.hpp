#pragma once

#include <cstdint>

namespace tender {

/**
 * @brief Represents a lightweight, RT-safe raw MIDI event.
 */
struct MidiEvent {
    uint8_t status;       ///< MIDI status byte (e.g., 0x90 for Note On)
    uint8_t data1;        ///< First data byte (e.g., pitch)
    uint8_t data2;        ///< Second data byte (e.g., velocity)
    uint32_t sampleOffset; ///< Offset in samples from the start of the current audio block

    bool isNoteOn() const {
        return (status & 0xF0) == 0x90 && data2 > 0;
    }

    /**
     * @brief Helper to check if this is a Note Off event.
     * Note: Handles both explicit Note Off (0x80) and Note On with velocity 0.
     */
    bool isNoteOff() const {
        if ((status & 0xF0) == 0x80) return true;
        if ((status & 0xF0) == 0x90 && data2 == 0) return true;
        return false;
    }

    /**
     * @brief Gets the MIDI channel (0-15).
     */
    uint8_t getChannel() const {
        return status & 0x0F;
    }
};

/**
 * @brief Note event as consumed by the engine, timed within one block.
 */
struct NoteEvent {
    enum class Type : uint8_t {
        NoteOn,
        NoteOff,
        Ignored
    };

    Type type = Type::Ignored;
    int note = 0;          ///< MIDI note number, 0-127
    float velocity = 0.0f; ///< 0.0 to 1.0, NoteOn only
    uint32_t timing = 0;   ///< Sample offset within the block

    static NoteEvent note_on(int note, float velocity, uint32_t timing = 0) {
        return NoteEvent{Type::NoteOn, note, velocity, timing};
    }

    static NoteEvent note_off(int note, uint32_t timing = 0) {
        return NoteEvent{Type::NoteOff, note, 0.0f, timing};
    }
};

/**
 * @brief Reduce a raw MIDI event to the note on/off subset the engine plays.
 *
 * Channel is not interpreted. Anything other than a note message becomes
 * NoteEvent::Type::Ignored.
 */
inline NoteEvent to_note_event(const MidiEvent& event) {
    if (event.isNoteOn()) {
        return NoteEvent::note_on(event.data1, event.data2 / 127.0f, event.sampleOffset);
    }
    if (event.isNoteOff()) {
        return NoteEvent::note_off(event.data1, event.sampleOffset);
    }
    NoteEvent ignored;
    ignored.timing = event.sampleOffset;
    return ignored;
}

} // namespace tender
