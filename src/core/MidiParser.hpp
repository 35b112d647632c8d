#pragma once

#include "MidiEvent.hpp"
#include <cstddef>
#include <optional>

namespace tender {

/**
 * @brief Incremental MIDI 1.0 byte stream decoder.
 *
 * Channel voice messages are reassembled across calls, so a message may be
 * split between two buffers. Running Status is honoured. System Real-Time
 * bytes are skipped wherever they appear; System Common and SysEx payloads
 * are discarded and cancel Running Status.
 */
class MidiParser {
public:
    /**
     * @brief Decode one byte.
     *
     * @return The completed message, if this byte finished one.
     */
    std::optional<MidiEvent> feed(uint8_t byte, uint32_t sampleOffset);

    /**
     * @brief Decode a buffer, calling onEvent for every completed message.
     *
     * All messages in the buffer share sampleOffset.
     */
    template<typename Callback>
    void parse(const uint8_t* data, size_t size, uint32_t sampleOffset, Callback&& onEvent) {
        for (size_t i = 0; i < size; ++i) {
            if (auto event = feed(data[i], sampleOffset)) {
                onEvent(*event);
            }
        }
    }

    /**
     * @brief Forget any partial message and the Running Status.
     */
    void reset();

private:
    enum class Mode {
        Idle,
        NeedFirstData,
        NeedSecondData,
        InSysEx
    };

    void handleStatus(uint8_t status);
    static int dataBytesFor(uint8_t status);

    Mode m_mode = Mode::Idle;
    uint8_t m_runningStatus = 0;
    uint8_t m_status = 0;
    uint8_t m_firstData = 0;
};

} // namespace tender
