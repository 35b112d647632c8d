#include "MidiParser.hpp"

namespace tender {

std::optional<MidiEvent> MidiParser::feed(uint8_t byte, uint32_t sampleOffset) {
    if (byte & 0x80) {
        handleStatus(byte);
        return std::nullopt;
    }

    switch (m_mode) {
        case Mode::InSysEx:
            return std::nullopt;

        case Mode::Idle:
            // Data byte after a complete message reuses the Running Status
            if (m_runningStatus == 0) {
                return std::nullopt;
            }
            m_status = m_runningStatus;
            [[fallthrough]];

        case Mode::NeedFirstData:
            if (dataBytesFor(m_status) == 1) {
                m_mode = Mode::Idle;
                return MidiEvent{m_status, byte, 0, sampleOffset};
            }
            m_firstData = byte;
            m_mode = Mode::NeedSecondData;
            return std::nullopt;

        case Mode::NeedSecondData:
            m_mode = Mode::Idle;
            return MidiEvent{m_status, m_firstData, byte, sampleOffset};
    }
    return std::nullopt;
}

void MidiParser::handleStatus(uint8_t status) {
    if (status >= 0xF8) {
        return; // Real-Time: Clock, Start, Active Sensing...
    }
    if (status >= 0xF0) {
        m_runningStatus = 0;
        m_mode = (status == 0xF0) ? Mode::InSysEx : Mode::Idle;
        return;
    }
    m_status = status;
    m_runningStatus = status;
    m_mode = Mode::NeedFirstData;
}

void MidiParser::reset() {
    m_mode = Mode::Idle;
    m_runningStatus = 0;
    m_status = 0;
    m_firstData = 0;
}

int MidiParser::dataBytesFor(uint8_t status) {
    switch (status & 0xF0) {
        case 0xC0: // Program Change
        case 0xD0: // Channel Pressure
            return 1;
        default:
            return 2;
    }
}

} // namespace tender
