/**
 * @file EnvelopeProcessor.hpp
 * @brief Base class for envelope processors.
 */

#ifndef TENDER_ENVELOPE_PROCESSOR_HPP
#define TENDER_ENVELOPE_PROCESSOR_HPP

#include "../Processor.hpp"

namespace tender {

/**
 * @brief Base class for envelope processors.
 *
 * Envelopes provide control signals (0.0 to the note velocity) that scale
 * a voice's amplitude.
 */
class EnvelopeProcessor : public Processor {
public:
    virtual ~EnvelopeProcessor() = default;

    /**
     * @brief Start the envelope from zero (e.g., Attack).
     *
     * @param velocity Peak level, clamped to [0, 1].
     */
    virtual void note_on(float velocity) = 0;

    /**
     * @brief Enter the "off" stage (e.g., Release) from the current level.
     */
    virtual void note_off() = 0;

    /**
     * @brief Advance one sample and return the new level.
     */
    virtual float process() = 0;

    /**
     * @brief Check if the envelope is currently active (not in Idle state).
     *
     * @return true if the envelope is processing, false if it has finished.
     */
    virtual bool is_active() const = 0;

    virtual bool is_releasing() const = 0;

protected:
    void do_pull(std::span<float> output) override {
        for (auto& sample : output) {
            sample = process();
        }
    }
};

} // namespace tender

#endif // TENDER_ENVELOPE_PROCESSOR_HPP
