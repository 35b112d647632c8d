/**
 * @file Oscillator.hpp
 * @brief Naive phase-accumulator oscillator with four selectable waveforms.
 *
 * Waveforms are generated without band-limiting; the discontinuities of the
 * saw and square alias above a few kHz.
 */

#ifndef TENDER_OSCILLATOR_HPP
#define TENDER_OSCILLATOR_HPP

#include <cmath>
#include <optional>
#include <string_view>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace tender {

/**
 * @brief Oscillator waveform selector.
 *
 * Numeric values match the host parameter indices.
 */
enum class Waveform {
    Sine = 0,
    Sawtooth = 1,
    Square = 2,
    Triangle = 3
};

/**
 * @brief Map a host parameter index to a waveform. Unknown values yield Sine.
 */
inline Waveform waveform_from_index(int index) {
    switch (index) {
        case 1: return Waveform::Sawtooth;
        case 2: return Waveform::Square;
        case 3: return Waveform::Triangle;
        default: return Waveform::Sine;
    }
}

inline const char* waveform_name(Waveform waveform) {
    switch (waveform) {
        case Waveform::Sawtooth: return "Sawtooth";
        case Waveform::Square: return "Square";
        case Waveform::Triangle: return "Triangle";
        case Waveform::Sine: break;
    }
    return "Sine";
}

inline std::optional<Waveform> waveform_from_name(std::string_view name) {
    if (name == "Sine") return Waveform::Sine;
    if (name == "Sawtooth") return Waveform::Sawtooth;
    if (name == "Square") return Waveform::Square;
    if (name == "Triangle") return Waveform::Triangle;
    return std::nullopt;
}

/**
 * @brief Phase accumulator oscillator.
 *
 * Holds only a phase in [0, 1) and the sample rate. Each process call returns
 * the sample at the current phase and then advances by frequency / sample_rate.
 * Any finite frequency is accepted: zero holds the phase, negative runs the
 * waveform backwards, above Nyquist aliases.
 */
class Oscillator {
public:
    explicit Oscillator(int sample_rate)
        : sample_rate_(sample_rate)
        , phase_(0.0)
    {
    }

    void reset() {
        phase_ = 0.0;
    }

    double phase() const { return phase_; }
    int sample_rate() const { return sample_rate_; }

    float process_sine(double frequency) {
        const float output = static_cast<float>(std::sin(2.0 * M_PI * phase_));
        advance_phase(frequency);
        return output;
    }

    float process_sawtooth(double frequency) {
        const float output = static_cast<float>(2.0 * phase_ - 1.0);
        advance_phase(frequency);
        return output;
    }

    float process_square(double frequency) {
        const float output = phase_ < 0.5 ? -1.0f : 1.0f;
        advance_phase(frequency);
        return output;
    }

    float process_triangle(double frequency) {
        const float output = phase_ < 0.5
            ? static_cast<float>(-1.0 + 4.0 * phase_)
            : static_cast<float>(3.0 - 4.0 * phase_);
        advance_phase(frequency);
        return output;
    }

    float process(Waveform waveform, double frequency) {
        switch (waveform) {
            case Waveform::Sawtooth: return process_sawtooth(frequency);
            case Waveform::Square: return process_square(frequency);
            case Waveform::Triangle: return process_triangle(frequency);
            case Waveform::Sine: break;
        }
        return process_sine(frequency);
    }

private:
    /**
     * @brief Advance and wrap the phase back into [0, 1).
     *
     * Equivalent to repeatedly adding or subtracting 1, but bounded for
     * increments of any magnitude.
     */
    void advance_phase(double frequency) {
        phase_ += frequency / static_cast<double>(sample_rate_);

        if (!std::isfinite(phase_)) {
            phase_ = 0.0;
            return;
        }

        if (phase_ >= 1.0 || phase_ < 0.0) {
            phase_ -= std::floor(phase_);
            // A tiny negative phase rounds up to exactly 1.0
            if (phase_ >= 1.0) {
                phase_ = 0.0;
            }
        }
    }

    int sample_rate_;
    double phase_;  // Phase accumulator (0.0 to 1.0)
};

} // namespace tender

#endif // TENDER_OSCILLATOR_HPP
