/**
 * @file SynthParams.hpp
 * @brief Per-block parameter snapshot handed to the engine by its host.
 */

#ifndef TENDER_SYNTH_PARAMS_HPP
#define TENDER_SYNTH_PARAMS_HPP

#include <algorithm>
#include <cmath>

namespace tender {

/**
 * @brief Tone-shaping parameters shared by every voice.
 *
 * Values are stored as the host delivers them; the envelope clamps times to
 * >= 0 ms and sustain to [0, 1] when they are applied.
 */
struct SynthParams {
    int waveform = 0;            ///< 0 Sine, 1 Sawtooth, 2 Square, 3 Triangle (others: Sine)
    float attack_ms = 10.0f;
    float decay_ms = 100.0f;
    float sustain_level = 0.7f;
    float release_ms = 300.0f;
    float gain = 1.0f;           ///< Linear master gain, applied after the voice mix
};

/**
 * @brief How long the release of a just-stopped note can still be heard.
 *
 * Patch files are not validated, so a negative value counts as 0 ms and a
 * huge or non-finite one is capped at max_ms.
 */
inline int release_tail_ms(const SynthParams& params, float max_ms = 10000.0f) {
    if (!std::isfinite(params.release_ms)) return static_cast<int>(max_ms);
    return static_cast<int>(std::clamp(params.release_ms, 0.0f, max_ms));
}

} // namespace tender

#endif // TENDER_SYNTH_PARAMS_HPP
