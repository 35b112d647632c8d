/**
 * @file AudioBuffer.hpp
 * @brief Non-owning view of a stereo audio block.
 */

#ifndef TENDER_AUDIO_BUFFER_HPP
#define TENDER_AUDIO_BUFFER_HPP

#include <algorithm>
#include <cstddef>
#include <span>

namespace tender {

/**
 * @brief Represents a stereo (2-channel) audio buffer.
 *
 * Both spans must have the same length; frames() reports the left one.
 */
struct AudioBuffer {
    std::span<float> left;
    std::span<float> right;

    size_t frames() const { return left.size(); }

    void clear() {
        std::fill(left.begin(), left.end(), 0.0f);
        std::fill(right.begin(), right.end(), 0.0f);
    }
};

} // namespace tender

#endif // TENDER_AUDIO_BUFFER_HPP
