/**
 * @file AudioChunk.hpp
 * @brief Raw captured audio blocks and the transcription windows assembled from them.
 */

#pragma once
#include <cstdint>
#include <vector>

namespace meetinglens::domain {

/**
 * @struct AudioChunk
 * @brief A block of 16-bit mono PCM samples tagged with its arrival order.
 *
 * Chunks are immutable once produced; the sequence index is assigned by the
 * capture queue at push time and is strictly increasing within a session.
 */
struct AudioChunk {
    uint64_t sequence = 0; ///< Arrival order within the session.
    std::vector<int16_t> samples; ///< Raw PCM samples.
};

/**
 * @struct AudioWindow
 * @brief Contiguous span of normalized samples submitted as one transcription unit.
 */
struct AudioWindow {
    uint64_t index = 0; ///< Window counter within the session.
    uint64_t firstChunk = 0; ///< Sequence of the oldest chunk contributing samples.
    uint64_t lastChunk = 0; ///< Sequence of the newest chunk contributing samples.
    int sampleRate = 16000;
    std::vector<float> samples; ///< Normalized to [-1, 1].

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

} // namespace meetinglens::domain
