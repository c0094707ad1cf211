/**
 * @file SpeechFilter.hpp
 * @brief Energy-based voice activity filter run on windows before inference.
 */

#pragma once
#include <cstddef>
#include <vector>
#include "application/PipelineConfig.hpp"

namespace meetinglens::application {

/**
 * @class SpeechFilter
 * @brief Removes long silences from a window and reports windows without speech.
 *
 * Samples are split into fixed frames and a frame is voiced when its RMS
 * reaches the threshold. Voiced frames are padded on both sides; pauses
 * between speech shorter than the minimum silence are kept so words are not
 * glued together. Everything else is cut.
 */
class SpeechFilter {
public:
    /**
     * @throws std::invalid_argument if the sample rate or the frame length is not positive.
     */
    SpeechFilter(VadSettings settings, int sampleRate);

    /**
     * @brief Returns the speech portions of @p samples.
     * @return An empty vector when the window holds less voiced audio than the minimum speech duration.
     */
    std::vector<float> apply(const std::vector<float>& samples) const;

    bool enabled() const { return m_settings.enabled; }

private:
    size_t msToFrames(int ms) const;

    VadSettings m_settings;
    size_t m_frameSamples;
};

} // namespace meetinglens::application
