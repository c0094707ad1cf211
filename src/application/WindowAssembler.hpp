/**
 * @file WindowAssembler.hpp
 * @brief Accumulates captured chunks into overlapping transcription windows.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "domain/AudioChunk.hpp"

namespace meetinglens::application {

/**
 * @class WindowAssembler
 * @brief Sole owner of the rolling sample buffer.
 *
 * A window is emitted as soon as the buffer holds at least the window duration.
 * The buffer is then re-seeded with its trailing overlap so a word spoken across
 * the boundary reaches the recognizer whole. Purely reactive: nothing happens
 * between chunk arrivals except an explicit flush().
 */
class WindowAssembler {
public:
    /**
     * @throws std::invalid_argument if the durations are not positive or the
     *         overlap is not shorter than the window.
     */
    WindowAssembler(int sampleRate, double windowSeconds, double overlapSeconds, double minFlushSeconds);

    /**
     * @brief Appends a chunk.
     * @return A window when the buffer reached the threshold, nullopt otherwise.
     */
    std::optional<domain::AudioWindow> append(const domain::AudioChunk& chunk);

    /**
     * @brief Empties the buffer at session end.
     * @return The residual audio as a window when it is longer than the minimum flush duration.
     */
    std::optional<domain::AudioWindow> flush();

    double bufferedSeconds() const;
    size_t bufferedSamples() const { return m_buffer.size(); }
    uint64_t windowsEmitted() const { return m_nextWindowIndex; }

private:
    domain::AudioWindow makeWindow();

    int m_sampleRate;
    size_t m_windowSamples;
    size_t m_overlapSamples;
    size_t m_minFlushSamples;

    std::vector<float> m_buffer;
    uint64_t m_firstChunk = 0;
    uint64_t m_lastChunk = 0;
    bool m_hasChunk = false;
    uint64_t m_nextWindowIndex = 0;
};

} // namespace meetinglens::application
