/**
 * @file WindowAssembler.cpp
 * @brief Implementation of the WindowAssembler class.
 */

#include "application/WindowAssembler.hpp"
#include <cmath>
#include <stdexcept>

namespace meetinglens::application {

namespace {

constexpr float kPcm16Scale = 32768.0f;

size_t SecondsToSamples(double seconds, int sampleRate) {
    return static_cast<size_t>(std::llround(seconds * sampleRate));
}

} // namespace

WindowAssembler::WindowAssembler(int sampleRate, double windowSeconds, double overlapSeconds, double minFlushSeconds)
    : m_sampleRate(sampleRate)
    , m_windowSamples(SecondsToSamples(windowSeconds, sampleRate))
    , m_overlapSamples(SecondsToSamples(overlapSeconds, sampleRate))
    , m_minFlushSamples(SecondsToSamples(minFlushSeconds, sampleRate))
{
    if (sampleRate <= 0 || windowSeconds <= 0.0) {
        throw std::invalid_argument("WindowAssembler: sample rate and window duration must be positive");
    }
    if (overlapSeconds < 0.0 || m_overlapSamples >= m_windowSamples) {
        throw std::invalid_argument("WindowAssembler: overlap must be non-negative and shorter than the window");
    }
    m_buffer.reserve(m_windowSamples * 2);
}

std::optional<domain::AudioWindow> WindowAssembler::append(const domain::AudioChunk& chunk) {
    if (!m_hasChunk) {
        m_firstChunk = chunk.sequence;
        m_hasChunk = true;
    }
    m_lastChunk = chunk.sequence;

    for (int16_t sample : chunk.samples) {
        m_buffer.push_back(static_cast<float>(sample) / kPcm16Scale);
    }

    if (m_buffer.size() < m_windowSamples) {
        return std::nullopt;
    }

    domain::AudioWindow window = makeWindow();

    // Re-seed with the overlap tail; it belongs to the newest chunk(s).
    if (m_buffer.size() > m_overlapSamples) {
        m_buffer.erase(m_buffer.begin(), m_buffer.end() - static_cast<std::ptrdiff_t>(m_overlapSamples));
    }
    m_firstChunk = m_lastChunk;
    m_hasChunk = !m_buffer.empty();
    return window;
}

std::optional<domain::AudioWindow> WindowAssembler::flush() {
    if (m_buffer.size() <= m_minFlushSamples) {
        m_buffer.clear();
        m_hasChunk = false;
        return std::nullopt;
    }
    domain::AudioWindow window = makeWindow();
    m_buffer.clear();
    m_hasChunk = false;
    return window;
}

double WindowAssembler::bufferedSeconds() const {
    return static_cast<double>(m_buffer.size()) / m_sampleRate;
}

domain::AudioWindow WindowAssembler::makeWindow() {
    domain::AudioWindow window;
    window.index = m_nextWindowIndex++;
    window.firstChunk = m_firstChunk;
    window.lastChunk = m_lastChunk;
    window.sampleRate = m_sampleRate;
    window.samples = m_buffer;
    return window;
}

} // namespace meetinglens::application
