/**
 * @file WavFileSource.cpp
 * @brief Implementation of WavFileSource.
 */

#include "infrastructure/WavFileSource.hpp"
#include "infrastructure/AudioUtils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace meetinglens::infrastructure {

WavFileSource::WavFileSource(std::string path, int sampleRate, int chunkSamples, bool realtime)
    : m_path(std::move(path)), m_sampleRate(sampleRate), m_chunkSamples(chunkSamples), m_realtime(realtime) {}

WavFileSource::~WavFileSource() {
    stop();
}

bool WavFileSource::start(ChunkSink sink, std::string& error) {
    stop();
    if (m_samples.empty() && !AudioUtils::LoadWavSDL(m_path, m_sampleRate, m_samples, error)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
    }
    m_exhausted = false;
    std::cout << "[Audio] Replaying " << m_path << " ("
              << m_samples.size() / static_cast<double>(m_sampleRate) << "s)." << std::endl;
    m_thread = std::thread(&WavFileSource::replay, this, std::move(sink));
    return true;
}

void WavFileSource::replay(ChunkSink sink) {
    const size_t step = static_cast<size_t>(std::max(1, m_chunkSamples));
    const auto blockDuration = std::chrono::duration<double>(static_cast<double>(step) / m_sampleRate);
    auto next = std::chrono::steady_clock::now();

    for (size_t offset = 0; offset < m_samples.size(); offset += step) {
        const size_t end = std::min(offset + step, m_samples.size());
        sink(std::vector<int16_t>(m_samples.begin() + offset, m_samples.begin() + end));

        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_realtime) {
            next += std::chrono::duration_cast<std::chrono::steady_clock::duration>(blockDuration);
            m_cv.wait_until(lock, next, [this] { return m_stopRequested; });
        }
        if (m_stopRequested) {
            return;
        }
    }
    m_exhausted = true;
    std::cout << "[Audio] End of " << m_path << std::endl;
}

void WavFileSource::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

} // namespace meetinglens::infrastructure
