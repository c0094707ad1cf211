/**
 * @file WavFileSource.hpp
 * @brief Replays a WAV file as if it were being captured live.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "domain/AudioSource.hpp"

namespace meetinglens::infrastructure {

class WavFileSource : public domain::AudioSource {
public:
    /**
     * @param path WAV file; any format SDL can convert.
     * @param realtime Pace blocks at the audio's own rate; false delivers as fast as possible.
     */
    WavFileSource(std::string path, int sampleRate, int chunkSamples, bool realtime = true);
    ~WavFileSource() override;

    bool start(ChunkSink sink, std::string& error) override;
    void stop() override;
    bool isExhausted() const override { return m_exhausted.load(); }
    int sampleRate() const override { return m_sampleRate; }

private:
    void replay(ChunkSink sink);

    std::string m_path;
    int m_sampleRate;
    int m_chunkSamples;
    bool m_realtime;

    std::vector<int16_t> m_samples;
    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;
    std::atomic<bool> m_exhausted{false};
};

} // namespace meetinglens::infrastructure
