/**
 * @file SdlCaptureSource.hpp
 * @brief Live microphone capture through an SDL2 audio device.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include "domain/AudioSource.hpp"

namespace meetinglens::infrastructure {

/**
 * @class SdlCaptureSource
 * @brief Opens a mono S16 capture device; SDL's audio thread feeds the sink.
 *
 * The callback only copies the block and hands it on, so the device never
 * waits on transcription or analysis.
 */
class SdlCaptureSource : public domain::AudioSource {
public:
    /**
     * @param sampleRate Requested rate; the device must support it exactly.
     * @param chunkSamples Samples per callback (power of two).
     * @param deviceName Capture device name; empty for the system default.
     */
    SdlCaptureSource(int sampleRate, int chunkSamples, std::string deviceName = "");
    ~SdlCaptureSource() override;

    bool start(ChunkSink sink, std::string& error) override;
    void stop() override;
    bool isHealthy(std::string& error) const override;
    int sampleRate() const override { return m_sampleRate; }

private:
    static void CaptureCallback(void* userdata, uint8_t* stream, int len);

    int m_sampleRate;
    int m_chunkSamples;
    std::string m_deviceName;

    mutable std::mutex m_mutex;
    uint32_t m_device = 0; ///< SDL_AudioDeviceID; 0 when closed.
    ChunkSink m_sink; ///< Set before unpausing, cleared after closing.
};

} // namespace meetinglens::infrastructure
