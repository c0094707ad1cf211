/**
 * @file SdlCaptureSource.cpp
 * @brief Implementation of SdlCaptureSource.
 */

#include "infrastructure/SdlCaptureSource.hpp"
#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <iostream>
#include <vector>

namespace meetinglens::infrastructure {

SdlCaptureSource::SdlCaptureSource(int sampleRate, int chunkSamples, std::string deviceName)
    : m_sampleRate(sampleRate), m_chunkSamples(chunkSamples), m_deviceName(std::move(deviceName)) {}

SdlCaptureSource::~SdlCaptureSource() {
    stop();
}

void SdlCaptureSource::CaptureCallback(void* userdata, uint8_t* stream, int len) {
    auto* self = static_cast<SdlCaptureSource*>(userdata);
    if (!self->m_sink || len <= 0) {
        return;
    }
    std::vector<int16_t> samples(static_cast<size_t>(len) / sizeof(int16_t));
    SDL_memcpy(samples.data(), stream, samples.size() * sizeof(int16_t));
    self->m_sink(std::move(samples));
}

bool SdlCaptureSource::start(ChunkSink sink, std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_device != 0) {
        error = "capture device already open";
        return false;
    }
    if (!AudioUtils::EnsureAudioSubsystem(error)) {
        return false;
    }

    SDL_AudioSpec want;
    SDL_AudioSpec have;
    SDL_zero(want);
    want.freq = m_sampleRate;
    want.format = AUDIO_S16SYS;
    want.channels = 1;
    want.samples = static_cast<Uint16>(m_chunkSamples);
    want.callback = &SdlCaptureSource::CaptureCallback;
    want.userdata = this;

    m_sink = std::move(sink);
    const char* name = m_deviceName.empty() ? nullptr : m_deviceName.c_str();
    SDL_AudioDeviceID device = SDL_OpenAudioDevice(name, 1, &want, &have, 0);
    if (device == 0) {
        m_sink = nullptr;
        error = "SDL_OpenAudioDevice failed: " + std::string(SDL_GetError());
        return false;
    }

    m_device = device;
    SDL_PauseAudioDevice(device, 0);
    std::cout << "[Audio] Capturing from " << (name ? name : "default device") << " at "
              << have.freq << " Hz, " << have.samples << " samples per block." << std::endl;
    return true;
}

void SdlCaptureSource::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_device == 0) {
        return;
    }
    // Blocks until an in-progress callback returns.
    SDL_CloseAudioDevice(m_device);
    m_device = 0;
    m_sink = nullptr;
    std::cout << "[Audio] Capture device closed." << std::endl;
}

bool SdlCaptureSource::isHealthy(std::string& error) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_device == 0) {
        return true;
    }
    if (SDL_GetAudioDeviceStatus(m_device) == SDL_AUDIO_STOPPED) {
        error = "capture device stopped (disconnected?)";
        return false;
    }
    return true;
}

} // namespace meetinglens::infrastructure
