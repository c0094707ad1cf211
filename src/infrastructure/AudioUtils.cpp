#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <mutex>

namespace meetinglens::infrastructure {

bool AudioUtils::EnsureAudioSubsystem(std::string& error) {
    static std::mutex initMutex;
    std::lock_guard<std::mutex> lock(initMutex);
    if (SDL_WasInit(SDL_INIT_AUDIO) != 0) {
        return true;
    }
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        error = "SDL_InitSubSystem(AUDIO) failed: " + std::string(SDL_GetError());
        return false;
    }
    return true;
}

bool AudioUtils::LoadWavSDL(const std::string& fname, int sampleRate, std::vector<int16_t>& pcm16, std::string& error) {
    if (!EnsureAudioSubsystem(error)) {
        return false;
    }

    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          AUDIO_S16SYS, 1, sampleRate) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = static_cast<int>(wavLength);
    cvt.buf = (Uint8 *)SDL_malloc(cvt.len * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory converting " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    // needed == 0 means the file is already in the target format.
    if (cvt.needed && SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    const int bytes = cvt.needed ? cvt.len_cvt : cvt.len;
    pcm16.resize(bytes / sizeof(int16_t));
    SDL_memcpy(pcm16.data(), cvt.buf, pcm16.size() * sizeof(int16_t));

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

} // namespace meetinglens::infrastructure
