#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetinglens::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    /**
     * @brief Loads a WAV file and converts it to mono signed 16-bit at the given rate.
     * @param fname Path to WAV file.
     * @param sampleRate Target rate (16000 for whisper).
     * @param pcm16 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadWavSDL(const std::string& fname, int sampleRate, std::vector<int16_t>& pcm16, std::string& error);

    /** @brief Initializes the SDL audio subsystem once per process. */
    static bool EnsureAudioSubsystem(std::string& error);
};

} // namespace meetinglens::infrastructure
