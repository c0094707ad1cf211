/**
 * @file TranscriptionService.hpp
 * @brief Interface for speech-to-text inference over in-memory audio.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetinglens::domain {

/**
 * @struct TranscribedSpan
 * @brief One piece of recognized text with its timing inside the submitted audio.
 */
struct TranscribedSpan {
    std::string text;
    int64_t startMs = 0;
    int64_t endMs = 0;
};

/**
 * @brief True for recognizer annotations such as "[BLANK_AUDIO]", "[ Silence ]" or "(music)".
 * @param text Span text with surrounding whitespace already removed.
 */
inline bool IsNonSpeechMarker(const std::string& text) {
    if (text.size() < 2) return false;
    return (text.front() == '[' && text.back() == ']') ||
           (text.front() == '(' && text.back() == ')');
}

/**
 * @class TranscriptionService
 * @brief Abstract interface for services that convert audio samples to text.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes a block of audio synchronously.
     * @param samples Mono samples normalized to [-1, 1].
     * @param sampleRate Sample rate of @p samples.
     * @param languageHint ISO language code ("en") or "auto".
     * @param spans Populated with recognized spans (may be empty when there is no speech).
     * @param error Populated on failure.
     * @return True if inference ran.
     */
    virtual bool transcribe(const std::vector<float>& samples,
                            int sampleRate,
                            const std::string& languageHint,
                            std::vector<TranscribedSpan>& spans,
                            std::string& error) = 0;
};

} // namespace meetinglens::domain
