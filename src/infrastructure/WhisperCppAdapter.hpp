#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>
#include <mutex>

// Keeps whisper.h out of the header.
struct whisper_context;

namespace meetinglens::infrastructure {

/**
 * @brief Speech-to-text through an in-process whisper.cpp model.
 *
 * The model is loaded on first use. A whisper context does not support
 * parallel inference, so calls are serialized.
 */
class WhisperCppAdapter : public domain::TranscriptionService {
public:
    WhisperCppAdapter(const std::string& modelPath, int threads = 0, int beamSize = 5);
    ~WhisperCppAdapter() override;

    WhisperCppAdapter(const WhisperCppAdapter&) = delete;
    WhisperCppAdapter& operator=(const WhisperCppAdapter&) = delete;

    /** @brief Loads the model now instead of on the first window. */
    bool preload(std::string& errorMsg);

    bool transcribe(const std::vector<float>& samples,
                    int sampleRate,
                    const std::string& languageHint,
                    std::vector<domain::TranscribedSpan>& spans,
                    std::string& error) override;

private:
    std::string m_modelPath;
    int m_threads;
    int m_beamSize;

    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;
    bool m_modelLoaded = false;

    bool loadModel(std::string& errorMsg);
};

} // namespace meetinglens::infrastructure
