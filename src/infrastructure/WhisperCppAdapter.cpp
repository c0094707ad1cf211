/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the WhisperCppAdapter class.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "whisper.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>

namespace meetinglens::infrastructure {

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelPath, int threads, int beamSize)
    : m_modelPath(modelPath)
    , m_threads(threads)
    , m_beamSize(beamSize)
{
    // Loading takes seconds; defer to preload() or the first window.
}

WhisperCppAdapter::~WhisperCppAdapter() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppAdapter::preload(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadModel(errorMsg);
}

bool WhisperCppAdapter::loadModel(std::string& errorMsg) {
    if (m_modelLoaded) return true;

    if (!std::filesystem::exists(m_modelPath)) {
        errorMsg = "Model file not found at: " + m_modelPath + ". Download a ggml model (e.g. ggml-base.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        errorMsg = "Failed to initialize whisper context from " + m_modelPath;
        return false;
    }

    std::cout << "[Whisper] Loaded model " << m_modelPath << std::endl;
    m_modelLoaded = true;
    return true;
}

bool WhisperCppAdapter::transcribe(const std::vector<float>& samples,
                                   int sampleRate,
                                   const std::string& languageHint,
                                   std::vector<domain::TranscribedSpan>& spans,
                                   std::string& error) {
    spans.clear();
    if (sampleRate != WHISPER_SAMPLE_RATE) {
        error = "whisper expects " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz audio, got " +
                std::to_string(sampleRate);
        return false;
    }
    if (samples.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!loadModel(error)) {
        return false;
    }

    const bool beam = m_beamSize > 1;
    whisper_full_params wparams = whisper_full_default_params(beam ? WHISPER_SAMPLING_BEAM_SEARCH
                                                                   : WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.no_context = true; // Windows overlap; carrying tokens over repeats text.
    wparams.suppress_blank = true;
    wparams.suppress_nst = true;
    wparams.language = languageHint.empty() ? "auto" : languageHint.c_str();
    wparams.n_threads = m_threads > 0
        ? m_threads
        : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    if (beam) {
        wparams.beam_search.beam_size = m_beamSize;
    }

    if (whisper_full(m_ctx, wparams, samples.data(), static_cast<int>(samples.size())) != 0) {
        error = "Whisper inference failed.";
        return false;
    }

    const int nSegments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < nSegments; ++i) {
        const char* text = whisper_full_get_segment_text(m_ctx, i);
        if (!text) continue;
        std::string trimmed(text);
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
        if (trimmed.empty() || domain::IsNonSpeechMarker(trimmed)) {
            continue;
        }

        domain::TranscribedSpan span;
        span.text = text;
        // t0/t1 are in 10 ms units.
        span.startMs = whisper_full_get_segment_t0(m_ctx, i) * 10;
        span.endMs = whisper_full_get_segment_t1(m_ctx, i) * 10;
        spans.push_back(std::move(span));
    }
    return true;
}

} // namespace meetinglens::infrastructure
