/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace meetinglens::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

void ReadAudio(const json& j, application::AudioSettings& audio) {
    ReadKey(j, "sample_rate", audio.sampleRate);
    ReadKey(j, "capture_chunk_samples", audio.captureChunkSamples);
    ReadKey(j, "window_seconds", audio.windowSeconds);
    ReadKey(j, "overlap_seconds", audio.overlapSeconds);
    ReadKey(j, "min_flush_seconds", audio.minFlushSeconds);
    ReadKey(j, "queue_warn_depth", audio.queueWarnDepth);
    ReadKey(j, "device", audio.device);
    ReadKey(j, "input_file", audio.inputFile);
}

void ReadTranscription(const json& j, application::TranscriptionSettings& stt) {
    ReadKey(j, "model_path", stt.modelPath);
    ReadKey(j, "language", stt.language);
    ReadKey(j, "threads", stt.threads);
    ReadKey(j, "beam_size", stt.beamSize);
    if (j.contains("vad")) {
        const json& vad = j["vad"];
        ReadKey(vad, "enabled", stt.vad.enabled);
        ReadKey(vad, "threshold", stt.vad.threshold);
        ReadKey(vad, "frame_ms", stt.vad.frameMs);
        ReadKey(vad, "min_speech_ms", stt.vad.minSpeechMs);
        ReadKey(vad, "min_silence_ms", stt.vad.minSilenceMs);
        ReadKey(vad, "speech_pad_ms", stt.vad.speechPadMs);
    }
}

void ReadAnalysis(const json& j, application::AnalysisSettings& analysis) {
    ReadKey(j, "words_per_analysis", analysis.wordsPerAnalysis);
    ReadKey(j, "words_per_rolling_summary", analysis.wordsPerRollingSummary);
    ReadKey(j, "max_prior_summary_words", analysis.maxPriorSummaryWords);
    ReadKey(j, "recent_segments_for_analysis", analysis.recentSegmentsForAnalysis);
    ReadKey(j, "recent_segments_for_summary", analysis.recentSegmentsForSummary);
    ReadKey(j, "final_transcript_word_cap", analysis.finalTranscriptWordCap);
    ReadKey(j, "dedup_lookback", analysis.dedupLookback);
    ReadKey(j, "prior_findings_in_context", analysis.priorFindingsInContext);
    ReadKey(j, "temperature", analysis.temperature);
    ReadKey(j, "analysis_max_tokens", analysis.analysisMaxTokens);
    ReadKey(j, "summary_max_tokens", analysis.summaryMaxTokens);
    ReadKey(j, "final_max_tokens", analysis.finalMaxTokens);
}

void ReadCompletion(const json& j, CompletionSettings& completion) {
    ReadKey(j, "provider", completion.provider);
    ReadKey(j, "host", completion.host);
    ReadKey(j, "port", completion.port);
    ReadKey(j, "model", completion.model);
    ReadKey(j, "base_url", completion.baseUrl);
    ReadKey(j, "api_key_env", completion.apiKeyEnv);
    ReadKey(j, "timeout_seconds", completion.timeoutSeconds);
}

void ReadSession(const json& j, application::SessionSettings& session) {
    ReadKey(j, "join_timeout_seconds", session.joinTimeoutSeconds);
    ReadKey(j, "max_duration_seconds", session.maxDurationSeconds);
}

AppConfig Defaults() {
    AppConfig config;
    config.pipeline.transcription.modelPath = (PathUtils::GetModelsDir() / "ggml-base.bin").string();
    return config;
}

} // namespace

std::optional<AppConfig> ConfigLoader::Parse(const std::string& text, std::string& error) {
    AppConfig config = Defaults();
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            error = "settings must be a JSON object";
            return std::nullopt;
        }
        if (j.contains("audio")) ReadAudio(j["audio"], config.pipeline.audio);
        if (j.contains("transcription")) ReadTranscription(j["transcription"], config.pipeline.transcription);
        if (j.contains("analysis")) ReadAnalysis(j["analysis"], config.pipeline.analysis);
        if (j.contains("completion")) ReadCompletion(j["completion"], config.completion);
        if (j.contains("session")) ReadSession(j["session"], config.pipeline.session);
    } catch (const json::exception& e) {
        error = e.what();
        return std::nullopt;
    }
    return config;
}

AppConfig ConfigLoader::Load(const std::string& explicitPath) {
    namespace fs = std::filesystem;

    std::vector<fs::path> candidates;
    if (!explicitPath.empty()) {
        candidates.emplace_back(explicitPath);
    } else {
        candidates.push_back(PathUtils::GetConfigHome() / "MeetingLens" / "settings.json");
        candidates.push_back(fs::current_path() / "settings.json");
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            if (!explicitPath.empty()) {
                std::cerr << "[ConfigLoader] " << path.string() << " not found; using defaults." << std::endl;
            }
            continue;
        }

        std::ifstream f(path);
        std::stringstream buffer;
        buffer << f.rdbuf();

        std::string error;
        auto parsed = Parse(buffer.str(), error);
        if (!parsed) {
            std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << error
                      << ". Using defaults." << std::endl;
            return Defaults();
        }
        parsed->sourcePath = path.string();
        std::cout << "[ConfigLoader] Loaded " << path.string() << std::endl;
        return *parsed;
    }
    return Defaults();
}

std::string ConfigLoader::ResolveApiKey(const CompletionSettings& settings) {
    if (settings.apiKeyEnv.empty()) return "";
    const char* value = std::getenv(settings.apiKeyEnv.c_str());
    return (value && *value) ? std::string(value) : std::string();
}

} // namespace meetinglens::infrastructure
