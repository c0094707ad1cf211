/**
 * @file PipelineConfig.hpp
 * @brief Tunables for the capture, transcription and analysis pipeline.
 */

#pragma once
#include <cstddef>
#include <string>

namespace meetinglens::application {

struct AudioSettings {
    int sampleRate = 16000;
    int captureChunkSamples = 8192;
    double windowSeconds = 3.0; ///< Accumulated audio that triggers a transcription.
    double overlapSeconds = 1.5; ///< Tail carried into the next window.
    double minFlushSeconds = 1.0; ///< Residual audio shorter than this is discarded on stop.
    size_t queueWarnDepth = 64;
    std::string device; ///< Empty selects the system default capture device.
    std::string inputFile; ///< When set, replay this WAV instead of capturing live.
};

/// Energy-based voice activity gate applied before inference.
struct VadSettings {
    bool enabled = true;
    float threshold = 0.005f; ///< Frame RMS at or above this counts as speech (about -46 dBFS).
    int frameMs = 30;
    int minSpeechMs = 250;   ///< Windows with less voiced audio than this are treated as silence.
    int minSilenceMs = 500;  ///< Shorter pauses between speech are kept.
    int speechPadMs = 200;   ///< Audio kept on either side of voiced frames.
};

struct TranscriptionSettings {
    std::string modelPath;
    std::string language = "en";
    int threads = 0;
    int beamSize = 5;
    VadSettings vad;
};

struct AnalysisSettings {
    int wordsPerAnalysis = 50;
    int wordsPerRollingSummary = 300;
    int maxPriorSummaryWords = 1000;
    size_t recentSegmentsForAnalysis = 3;
    size_t recentSegmentsForSummary = 5;
    int finalTranscriptWordCap = 1000;
    size_t dedupLookback = 10;
    size_t priorFindingsInContext = 5;
    float temperature = 0.3f;
    int analysisMaxTokens = 1500;
    int summaryMaxTokens = 200;
    int finalMaxTokens = 2500;
};

struct SessionSettings {
    double joinTimeoutSeconds = 5.0;
    double maxDurationSeconds = 0.0; ///< 0 records until interrupted.
};

struct PipelineConfig {
    AudioSettings audio;
    TranscriptionSettings transcription;
    AnalysisSettings analysis;
    SessionSettings session;
};

} // namespace meetinglens::application
