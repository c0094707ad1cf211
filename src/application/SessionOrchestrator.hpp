/**
 * @file SessionOrchestrator.hpp
 * @brief Owns the capture session lifecycle and the processing context.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "application/PipelineConfig.hpp"
#include "domain/AnalysisResult.hpp"
#include "domain/AudioSource.hpp"
#include "domain/CompletionService.hpp"
#include "domain/Session.hpp"
#include "domain/TranscriptionService.hpp"

namespace meetinglens::application {

enum class OutcomeCode {
    Ok,
    AlreadyRecording,
    NotRecording,
    StopInProgress,
    NoSpeechCaptured,
    CaptureFailed
};

/**
 * @struct Outcome
 * @brief Result of a lifecycle request, with a message suitable for display.
 */
struct Outcome {
    OutcomeCode code = OutcomeCode::Ok;
    std::string message;

    bool ok() const { return code == OutcomeCode::Ok; }
};

/**
 * @struct SessionSnapshot
 * @brief Point-in-time view of the current (or most recent) session.
 */
struct SessionSnapshot {
    domain::SessionState state = domain::SessionState::Idle;
    std::string sessionId;
    int wordCount = 0;
    size_t segmentCount = 0;
    double durationSeconds = 0.0;
    size_t summaryCount = 0;
    size_t analysisPasses = 0;
    size_t issuesIdentified = 0;
    size_t recommendationsGiven = 0;
    uint64_t windowsTranscribed = 0;
    uint64_t windowsDropped = 0;
    size_t queueDepth = 0;
    size_t queueHighWater = 0;
    std::string lastError;
};

/**
 * @class SessionOrchestrator
 * @brief Idle -> Recording -> Stopping -> Idle.
 *
 * start() builds a fresh ledger, window assembler and summarizer, starts the
 * audio source (capture context) and a processing thread. The two only share
 * the capture queue. stop() drains the queue, flushes the assembler, waits a
 * bounded time for the processing thread, and produces the final report.
 * A processing thread that does not finish in time is abandoned: it keeps its
 * own reference to the session state and never ingests again.
 */
class SessionOrchestrator {
public:
    /**
     * @throws std::invalid_argument if the audio window configuration is inconsistent.
     */
    SessionOrchestrator(std::shared_ptr<domain::AudioSource> source,
                        std::shared_ptr<domain::TranscriptionService> transcriber,
                        std::shared_ptr<domain::CompletionService> ai,
                        PipelineConfig config);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /** @brief Starts a new session. Rejected unless Idle. */
    Outcome start();

    /** @brief Ends the session and generates the final report. Idempotent. */
    Outcome stop();

    /** @brief Latest successful incremental analysis of the current or last session. */
    std::optional<domain::AnalysisResult> currentAnalysis() const;

    /** @brief Final report of the last completed session, if one was produced. */
    std::optional<domain::AnalysisResult> finalReport() const;

    SessionSnapshot sessionState() const;

    /** @brief All transcript segments of the current or last session, joined. */
    std::string transcriptText() const;

    /** @brief Why the last session ended abnormally or failed to start; empty otherwise. */
    std::string lastError() const;

    /** @brief True when a finite source (file replay) has delivered all its audio. */
    bool sourceExhausted() const;

private:
    struct SessionRuntime;

    bool reconcileCaptureFailureLocked() const;
    static std::string MakeSessionId();

    std::shared_ptr<domain::AudioSource> m_source;
    std::shared_ptr<domain::TranscriptionService> m_transcriber;
    std::shared_ptr<domain::CompletionService> m_ai;
    PipelineConfig m_config;

    // Mutable so that const snapshot accessors can fold in a capture failure.
    mutable std::mutex m_mutex;
    mutable domain::Session m_session;
    mutable std::shared_ptr<SessionRuntime> m_runtime;
    mutable std::thread m_worker;
    mutable std::string m_lastError;
};

} // namespace meetinglens::application
