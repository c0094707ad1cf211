/**
 * @file SessionOrchestrator.cpp
 * @brief Implementation of SessionOrchestrator.
 */

#include "application/SessionOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "application/CaptureQueue.hpp"
#include "application/ProgressiveSummarizer.hpp"
#include "application/SpeechFilter.hpp"
#include "application/TranscriptionWorker.hpp"
#include "application/WindowAssembler.hpp"
#include "domain/Transcript.hpp"

namespace meetinglens::application {

/**
 * @brief Everything a single session owns.
 *
 * Shared between the orchestrator and the processing thread so that an
 * abandoned thread never outlives the objects it touches.
 */
struct SessionOrchestrator::SessionRuntime {
    SessionRuntime(std::shared_ptr<domain::AudioSource> src,
                   std::shared_ptr<domain::TranscriptionService> stt,
                   std::shared_ptr<domain::CompletionService> ai,
                   const PipelineConfig& config,
                   std::chrono::steady_clock::time_point sessionStart)
        : source(std::move(src)),
          transcriber(std::move(stt)),
          queue(config.audio.queueWarnDepth),
          assembler(config.audio.sampleRate, config.audio.windowSeconds,
                    config.audio.overlapSeconds, config.audio.minFlushSeconds),
          worker(*transcriber, ledger, config.transcription.language,
                 SpeechFilter(config.transcription.vad, config.audio.sampleRate)),
          summarizer(ledger, std::move(ai), config.analysis, sessionStart),
          finished(done.get_future()) {}

    void failCapture(const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            captureError = error;
        }
        captureFailed = true;
    }

    std::string captureFailure() const {
        std::lock_guard<std::mutex> lock(errorMutex);
        return captureError;
    }

    std::shared_ptr<domain::AudioSource> source;
    std::shared_ptr<domain::TranscriptionService> transcriber;
    domain::TranscriptLedger ledger;
    CaptureQueue queue;
    WindowAssembler assembler; ///< Touched only by the processing thread.
    TranscriptionWorker worker;
    ProgressiveSummarizer summarizer;

    std::promise<void> done;
    std::future<void> finished;
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> abandoned{false};
    std::atomic<bool> captureFailed{false};
    mutable std::mutex errorMutex;
    std::string captureError;
};

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(500);

template <typename RuntimePtr>
void HandleWindow(const RuntimePtr& rt, std::optional<domain::AudioWindow> window) {
    if (!window || rt->abandoned) {
        return;
    }
    auto segment = rt->worker.transcribe(*window);
    if (segment && !rt->abandoned) {
        rt->summarizer.ingest(*segment);
    }
}

// Processing context. Runs until the queue is closed and drained, or until
// the source reports a failure.
template <typename RuntimePtr>
void RunProcessingLoop(RuntimePtr rt) {
    domain::AudioChunk chunk;
    while (true) {
        auto status = rt->queue.popFor(chunk, kPollInterval);
        if (status == CaptureQueue::PopStatus::Closed) {
            break;
        }
        if (status == CaptureQueue::PopStatus::Timeout) {
            std::string error;
            if (!rt->stopRequested && !rt->source->isHealthy(error)) {
                std::cerr << "[Session] Audio capture failed: " << error << std::endl;
                rt->failCapture(error);
                break;
            }
            continue;
        }
        HandleWindow(rt, rt->assembler.append(chunk));
    }

    if (!rt->captureFailed) {
        HandleWindow(rt, rt->assembler.flush());
    }
    rt->done.set_value();
}

} // namespace

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<domain::AudioSource> source,
                                         std::shared_ptr<domain::TranscriptionService> transcriber,
                                         std::shared_ptr<domain::CompletionService> ai,
                                         PipelineConfig config)
    : m_source(std::move(source)),
      m_transcriber(std::move(transcriber)),
      m_ai(std::move(ai)),
      m_config(std::move(config)) {
    if (!m_source || !m_transcriber || !m_ai) {
        throw std::invalid_argument("SessionOrchestrator requires a source, a transcriber and a completion service");
    }
    if (m_source->sampleRate() != m_config.audio.sampleRate) {
        throw std::invalid_argument("Audio source delivers " + std::to_string(m_source->sampleRate()) +
                                    " Hz but the pipeline is configured for " +
                                    std::to_string(m_config.audio.sampleRate) + " Hz");
    }
    // Reject a bad window layout now rather than on the first start().
    WindowAssembler layout(m_config.audio.sampleRate, m_config.audio.windowSeconds,
                           m_config.audio.overlapSeconds, m_config.audio.minFlushSeconds);
    SpeechFilter filter(m_config.transcription.vad, m_config.audio.sampleRate);
    (void)layout;
    (void)filter;
}

SessionOrchestrator::~SessionOrchestrator() {
    bool recording = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        reconcileCaptureFailureLocked();
        recording = m_session.state == domain::SessionState::Recording;
    }
    if (recording) {
        stop();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::string SessionOrchestrator::MakeSessionId() {
    static std::atomic<unsigned> counter{0};
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S") << "-" << counter.fetch_add(1);
    return oss.str();
}

bool SessionOrchestrator::reconcileCaptureFailureLocked() const {
    if (!m_runtime || m_session.state != domain::SessionState::Recording || !m_runtime->captureFailed) {
        return false;
    }
    m_source->stop();
    m_runtime->queue.close();
    // The loop sets the failure flag right before it exits.
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_lastError = m_runtime->captureFailure();
    m_session.state = domain::SessionState::Idle;
    m_session.endedAt = std::chrono::steady_clock::now();
    m_session.ended = true;
    return true;
}

Outcome SessionOrchestrator::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    reconcileCaptureFailureLocked();

    if (m_session.state == domain::SessionState::Recording) {
        return {OutcomeCode::AlreadyRecording, "Already recording."};
    }
    if (m_session.state == domain::SessionState::Stopping) {
        return {OutcomeCode::StopInProgress, "The previous session is still stopping."};
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }

    domain::Session session;
    session.id = MakeSessionId();
    session.startTime = std::chrono::system_clock::now();
    session.startedAt = std::chrono::steady_clock::now();

    auto runtime = std::make_shared<SessionRuntime>(m_source, m_transcriber, m_ai, m_config, session.startedAt);
    std::thread worker([runtime]() { RunProcessingLoop(runtime); });

    std::string error;
    bool started = m_source->start(
        [runtime](std::vector<int16_t>&& samples) { runtime->queue.push(std::move(samples)); },
        error);
    if (!started) {
        runtime->stopRequested = true;
        runtime->queue.close();
        worker.join();
        m_lastError = error;
        std::cerr << "[Session] Could not start audio capture: " << error << std::endl;
        return {OutcomeCode::CaptureFailed, "Could not start audio capture: " + error};
    }

    m_session = session;
    m_session.state = domain::SessionState::Recording;
    m_runtime = runtime;
    m_worker = std::move(worker);
    m_lastError.clear();

    std::cout << "[Session] Recording started (" << m_session.id << ")." << std::endl;
    return {OutcomeCode::Ok, "Recording started."};
}

Outcome SessionOrchestrator::stop() {
    std::shared_ptr<SessionRuntime> runtime;
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (reconcileCaptureFailureLocked()) {
            return {OutcomeCode::CaptureFailed, "Recording ended because audio capture failed: " + m_lastError};
        }
        if (m_session.state == domain::SessionState::Idle) {
            return {OutcomeCode::NotRecording, "Not recording."};
        }
        if (m_session.state == domain::SessionState::Stopping) {
            return {OutcomeCode::StopInProgress, "Stop already in progress."};
        }
        m_session.state = domain::SessionState::Stopping;
        runtime = m_runtime;
        worker = std::move(m_worker);
    }

    std::cout << "[Session] Stopping; draining buffered audio..." << std::endl;
    runtime->stopRequested = true;
    m_source->stop();
    runtime->queue.close();

    // One budget covers both the join and the wait for the summarizer's pass lock.
    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(m_config.session.joinTimeoutSeconds));
    bool joined = runtime->finished.wait_until(deadline) == std::future_status::ready;
    if (joined) {
        worker.join();
    } else {
        std::cerr << "[Session] Processing did not finish within "
                  << m_config.session.joinTimeoutSeconds << "s; abandoning it." << std::endl;
        runtime->abandoned = true;
        worker.detach();
    }

    Outcome outcome;
    if (runtime->ledger.segmentCount() == 0) {
        std::cout << "[Session] No speech was transcribed; skipping the final report." << std::endl;
        outcome = {OutcomeCode::NoSpeechCaptured,
                   "No transcripts recorded. Make sure someone spoke during the recording."};
    } else {
        // An abandoned worker may still hold the summarizer inside a completion call.
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto report = joined
            ? runtime->summarizer.finalize()
            : runtime->summarizer.finalize(std::max(remaining, std::chrono::milliseconds(0)));
        outcome = report.isError
            ? Outcome{OutcomeCode::Ok, "Recording stopped; the final report failed: " + report.technicalAnalysis}
            : Outcome{OutcomeCode::Ok, "Recording stopped; final report generated."};
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_session.state = domain::SessionState::Idle;
    m_session.endedAt = std::chrono::steady_clock::now();
    m_session.ended = true;
    std::cout << "[Session] Session " << m_session.id << " ended after "
              << static_cast<int>(m_session.durationSeconds()) << "s." << std::endl;
    return outcome;
}

std::optional<domain::AnalysisResult> SessionOrchestrator::currentAnalysis() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_runtime) return std::nullopt;
    return m_runtime->summarizer.currentAnalysis();
}

std::optional<domain::AnalysisResult> SessionOrchestrator::finalReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_runtime) return std::nullopt;
    return m_runtime->summarizer.finalReport();
}

SessionSnapshot SessionOrchestrator::sessionState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    reconcileCaptureFailureLocked();

    SessionSnapshot snapshot;
    snapshot.state = m_session.state;
    snapshot.sessionId = m_session.id;
    snapshot.durationSeconds = m_session.durationSeconds();
    snapshot.lastError = m_lastError;
    if (m_runtime) {
        auto stats = m_runtime->summarizer.stats();
        snapshot.wordCount = m_runtime->ledger.totalWords();
        snapshot.segmentCount = m_runtime->ledger.segmentCount();
        snapshot.summaryCount = stats.summaryCount;
        snapshot.analysisPasses = stats.analysisPasses;
        snapshot.issuesIdentified = stats.issuesIdentified;
        snapshot.recommendationsGiven = stats.recommendationsGiven;
        snapshot.windowsTranscribed = m_runtime->worker.windowsTranscribed();
        snapshot.windowsDropped = m_runtime->worker.windowsDropped();
        snapshot.queueDepth = m_runtime->queue.size();
        snapshot.queueHighWater = m_runtime->queue.highWaterMark();
    }
    return snapshot;
}

std::string SessionOrchestrator::transcriptText() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_runtime) return "";
    return m_runtime->ledger.fullText();
}

std::string SessionOrchestrator::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    reconcileCaptureFailureLocked();
    return m_lastError;
}

bool SessionOrchestrator::sourceExhausted() const {
    return m_source->isExhausted();
}

} // namespace meetinglens::application
