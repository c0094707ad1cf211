/**
 * @file ProgressiveSummarizer.hpp
 * @brief Word-count driven incremental analysis with a rolling compressed context.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/ContextAssembler.hpp"
#include "application/FindingHistory.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/AnalysisResult.hpp"
#include "domain/CompletionService.hpp"
#include "domain/RollingSummary.hpp"
#include "domain/Transcript.hpp"

namespace meetinglens::application {

/**
 * @struct SummarizerStats
 * @brief Counters exposed to the presentation layer.
 */
struct SummarizerStats {
    int totalWords = 0;
    int lastAnalysisWordCount = 0;
    int lastSummaryWordCount = 0;
    size_t summaryCount = 0;
    int summaryWords = 0;
    size_t analysisPasses = 0;
    size_t failedPasses = 0;
    size_t compressionPasses = 0;
    size_t issuesIdentified = 0;
    size_t recommendationsGiven = 0;
};

/**
 * @class ProgressiveSummarizer
 * @brief Consumes transcript segments and keeps an up-to-date structured analysis.
 *
 * One instance per session. ingest() and finalize() are serialized by an
 * internal lock, so at most one completion call is in flight. Accessors read
 * a published snapshot and never wait on that lock.
 */
class ProgressiveSummarizer {
public:
    enum class State {
        Idle,       ///< No words ingested yet.
        Active,     ///< Tracking word counts.
        Finalizing, ///< Final report in progress.
        Finished    ///< Final report produced; further ingest is ignored.
    };

    ProgressiveSummarizer(const domain::TranscriptLedger& ledger,
                          std::shared_ptr<domain::CompletionService> ai,
                          AnalysisSettings settings,
                          std::chrono::steady_clock::time_point sessionStart = std::chrono::steady_clock::now());

    /**
     * @brief Accounts for a new segment and runs compression and/or analysis when due.
     * @return The analysis produced by this call (possibly the error-shaped fallback),
     *         or nullopt when no analysis pass was due.
     */
    std::optional<domain::AnalysisResult> ingest(const domain::TranscriptSegment& segment);

    /**
     * @brief Produces the end-of-session report. Runs at most once; later calls return the same report.
     */
    domain::AnalysisResult finalize();

    /**
     * @brief Like finalize(), but waits at most @p maxWait for an in-flight pass.
     *
     * If the pass lock cannot be taken in time, the session is closed with an
     * error-shaped final report and whatever the stuck pass produces later is
     * discarded.
     */
    domain::AnalysisResult finalize(std::chrono::milliseconds maxWait);

    std::optional<domain::AnalysisResult> currentAnalysis() const;
    std::optional<domain::AnalysisResult> finalReport() const;
    SummarizerStats stats() const;
    State state() const;

    std::vector<domain::RollingSummary> rollingSummaries() const;

private:
    domain::AnalysisResult finalizeHeld();
    void createRollingSummary();
    domain::AnalysisResult runAnalysis();
    std::optional<domain::AnalysisResult> requestStructured(const std::string& systemPrompt,
                                                            const std::string& context,
                                                            int maxTokens,
                                                            const std::string& defaultOverview,
                                                            std::string& error);
    int elapsedMinutes() const;

    std::shared_ptr<domain::CompletionService> m_ai;
    AnalysisSettings m_settings;
    std::chrono::steady_clock::time_point m_sessionStart;

    // Processing-context state (guarded by m_passMutex).
    domain::RollingSummaryStore m_summaries;
    FindingHistory m_previousIssues;
    FindingHistory m_previousRecommendations;
    ContextAssembler m_assembler;
    int m_totalWords = 0;
    int m_lastAnalysisWordCount = 0;
    int m_lastSummaryWordCount = 0;
    std::timed_mutex m_passMutex;

    // Published snapshot (guarded by m_stateMutex).
    mutable std::mutex m_stateMutex;
    State m_state = State::Idle;
    std::optional<domain::AnalysisResult> m_current;
    std::optional<domain::AnalysisResult> m_final;
    SummarizerStats m_stats;
    std::vector<domain::RollingSummary> m_publishedSummaries;
};

} // namespace meetinglens::application
