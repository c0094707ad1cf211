/**
 * @file ProgressiveSummarizer.cpp
 * @brief Implementation of the ProgressiveSummarizer class.
 */

#include "application/ProgressiveSummarizer.hpp"
#include "application/AnalysisParser.hpp"
#include "application/PromptCatalog.hpp"
#include <exception>
#include <iostream>

namespace meetinglens::application {

namespace {

const char* kIncrementalOverviewDefault = "No technical discussion detected yet";
const char* kFinalOverviewDefault = "No technical analysis available";

} // namespace

ProgressiveSummarizer::ProgressiveSummarizer(const domain::TranscriptLedger& ledger,
                                             std::shared_ptr<domain::CompletionService> ai,
                                             AnalysisSettings settings,
                                             std::chrono::steady_clock::time_point sessionStart)
    : m_ai(std::move(ai))
    , m_settings(settings)
    , m_sessionStart(sessionStart)
    , m_summaries(settings.maxPriorSummaryWords)
    , m_previousIssues(settings.dedupLookback)
    , m_previousRecommendations(settings.dedupLookback)
    , m_assembler(ledger, m_summaries, m_previousIssues, m_previousRecommendations, m_settings) {}

std::optional<domain::AnalysisResult> ProgressiveSummarizer::ingest(const domain::TranscriptSegment& segment) {
    std::lock_guard<std::timed_mutex> pass(m_passMutex);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == State::Finalizing || m_state == State::Finished) {
            std::cerr << "[ProgressiveSummarizer] Ignoring segment " << segment.sequenceIndex
                      << " received after finalization." << std::endl;
            return std::nullopt;
        }
        m_state = State::Active;
    }

    m_totalWords += segment.wordCount;

    if (m_totalWords - m_lastSummaryWordCount >= m_settings.wordsPerRollingSummary) {
        createRollingSummary();
        m_lastSummaryWordCount = m_totalWords;
    }

    std::optional<domain::AnalysisResult> produced;
    if (m_totalWords - m_lastAnalysisWordCount >= m_settings.wordsPerAnalysis && state() != State::Finished) {
        std::cout << "[ProgressiveSummarizer] Analyzing (" << m_totalWords << " total words)..." << std::endl;
        produced = runAnalysis();
        m_lastAnalysisWordCount = m_totalWords;
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_state == State::Finished) {
        return std::nullopt;
    }
    m_stats.totalWords = m_totalWords;
    m_stats.lastAnalysisWordCount = m_lastAnalysisWordCount;
    m_stats.lastSummaryWordCount = m_lastSummaryWordCount;
    m_stats.summaryCount = m_summaries.size();
    m_stats.summaryWords = m_summaries.totalWords();
    m_stats.issuesIdentified = m_previousIssues.size();
    m_stats.recommendationsGiven = m_previousRecommendations.size();
    return produced;
}

void ProgressiveSummarizer::createRollingSummary() {
    std::cout << "[ProgressiveSummarizer] Creating rolling summary..." << std::endl;

    domain::CompletionRequest request;
    request.systemInstruction = PromptCatalog::GetCompressionPrompt();
    request.userContent = m_assembler.assembleCompressionInput();
    request.shape = domain::ResponseShape::FreeText;
    request.maxOutputTokens = m_settings.summaryMaxTokens;
    request.temperature = m_settings.temperature;

    std::optional<std::string> summary;
    try {
        summary = m_ai->complete(request);
    } catch (const std::exception& e) {
        std::cerr << "[ProgressiveSummarizer] Rolling summary error: " << e.what() << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        ++m_stats.compressionPasses;
    }

    if (!summary || domain::CountWords(*summary) == 0) {
        std::cerr << "[ProgressiveSummarizer] Rolling summary skipped: no usable reply." << std::endl;
        return;
    }

    size_t evicted = m_summaries.add(*summary);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_publishedSummaries = m_summaries.entries();
    }
    if (evicted > 0) {
        std::cout << "[ProgressiveSummarizer] Trimmed " << evicted << " old summar"
                  << (evicted == 1 ? "y" : "ies") << " to stay within "
                  << m_summaries.maxTotalWords() << " words." << std::endl;
    }
    std::cout << "[ProgressiveSummarizer] Rolling summary created (" << m_summaries.size() << " total)" << std::endl;
}

domain::AnalysisResult ProgressiveSummarizer::runAnalysis() {
    AnalysisContextBundle bundle = m_assembler.assembleAnalysis(elapsedMinutes(), m_totalWords);

    std::string error;
    auto parsed = requestStructured(PromptCatalog::GetAnalysisPrompt(), bundle.render(),
                                    m_settings.analysisMaxTokens, kIncrementalOverviewDefault, error);

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_state == State::Finished) {
        // The session was closed while this call was outstanding.
        std::cerr << "[ProgressiveSummarizer] Discarding analysis that completed after finalization." << std::endl;
        return parsed ? *parsed : domain::AnalysisResult::Error(error);
    }
    ++m_stats.analysisPasses;
    if (!parsed) {
        ++m_stats.failedPasses;
        std::cerr << "[ProgressiveSummarizer] Analysis failed: " << error << std::endl;
        return domain::AnalysisResult::Error(error);
    }

    domain::AnalysisResult result = *parsed;
    result.potentialIssues = m_previousIssues.filterNew(result.potentialIssues);
    result.recommendations = m_previousRecommendations.filterNew(result.recommendations);
    m_previousIssues.record(result.potentialIssues);
    m_previousRecommendations.record(result.recommendations);

    m_current = result;
    return result;
}

domain::AnalysisResult ProgressiveSummarizer::finalize() {
    std::lock_guard<std::timed_mutex> pass(m_passMutex);
    return finalizeHeld();
}

domain::AnalysisResult ProgressiveSummarizer::finalize(std::chrono::milliseconds maxWait) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_final) {
            return *m_final;
        }
    }

    std::unique_lock<std::timed_mutex> pass(m_passMutex, std::defer_lock);
    if (!pass.try_lock_for(maxWait)) {
        std::cerr << "[ProgressiveSummarizer] A completion call is still outstanding after "
                  << maxWait.count() << " ms; closing without a final report." << std::endl;
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_final) {
            m_final = domain::AnalysisResult::Error(
                "Final report skipped: an analysis call was still in progress when the session stopped", true);
            m_state = State::Finished;
        }
        return *m_final;
    }
    return finalizeHeld();
}

// Caller holds m_passMutex.
domain::AnalysisResult ProgressiveSummarizer::finalizeHeld() {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_final) {
            return *m_final;
        }
        m_state = State::Finalizing;
    }

    std::cout << "[ProgressiveSummarizer] Generating final comprehensive report..." << std::endl;
    FinalContextBundle bundle = m_assembler.assembleFinal(elapsedMinutes(), m_totalWords);

    std::string error;
    auto parsed = requestStructured(PromptCatalog::GetFinalReportPrompt(), bundle.render(),
                                    m_settings.finalMaxTokens, kFinalOverviewDefault, error);

    domain::AnalysisResult report;
    if (parsed) {
        report = *parsed;
        report.isFinal = true;
        std::cout << "[ProgressiveSummarizer] Final report generated." << std::endl;
    } else {
        std::cerr << "[ProgressiveSummarizer] Final report failed: " << error << std::endl;
        report = domain::AnalysisResult::Error(error, true);
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_final = report;
    m_state = State::Finished;
    return report;
}

std::optional<domain::AnalysisResult> ProgressiveSummarizer::requestStructured(const std::string& systemPrompt,
                                                                               const std::string& context,
                                                                               int maxTokens,
                                                                               const std::string& defaultOverview,
                                                                               std::string& error) {
    domain::CompletionRequest request;
    request.systemInstruction = systemPrompt;
    request.userContent = context;
    request.shape = domain::ResponseShape::JsonObject;
    request.maxOutputTokens = maxTokens;
    request.temperature = m_settings.temperature;

    std::optional<std::string> reply;
    try {
        reply = m_ai->complete(request);
    } catch (const std::exception& e) {
        error = e.what();
        return std::nullopt;
    }

    if (!reply) {
        error = "Completion service returned no response";
        return std::nullopt;
    }

    auto parsed = AnalysisParser::Parse(*reply, defaultOverview, error);
    if (!parsed) {
        std::cerr << "[ProgressiveSummarizer] Unparseable reply: " << reply->substr(0, 200) << std::endl;
    }
    return parsed;
}

int ProgressiveSummarizer::elapsedMinutes() const {
    auto elapsed = std::chrono::steady_clock::now() - m_sessionStart;
    return static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(elapsed).count());
}

std::optional<domain::AnalysisResult> ProgressiveSummarizer::currentAnalysis() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_current;
}

std::optional<domain::AnalysisResult> ProgressiveSummarizer::finalReport() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_final;
}

SummarizerStats ProgressiveSummarizer::stats() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_stats;
}

ProgressiveSummarizer::State ProgressiveSummarizer::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

std::vector<domain::RollingSummary> ProgressiveSummarizer::rollingSummaries() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_publishedSummaries;
}

} // namespace meetinglens::application
