/**
 * @file ContextAssembler.hpp
 * @brief Builds the bounded-size prompts sent for analysis and for the final report.
 */

#pragma once
#include <string>
#include <vector>
#include "application/FindingHistory.hpp"
#include "application/PipelineConfig.hpp"
#include "domain/RollingSummary.hpp"
#include "domain/Transcript.hpp"

namespace meetinglens::application {

/**
 * @struct AnalysisContextBundle
 * @brief A value object with the labeled blocks of one incremental analysis prompt.
 */
struct AnalysisContextBundle {
    int durationMinutes = 0;
    int totalWords = 0;
    std::vector<std::string> previousIssues;
    std::vector<std::string> previousRecommendations;
    std::vector<domain::RollingSummary> summaries;
    std::vector<std::string> recentSegments;

    /** @brief Renders the bundle into the user message. */
    std::string render() const;
};

/**
 * @struct FinalContextBundle
 * @brief Blocks of the end-of-session prompt: every retained summary plus the (capped) transcript.
 */
struct FinalContextBundle {
    int durationMinutes = 0;
    int totalWords = 0;
    std::vector<domain::RollingSummary> summaries;
    std::string transcript;
    bool transcriptTruncated = false;
    int transcriptWordCap = 0;

    std::string render() const;
};

/**
 * @class ContextAssembler
 * @brief Gathers context from the ledger, the summary store and the finding histories.
 */
class ContextAssembler {
public:
    ContextAssembler(const domain::TranscriptLedger& ledger,
                     const domain::RollingSummaryStore& summaries,
                     const FindingHistory& issues,
                     const FindingHistory& recommendations,
                     const AnalysisSettings& settings);

    AnalysisContextBundle assembleAnalysis(int durationMinutes, int totalWords) const;

    FinalContextBundle assembleFinal(int durationMinutes, int totalWords) const;

    /** @brief Text of the newest segments, joined, for rolling-summary compression. */
    std::string assembleCompressionInput() const;

    /** @brief Keeps only the last @p maxWords words of @p text. */
    static std::string LastWords(const std::string& text, int maxWords, bool& truncated);

private:
    const domain::TranscriptLedger& m_ledger;
    const domain::RollingSummaryStore& m_summaries;
    const FindingHistory& m_issues;
    const FindingHistory& m_recommendations;
    const AnalysisSettings& m_settings;
};

} // namespace meetinglens::application
