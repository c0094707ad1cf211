/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include <sstream>

namespace meetinglens::application {

namespace {

std::string Join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += " ";
        out += part;
    }
    return out;
}

} // namespace

std::string AnalysisContextBundle::render() const {
    std::stringstream ss;

    ss << "MEETING METADATA:\n"
       << "- Duration: " << durationMinutes << " minutes\n"
       << "- Total words: " << totalWords << "\n"
       << "- Type: IT Technical Discussion\n";

    if (!previousIssues.empty()) {
        ss << "\n--- PREVIOUSLY IDENTIFIED ISSUES (DON'T REPEAT) ---\n";
        for (const auto& issue : previousIssues) {
            ss << "- " << issue << "\n";
        }
    }

    if (!previousRecommendations.empty()) {
        ss << "\n--- PREVIOUS RECOMMENDATIONS (DON'T REPEAT) ---\n";
        for (const auto& rec : previousRecommendations) {
            ss << "- " << rec << "\n";
        }
    }

    if (!summaries.empty()) {
        ss << "\n--- PREVIOUS DISCUSSION (SUMMARIES) ---\n";
        for (size_t i = 0; i < summaries.size(); ++i) {
            ss << "\nPhase " << (i + 1) << ":\n" << summaries[i].text << "\n";
        }
    }

    if (!recentSegments.empty()) {
        ss << "\n--- CURRENT DISCUSSION ---\n" << Join(recentSegments) << "\n";
    }

    return ss.str();
}

std::string FinalContextBundle::render() const {
    std::stringstream ss;

    ss << "MEETING COMPLETED - FINAL ANALYSIS\n"
       << "Duration: " << durationMinutes << " minutes\n"
       << "Total words: " << totalWords << "\n";

    if (!summaries.empty()) {
        ss << "\n--- MEETING PROGRESSION ---\n";
        for (size_t i = 0; i < summaries.size(); ++i) {
            ss << "\nPhase " << (i + 1) << ":\n" << summaries[i].text << "\n";
        }
    }

    if (transcriptTruncated) {
        ss << "\n--- RECENT TRANSCRIPT (LAST " << transcriptWordCap << " WORDS) ---\n";
    } else {
        ss << "\n--- FULL TRANSCRIPT ---\n";
    }
    ss << transcript << "\n";

    return ss.str();
}

ContextAssembler::ContextAssembler(const domain::TranscriptLedger& ledger,
                                   const domain::RollingSummaryStore& summaries,
                                   const FindingHistory& issues,
                                   const FindingHistory& recommendations,
                                   const AnalysisSettings& settings)
    : m_ledger(ledger)
    , m_summaries(summaries)
    , m_issues(issues)
    , m_recommendations(recommendations)
    , m_settings(settings) {}

AnalysisContextBundle ContextAssembler::assembleAnalysis(int durationMinutes, int totalWords) const {
    AnalysisContextBundle bundle;
    bundle.durationMinutes = durationMinutes;
    bundle.totalWords = totalWords;
    bundle.previousIssues = m_issues.recent(m_settings.priorFindingsInContext);
    bundle.previousRecommendations = m_recommendations.recent(m_settings.priorFindingsInContext);
    bundle.summaries = m_summaries.entries();
    bundle.recentSegments = m_ledger.recentTexts(m_settings.recentSegmentsForAnalysis);
    return bundle;
}

FinalContextBundle ContextAssembler::assembleFinal(int durationMinutes, int totalWords) const {
    FinalContextBundle bundle;
    bundle.durationMinutes = durationMinutes;
    bundle.totalWords = totalWords;
    bundle.summaries = m_summaries.entries();
    bundle.transcriptWordCap = m_settings.finalTranscriptWordCap;
    bundle.transcript = LastWords(m_ledger.fullText(), m_settings.finalTranscriptWordCap, bundle.transcriptTruncated);
    return bundle;
}

std::string ContextAssembler::assembleCompressionInput() const {
    return Join(m_ledger.recentTexts(m_settings.recentSegmentsForSummary));
}

std::string ContextAssembler::LastWords(const std::string& text, int maxWords, bool& truncated) {
    std::istringstream ss(text);
    std::vector<std::string> words;
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }

    truncated = maxWords >= 0 && words.size() > static_cast<size_t>(maxWords);
    if (!truncated) {
        return Join(words);
    }
    return Join(std::vector<std::string>(words.end() - maxWords, words.end()));
}

} // namespace meetinglens::application
