/**
 * @file AnalysisResult.hpp
 * @brief Fixed-shape structured insight produced by each analysis pass.
 */

#pragma once
#include <string>
#include <vector>

namespace meetinglens::domain {

/**
 * @struct AnalysisResult
 * @brief One snapshot of the model's view of the conversation.
 */
struct AnalysisResult {
    std::string technicalAnalysis; ///< Short free-text overview of the discussion.
    std::vector<std::string> potentialIssues;
    std::vector<std::string> recommendations;
    std::vector<std::string> clarifyingQuestions;
    std::vector<std::string> actionItems;
    std::vector<std::string> keyDecisions;
    bool isError = false; ///< True for the fallback produced when a pass failed.
    bool isFinal = false; ///< True for the end-of-session report.

    /** @brief The fallback returned whenever a completion call or its parsing fails. */
    static AnalysisResult Error(const std::string& description, bool final = false) {
        AnalysisResult result;
        result.technicalAnalysis = "Error: " + description;
        result.isError = true;
        result.isFinal = final;
        return result;
    }
};

} // namespace meetinglens::domain
