/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the system instructions sent to the completion service.
 */

#pragma once

#include <string>

namespace meetinglens::application {

class PromptCatalog {
public:
    /** @brief Instruction for incremental analysis passes (JSON object reply). */
    static std::string GetAnalysisPrompt();

    /** @brief Instruction for the end-of-session report (JSON object reply). */
    static std::string GetFinalReportPrompt();

    /** @brief Short instruction for rolling-summary compression (free text reply). */
    static std::string GetCompressionPrompt();
};

} // namespace meetinglens::application
