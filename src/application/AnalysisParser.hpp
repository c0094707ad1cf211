/**
 * @file AnalysisParser.hpp
 * @brief Converts raw model output into a fixed-shape AnalysisResult.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/AnalysisResult.hpp"

namespace meetinglens::application {

class AnalysisParser {
public:
    /**
     * @brief Parses a JSON object reply.
     *
     * Missing list fields become empty and a missing overview gets
     * @p defaultOverview. The reply is rejected when it is not a JSON object or
     * carries none of the known fields.
     *
     * @param raw Model output; a surrounding markdown code fence is tolerated.
     * @param defaultOverview Fill text for a missing "technical_analysis".
     * @param error Populated on rejection.
     */
    static std::optional<domain::AnalysisResult> Parse(const std::string& raw,
                                                       const std::string& defaultOverview,
                                                       std::string& error);
};

} // namespace meetinglens::application
