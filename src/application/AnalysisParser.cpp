/**
 * @file AnalysisParser.cpp
 * @brief Implementation of AnalysisParser.
 */

#include "application/AnalysisParser.hpp"
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace meetinglens::application {

namespace {

std::string StripCodeFence(const std::string& raw) {
    size_t begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos || raw.compare(begin, 3, "```") != 0) {
        return raw;
    }
    size_t bodyStart = raw.find('\n', begin);
    size_t fenceEnd = raw.rfind("```");
    if (bodyStart == std::string::npos || fenceEnd == std::string::npos || fenceEnd <= bodyStart) {
        return raw;
    }
    return raw.substr(bodyStart + 1, fenceEnd - bodyStart - 1);
}

bool ReadList(const json& data, const char* key, std::vector<std::string>& out) {
    if (!data.contains(key)) return false;
    const auto& value = data[key];
    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                std::string text = item.get<std::string>();
                if (!text.empty()) out.push_back(text);
            }
        }
    } else if (value.is_string() && !value.get<std::string>().empty()) {
        out.push_back(value.get<std::string>());
    }
    return true;
}

} // namespace

std::optional<domain::AnalysisResult> AnalysisParser::Parse(const std::string& raw,
                                                            const std::string& defaultOverview,
                                                            std::string& error) {
    json data;
    try {
        data = json::parse(StripCodeFence(raw));
    } catch (const std::exception& e) {
        error = std::string("Invalid JSON response from API: ") + e.what();
        return std::nullopt;
    }

    if (!data.is_object()) {
        error = "Invalid JSON response from API: expected an object";
        return std::nullopt;
    }

    domain::AnalysisResult result;
    bool anyField = false;

    if (data.contains("technical_analysis") && data["technical_analysis"].is_string()) {
        result.technicalAnalysis = data["technical_analysis"].get<std::string>();
        anyField = true;
    } else if (data.contains("summary") && data["summary"].is_string()) {
        result.technicalAnalysis = data["summary"].get<std::string>();
        anyField = true;
    }
    if (result.technicalAnalysis.empty()) {
        result.technicalAnalysis = defaultOverview;
    }

    anyField |= ReadList(data, "potential_issues", result.potentialIssues);
    anyField |= ReadList(data, "recommendations", result.recommendations);
    anyField |= ReadList(data, "clarifying_questions", result.clarifyingQuestions);
    anyField |= ReadList(data, "action_items", result.actionItems);
    anyField |= ReadList(data, "key_decisions", result.keyDecisions);

    if (!anyField) {
        error = "Response is missing all analysis fields";
        return std::nullopt;
    }
    return result;
}

} // namespace meetinglens::application
