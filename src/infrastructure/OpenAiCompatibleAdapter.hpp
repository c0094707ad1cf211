/**
 * @file OpenAiCompatibleAdapter.hpp
 * @brief Adapter for hosted OpenAI-style chat completion endpoints (xAI Grok and similar).
 */

#pragma once
#include "domain/CompletionService.hpp"
#include <string>

namespace meetinglens::infrastructure {

/**
 * @class OpenAiCompatibleAdapter
 * @brief Implements CompletionService over POST /v1/chat/completions.
 *
 * https URLs need cpp-httplib built with OpenSSL support.
 */
class OpenAiCompatibleAdapter : public domain::CompletionService {
public:
    /**
     * @param baseUrl Scheme, host and optional port, e.g. "https://api.x.ai".
     * @param apiKey Bearer token; an empty key is rejected at initialize().
     */
    OpenAiCompatibleAdapter(const std::string& baseUrl, const std::string& apiKey,
                            const std::string& model = "grok-3-mini", int timeoutSeconds = 120);

    void initialize() override;
    std::optional<std::string> complete(const domain::CompletionRequest& request) override;
    std::string getCurrentModel() const override { return m_model; }

private:
    std::string m_baseUrl;
    std::string m_apiKey;
    std::string m_model;
    int m_timeoutSeconds;
};

} // namespace meetinglens::infrastructure
