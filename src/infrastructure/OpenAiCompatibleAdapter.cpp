/**
 * @file OpenAiCompatibleAdapter.cpp
 * @brief Implementation of the OpenAiCompatibleAdapter class.
 */
#include "infrastructure/OpenAiCompatibleAdapter.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace meetinglens::infrastructure {

OpenAiCompatibleAdapter::OpenAiCompatibleAdapter(const std::string& baseUrl, const std::string& apiKey,
                                                 const std::string& model, int timeoutSeconds)
    : m_baseUrl(baseUrl), m_apiKey(apiKey), m_model(model.empty() ? "grok-3-mini" : model),
      m_timeoutSeconds(timeoutSeconds) {}

void OpenAiCompatibleAdapter::initialize() {
    if (m_apiKey.empty()) {
        std::cerr << "[OpenAiAdapter] No API key configured; every request to " << m_baseUrl
                  << " will be rejected." << std::endl;
    }
    httplib::Client cli(m_baseUrl);
    if (!cli.is_valid()) {
        std::cerr << "[OpenAiAdapter] Cannot use " << m_baseUrl
                  << " (https requires OpenSSL support)." << std::endl;
    }
    std::cout << "[OpenAiAdapter] Using model " << m_model << " at " << m_baseUrl << std::endl;
}

std::optional<std::string> OpenAiCompatibleAdapter::complete(const domain::CompletionRequest& request) {
    httplib::Client cli(m_baseUrl);
    if (!cli.is_valid()) {
        std::cerr << "[OpenAiAdapter] Invalid endpoint: " << m_baseUrl << std::endl;
        return std::nullopt;
    }
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_bearer_token_auth(m_apiKey);

    json messagesJson = json::array();
    if (!request.systemInstruction.empty()) {
        messagesJson.push_back({{"role", "system"}, {"content", request.systemInstruction}});
    }
    messagesJson.push_back({{"role", "user"}, {"content", request.userContent}});

    json requestData = {
        {"model", m_model},
        {"messages", messagesJson},
        {"max_tokens", request.maxOutputTokens},
        {"temperature", request.temperature}
    };
    if (request.shape == domain::ResponseShape::JsonObject) {
        requestData["response_format"] = {{"type", "json_object"}};
    }

    auto res = cli.Post("/v1/chat/completions", requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OpenAiAdapter] Request failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OpenAiAdapter] HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("usage") && body["usage"].is_object()) {
            const auto& usage = body["usage"];
            std::cout << "[OpenAiAdapter] Tokens used: prompt=" << usage.value("prompt_tokens", 0)
                      << " completion=" << usage.value("completion_tokens", 0)
                      << " total=" << usage.value("total_tokens", 0) << std::endl;
        }
        const auto& choices = body.at("choices");
        if (choices.is_array() && !choices.empty()) {
            const auto& content = choices[0].at("message").at("content");
            if (content.is_string()) {
                return content.get<std::string>();
            }
        }
        std::cerr << "[OpenAiAdapter] Response has no message content." << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OpenAiAdapter] Malformed response: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace meetinglens::infrastructure
