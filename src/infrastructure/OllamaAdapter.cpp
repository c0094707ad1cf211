/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace meetinglens::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds), m_modelPinned(!model.empty()) {
    if (!model.empty()) {
        m_model = model;
    }
}

void OllamaAdapter::initialize() {
    detectBestModel();
}

void OllamaAdapter::detectBestModel() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5); // Short timeout for detection

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: "
                  << getCurrentModel() << std::endl;
        return;
    }

    std::vector<std::string> availableModels;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    availableModels.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaAdapter] Error parsing models: " << e.what()
                  << ". Using default: " << getCurrentModel() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    std::string selected = ModelSelector::SelectBest(availableModels, m_model);
    if (m_modelPinned && selected != m_model) {
        std::cerr << "[OllamaAdapter] Configured model " << m_model
                  << " is not installed on the server." << std::endl;
        return;
    }
    if (selected != m_model) {
        m_model = selected;
        std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
    }
}

std::string OllamaAdapter::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

std::optional<std::string> OllamaAdapter::complete(const domain::CompletionRequest& request) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_timeoutSeconds);

    json messagesJson = json::array();
    if (!request.systemInstruction.empty()) {
        messagesJson.push_back({{"role", "system"}, {"content", request.systemInstruction}});
    }
    messagesJson.push_back({{"role", "user"}, {"content", request.userContent}});

    json requestData = {
        {"model", getCurrentModel()},
        {"messages", messagesJson},
        {"stream", false},
        {"options", {
            {"temperature", request.temperature},
            {"num_predict", request.maxOutputTokens}
        }}
    };
    if (request.shape == domain::ResponseShape::JsonObject) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaAdapter] Request failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaAdapter] HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        // Ollama /api/chat response: { "message": { "role": "assistant", "content": "..." }, ... }
        if (body.contains("message") && body["message"].contains("content")) {
            return body["message"]["content"].get<std::string>();
        }
        std::cerr << "[OllamaAdapter] Response has no message content." << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaAdapter] Malformed response: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace meetinglens::infrastructure
