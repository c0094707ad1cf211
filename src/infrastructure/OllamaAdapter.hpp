/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/CompletionService.hpp"
#include <mutex>
#include <string>

namespace meetinglens::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements CompletionService using the Ollama REST API.
 */
class OllamaAdapter : public domain::CompletionService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Model to use; empty to auto-select from the installed ones.
     * @param timeoutSeconds Read timeout for one completion.
     */
    OllamaAdapter(const std::string& host = "localhost", int port = 11434,
                  const std::string& model = "", int timeoutSeconds = 120);

    /** @brief Queries /api/tags and selects a model. @see ModelSelector */
    void initialize() override;

    /** @brief Runs one chat completion. @see domain::CompletionService::complete */
    std::optional<std::string> complete(const domain::CompletionRequest& request) override;

    std::string getCurrentModel() const override;

private:
    void detectBestModel();

    std::string m_host; ///< Ollama host.
    int m_port; ///< Ollama port.
    int m_timeoutSeconds;
    bool m_modelPinned; ///< True when the model came from configuration.
    mutable std::mutex m_modelMutex;
    std::string m_model = "qwen2.5:7b"; ///< Target model name.
};

} // namespace meetinglens::infrastructure
