/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Every key is optional. Anything missing keeps its built-in default, so an
 * empty or absent file yields a working configuration.
 */

#pragma once

#include <optional>
#include <string>
#include "application/PipelineConfig.hpp"

namespace meetinglens::infrastructure {

/**
 * @struct CompletionSettings
 * @brief Which text-completion backend to talk to, and how.
 */
struct CompletionSettings {
    std::string provider = "ollama"; ///< "ollama" or "openai".
    std::string host = "localhost";
    int port = 11434;
    std::string model; ///< Empty lets the Ollama adapter pick one.
    std::string baseUrl = "https://api.x.ai"; ///< OpenAI-compatible endpoint root.
    std::string apiKeyEnv = "XAI_API_KEY";
    int timeoutSeconds = 120;
};

struct AppConfig {
    application::PipelineConfig pipeline;
    CompletionSettings completion;
    std::string sourcePath; ///< File the values came from; empty when defaults only.
};

class ConfigLoader {
public:
    /**
     * @brief Loads configuration.
     * @param explicitPath File given on the command line; empty to search the default locations.
     * @return The merged configuration. Parse errors are logged and defaults kept.
     */
    static AppConfig Load(const std::string& explicitPath = "");

    /**
     * @brief Parses a settings document held in memory.
     * @return std::nullopt if the text is not a JSON object.
     */
    static std::optional<AppConfig> Parse(const std::string& text, std::string& error);

    /** @brief Resolves the API key named by completion.apiKeyEnv. */
    static std::string ResolveApiKey(const CompletionSettings& settings);
};

} // namespace meetinglens::infrastructure
