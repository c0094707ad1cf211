/**
 * @file ModelSelector.hpp
 * @brief Utility for selecting the best AI model from available options.
 */

#pragma once
#include <string>
#include <vector>

namespace meetinglens::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from adapter I/O.
 */
class ModelSelector {
public:
    /**
     * @brief Picks the model used for meeting analysis.
     *
     * A configured model that the server has wins. Otherwise the first model
     * matching the priority list, otherwise whatever is installed first.
     */
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& preferred = "qwen2.5:7b") {
        if (availableModels.empty()) {
            return preferred;
        }

        for (const auto& model : availableModels) {
            if (model == preferred) {
                return preferred;
            }
        }

        // Instruction-tuned models that follow a JSON output contract reliably.
        const std::vector<std::string> priorities = {
            "qwen2.5:7b",
            "qwen2.5",
            "llama3.1",
            "llama3",
            "mistral",
            "gemma"
        };

        for (const auto& priority : priorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        return availableModels[0];
    }
};

} // namespace meetinglens::infrastructure
