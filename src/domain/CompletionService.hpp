/**
 * @file CompletionService.hpp
 * @brief Interface for large-language-model completions.
 */

#pragma once
#include <optional>
#include <string>

namespace meetinglens::domain {

/**
 * @enum ResponseShape
 * @brief Output contract requested from the model.
 */
enum class ResponseShape {
    FreeText,
    JsonObject
};

/**
 * @struct CompletionRequest
 * @brief A single system + user prompt exchange.
 */
struct CompletionRequest {
    std::string systemInstruction;
    std::string userContent;
    ResponseShape shape = ResponseShape::FreeText;
    int maxOutputTokens = 1000;
    float temperature = 0.3f;
};

/**
 * @class CompletionService
 * @brief Abstract interface for services that answer a prompt with text.
 */
class CompletionService {
public:
    virtual ~CompletionService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Runs one completion.
     * @param request Prompt, output shape and sampling parameters.
     * @return The raw model output, or nullopt if the call failed (the adapter logs why).
     */
    virtual std::optional<std::string> complete(const CompletionRequest& request) = 0;

    /** @brief Name of the model answering requests. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace meetinglens::domain
