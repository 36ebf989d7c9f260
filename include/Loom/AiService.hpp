// =================================================================
// include/Loom/AiService.hpp
// =================================================================
// Defines the client for generating commit messages through an
// OpenAI-compatible chat completions endpoint.

#pragma once

#include "Loom/CommitMessageGenerator.hpp"
#include "Loom/LoomConfig.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Loom {

class AiService : public CommitMessageGenerator {
public:
    static constexpr int MAX_RESPONSE_TOKENS = 1000;
    static constexpr double TEMPERATURE = 0.7;

    /**
     * @brief Constructs the client.
     * @param config Supplies API key, base URL, model, pricing and timeout; must outlive this object.
     */
    explicit AiService(const LoomConfig& config);

    std::pair<CommitSuggestion, TokenUsage> generateCommitMessage(
        const std::string& diff, const std::vector<ChangedFile>& files) override;

    /**
     * @brief Build the prompt for a diff; binary listings get a simpler prompt.
     */
    std::string generatePrompt(const std::string& diff, const std::vector<ChangedFile>& files) const;

    /**
     * @brief Chat completions request body for a prompt.
     */
    nlohmann::json buildRequestPayload(const std::string& prompt) const;

    /**
     * @brief Turn an HTTP status and body into a suggestion and usage.
     * @throws AiServiceError for non-200 statuses or malformed responses
     */
    std::pair<CommitSuggestion, TokenUsage> parseResponse(int status, const std::string& body) const;

    /**
     * @brief Parse the JSON commit message produced by the model.
     * @throws AiServiceError on invalid JSON or missing fields
     */
    static CommitSuggestion parseSuggestion(const std::string& content);

    /**
     * @brief Token usage from the API's "usage" object, priced for the configured model.
     */
    TokenUsage parseUsage(const nlohmann::json& usage) const;

private:
    const LoomConfig& m_config;

    /**
     * @brief POST the payload and return (status, body).
     * @throws AiServiceError when no response is received
     */
    std::pair<int, std::string> postChatCompletion(const nlohmann::json& payload) const;
};

} // namespace Loom
