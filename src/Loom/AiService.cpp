// =================================================================
// src/Loom/AiService.cpp
// =================================================================
// Implementation for commit message generation over HTTP.

#include "Loom/AiService.hpp"
#include "Loom/Errors.hpp"
#include "Loom/Logger.hpp"
#include "httplib.h"
#include <chrono>
#include <sstream>

namespace Loom {

namespace {

const char* const CHAT_COMPLETIONS_PATH = "/v1/chat/completions";
const char* const BINARY_DIFF_PREFIX = "Binary files changed:";

std::string joinPaths(const std::vector<ChangedFile>& files) {
    std::string joined;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += files[i].path;
    }
    return joined;
}

const std::string TITLE_REQUIREMENT =
    "1. Title: Maximum 50 characters, MUST start with an appropriate "
    "gitemoji (e.g. 📝, ✨, 🐛), followed by the semantic commit "
    "type (feat, fix, etc) and a brief description.\n";

} // namespace

AiService::AiService(const LoomConfig& config) : m_config(config) {}

std::string AiService::generatePrompt(const std::string& diff, const std::vector<ChangedFile>& files) const {
    std::ostringstream prompt;
    std::string files_summary = joinPaths(files);

    if (diff.compare(0, std::string(BINARY_DIFF_PREFIX).size(), BINARY_DIFF_PREFIX) == 0) {
        prompt << "Generate a structured commit message in JSON format for the following binary file changes.\n"
               << "The commit MUST follow conventional commits format with a gitemoji prefix.\n\n"
               << "Files changed: " << files_summary << "\n\n"
               << diff << "\n\n"
               << "Requirements:\n"
               << TITLE_REQUIREMENT
               << "2. Body: Create a simple summary of the binary file changes.\n"
               << "3. Summary: A brief sentence describing the data updates.\n\n"
               << "Return the response in the following JSON format:\n"
               << "{\n"
               << "  \"title\": \"✨ feat: example title\",\n"
               << "  \"body\": {\n"
               << "    \"Changes\": {\n"
               << "      \"emoji\": \"📦\",\n"
               << "      \"changes\": [\n"
               << "        \"✨ Added new feature X\",\n"
               << "        \"🔧 Updated configuration Y\"\n"
               << "      ]\n"
               << "    }\n"
               << "  },\n"
               << "  \"summary\": \"This change implements feature X with updated configuration.\"\n"
               << "}";
        return prompt.str();
    }

    prompt << "Generate a structured commit message in JSON format for the following git diff.\n"
           << "The commit MUST follow conventional commits format with a gitemoji prefix.\n\n"
           << "Files changed: " << files_summary << "\n\n"
           << "```\n" << diff << "\n```\n\n"
           << "Requirements:\n"
           << TITLE_REQUIREMENT
           << "2. Body: Organize changes into categories. Each category should "
           << "have an appropriate emoji and bullet points summarizing key changes.\n"
           << "3. Summary: A brief sentence summarizing the overall impact.\n\n"
           << "Return the response in the following JSON format:\n"
           << "{\n"
           << "  \"title\": \"✨ feat: example title\",\n"
           << "  \"body\": {\n"
           << "    \"Features\": {\n"
           << "      \"emoji\": \"✨\",\n"
           << "      \"changes\": [\n"
           << "        \"✨ Added new feature X\",\n"
           << "        \"🔧 Updated configuration Y\"\n"
           << "      ]\n"
           << "    },\n"
           << "    \"Fixes\": {\n"
           << "      \"emoji\": \"🐛\",\n"
           << "      \"changes\": [\n"
           << "        \"🐛 Fixed issue Z\"\n"
           << "      ]\n"
           << "    }\n"
           << "  },\n"
           << "  \"summary\": \"This change implements feature X with configuration updates and bug fixes.\"\n"
           << "}";
    return prompt.str();
}

nlohmann::json AiService::buildRequestPayload(const std::string& prompt) const {
    return {
        {"model", m_config.default_model},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"response_format", {{"type", "json_object"}}},
        {"max_tokens", MAX_RESPONSE_TOKENS},
        {"temperature", TEMPERATURE}
    };
}

std::pair<CommitSuggestion, TokenUsage> AiService::generateCommitMessage(const std::string& diff,
                                                                         const std::vector<ChangedFile>& files) {
    if (m_config.api_key.empty()) {
        throw AiServiceError("OPENAI_API_KEY is not set");
    }

    std::string prompt = generatePrompt(diff, files);
    LOOM_LOG_DEBUG("AiService", "Requesting commit message", "Prompt length: " + std::to_string(prompt.size()));

    auto start_time = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start_time]() {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());
    };

    try {
        auto [status, body] = postChatCompletion(buildRequestPayload(prompt));
        auto result = parseResponse(status, body);
        Logger::getInstance().logAiRequest(result.second.prompt_tokens, result.second.completion_tokens,
                                           result.second.total_cost, elapsed_ms(), true);
        return result;
    } catch (const AiServiceError& e) {
        Logger::getInstance().logAiRequest(0, 0, 0.0, elapsed_ms(), false);
        LOOM_LOG_ERROR("AiService", e.what());
        throw;
    }
}

std::pair<int, std::string> AiService::postChatCompletion(const nlohmann::json& payload) const {
    httplib::Client client(m_config.api_base_url);
    client.set_connection_timeout(m_config.request_timeout_seconds, 0);
    client.set_read_timeout(m_config.request_timeout_seconds, 0);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + m_config.api_key}
    };

    auto res = client.Post(CHAT_COMPLETIONS_PATH, headers, payload.dump(), "application/json");
    if (!res) {
        throw AiServiceError("API Request failed: " + httplib::to_string(res.error()) +
                             " (" + m_config.api_base_url + ")");
    }

    return {res->status, res->body};
}

std::pair<CommitSuggestion, TokenUsage> AiService::parseResponse(int status, const std::string& body) const {
    if (status == 400) {
        std::string error_message = "Unknown error";
        nlohmann::json error_data = nlohmann::json::parse(body, nullptr, false);
        if (!error_data.is_discarded() && error_data.contains("error") && error_data["error"].is_object()) {
            error_message = error_data["error"].value("message", error_message);
        }
        throw AiServiceError("API Error: " + error_message, status);
    }

    if (status != 200) {
        throw AiServiceError("API Request failed: HTTP " + std::to_string(status) + ": " + body, status);
    }

    nlohmann::json response_data = nlohmann::json::parse(body, nullptr, false);
    if (response_data.is_discarded()) {
        throw AiServiceError("Failed to parse API response as JSON", status);
    }

    try {
        const auto& message = response_data.at("choices").at(0).at("message");
        std::string content = message.at("content").get<std::string>();
        TokenUsage usage = parseUsage(response_data.at("usage"));
        return {parseSuggestion(content), usage};
    } catch (const nlohmann::json::exception& e) {
        throw AiServiceError("Invalid response format from API: " + std::string(e.what()), status);
    }
}

CommitSuggestion AiService::parseSuggestion(const std::string& content) {
    // Ordered parsing keeps categories in the order the model wrote them
    nlohmann::ordered_json data = nlohmann::ordered_json::parse(content, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw AiServiceError("Failed to parse API response as JSON");
    }

    CommitSuggestion suggestion;
    try {
        suggestion.title = data.at("title").get<std::string>();
        suggestion.summary = data.at("summary").get<std::string>();

        const auto& body = data.at("body");
        if (!body.is_object()) {
            throw AiServiceError("Commit body must be an object of categories");
        }

        for (auto it = body.begin(); it != body.end(); ++it) {
            const std::string& name = it.key();
            const auto& content_node = it.value();

            CommitCategory category;
            category.name = name;
            if (content_node.is_object()) {
                category.emoji = content_node.value("emoji", "");
                const auto& changes = content_node.at("changes");
                if (changes.is_array()) {
                    for (const auto& change : changes) {
                        category.changes.push_back(change.get<std::string>());
                    }
                } else {
                    category.changes.push_back(changes.get<std::string>());
                }
            } else if (content_node.is_array()) {
                for (const auto& change : content_node) {
                    category.changes.push_back(change.get<std::string>());
                }
            } else {
                throw AiServiceError("Invalid commit body category: " + name);
            }
            suggestion.body.push_back(std::move(category));
        }
    } catch (const nlohmann::json::exception& e) {
        throw AiServiceError("Missing or invalid field in commit message: " + std::string(e.what()));
    }

    return suggestion;
}

TokenUsage AiService::parseUsage(const nlohmann::json& usage) const {
    int prompt_tokens = usage.at("prompt_tokens").get<int>();
    int completion_tokens = usage.at("completion_tokens").get<int>();
    int total_tokens = usage.value("total_tokens", prompt_tokens + completion_tokens);

    return TokenUsage::fromCounts(prompt_tokens, completion_tokens, total_tokens,
                                  m_config.getModelCosts(m_config.default_model));
}

} // namespace Loom
