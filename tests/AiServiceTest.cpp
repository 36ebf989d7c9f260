// =================================================================
// tests/AiServiceTest.cpp
// =================================================================
// Unit tests for AiService response handling and commit message formatting.
// No request leaves the process; HTTP responses are fed in directly.

#include "Loom/AiService.hpp"
#include "Loom/Errors.hpp"
#include "Loom/Logger.hpp"
#include "Loom/LoomConfig.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>

class AiServiceTest {
private:
    Loom::LoomConfig config;

    static bool near(double a, double b) {
        return std::fabs(a - b) < 1e-12;
    }

    static std::string makeResponse(const std::string& content) {
        nlohmann::json response = {
            {"choices", nlohmann::json::array({
                {{"message", {{"role", "assistant"}, {"content", content}}}}
            })},
            {"usage", {{"prompt_tokens", 1000}, {"completion_tokens", 200}, {"total_tokens", 1200}}}
        };
        return response.dump();
    }

    static const char* sampleContent() {
        return R"({
            "title": "✨ feat: add login form",
            "body": {
                "Features": {"emoji": "✨", "changes": ["Add form component", "Wire submit handler"]},
                "Fixes": {"emoji": "🐛", "changes": "Correct password field type"},
                "Docs": ["Document login flow"]
            },
            "summary": "Adds a working login form."
        })";
    }

public:
    AiServiceTest() {
        config.api_key = "test-key";
    }

    void testPromptGeneration() {
        std::cout << "Testing prompt generation..." << std::endl;

        Loom::AiService service(config);
        std::vector<Loom::ChangedFile> files = {Loom::ChangedFile("src/a.py"), Loom::ChangedFile("src/b.py")};

        std::string prompt = service.generatePrompt("diff --git a/src/a.py b/src/a.py\n+x", files);
        assert(prompt.find("Files changed: src/a.py, src/b.py") != std::string::npos && "Prompt lists files");
        assert(prompt.find("```\ndiff --git") != std::string::npos && "Text diff is fenced");
        assert(prompt.find("Maximum 50 characters") != std::string::npos && "Title rule included");
        assert(prompt.find("\"Fixes\"") != std::string::npos && "Standard prompt shows categories");

        std::string binary = service.generatePrompt("Binary files changed:\n- img.png (1.00 KB)\n", files);
        assert(binary.find("binary file changes") != std::string::npos && "Binary diffs get their own prompt");
        assert(binary.find("```") == std::string::npos && "Binary listing is not fenced");

        std::cout << "✓ Prompt generation test passed" << std::endl;
    }

    void testRequestPayload() {
        std::cout << "Testing request payload..." << std::endl;

        Loom::AiService service(config);
        auto payload = service.buildRequestPayload("hello");

        assert(payload["model"] == "gpt-4o-mini" && "Configured model is used");
        assert(payload["messages"].size() == 1 && "Single user message");
        assert(payload["messages"][0]["role"] == "user" && "Message role");
        assert(payload["messages"][0]["content"] == "hello" && "Message content");
        assert(payload["response_format"]["type"] == "json_object" && "JSON response requested");
        assert(payload["max_tokens"] == Loom::AiService::MAX_RESPONSE_TOKENS && "Response length capped");

        std::cout << "✓ Request payload test passed" << std::endl;
    }

    void testParseSuggestion() {
        std::cout << "Testing suggestion parsing..." << std::endl;

        auto suggestion = Loom::AiService::parseSuggestion(sampleContent());

        assert(suggestion.title == "✨ feat: add login form" && "Title parsed");
        assert(suggestion.summary == "Adds a working login form." && "Summary parsed");
        assert(suggestion.body.size() == 3 && "Three categories parsed");
        assert(suggestion.body[0].name == "Features" && "Category order is preserved");
        assert(suggestion.body[0].emoji == "✨" && "Emoji parsed");
        assert(suggestion.body[0].changes.size() == 2 && "Change list parsed");
        assert(suggestion.body[1].name == "Fixes" && suggestion.body[1].changes.size() == 1
               && "A single change string becomes one entry");
        assert(suggestion.body[2].name == "Docs" && suggestion.body[2].emoji.empty()
               && suggestion.body[2].changes[0] == "Document login flow" && "Bare arrays are accepted");

        bool threw = false;
        try {
            Loom::AiService::parseSuggestion(R"({"title": "x", "body": {}})");
        } catch (const Loom::AiServiceError&) {
            threw = true;
        }
        assert(threw && "Missing summary is an error");

        threw = false;
        try {
            Loom::AiService::parseSuggestion("not json");
        } catch (const Loom::AiServiceError& e) {
            threw = true;
            assert(std::string(e.what()).find("Failed to parse") != std::string::npos && "Invalid JSON message");
        }
        assert(threw && "Invalid JSON is an error");

        std::cout << "✓ Suggestion parsing test passed" << std::endl;
    }

    void testParseResponse() {
        std::cout << "Testing response parsing..." << std::endl;

        Loom::AiService service(config);
        auto [suggestion, usage] = service.parseResponse(200, makeResponse(sampleContent()));

        assert(suggestion.title == "✨ feat: add login form" && "Suggestion extracted from choices");
        assert(usage.prompt_tokens == 1000 && usage.completion_tokens == 200 && usage.total_tokens == 1200
               && "Usage counts extracted");
        assert(near(usage.input_cost, 1000 / 1000000.0 * 0.00015) && "Input cost priced per million tokens");
        assert(near(usage.output_cost, 200 / 1000000.0 * 0.00060) && "Output cost priced per million tokens");
        assert(near(usage.total_cost, usage.input_cost + usage.output_cost) && "Total cost is the sum");

        bool threw = false;
        try {
            service.parseResponse(400, R"({"error": {"message": "context length exceeded"}})");
        } catch (const Loom::AiServiceError& e) {
            threw = true;
            assert(std::string(e.what()) == "API Error: context length exceeded" && "400 carries the API message");
            assert(e.getStatusCode() == 400 && "Status code kept");
        }
        assert(threw && "HTTP 400 is an error");

        threw = false;
        try {
            service.parseResponse(500, "upstream down");
        } catch (const Loom::AiServiceError& e) {
            threw = true;
            assert(std::string(e.what()).find("HTTP 500") != std::string::npos && "Other statuses report the code");
        }
        assert(threw && "HTTP 500 is an error");

        threw = false;
        try {
            service.parseResponse(200, R"({"choices": []})");
        } catch (const Loom::AiServiceError& e) {
            threw = true;
            assert(std::string(e.what()).find("Invalid response format") != std::string::npos && "Shape errors reported");
        }
        assert(threw && "Missing choices is an error");

        std::cout << "✓ Response parsing test passed" << std::endl;
    }

    void testMissingApiKey() {
        std::cout << "Testing missing API key..." << std::endl;

        Loom::LoomConfig no_key;
        Loom::AiService service(no_key);

        bool threw = false;
        try {
            service.generateCommitMessage("diff", {Loom::ChangedFile("a.py")});
        } catch (const Loom::AiServiceError& e) {
            threw = true;
            assert(std::string(e.what()).find("OPENAI_API_KEY") != std::string::npos && "Error names the key");
        }
        assert(threw && "No request is made without a key");

        std::cout << "✓ Missing API key test passed" << std::endl;
    }

    void testMessageFormatting() {
        std::cout << "Testing commit message formatting..." << std::endl;

        auto suggestion = Loom::AiService::parseSuggestion(sampleContent());

        std::string body = suggestion.formatBody();
        assert(body.find("Features:\n- Add form component\n- Wire submit handler\n\n") == 0 && "Body starts with first category");
        assert(body.substr(body.size() - std::string("Adds a working login form.").size()) == "Adds a working login form."
               && "Body ends with the summary");

        std::string message = suggestion.formatCommitMessage();
        assert(message == suggestion.title + "\n\n" + body + "\n" && "Full message is title, blank line, body");

        Loom::CommitSuggestion other;
        other.title = "🐛 fix: null check";
        other.body.push_back({"Fixes", "🐛", {"Guard against null user"}});
        other.body.push_back({"Tests", "✅", {"Cover null user"}});
        other.summary = "Prevents a crash.";

        auto combined = Loom::CommitSuggestion::combine({suggestion, other});
        assert(combined.title == "📦 chore: combine multiple changes" && "Combined title");
        assert(combined.body.size() == 4 && "Categories merged by name");
        assert(combined.body[1].name == "Fixes" && combined.body[1].changes.size() == 2 && "Same-name changes appended");
        assert(combined.body[3].name == "Tests" && "New categories appended in order");
        assert(combined.summary == "Adds a working login form. Prevents a crash." && "Summaries joined with spaces");

        std::cout << "✓ Commit message formatting test passed" << std::endl;
    }

    void testUsageAccumulation() {
        std::cout << "Testing usage accumulation..." << std::endl;

        Loom::ModelCosts costs{1.0, 2.0};
        auto first = Loom::TokenUsage::fromCounts(500000, 250000, 750000, costs);
        assert(near(first.input_cost, 0.5) && near(first.output_cost, 0.5) && "Per-million pricing");

        Loom::TokenUsage total;
        total += first;
        total += first;
        assert(total.prompt_tokens == 1000000 && total.total_tokens == 1500000 && "Counts accumulate");
        assert(near(total.total_cost, 2.0) && "Costs accumulate");

        std::cout << "✓ Usage accumulation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running AiService Tests..." << std::endl;
        std::cout << "==========================" << std::endl;

        testPromptGeneration();
        std::cout << std::endl;

        testRequestPayload();
        std::cout << std::endl;

        testParseSuggestion();
        std::cout << std::endl;

        testParseResponse();
        std::cout << std::endl;

        testMissingApiKey();
        std::cout << std::endl;

        testMessageFormatting();
        std::cout << std::endl;

        testUsageAccumulation();
        std::cout << std::endl;

        std::cout << "All AiService tests passed!" << std::endl;
    }
};

int main() {
    try {
        Loom::Logger::getInstance().setConsoleLogging(false);
        Loom::Logger::getInstance().setFileLogging(false);

        AiServiceTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All AiService component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
