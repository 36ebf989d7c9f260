// =================================================================
// src/Loom/CommitMessageGenerator.cpp
// =================================================================
// Formatting and merging of commit suggestions.

#include "Loom/CommitMessageGenerator.hpp"
#include <algorithm>
#include <sstream>

namespace Loom {

std::string CommitSuggestion::formatBody() const {
    std::ostringstream formatted;

    for (const auto& category : body) {
        formatted << category.name << ":\n";
        for (const auto& change : category.changes) {
            formatted << "- " << change << "\n";
        }
        formatted << "\n";
    }
    formatted << summary;

    return formatted.str();
}

std::string CommitSuggestion::formatCommitMessage() const {
    return title + "\n\n" + formatBody() + "\n";
}

CommitSuggestion CommitSuggestion::combine(const std::vector<CommitSuggestion>& suggestions) {
    CommitSuggestion combined;
    combined.title = "📦 chore: combine multiple changes";

    std::vector<std::string> summaries;
    for (const auto& suggestion : suggestions) {
        for (const auto& category : suggestion.body) {
            auto it = std::find_if(combined.body.begin(), combined.body.end(),
                                   [&category](const CommitCategory& c) { return c.name == category.name; });
            if (it == combined.body.end()) {
                combined.body.push_back(category);
            } else {
                it->changes.insert(it->changes.end(), category.changes.begin(), category.changes.end());
            }
        }
        if (!suggestion.summary.empty()) {
            summaries.push_back(suggestion.summary);
        }
    }

    for (size_t i = 0; i < summaries.size(); ++i) {
        if (i > 0) combined.summary += " ";
        combined.summary += summaries[i];
    }

    return combined;
}

TokenUsage TokenUsage::fromCounts(int prompt_tokens, int completion_tokens, int total_tokens,
                                  const ModelCosts& costs) {
    TokenUsage usage;
    usage.prompt_tokens = prompt_tokens;
    usage.completion_tokens = completion_tokens;
    usage.total_tokens = total_tokens;
    usage.input_cost = (static_cast<double>(prompt_tokens) / 1000000.0) * costs.input;
    usage.output_cost = (static_cast<double>(completion_tokens) / 1000000.0) * costs.output;
    usage.total_cost = usage.input_cost + usage.output_cost;
    return usage;
}

TokenUsage& TokenUsage::operator+=(const TokenUsage& other) {
    prompt_tokens += other.prompt_tokens;
    completion_tokens += other.completion_tokens;
    total_tokens += other.total_tokens;
    input_cost += other.input_cost;
    output_cost += other.output_cost;
    total_cost += other.total_cost;
    return *this;
}

} // namespace Loom
