// =================================================================
// include/Loom/CommitMessageGenerator.hpp
// =================================================================
// Commit suggestion types and the abstract message-generation
// interface consumed by the commit workflow.

#pragma once

#include "Loom/ChangedFile.hpp"
#include "Loom/LoomConfig.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Loom {

/**
 * @brief One titled block of the commit body, e.g. "Features"
 */
struct CommitCategory {
    std::string name;
    std::string emoji;                  ///< Optional
    std::vector<std::string> changes;
};

/**
 * @brief A structured commit message
 */
struct CommitSuggestion {
    std::string title;
    std::vector<CommitCategory> body;   ///< Categories in the order they were produced
    std::string summary;

    /**
     * @brief Body text passed to git: category blocks, then the summary
     */
    std::string formatBody() const;

    /**
     * @brief Full message for display: title, blank line, body
     */
    std::string formatCommitMessage() const;

    /**
     * @brief Merge several suggestions into one combined commit
     *
     * Categories are merged by name in first-seen order and summaries are
     * joined with spaces.
     */
    static CommitSuggestion combine(const std::vector<CommitSuggestion>& suggestions);
};

/**
 * @brief Billed token counts and their cost in EUR
 */
struct TokenUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;
    double input_cost = 0.0;
    double output_cost = 0.0;
    double total_cost = 0.0;

    /**
     * @brief Compute costs from token counts and per-1M-token pricing
     */
    static TokenUsage fromCounts(int prompt_tokens, int completion_tokens, int total_tokens,
                                 const ModelCosts& costs);

    TokenUsage& operator+=(const TokenUsage& other);
};

/**
 * @brief Produces a commit suggestion for a diff
 *
 * Implementations throw AiServiceError on failure.
 */
class CommitMessageGenerator {
public:
    virtual ~CommitMessageGenerator() = default;

    /**
     * @brief Generate a commit message for one group of files
     * @param diff Unified diff, or a "Binary files changed:" listing
     * @param files Files covered by the diff
     */
    virtual std::pair<CommitSuggestion, TokenUsage> generateCommitMessage(
        const std::string& diff, const std::vector<ChangedFile>& files) = 0;
};

} // namespace Loom
