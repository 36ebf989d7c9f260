// =================================================================
// include/Loom/Console.hpp
// =================================================================
// Header for user-facing terminal output and y/n confirmation prompts.

#pragma once

#include "Loom/ChangedFile.hpp"
#include "Loom/CommitAnalyzer.hpp"
#include "Loom/CommitMessageGenerator.hpp"
#include "Loom/SmartGrouper.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Colored, emoji-prefixed output plus confirmations
 *
 * Streams are injected so the interaction can be scripted in tests.
 */
class Console {
public:
    /**
     * @param out Destination for all output
     * @param in Source of confirmation answers
     * @param use_color Emit ANSI color codes
     */
    explicit Console(std::ostream& out = std::cout, std::istream& in = std::cin, bool use_color = true);

    void printChangedFiles(const std::vector<ChangedFile>& files);

    /**
     * @brief Complexity warnings followed by the diff statistics
     */
    void printWarnings(const CommitAnalysis& analysis);

    void printBatchSummary(size_t total_files, size_t total_batches);
    void printBatchStart(size_t batch_num, size_t total_batches, const FileGroup& batch);
    void printBatchComplete(size_t batch_num, size_t total_batches);
    void printBatchInfo(size_t batch_num, const std::vector<std::string>& files);
    void printGroupSummary(size_t group_num, const std::string& summary);
    void printCommitMessage(const std::string& message);

    /**
     * @brief Token counts and cost breakdown, optionally tagged with a batch number
     */
    void printTokenUsage(const TokenUsage& usage, std::optional<size_t> batch_num = std::nullopt);

    void printInfo(const std::string& message);
    void printSuccess(const std::string& message);
    void printWarning(const std::string& message);
    void printError(const std::string& message);

    /**
     * @brief Ask a y/n question
     *
     * Accepts y, yes, n and no in any case. Empty input and end of input
     * return the default answer; anything else asks again.
     */
    bool confirmAction(const std::string& prompt, bool default_answer = false);

    bool confirmBatchContinue();

    /**
     * @brief Human-readable cost followed by the precise amount, e.g. "0.10¢ (€0.00001500)"
     */
    static std::string formatCost(double cost);

private:
    std::ostream& m_out;
    std::istream& m_in;
    bool m_use_color;

    std::string colorize(const std::string& code, const std::string& text) const;
};

} // namespace Loom
