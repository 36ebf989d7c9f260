// =================================================================
// include/Loom/CommitAnalyzer.hpp
// =================================================================
// Header for commit complexity and cost estimation.

#pragma once

#include "Loom/ChangedFile.hpp"
#include "Loom/LoomConfig.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Loom {

enum class WarningLevel {
    LOW,
    MEDIUM,
    HIGH
};

struct ComplexityWarning {
    WarningLevel level;
    std::string message;
};

/**
 * @brief Result of analysing a staged diff before it is sent anywhere
 */
struct CommitAnalysis {
    size_t estimated_tokens = 0;
    double estimated_cost = 0.0;
    size_t num_files = 0;
    std::vector<ComplexityWarning> warnings;
    bool is_complex = false;    ///< True when any warning is HIGH
};

/**
 * @brief Estimates token usage and cost of a diff and flags oversized commits
 *
 * Token counts are estimated from text length, not by a tokenizer.
 */
class CommitAnalyzer {
public:
    explicit CommitAnalyzer(const LoomConfig& config);

    /**
     * @brief Estimate tokens and input cost of a text for the configured model
     * @return (tokens, cost in EUR)
     */
    std::pair<size_t, double> estimateTokensAndCost(const std::string& text) const;

    /**
     * @brief Estimate tokens and input cost of a text for a given model
     */
    std::pair<size_t, double> estimateTokensAndCost(const std::string& text, const std::string& model) const;

    /**
     * @brief Check a diff against the token, cost and file-count thresholds
     * @param diff Unified diff text
     * @param files Files in the diff
     */
    CommitAnalysis analyzeDiffComplexity(const std::string& diff, const std::vector<ChangedFile>& files) const;

    /**
     * @brief Format a cost as euros, cents, or the minimum "0.10¢"
     */
    static std::string formatCostForHumans(double cost);

    /**
     * @brief Qualitative label: "very expensive" down to "very cheap"
     */
    static std::string getCostContext(double total_cost);

    /**
     * @brief Extract one file's section from a unified diff
     * @return Empty if the file has no section
     */
    static std::string extractFileDiff(const std::string& diff, const std::string& path);

private:
    const LoomConfig& m_config;
};

} // namespace Loom
