// =================================================================
// src/Loom/CommitAnalyzer.cpp
// =================================================================
// Implementation for commit complexity and cost estimation.

#include "Loom/CommitAnalyzer.hpp"
#include "Loom/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace Loom {

namespace {

std::string formatThousands(size_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        ++count;
    }
    return result;
}

std::string formatEuros(double cost) {
    std::ostringstream formatted;
    formatted << "€" << std::fixed << std::setprecision(4) << cost;
    return formatted.str();
}

} // namespace

CommitAnalyzer::CommitAnalyzer(const LoomConfig& config) : m_config(config) {}

std::pair<size_t, double> CommitAnalyzer::estimateTokensAndCost(const std::string& text) const {
    return estimateTokensAndCost(text, m_config.default_model);
}

std::pair<size_t, double> CommitAnalyzer::estimateTokensAndCost(const std::string& text,
                                                                const std::string& model) const {
    size_t ratio = m_config.token_estimation_ratio > 0 ? m_config.token_estimation_ratio : 1;
    size_t estimated_tokens = text.length() / ratio;
    double cost_per_token = m_config.getModelCosts(model).input / 1000000.0;
    return {estimated_tokens, static_cast<double>(estimated_tokens) * cost_per_token};
}

CommitAnalysis CommitAnalyzer::analyzeDiffComplexity(const std::string& diff,
                                                     const std::vector<ChangedFile>& files) const {
    CommitAnalysis analysis;
    auto [estimated_tokens, estimated_cost] = estimateTokensAndCost(diff);
    analysis.estimated_tokens = estimated_tokens;
    analysis.estimated_cost = estimated_cost;
    analysis.num_files = files.size();

    if (estimated_tokens >= m_config.token_limit) {
        analysis.warnings.push_back({WarningLevel::HIGH,
            "The diff exceeds token limit (" + formatThousands(estimated_tokens) + " tokens). "
            "Recommended limit is " + formatThousands(m_config.token_limit) + " tokens."});
    }

    if (estimated_cost >= 0.10) {
        analysis.warnings.push_back({WarningLevel::HIGH,
            "This commit could be expensive (" + formatEuros(estimated_cost) + "). "
            "Consider splitting it into smaller commits."});
    } else if (estimated_cost >= m_config.cost_warning_threshold) {
        analysis.warnings.push_back({WarningLevel::MEDIUM,
            "This commit has a moderate cost (" + formatEuros(estimated_cost) + "). "
            "Consider if it can be optimized."});
    }

    if (files.size() > m_config.max_files_threshold) {
        analysis.warnings.push_back({WarningLevel::HIGH,
            "You're modifying " + std::to_string(files.size()) + " files. "
            "For atomic commits, consider limiting to " + std::to_string(m_config.max_files_threshold) +
            " files per commit."});
    }

    for (const auto& file : files) {
        std::string file_diff = extractFileDiff(diff, file.path);
        if (file_diff.empty()) {
            // Binary or newly added files have no section of their own
            continue;
        }

        auto [file_tokens, file_cost] = estimateTokensAndCost(file_diff);
        if (file_tokens >= m_config.token_limit / 2) {
            analysis.warnings.push_back({WarningLevel::HIGH,
                "File " + file.path + " is too large (" + formatThousands(file_tokens) + " tokens). "
                "Consider splitting these changes across multiple commits."});
        }
        if (file_cost >= 0.05) {
            analysis.warnings.push_back({WarningLevel::HIGH,
                "File " + file.path + " has expensive changes (" + formatEuros(file_cost) + "). "
                "Consider splitting these changes across multiple commits."});
        }
    }

    for (const auto& warning : analysis.warnings) {
        if (warning.level == WarningLevel::HIGH) {
            analysis.is_complex = true;
            break;
        }
    }

    LOOM_LOG_DEBUG("CommitAnalyzer", "Diff analysed",
                   "Tokens: " + std::to_string(estimated_tokens) +
                   ", Warnings: " + std::to_string(analysis.warnings.size()));
    return analysis;
}

std::string CommitAnalyzer::extractFileDiff(const std::string& diff, const std::string& path) {
    const std::string header = "diff --git a/" + path + " b/" + path;
    size_t start = diff.find(header);
    if (start == std::string::npos) {
        return "";
    }
    start += header.size();

    size_t end = diff.find("diff --git", start);
    return diff.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string CommitAnalyzer::formatCostForHumans(double cost) {
    std::ostringstream formatted;
    formatted << std::fixed << std::setprecision(2);

    if (cost >= 1.0) {
        formatted << "€" << cost;
    } else if (cost >= 0.01) {
        formatted << cost * 100.0 << "¢";
    } else {
        return "0.10¢";
    }
    return formatted.str();
}

std::string CommitAnalyzer::getCostContext(double total_cost) {
    if (total_cost >= 0.10) {
        return "very expensive";
    } else if (total_cost >= 0.05) {
        return "expensive";
    } else if (total_cost >= 0.01) {
        return "moderate";
    } else if (total_cost >= 0.001) {
        return "cheap";
    }
    return "very cheap";
}

} // namespace Loom
