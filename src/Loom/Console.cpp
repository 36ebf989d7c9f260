// =================================================================
// src/Loom/Console.cpp
// =================================================================
// Implementation for terminal output and confirmations.

#include "Loom/Console.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace Loom {

namespace {

const char* const BOLD_BLUE = "\033[1;34m";
const char* const BOLD_GREEN = "\033[1;32m";
const char* const BOLD_YELLOW = "\033[1;33m";
const char* const BOLD_RED = "\033[1;31m";
const char* const BOLD_CYAN = "\033[1;36m";
const char* const CYAN = "\033[36m";
const char* const DIM = "\033[2m";

std::string withThousands(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<size_t>(pos), ",");
    }
    return value < 0 ? "-" + digits : digits;
}

} // namespace

Console::Console(std::ostream& out, std::istream& in, bool use_color)
    : m_out(out), m_in(in), m_use_color(use_color) {}

std::string Console::colorize(const std::string& code, const std::string& text) const {
    if (!m_use_color) {
        return text;
    }
    return code + text + "\033[0m";
}

void Console::printChangedFiles(const std::vector<ChangedFile>& files) {
    m_out << "\n" << colorize(BOLD_BLUE, "📜 Changes detected in the following files:") << "\n";
    for (const auto& file : files) {
        m_out << "  - " << colorize(CYAN, file.path) << "\n";
    }
}

void Console::printWarnings(const CommitAnalysis& analysis) {
    if (analysis.warnings.empty()) {
        return;
    }

    m_out << "\n" << colorize(BOLD_YELLOW, "⚠️ Commit Size Warnings:") << "\n";
    for (const auto& warning : analysis.warnings) {
        const char* icon = warning.level == WarningLevel::HIGH ? "🔴" : "🟡";
        m_out << icon << " " << warning.message << "\n";
    }

    std::ostringstream cost;
    cost << std::fixed << std::setprecision(4) << analysis.estimated_cost;

    m_out << "\n" << colorize(CYAN, "📊 Commit Statistics:") << "\n";
    m_out << "  • Estimated tokens: " << withThousands(static_cast<long long>(analysis.estimated_tokens)) << "\n";
    m_out << "  • Estimated cost: €" << cost.str() << "\n";
    m_out << "  • Files changed: " << analysis.num_files << "\n";
}

void Console::printBatchSummary(size_t total_files, size_t total_batches) {
    m_out << "\n" << colorize(BOLD_BLUE, "🔄 Batch Processing Summary:") << "\n";
    m_out << "  • Total files: " << colorize(CYAN, std::to_string(total_files)) << "\n";
    m_out << "  • Number of batches: " << colorize(CYAN, std::to_string(total_batches)) << "\n";
    if (total_batches > 0) {
        m_out << "  • Files per batch: " << colorize(CYAN, "~" + std::to_string(total_files / total_batches)) << "\n";
    }
}

void Console::printBatchStart(size_t batch_num, size_t total_batches, const FileGroup& batch) {
    m_out << "\n" << colorize(BOLD_BLUE, "📦 Processing Batch " + std::to_string(batch_num) + "/" +
                                         std::to_string(total_batches)) << "\n";
    if (!batch.reason.empty()) {
        m_out << colorize(CYAN, "Reason: ") << batch.reason << "\n";
    }
    m_out << colorize(CYAN, "Files in this batch:") << "\n";
    for (const auto& file : batch.files) {
        m_out << "  - " << colorize(DIM, file.path) << "\n";
    }
}

void Console::printBatchComplete(size_t batch_num, size_t total_batches) {
    m_out << "\n" << colorize(BOLD_GREEN, "✅ Batch " + std::to_string(batch_num) + "/" +
                                          std::to_string(total_batches) + " completed successfully") << "\n";
}

void Console::printBatchInfo(size_t batch_num, const std::vector<std::string>& files) {
    m_out << "\n" << colorize(BOLD_BLUE, "📑 Batch " + std::to_string(batch_num) + " Summary:") << "\n";
    for (const auto& file : files) {
        m_out << "  - " << colorize(CYAN, file) << "\n";
    }
}

void Console::printGroupSummary(size_t group_num, const std::string& summary) {
    m_out << "\n" << colorize(BOLD_BLUE, "🧩 Group " + std::to_string(group_num)) << "\n";
    std::istringstream lines(summary);
    std::string line;
    while (std::getline(lines, line)) {
        m_out << "  " << line << "\n";
    }
}

void Console::printCommitMessage(const std::string& message) {
    std::vector<std::string> lines;
    std::istringstream stream(message);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }

    const std::string rule(60, '-');
    m_out << colorize(BOLD_GREEN, rule) << "\n";
    for (const auto& text : lines) {
        m_out << "  " << text << "\n";
    }
    m_out << colorize(BOLD_GREEN, rule) << "\n";
}

void Console::printTokenUsage(const TokenUsage& usage, std::optional<size_t> batch_num) {
    std::string batch_info = batch_num ? " (Batch " + std::to_string(*batch_num) + ")" : "";

    m_out << "\n" << colorize(BOLD_CYAN, "📊 Token Usage Summary" + batch_info + ":") << "\n";
    m_out << "  • Prompt Tokens: " << withThousands(usage.prompt_tokens) << "\n";
    m_out << "  • Completion Tokens: " << withThousands(usage.completion_tokens) << "\n";
    m_out << "  • Total Tokens: " << withThousands(usage.total_tokens) << "\n";
    m_out << "\n" << colorize(BOLD_GREEN, "💰 Cost Breakdown:") << "\n";
    m_out << "  • Input Cost: " << formatCost(usage.input_cost) << "\n";
    m_out << "  • Output Cost: " << formatCost(usage.output_cost) << "\n";
    m_out << "  • Total Cost: " << formatCost(usage.total_cost) << "\n";
}

void Console::printInfo(const std::string& message) {
    m_out << "\n" << colorize(BOLD_BLUE, "ℹ️ " + message) << "\n";
}

void Console::printSuccess(const std::string& message) {
    m_out << "\n" << colorize(BOLD_GREEN, "✅ " + message) << "\n";
}

void Console::printWarning(const std::string& message) {
    m_out << "\n" << colorize(BOLD_YELLOW, "⚠️ " + message) << "\n";
}

void Console::printError(const std::string& message) {
    m_out << "\n" << colorize(BOLD_RED, "❌ " + message) << "\n";
}

bool Console::confirmAction(const std::string& prompt, bool default_answer) {
    while (true) {
        m_out << "\n" << prompt << (default_answer ? " [Y/n]: " : " [y/N]: ") << std::flush;

        std::string answer;
        if (!std::getline(m_in, answer)) {
            m_out << "\n";
            return default_answer;
        }

        answer.erase(0, answer.find_first_not_of(" \t\r"));
        answer.erase(answer.find_last_not_of(" \t\r") + 1);
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (answer.empty()) {
            return default_answer;
        }
        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no") {
            return false;
        }
        m_out << "Please answer y or n.";
    }
}

bool Console::confirmBatchContinue() {
    return confirmAction(colorize(BOLD_YELLOW, "🤔 Continue with next batch?"));
}

std::string Console::formatCost(double cost) {
    std::ostringstream formatted;
    formatted << CommitAnalyzer::formatCostForHumans(cost)
              << " (€" << std::fixed << std::setprecision(8) << cost << ")";
    return formatted.str();
}

} // namespace Loom
