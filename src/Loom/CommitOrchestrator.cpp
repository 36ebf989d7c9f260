// =================================================================
// src/Loom/CommitOrchestrator.cpp
// =================================================================
// Implementation for the commit workflow.

#include "Loom/CommitOrchestrator.hpp"
#include "Loom/Errors.hpp"
#include "Loom/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <tuple>

namespace Loom {

CommitOrchestrator::CommitOrchestrator(VersionControl& vcs,
                                       CommitMessageGenerator& generator,
                                       BatchPlanner& planner,
                                       const LoomConfig& config,
                                       Console& console,
                                       const OrchestratorOptions& options)
    : m_vcs(vcs),
      m_generator(generator),
      m_planner(planner),
      m_config(config),
      m_console(console),
      m_options(options),
      m_analyzer(config) {}

int CommitOrchestrator::run() {
    m_result = CommitRunResult();
    m_pending_paths.clear();

    m_console.printInfo("Analyzing your changes...");

    std::vector<ChangedFile> files;
    std::string diff;
    try {
        files = m_vcs.getChangedFiles();
        m_result.files_found = files.size();
        if (files.empty()) {
            m_console.printError("No changes detected in the staging area.");
            return 1;
        }
        diff = m_vcs.getDiff(files);
    } catch (const GitError& e) {
        m_console.printError("An error occurred: " + std::string(e.what()));
        return 1;
    }

    m_console.printChangedFiles(files);

    CommitAnalysis analysis = m_analyzer.analyzeDiffComplexity(diff, files);
    if (!analysis.warnings.empty()) {
        m_console.printWarnings(analysis);
    }

    for (const auto& file : files) {
        m_pending_paths.push_back(file.path);
    }

    std::vector<FileGroup> batches = m_planner.planBatches(files);
    m_result.batches_planned = batches.size();

    if (batches.size() <= 1) {
        return runSingleCommit(files, diff);
    }
    return runBatches(batches);
}

int CommitOrchestrator::runSingleCommit(const std::vector<ChangedFile>& files, const std::string& diff) {
    CommitSuggestion suggestion;
    TokenUsage usage;
    try {
        std::tie(suggestion, usage) = m_generator.generateCommitMessage(diff, files);
    } catch (const AiServiceError& e) {
        m_console.printError(e.what());
        return 1;
    }
    m_result.batches_processed = 1;
    m_result.total_usage += usage;

    m_console.printInfo("Generated Commit Message:");
    m_console.printCommitMessage(suggestion.formatCommitMessage());
    m_console.printTokenUsage(usage);

    if (m_options.dry_run) {
        m_console.printInfo("Dry run: no commit was created.");
        return 0;
    }

    if (!m_options.auto_confirm && !m_console.confirmAction("Create this commit?")) {
        m_console.printWarning("Commit cancelled.");
        return 0;
    }

    try {
        if (!m_vcs.createCommit(suggestion.title, suggestion.formatBody())) {
            m_console.printWarning("No changes were committed. Files may already be committed.");
            return 0;
        }
        m_result.commits_created = 1;
        m_console.printSuccess("Commit created successfully!");
    } catch (const GitError& e) {
        m_console.printError(e.what());
        showStatusAfterFailure();
        return 1;
    }
    return 0;
}

int CommitOrchestrator::runBatches(const std::vector<FileGroup>& batches) {
    bool auto_commit = m_options.auto_confirm || m_options.dry_run;
    if (!auto_commit) {
        auto_commit = m_console.confirmAction("Would you like to automate the entire process?");
    }

    std::vector<ProcessedBatch> processed = processBatches(batches, auto_commit);
    if (processed.empty()) {
        m_console.printError("No batches were processed successfully.");
        return 1;
    }

    m_console.printInfo("📑 Batch Processing Summary:");
    for (size_t i = 0; i < processed.size(); ++i) {
        m_console.printBatchInfo(i + 1, processed[i].group.getPaths());
        m_console.printCommitMessage(processed[i].suggestion.formatCommitMessage());
    }

    if (m_options.dry_run) {
        m_console.printInfo("Dry run: no changes were staged or committed.");
        return 0;
    }

    if (auto_commit) {
        if (m_options.combine) {
            createCombinedCommit(processed);
        }
        return 0;
    }

    if (m_options.combine ||
        !m_console.confirmAction("Would you like to create individual commits for each batch?")) {
        createCombinedCommit(processed);
    } else {
        for (auto& batch : processed) {
            createIndividualCommit(batch, false);
        }
    }
    return 0;
}

std::vector<ProcessedBatch> CommitOrchestrator::processBatches(const std::vector<FileGroup>& batches,
                                                               bool auto_commit) {
    std::vector<ProcessedBatch> processed;
    const size_t total_files = m_pending_paths.size();
    const size_t total_batches = batches.size();

    m_console.printBatchSummary(total_files, total_batches);

    for (size_t i = 0; i < total_batches; ++i) {
        const size_t batch_num = i + 1;
        const FileGroup& batch = batches[i];
        m_console.printBatchStart(batch_num, total_batches, batch);

        try {
            std::string batch_diff = m_vcs.getDiff(batch.files);
            auto [suggestion, usage] = m_generator.generateCommitMessage(batch_diff, batch.files);

            ProcessedBatch entry;
            entry.group = batch;
            entry.suggestion = suggestion;
            entry.usage = usage;
            processed.push_back(std::move(entry));
            m_result.batches_processed++;
            m_result.total_usage += usage;

            m_console.printBatchComplete(batch_num, total_batches);
            m_console.printTokenUsage(usage, batch_num);

            if (auto_commit && !m_options.combine && !m_options.dry_run) {
                createIndividualCommit(processed.back(), true);
            }

            if (batch_num < total_batches && !auto_commit) {
                if (!m_console.confirmBatchContinue()) {
                    m_console.printWarning("Batch processing paused. Remaining files will be skipped.");
                    break;
                }
            }
        } catch (const std::runtime_error& e) {
            LOOM_LOG_ERROR("CommitOrchestrator", "Batch " + std::to_string(batch_num) + " failed", e.what());
            m_console.printError("Failed to process batch " + std::to_string(batch_num) + ": " + e.what());
            if (!auto_commit && !m_console.confirmAction("Try next batch?")) {
                break;
            }
        }
    }

    return processed;
}

bool CommitOrchestrator::createIndividualCommit(ProcessedBatch& batch, bool auto_confirm) {
    std::vector<std::string> paths = batch.group.getPaths();

    m_console.printInfo("Creating commit for:");
    for (const auto& path : paths) {
        m_console.printInfo("  - " + path);
    }
    m_console.printInfo("With message:");
    m_console.printCommitMessage(batch.suggestion.formatCommitMessage());

    if (!auto_confirm && !m_console.confirmAction("Create this commit?")) {
        return false;
    }

    batch.committed = stageAndCommit(paths, batch.suggestion);
    if (batch.committed) {
        m_console.printSuccess("Commit created successfully!");
    }
    return batch.committed;
}

bool CommitOrchestrator::createCombinedCommit(std::vector<ProcessedBatch>& batches) {
    std::vector<CommitSuggestion> suggestions;
    std::vector<std::string> paths;
    for (const auto& batch : batches) {
        if (batch.committed) {
            continue;
        }
        suggestions.push_back(batch.suggestion);
        for (const auto& path : batch.group.getPaths()) {
            paths.push_back(path);
        }
    }
    if (suggestions.empty()) {
        return false;
    }

    CommitSuggestion combined = CommitSuggestion::combine(suggestions);
    if (!stageAndCommit(paths, combined)) {
        return false;
    }

    for (auto& batch : batches) {
        batch.committed = true;
    }
    m_console.printSuccess("Combined commit created successfully!");
    return true;
}

bool CommitOrchestrator::stageAndCommit(const std::vector<std::string>& paths, const CommitSuggestion& suggestion) {
    try {
        m_vcs.stageFiles(paths);
        bool committed = m_vcs.createCommit(suggestion.title, suggestion.formatBody());
        if (!committed) {
            m_console.printWarning("No changes were committed. Files may already be committed.");
            restorePendingStage();
            return false;
        }

        m_result.commits_created++;
        markCommitted(paths);
        restorePendingStage();
        return true;
    } catch (const GitError& e) {
        m_console.printError("Failed to create commit: " + std::string(e.what()));
        showStatusAfterFailure();
        return false;
    }
}

void CommitOrchestrator::markCommitted(const std::vector<std::string>& paths) {
    std::set<std::string> done(paths.begin(), paths.end());
    m_pending_paths.erase(std::remove_if(m_pending_paths.begin(), m_pending_paths.end(),
                                         [&done](const std::string& path) { return done.count(path) > 0; }),
                          m_pending_paths.end());
}

void CommitOrchestrator::restorePendingStage() {
    if (m_pending_paths.empty()) {
        return;
    }
    LOOM_LOG_DEBUG("CommitOrchestrator", "Restoring staged files",
                   std::to_string(m_pending_paths.size()) + " path(s)");
    try {
        m_vcs.stageFiles(m_pending_paths);
    } catch (const GitError& e) {
        m_console.printWarning("Could not restage remaining files: " + std::string(e.what()));
    }
}

void CommitOrchestrator::showStatusAfterFailure() {
    try {
        std::string status = m_vcs.getShortStatus();
        if (status.empty()) {
            return;
        }
        m_console.printInfo("Current git status:");
        std::istringstream lines(status);
        std::string line;
        while (std::getline(lines, line)) {
            m_console.printInfo("  " + line);
        }
    } catch (const GitError& e) {
        LOOM_LOG_WARNING("CommitOrchestrator", "Could not read git status", e.what());
    }
}

} // namespace Loom
