// =================================================================
// include/Loom/CommitOrchestrator.hpp
// =================================================================
// Header for the commit workflow: analyse, plan batches, generate
// messages and create individual or combined commits.

#pragma once

#include "Loom/BatchPlanner.hpp"
#include "Loom/CommitAnalyzer.hpp"
#include "Loom/CommitMessageGenerator.hpp"
#include "Loom/Console.hpp"
#include "Loom/LoomConfig.hpp"
#include "Loom/VersionControl.hpp"
#include <set>
#include <string>
#include <vector>

namespace Loom {

struct OrchestratorOptions {
    bool auto_confirm = false;  ///< Never prompt; commit each batch as soon as it is ready
    bool combine = false;       ///< One commit for all batches
    bool dry_run = false;       ///< Never stage or commit
};

/**
 * @brief A batch with its generated message
 */
struct ProcessedBatch {
    FileGroup group;
    CommitSuggestion suggestion;
    TokenUsage usage;
    bool committed = false;
};

/**
 * @brief Counters describing the last run
 */
struct CommitRunResult {
    size_t files_found = 0;
    size_t batches_planned = 0;
    size_t batches_processed = 0;
    size_t commits_created = 0;
    TokenUsage total_usage;
};

/**
 * @brief Drives one `loom commit` session
 *
 * All collaborators are borrowed and must outlive the orchestrator.
 */
class CommitOrchestrator {
public:
    CommitOrchestrator(VersionControl& vcs,
                       CommitMessageGenerator& generator,
                       BatchPlanner& planner,
                       const LoomConfig& config,
                       Console& console,
                       const OrchestratorOptions& options = OrchestratorOptions());

    /**
     * @brief Run the full workflow
     * @return Process exit code
     */
    int run();

    const CommitRunResult& getLastResult() const { return m_result; }

private:
    VersionControl& m_vcs;
    CommitMessageGenerator& m_generator;
    BatchPlanner& m_planner;
    const LoomConfig& m_config;
    Console& m_console;
    OrchestratorOptions m_options;
    CommitAnalyzer m_analyzer;

    CommitRunResult m_result;
    std::vector<std::string> m_pending_paths;   ///< Staged paths not yet committed

    /**
     * @brief One suggestion for everything that is staged
     */
    int runSingleCommit(const std::vector<ChangedFile>& files, const std::string& diff);

    int runBatches(const std::vector<FileGroup>& batches);

    /**
     * @brief Generate messages batch by batch
     *
     * In automatic mode each batch is committed as soon as its message is
     * ready, unless the batches are to be combined.
     */
    std::vector<ProcessedBatch> processBatches(const std::vector<FileGroup>& batches, bool auto_commit);

    bool createIndividualCommit(ProcessedBatch& batch, bool auto_confirm);
    bool createCombinedCommit(std::vector<ProcessedBatch>& batches);

    /**
     * @brief Stage exactly the given paths and commit them
     * @return False when git had nothing to commit
     */
    bool stageAndCommit(const std::vector<std::string>& paths, const CommitSuggestion& suggestion);

    /// Put back on the stage the paths that are still waiting for a commit
    void restorePendingStage();

    void markCommitted(const std::vector<std::string>& paths);

    void showStatusAfterFailure();
};

} // namespace Loom
