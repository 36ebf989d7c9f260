// =================================================================
// include/Loom/VersionControl.hpp
// =================================================================
// Abstract interface to the version control system. Only the staging
// area and commit creation are needed.

#pragma once

#include "Loom/ChangedFile.hpp"
#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Staging-area operations used by the commit workflow
 *
 * Implementations report failures by throwing GitError.
 */
class VersionControl {
public:
    virtual ~VersionControl() = default;

    /**
     * @brief Staged files, minus ignored paths, with blob metadata when available
     */
    virtual std::vector<ChangedFile> getChangedFiles() = 0;

    /**
     * @brief Staged diff restricted to the given files
     * @param files Files to include; empty means the whole staging area
     * @return Unified diff text, or a "Binary files changed:" listing
     */
    virtual std::string getDiff(const std::vector<ChangedFile>& files) = 0;

    /**
     * @brief Replace the staging area with exactly the given paths
     */
    virtual void stageFiles(const std::vector<std::string>& paths) = 0;

    /**
     * @brief Commit the staging area
     * @param title Subject line
     * @param message Body text
     * @return False if there was nothing to commit
     */
    virtual bool createCommit(const std::string& title, const std::string& message) = 0;

    virtual void resetStagedChanges() = 0;

    virtual std::vector<std::string> getStagedFiles() = 0;

    /**
     * @brief Short working tree status, shown to the user after a failed commit
     */
    virtual std::string getShortStatus() = 0;
};

} // namespace Loom
