// =================================================================
// include/Loom/GitOperations.hpp
// =================================================================
// VersionControl implementation that drives the git command line.

#pragma once

#include "Loom/PathFilter.hpp"
#include "Loom/SysInteraction.hpp"
#include "Loom/VersionControl.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace Loom {

class GitOperations : public VersionControl {
public:
    /**
     * @brief Construct over a system interaction layer
     * @param sys Used to run git; must outlive this object
     * @param ignored_patterns Gitignore-style patterns for staged paths to skip
     */
    GitOperations(SysInteraction& sys, const std::vector<std::string>& ignored_patterns);

    /**
     * @brief Add patterns from an ignore file such as .loomignore
     * @return Number of patterns loaded
     */
    size_t loadIgnoreFile(const std::string& file_path);

    bool shouldIgnoreFile(const std::string& file_path) const;

    /**
     * @brief Absolute path of the working tree root
     * @throws GitError outside a git repository
     */
    std::string getRepositoryRoot();

    std::vector<ChangedFile> getChangedFiles() override;
    std::string getDiff(const std::vector<ChangedFile>& files) override;
    void stageFiles(const std::vector<std::string>& paths) override;
    bool createCommit(const std::string& title, const std::string& message) override;
    void resetStagedChanges() override;
    std::vector<std::string> getStagedFiles() override;
    std::string getShortStatus() override;

    /**
     * @brief Human-readable size with two decimals, e.g. "1.50 KB"
     */
    static std::string formatFileSize(std::uintmax_t size);

    /**
     * @brief Paths reported as binary ("-\t-\t") in numstat output
     */
    static std::set<std::string> parseBinaryPaths(const std::string& numstat);

    static std::vector<std::string> splitLines(const std::string& text);

private:
    SysInteraction& m_sys;
    PathFilter m_path_filter;

    /**
     * @brief Run git with the given arguments
     * @return Output and exit code; never throws for a non-zero exit
     */
    CommandResult runGit(const std::vector<std::string>& args, bool capture_stderr = true);

    /**
     * @brief Run git and throw GitError with the given context on failure
     */
    std::string runGitChecked(const std::vector<std::string>& args, const std::string& error_context);

    /// Fill hash and size from the index; leaves them unset on any failure
    void readBlobMetadata(ChangedFile& file);
};

} // namespace Loom
