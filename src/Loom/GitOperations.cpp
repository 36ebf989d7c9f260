// =================================================================
// src/Loom/GitOperations.cpp
// =================================================================
// Implementation for git command line operations.

#include "Loom/GitOperations.hpp"
#include "Loom/Errors.hpp"
#include "Loom/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace Loom {

GitOperations::GitOperations(SysInteraction& sys, const std::vector<std::string>& ignored_patterns)
    : m_sys(sys), m_path_filter(ignored_patterns) {}

size_t GitOperations::loadIgnoreFile(const std::string& file_path) {
    return m_path_filter.loadFromFile(file_path);
}

bool GitOperations::shouldIgnoreFile(const std::string& file_path) const {
    return m_path_filter.isIgnored(file_path);
}

std::string GitOperations::getRepositoryRoot() {
    std::string root = runGitChecked({"rev-parse", "--show-toplevel"}, "Not a git repository");
    while (!root.empty() && (root.back() == '\n' || root.back() == '\r')) {
        root.pop_back();
    }
    return root;
}

CommandResult GitOperations::runGit(const std::vector<std::string>& args, bool capture_stderr) {
    CommandResult result = m_sys.executeCommand("git", args, capture_stderr);

    std::string command = "git";
    for (const auto& arg : args) {
        command += " " + arg;
    }
    Logger::getInstance().logGitCommand(command, result.exit_code);

    return result;
}

std::string GitOperations::runGitChecked(const std::vector<std::string>& args, const std::string& error_context) {
    CommandResult result = runGit(args);
    if (!result.succeeded()) {
        std::string details = result.output;
        while (!details.empty() && std::isspace(static_cast<unsigned char>(details.back()))) {
            details.pop_back();
        }
        if (details.empty()) {
            details = "exit code " + std::to_string(result.exit_code);
        }
        throw GitError(error_context + ": " + details);
    }
    return result.output;
}

std::vector<ChangedFile> GitOperations::getChangedFiles() {
    std::string names = runGitChecked({"diff", "--staged", "--name-only", "--"}, "Failed to get changed files");
    std::string numstat = runGitChecked({"diff", "--staged", "--numstat", "--"}, "Failed to get changed files");
    std::set<std::string> binary_paths = parseBinaryPaths(numstat);

    std::vector<ChangedFile> files;
    for (const auto& path : splitLines(names)) {
        const IgnoreRule* rule = m_path_filter.findDecidingRule(path);
        if (rule != nullptr && !rule->negated) {
            LOOM_LOG_DEBUG("GitOperations", "Ignoring staged file: " + path, "Rule: " + rule->pattern);
            continue;
        }

        ChangedFile file(path, binary_paths.count(path) > 0);
        readBlobMetadata(file);
        files.push_back(std::move(file));
    }

    LOOM_LOG_INFO("GitOperations", "Found " + std::to_string(files.size()) + " staged file(s)");
    return files;
}

void GitOperations::readBlobMetadata(ChangedFile& file) {
    CommandResult entry = runGit({"ls-files", "-s", "--", file.path}, false);
    if (!entry.succeeded()) {
        return;
    }

    std::istringstream fields(entry.output);
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() < 4) {
        // Deleted files have no index entry
        return;
    }

    const std::string& hash = tokens[1];
    CommandResult blob_size = runGit({"cat-file", "-s", hash}, false);
    if (!blob_size.succeeded()) {
        return;
    }

    std::istringstream size_stream(blob_size.output);
    std::uintmax_t size = 0;
    if (size_stream >> size) {
        file.hash = hash;
        file.size = size;
    }
}

std::string GitOperations::getDiff(const std::vector<ChangedFile>& files) {
    std::vector<std::string> paths;
    for (const auto& file : files) {
        paths.push_back(file.path);
    }

    std::vector<std::string> numstat_args = {"diff", "--staged", "--numstat", "--"};
    numstat_args.insert(numstat_args.end(), paths.begin(), paths.end());
    std::string numstat = runGitChecked(numstat_args, "Failed to get diff");

    if (numstat.find("-\t-\t") != std::string::npos) {
        std::ostringstream listing;
        listing << "Binary files changed:\n";
        for (const auto& file : files) {
            if (file.size) {
                listing << "- " << file.path << " (" << formatFileSize(*file.size) << ")\n";
            } else {
                listing << "- " << file.path << " (size unknown)\n";
            }
        }
        return listing.str();
    }

    std::vector<std::string> diff_args = {"diff", "--staged", "--"};
    diff_args.insert(diff_args.end(), paths.begin(), paths.end());
    return runGitChecked(diff_args, "Failed to get diff");
}

std::string GitOperations::formatFileSize(std::uintmax_t size) {
    static const char* const units[] = {"B", "KB", "MB", "GB"};

    double value = static_cast<double>(size);
    std::ostringstream formatted;
    formatted << std::fixed << std::setprecision(2);

    for (const char* unit : units) {
        if (value < 1024.0) {
            formatted << value << " " << unit;
            return formatted.str();
        }
        value /= 1024.0;
    }

    formatted << value << " TB";
    return formatted.str();
}

void GitOperations::stageFiles(const std::vector<std::string>& paths) {
    runGitChecked({"reset", "-q"}, "Failed to stage files");

    for (const auto& path : paths) {
        runGitChecked({"add", "--", path}, "Failed to stage files");
    }
}

bool GitOperations::createCommit(const std::string& title, const std::string& message) {
    CommandResult result = runGit({"commit", "-m", title, "-m", message});

    std::string lower = result.output;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    bool nothing_to_commit = lower.find("nothing to commit") != std::string::npos;

    if (!result.succeeded() && !nothing_to_commit) {
        throw GitError("Failed to create commit: " + result.output);
    }
    return !nothing_to_commit;
}

void GitOperations::resetStagedChanges() {
    runGitChecked({"reset", "-q"}, "Failed to reset staged changes");
}

std::vector<std::string> GitOperations::getStagedFiles() {
    return splitLines(runGitChecked({"diff", "--staged", "--name-only"}, "Failed to get staged files"));
}

std::string GitOperations::getShortStatus() {
    return runGitChecked({"status", "--short"}, "Failed to get status");
}

std::set<std::string> GitOperations::parseBinaryPaths(const std::string& numstat) {
    std::set<std::string> binary_paths;
    for (const auto& line : splitLines(numstat)) {
        if (line.compare(0, 4, "-\t-\t") == 0) {
            binary_paths.insert(line.substr(4));
        }
    }
    return binary_paths;
}

std::vector<std::string> GitOperations::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace Loom
