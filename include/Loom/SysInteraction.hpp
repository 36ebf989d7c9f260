// =================================================================
// include/Loom/SysInteraction.hpp
// =================================================================
// Defines the operating system layer: running external programs such
// as git, and the few filesystem writes done by `loom init`.

#pragma once

#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Captured output and exit code of a finished process
 */
struct CommandResult {
    std::string output;
    int exit_code = -1;     ///< -1 when the process did not exit normally

    bool succeeded() const { return exit_code == 0; }
};

class SysInteraction {
public:
    virtual ~SysInteraction() = default;

    /**
     * @brief Runs a program through the shell and waits for it.
     * @param program Program name, looked up on PATH.
     * @param args Arguments; each one is quoted for the shell.
     * @param capture_stderr Include stderr in the output instead of discarding it.
     * @throws std::runtime_error if the process cannot be started.
     */
    virtual CommandResult executeCommand(const std::string& program,
                                         const std::vector<std::string>& args,
                                         bool capture_stderr = true);

    /**
     * @brief Shell command line for a program invocation, including the stderr redirect.
     */
    static std::string buildCommandLine(const std::string& program,
                                        const std::vector<std::string>& args,
                                        bool capture_stderr);

    /**
     * @brief Quote a single argument for a POSIX shell.
     *
     * Plain words pass through unchanged; anything else is single-quoted.
     */
    static std::string quoteArgument(const std::string& arg);

    bool fileExists(const std::string& file_path) const;
    bool directoryExists(const std::string& dir_path) const;

    /**
     * @brief Creates a directory and any missing parents.
     * @return True if the directory exists afterwards.
     */
    bool createDirectory(const std::string& dir_path) const;

    /**
     * @brief Writes content to a file, replacing it.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content) const;
};

} // namespace Loom
