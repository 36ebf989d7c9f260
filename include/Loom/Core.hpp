// =================================================================
// include/Loom/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Loom/CliParser.hpp"
#include <memory>
#include <string>

namespace Loom {
    class SysInteraction;
    class Console;
    struct LoomConfig;
}

namespace Loom {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor defined in the .cpp file because of the
     * forward-declared unique_ptr members.
     */
    ~Core();

    /**
     * @brief Runs the subcommand selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleCommit();
    int handleGroup();

    /**
     * @brief Switch to the top of the current git working tree so that
     * paths reported by git resolve on disk.
     * @return false when not inside a repository
     */
    bool enterRepositoryRoot();

    /// Load and validate configuration for a workflow command
    bool loadConfig(bool require_api_key);

    void configureLogging();

    const Commands& m_commands;
    std::unique_ptr<SysInteraction> m_sys;
    std::unique_ptr<Console> m_console;
    std::unique_ptr<LoomConfig> m_config;
};

} // namespace Loom
