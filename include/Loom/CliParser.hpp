// =================================================================
// include/Loom/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Loom {

// Parsed command information. Global options apply to every subcommand.
struct Commands {
    std::string active_command = "commit"; // Name of the subcommand triggered

    bool auto_confirm = false;        // -y: answer yes to every prompt
    bool combine = false;             // -c: one commit for all batches
    bool no_smart_grouping = false;   // fixed-size batches instead of smart groups
    bool dry_run = false;             // never stage or commit
    bool debug = false;               // debug output on the console

    size_t max_group_size = 0;        // 0 means "use configuration"
    std::string model_name;           // empty means "use configuration"
    std::string config_path = ".loom/config.yml";
    std::string env_path = ".env";
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupCommitCommand(CLI::App& app);
    void setupGroupCommand(CLI::App& app);
    void setupInitCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Loom
