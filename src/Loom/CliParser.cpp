// =================================================================
// src/Loom/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Loom/CliParser.hpp"

namespace Loom {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Loom: AI-assisted commit messages with smart file grouping.");
    m_app->require_subcommand(0, 1);

    // Store which subcommand was used; no subcommand means "commit"
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupGlobalOptions(*m_app);
    setupCommitCommand(*m_app);
    setupGroupCommand(*m_app);
    setupInitCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    app.add_flag("-y,--yes", m_commands.auto_confirm, "Skip all confirmation prompts.");
    app.add_flag("-c,--combine", m_commands.combine, "Combine all batches into a single commit.");
    app.add_flag("--no-smart-grouping", m_commands.no_smart_grouping,
                 "Split large changes into fixed-size batches instead of smart groups.");
    app.add_option("--max-group-size", m_commands.max_group_size,
                   "Maximum number of files per group.")->check(CLI::PositiveNumber);
    app.add_flag("--dry-run", m_commands.dry_run, "Show the plan and suggested messages without committing.");
    app.add_flag("-d,--debug", m_commands.debug, "Enable debug logging on the console.");
    app.add_option("-m,--model", m_commands.model_name, "Model used to generate commit messages.");
    app.add_option("--config", m_commands.config_path, "Path to the configuration file.");
    app.add_option("--env-file", m_commands.env_path, "Path to a .env file with API credentials.");
}

void CliParser::setupCommitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("commit", "Generates commit messages for staged changes and commits them (default).");
    sub->fallthrough();
}

void CliParser::setupGroupCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("group", "Shows how staged changes would be grouped, without calling the AI service.");
    sub->fallthrough();
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes a default .loom/config.yml for the current repository.");
    sub->fallthrough();
}

} // namespace Loom
