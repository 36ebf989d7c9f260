// =================================================================
// src/Loom/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Loom/Core.hpp"
#include "Loom/AiService.hpp"
#include "Loom/BatchPlanner.hpp"
#include "Loom/CommitOrchestrator.hpp"
#include "Loom/Console.hpp"
#include "Loom/Errors.hpp"
#include "Loom/FileSource.hpp"
#include "Loom/GitOperations.hpp"
#include "Loom/Logger.hpp"
#include "Loom/LoomConfig.hpp"
#include "Loom/SysInteraction.hpp"
#include <chrono>
#include <filesystem>
#include <sstream>

namespace Loom {

namespace {
const char* const IGNORE_FILE = ".loomignore";
}

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>()),
      m_console(std::make_unique<Console>())
{
}

Core::~Core() = default;

int Core::run() {
    configureLogging();

    std::ostringstream details;
    details << "yes=" << m_commands.auto_confirm
            << " combine=" << m_commands.combine
            << " dry_run=" << m_commands.dry_run
            << " smart_grouping=" << !m_commands.no_smart_grouping;
    Logger::getInstance().logSessionStart(m_commands.active_command, details.str());
    auto start_time = std::chrono::steady_clock::now();

    int exit_code = 1;
    if (m_commands.active_command == "init") {
        exit_code = handleInit();
    } else if (m_commands.active_command == "group") {
        exit_code = handleGroup();
    } else if (m_commands.active_command == "commit" || m_commands.active_command.empty()) {
        exit_code = handleCommit();
    } else {
        m_console->printError("Unknown command: " + m_commands.active_command);
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code,
                                        static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    if (m_commands.debug) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    }
    logger.initialize();
}

int Core::handleInit() {
    std::filesystem::path config_path(m_commands.config_path);
    std::string config_dir = config_path.parent_path().string();

    if (!config_dir.empty() && !m_sys->directoryExists(config_dir)) {
        if (!m_sys->createDirectory(config_dir)) {
            m_console->printError("Could not create directory " + config_dir);
            return 1;
        }
        m_console->printInfo("Created directory: " + config_dir);
    }

    if (m_sys->fileExists(m_commands.config_path)) {
        m_console->printInfo("Configuration file already exists: " + m_commands.config_path);
        return 0;
    }

    if (!m_sys->writeFile(m_commands.config_path, LoomConfig::getDefaultConfigYaml())) {
        m_console->printError("Could not write " + m_commands.config_path);
        return 1;
    }

    m_console->printSuccess("Created default configuration: " + m_commands.config_path);
    m_console->printInfo("Set OPENAI_API_KEY in your environment or in " + m_commands.env_path
                         + " before running 'loom commit'.");
    return 0;
}

bool Core::enterRepositoryRoot() {
    GitOperations probe(*m_sys, {});
    try {
        std::filesystem::current_path(probe.getRepositoryRoot());
    } catch (const GitError& e) {
        m_console->printError(e.what());
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        m_console->printError(std::string("Cannot enter repository root: ") + e.what());
        return false;
    }
    return true;
}

bool Core::loadConfig(bool require_api_key) {
    m_config = std::make_unique<LoomConfig>(LoomConfig::load(m_commands));
    if (!m_config->validate(require_api_key)) {
        m_console->printError("Invalid configuration. Run 'loom init' and check "
                              + m_commands.config_path + " or your environment.");
        return false;
    }
    return true;
}

int Core::handleCommit() {
    if (!enterRepositoryRoot() || !loadConfig(true)) {
        return 1;
    }

    GitOperations git(*m_sys, m_config->ignored_patterns);
    size_t extra_patterns = git.loadIgnoreFile(IGNORE_FILE);
    if (extra_patterns > 0) {
        LOOM_LOG_DEBUG("Core", "Loaded ignore patterns", std::to_string(extra_patterns) + " from " + IGNORE_FILE);
    }

    DiskFileSource source(".");
    BatchPlanner planner(*m_config, source);
    AiService ai(*m_config);

    OrchestratorOptions options;
    options.auto_confirm = m_commands.auto_confirm;
    options.combine = m_commands.combine;
    options.dry_run = m_commands.dry_run;

    CommitOrchestrator orchestrator(git, ai, planner, *m_config, *m_console, options);
    return orchestrator.run();
}

int Core::handleGroup() {
    if (!enterRepositoryRoot() || !loadConfig(false)) {
        return 1;
    }

    GitOperations git(*m_sys, m_config->ignored_patterns);
    git.loadIgnoreFile(IGNORE_FILE);

    std::vector<ChangedFile> files;
    try {
        files = git.getChangedFiles();
    } catch (const GitError& e) {
        m_console->printError(e.what());
        return 1;
    }

    if (files.empty()) {
        m_console->printWarning("No changes detected in the staging area.");
        return 0;
    }

    m_console->printChangedFiles(files);

    DiskFileSource source(".");
    BatchPlanner planner(*m_config, source);
    std::vector<FileGroup> groups = planner.planBatches(files);

    m_console->printBatchSummary(files.size(), groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        m_console->printGroupSummary(i + 1, planner.getGrouper().getGroupSummary(groups[i]));
    }
    return 0;
}

} // namespace Loom
