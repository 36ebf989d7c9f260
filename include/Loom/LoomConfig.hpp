// =================================================================
// include/Loom/LoomConfig.hpp
// =================================================================
// Configuration structure layered from defaults, .loom/config.yml,
// a .env file, the process environment and command-line overrides.

#pragma once

#include "Loom/SmartGrouper.hpp"
#include <map>
#include <string>
#include <vector>

namespace Loom {

struct Commands;
class EnvFileParser;

/**
 * @brief Pricing of a model, in EUR per 1M tokens
 */
struct ModelCosts {
    double input = 0.0;
    double output = 0.0;
};

/**
 * @brief Configuration settings for commit generation
 */
struct LoomConfig {
    // Complexity thresholds
    size_t token_limit = 120000;
    size_t max_files_threshold = 5;
    double cost_warning_threshold = 0.05;
    size_t token_estimation_ratio = 4;

    // Message generation
    std::string default_model = "gpt-4o-mini";
    std::string api_key;
    std::string api_base_url = "https://api.openai.com";
    int request_timeout_seconds = 30;
    std::map<std::string, ModelCosts> model_costs = getDefaultModelCosts();

    // Staged paths that are never analysed or sent
    std::vector<std::string> ignored_patterns = getDefaultIgnorePatterns();

    // Grouping
    bool smart_grouping = true;
    GroupingConfig grouping;

    /**
     * @brief Load the full configuration in layering order
     *
     * Defaults, then the YAML file, then the .env file, then the process
     * environment, then command-line overrides.
     * @param commands Parsed command line (also names the file locations)
     */
    static LoomConfig load(const Commands& commands);

    /**
     * @brief Overlay values from a YAML configuration file
     * @param config_path Path to the YAML file
     * @return False if the file exists but could not be parsed
     */
    bool loadFromYamlFile(const std::string& config_path);

    /**
     * @brief Overlay values from YAML text
     * @return False if the text could not be parsed
     */
    bool loadFromYamlString(const std::string& yaml_text);

    /**
     * @brief Overlay recognised variables from a .env file
     * @param env Parsed .env file
     */
    void loadFromEnvFile(const EnvFileParser& env);

    /**
     * @brief Overlay recognised variables from the process environment
     */
    void loadFromEnvironment();

    /**
     * @brief Apply OPENAI_API_KEY, TOKEN_LIMIT, MAX_FILES_THRESHOLD,
     *        COST_WARNING_THRESHOLD and MODEL_NAME from a variable map
     *
     * Invalid numbers are logged and the current value is kept.
     */
    void applyEnvironmentValues(const std::map<std::string, std::string>& values);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Pricing for a model
     *
     * Unknown models fall back to the default model's pricing, or zero.
     */
    ModelCosts getModelCosts(const std::string& model) const;

    /**
     * @brief Validate configuration settings
     * @param require_api_key Whether a missing API key is an error
     * @return True if configuration is valid; every problem is logged
     */
    bool validate(bool require_api_key = true) const;

    static std::vector<std::string> getDefaultIgnorePatterns();
    static std::map<std::string, ModelCosts> getDefaultModelCosts();

    /**
     * @brief Commented YAML written by `loom init`
     */
    static std::string getDefaultConfigYaml();
};

} // namespace Loom
