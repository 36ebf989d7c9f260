// =================================================================
// src/Loom/LoomConfig.cpp
// =================================================================
// Implementation for layered configuration loading.

#include "Loom/LoomConfig.hpp"
#include "Loom/CliParser.hpp"
#include "Loom/EnvFileParser.hpp"
#include "Loom/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace Loom {

namespace {

// Read an optional scalar; conversion failures keep the current value
template <typename T>
void readScalar(const YAML::Node& node, const std::string& key, T& target) {
    if (!node[key]) {
        return;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("LoomConfig", "Invalid value for '" + key + "', keeping "
                                      "previous value", e.what());
    }
}

void applyYaml(LoomConfig& config, const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        Logger::getInstance().warning("LoomConfig", "Configuration root is not a map, ignoring it");
        return;
    }

    readScalar(root, "token_limit", config.token_limit);
    readScalar(root, "max_files_threshold", config.max_files_threshold);
    readScalar(root, "cost_warning_threshold", config.cost_warning_threshold);
    readScalar(root, "token_estimation_ratio", config.token_estimation_ratio);
    readScalar(root, "default_model", config.default_model);
    readScalar(root, "api_base_url", config.api_base_url);
    readScalar(root, "request_timeout_seconds", config.request_timeout_seconds);
    readScalar(root, "smart_grouping", config.smart_grouping);

    if (root["ignored_patterns"]) {
        if (root["ignored_patterns"].IsSequence()) {
            std::vector<std::string> patterns;
            for (const auto& pattern : root["ignored_patterns"]) {
                patterns.push_back(pattern.as<std::string>());
            }
            config.ignored_patterns = patterns;
        } else {
            Logger::getInstance().warning("LoomConfig", "'ignored_patterns' must be a list, ignoring it");
        }
    }

    if (root["model_costs"]) {
        YAML::Node costs = root["model_costs"];
        for (YAML::const_iterator it = costs.begin(); it != costs.end(); ++it) {
            std::string model = it->first.as<std::string>();
            ModelCosts model_costs = config.getModelCosts(model);
            readScalar(it->second, "input", model_costs.input);
            readScalar(it->second, "output", model_costs.output);
            config.model_costs[model] = model_costs;
        }
    }

    if (root["grouping"]) {
        YAML::Node grouping = root["grouping"];
        readScalar(grouping, "max_group_size", config.grouping.max_group_size);
        readScalar(grouping, "small_group_threshold", config.grouping.small_group_threshold);
        readScalar(grouping, "max_file_size_for_analysis", config.grouping.max_file_size_for_analysis);
    }
}

bool parseSize(const std::string& name, const std::string& text, size_t& target) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || text.find('-') != std::string::npos) {
            throw std::invalid_argument(text);
        }
        target = static_cast<size_t>(value);
        return true;
    } catch (const std::logic_error&) {
        Logger::getInstance().warning("LoomConfig", "Invalid " + name + " value, keeping " +
                                      std::to_string(target), text);
        return false;
    }
}

bool parseDouble(const std::string& name, const std::string& text, double& target) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        target = value;
        return true;
    } catch (const std::logic_error&) {
        Logger::getInstance().warning("LoomConfig", "Invalid " + name + " value, keeping previous value", text);
        return false;
    }
}

} // namespace

LoomConfig LoomConfig::load(const Commands& commands) {
    LoomConfig config;

    if (!config.loadFromYamlFile(commands.config_path)) {
        Logger::getInstance().warning("LoomConfig", "Using defaults for unreadable configuration",
                                      commands.config_path);
    }

    EnvFileParser env(commands.env_path);
    config.loadFromEnvFile(env);
    config.loadFromEnvironment();
    config.applyCommandOverrides(commands);

    return config;
}

bool LoomConfig::loadFromYamlFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist, e.g., before `init` is run.
        return true;
    }

    try {
        applyYaml(*this, YAML::LoadFile(config_path));
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("LoomConfig", "Failed to parse configuration file " + config_path, e.what());
        return false;
    }

    Logger::getInstance().debug("LoomConfig", "Loaded configuration", config_path);
    return true;
}

bool LoomConfig::loadFromYamlString(const std::string& yaml_text) {
    try {
        applyYaml(*this, YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("LoomConfig", "Failed to parse configuration", e.what());
        return false;
    }
    return true;
}

void LoomConfig::loadFromEnvFile(const EnvFileParser& env) {
    applyEnvironmentValues(env.getValues());
}

void LoomConfig::loadFromEnvironment() {
    static const char* const names[] = {
        "OPENAI_API_KEY", "TOKEN_LIMIT", "MAX_FILES_THRESHOLD", "COST_WARNING_THRESHOLD", "MODEL_NAME"
    };

    std::map<std::string, std::string> values;
    for (const char* name : names) {
        const char* value = std::getenv(name);
        if (value != nullptr) {
            values[name] = value;
        }
    }
    applyEnvironmentValues(values);
}

void LoomConfig::applyEnvironmentValues(const std::map<std::string, std::string>& values) {
    auto lookup = [&values](const std::string& key) -> const std::string* {
        auto it = values.find(key);
        if (it == values.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    };

    if (const auto* value = lookup("OPENAI_API_KEY")) {
        api_key = *value;
    }
    if (const auto* value = lookup("TOKEN_LIMIT")) {
        parseSize("TOKEN_LIMIT", *value, token_limit);
    }
    if (const auto* value = lookup("MAX_FILES_THRESHOLD")) {
        parseSize("MAX_FILES_THRESHOLD", *value, max_files_threshold);
    }
    if (const auto* value = lookup("COST_WARNING_THRESHOLD")) {
        parseDouble("COST_WARNING_THRESHOLD", *value, cost_warning_threshold);
    }
    if (const auto* value = lookup("MODEL_NAME")) {
        default_model = *value;
    }
}

void LoomConfig::applyCommandOverrides(const Commands& commands) {
    if (commands.max_group_size > 0) {
        grouping.max_group_size = commands.max_group_size;
    }
    if (!commands.model_name.empty()) {
        default_model = commands.model_name;
    }
    if (commands.no_smart_grouping) {
        smart_grouping = false;
    }
}

ModelCosts LoomConfig::getModelCosts(const std::string& model) const {
    auto it = model_costs.find(model);
    if (it != model_costs.end()) {
        return it->second;
    }

    auto fallback = model_costs.find(default_model);
    if (fallback != model_costs.end()) {
        return fallback->second;
    }
    return ModelCosts{};
}

bool LoomConfig::validate(bool require_api_key) const {
    bool valid = true;
    Logger& logger = Logger::getInstance();

    if (require_api_key && api_key.empty()) {
        logger.error("LoomConfig", "OPENAI_API_KEY is not set (environment or .env file)");
        valid = false;
    }

    if (token_limit == 0) {
        logger.error("LoomConfig", "token_limit must be greater than 0");
        valid = false;
    }

    if (max_files_threshold == 0) {
        logger.error("LoomConfig", "max_files_threshold must be greater than 0");
        valid = false;
    }

    if (token_estimation_ratio == 0) {
        logger.error("LoomConfig", "token_estimation_ratio must be greater than 0");
        valid = false;
    }

    if (cost_warning_threshold < 0.0) {
        logger.error("LoomConfig", "cost_warning_threshold cannot be negative");
        valid = false;
    }

    if (default_model.empty()) {
        logger.error("LoomConfig", "default_model cannot be empty");
        valid = false;
    } else if (model_costs.find(default_model) == model_costs.end()) {
        logger.warning("LoomConfig", "No pricing configured for model '" + default_model +
                       "', cost estimates will be inaccurate");
    }

    if (request_timeout_seconds <= 0) {
        logger.error("LoomConfig", "request_timeout_seconds must be greater than 0");
        valid = false;
    }

    if (grouping.max_group_size == 0) {
        logger.error("LoomConfig", "grouping.max_group_size must be greater than 0");
        valid = false;
    }

    return valid;
}

std::vector<std::string> LoomConfig::getDefaultIgnorePatterns() {
    return {
        "bun.lockb",
        "package-lock.json",
        "yarn.lock",
        "pnpm-lock.yaml",
        ".env",
        ".env.*",
        "*.lock",
        "*.log",
        "__pycache__/*",
        "*.pyc",
        ".DS_Store",
        "dist/*",
        "build/*",
        "node_modules/*",
        "*.min.js",
        "*.min.css"
    };
}

std::map<std::string, ModelCosts> LoomConfig::getDefaultModelCosts() {
    return {
        {"gpt-4o-mini", ModelCosts{0.00015, 0.00060}}
    };
}

std::string LoomConfig::getDefaultConfigYaml() {
    std::ostringstream yaml;
    yaml << "# Loom configuration\n"
         << "# Values here are overridden by .env, environment variables and flags.\n"
         << "\n"
         << "default_model: gpt-4o-mini\n"
         << "api_base_url: https://api.openai.com\n"
         << "request_timeout_seconds: 30\n"
         << "\n"
         << "# Complexity warnings\n"
         << "token_limit: 120000\n"
         << "max_files_threshold: 5\n"
         << "cost_warning_threshold: 0.05\n"
         << "token_estimation_ratio: 4\n"
         << "\n"
         << "# Pricing per 1M tokens\n"
         << "model_costs:\n"
         << "  gpt-4o-mini:\n"
         << "    input: 0.00015\n"
         << "    output: 0.00060\n"
         << "\n"
         << "smart_grouping: true\n"
         << "grouping:\n"
         << "  max_group_size: 5\n"
         << "  small_group_threshold: 3\n"
         << "  max_file_size_for_analysis: 200000\n"
         << "\n"
         << "# Staged paths never sent for analysis (gitignore syntax)\n"
         << "ignored_patterns:\n";
    for (const auto& pattern : getDefaultIgnorePatterns()) {
        yaml << "  - \"" << pattern << "\"\n";
    }
    return yaml.str();
}

} // namespace Loom
