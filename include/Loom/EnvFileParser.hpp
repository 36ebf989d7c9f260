// =================================================================
// include/Loom/EnvFileParser.hpp
// =================================================================
// Defines a simple parser for KEY=VALUE .env files.

#pragma once

#include <string>
#include <map>

namespace Loom {

class EnvFileParser {
public:
    EnvFileParser() = default;

    /**
     * @brief Constructs the parser and loads the given file.
     * @param env_path The path to the .env file. A missing file is not an error.
     */
    explicit EnvFileParser(const std::string& env_path);

    /**
     * @brief Parses .env content. Accepts "export KEY=VALUE", quoted values and # comments.
     */
    void parse(const std::string& content);

    /**
     * @brief Retrieves a value for a given key.
     * @param key The variable name (e.g., "OPENAI_API_KEY").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    bool hasValue(const std::string& key) const;

    const std::map<std::string, std::string>& getValues() const { return m_values; }

private:
    std::map<std::string, std::string> m_values;
};

} // namespace Loom
