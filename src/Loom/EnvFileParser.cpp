// =================================================================
// src/Loom/EnvFileParser.cpp
// =================================================================
// Implementation for the .env file parser.

#include "Loom/EnvFileParser.hpp"
#include <fstream>
#include <sstream>

namespace Loom {

// Helper function to trim whitespace from both ends of a string.
static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

static std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }

    // Unquoted values may carry a trailing comment
    size_t comment_pos = value.find(" #");
    if (comment_pos != std::string::npos) {
        return trim(value.substr(0, comment_pos));
    }
    return value;
}

EnvFileParser::EnvFileParser(const std::string& env_path) {
    std::ifstream env_file(env_path);
    if (!env_file.is_open()) {
        // Absence of a .env file is normal
        return;
    }

    std::stringstream buffer;
    buffer << env_file.rdbuf();
    parse(buffer.str());
}

void EnvFileParser::parse(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);

        // Ignore comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        if (key.empty()) {
            continue;
        }
        m_values[key] = unquote(trim(line.substr(delimiter_pos + 1)));
    }
}

std::string EnvFileParser::getStringValue(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return "";
}

bool EnvFileParser::hasValue(const std::string& key) const {
    return m_values.count(key) > 0;
}

} // namespace Loom
