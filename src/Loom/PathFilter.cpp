// =================================================================
// src/Loom/PathFilter.cpp
// =================================================================
// Implementation for gitignore-style path filtering.

#include "Loom/PathFilter.hpp"
#include "Loom/Logger.hpp"
#include <algorithm>
#include <fstream>

namespace Loom {

namespace {

const std::string REGEX_SPECIALS = ".^$+{}|()";

std::string trimBlanks(const std::string& text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

std::optional<IgnoreRule> IgnoreRule::parse(const std::string& line) {
    std::string body = line;
    if (!body.empty() && body.back() == '\r') {
        body.pop_back();
    }
    if (body.empty() || body[0] == '#') {
        return std::nullopt;
    }

    body = trimBlanks(body);
    if (body.empty()) {
        return std::nullopt;
    }

    IgnoreRule rule;
    rule.pattern = body;

    if (body[0] == '!') {
        rule.negated = true;
        body.erase(0, 1);
    }
    if (!body.empty() && body.back() == '/') {
        rule.directory_only = true;
        body.pop_back();
    }
    if (!body.empty() && body[0] == '/') {
        rule.anchored = true;
        body.erase(0, 1);
    }
    if (body.empty()) {
        return std::nullopt;
    }

    try {
        rule.regex = std::regex(PathFilter::globToRegex(body, rule.anchored), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOOM_LOG_WARNING("PathFilter", "Skipping invalid ignore pattern '" + rule.pattern + "'", e.what());
        return std::nullopt;
    }
    return rule;
}

bool IgnoreRule::matches(const std::string& path, bool is_directory) const {
    if (!directory_only || is_directory) {
        return matchesWhole(path);
    }

    size_t slash = path.find('/');
    while (slash != std::string::npos) {
        if (matchesWhole(path.substr(0, slash))) {
            return true;
        }
        slash = path.find('/', slash + 1);
    }
    return false;
}

bool IgnoreRule::matchesWhole(const std::string& path) const {
    return anchored ? std::regex_match(path, regex) : std::regex_search(path, regex);
}

PathFilter::PathFilter(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

bool PathFilter::addPattern(const std::string& pattern) {
    auto rule = IgnoreRule::parse(pattern);
    if (!rule) {
        return false;
    }
    m_rules.push_back(std::move(*rule));
    return true;
}

size_t PathFilter::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file) {
        return 0;
    }

    size_t added = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (addPattern(line)) {
            ++added;
        }
    }

    LOOM_LOG_DEBUG("PathFilter", "Read ignore file " + file_path, std::to_string(added) + " rule(s)");
    return added;
}

bool PathFilter::isIgnored(const std::string& path, bool is_directory) const {
    const IgnoreRule* rule = findDecidingRule(path, is_directory);
    return rule != nullptr && !rule->negated;
}

const IgnoreRule* PathFilter::findDecidingRule(const std::string& path, bool is_directory) const {
    const std::string normalized = normalizePath(path);

    for (auto it = m_rules.rbegin(); it != m_rules.rend(); ++it) {
        if (it->matches(normalized, is_directory)) {
            return &*it;
        }
    }
    return nullptr;
}

std::string PathFilter::globToRegex(const std::string& glob, bool anchored) {
    std::string regex;
    bool in_class = false;
    size_t i = 0;

    while (i < glob.size()) {
        const char c = glob[i];

        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            regex += c;
            ++i;
            continue;
        }

        if (c == '*') {
            const bool double_star = i + 1 < glob.size() && glob[i + 1] == '*';
            if (!double_star) {
                regex += "[^/]*";
                ++i;
            } else if (i + 2 < glob.size() && glob[i + 2] == '/') {
                // "**/" spans zero or more directories
                regex += "(?:.*/)?";
                i += 3;
            } else if (i + 2 == glob.size()) {
                regex += ".*";
                i += 2;
            } else {
                regex += "[^/]*";
                i += 2;
            }
        } else if (c == '?') {
            regex += "[^/]";
            ++i;
        } else if (c == '[') {
            in_class = true;
            regex += '[';
            ++i;
            if (i < glob.size() && glob[i] == '!') {
                regex += '^';
                ++i;
            }
        } else if (c == '\\' && i + 1 < glob.size()) {
            // Escaped glob character stands for itself
            const char literal = glob[i + 1];
            if (REGEX_SPECIALS.find(literal) != std::string::npos || literal == '*' || literal == '?' ||
                literal == '[' || literal == ']' || literal == '\\') {
                regex += '\\';
            }
            regex += literal;
            i += 2;
        } else {
            if (c == '\\' || REGEX_SPECIALS.find(c) != std::string::npos) {
                regex += '\\';
            }
            regex += c;
            ++i;
        }
    }

    // A match on a directory also covers everything below it
    if (anchored) {
        return "^" + regex + "(/.*)?$";
    }
    return "(^|/)" + regex + "(/|$)";
}

std::string PathFilter::normalizePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    while (normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    return normalized;
}

} // namespace Loom
