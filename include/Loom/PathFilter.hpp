// =================================================================
// include/Loom/PathFilter.hpp
// =================================================================
// Header for filtering staged paths through gitignore-style rules
// before anything is analysed or sent for message generation.

#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace Loom {

/**
 * @brief One compiled line of an ignore list
 *
 * Understands *, ** and ?, [...] classes with ! negation, a leading ! to
 * re-include, a leading / to anchor at the repository root and a trailing
 * / to restrict the rule to directories.
 */
struct IgnoreRule {
    std::string pattern;            ///< Line as written, without line ending
    bool negated = false;
    bool directory_only = false;
    bool anchored = false;
    std::regex regex;

    /**
     * @brief Compile one line
     * @return std::nullopt for blank lines, comments and globs that do not compile
     */
    static std::optional<IgnoreRule> parse(const std::string& line);

    /**
     * @brief Test a normalised repository-relative path
     *
     * A file matches a directory-only rule when one of its parent
     * directories does.
     */
    bool matches(const std::string& path, bool is_directory = false) const;

private:
    bool matchesWhole(const std::string& path) const;
};

/**
 * @brief Ordered rule list where the last matching rule decides
 */
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const std::vector<std::string>& patterns);

    /**
     * @brief Append a rule
     * @return False if the line was blank, a comment or invalid
     */
    bool addPattern(const std::string& pattern);

    /**
     * @brief Append every rule of an ignore file such as .loomignore
     * @return Number of rules added; a missing file adds none
     */
    size_t loadFromFile(const std::string& file_path);

    bool isIgnored(const std::string& path, bool is_directory = false) const;

    /**
     * @brief The last rule matching the path, or nullptr
     *
     * The path is ignored exactly when this rule exists and is not negated.
     */
    const IgnoreRule* findDecidingRule(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_rules.size(); }
    void clear() { m_rules.clear(); }

    /**
     * @brief Translate a glob body (no !, leading or trailing /) to an ECMAScript regex
     */
    static std::string globToRegex(const std::string& glob, bool anchored);

    /// Backslashes become '/', a leading "./" is dropped
    static std::string normalizePath(const std::string& path);

private:
    std::vector<IgnoreRule> m_rules;
};

} // namespace Loom
