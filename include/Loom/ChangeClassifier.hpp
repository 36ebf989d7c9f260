// =================================================================
// include/Loom/ChangeClassifier.hpp
// =================================================================
// Header for path-based change type classification.

#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace Loom {

/**
 * @brief Kind of change a file most likely represents
 */
enum class ChangeType {
    FEATURE,    ///< New functionality
    FIX,        ///< Bug fix
    TEST,       ///< Test code
    DOCS,       ///< Documentation
    REFACTOR,   ///< Source edits without a clearer signal
    STYLE,      ///< Stylesheets
    CHORE,      ///< Anything else
    CONFIG,     ///< Configuration files
    BUILD,      ///< Build and dependency manifests
    PERF        ///< Performance work
};

/**
 * @brief A single classification pattern
 *
 * Patterns containing a '/' are matched against the whole path, all others
 * against the base name only. An optional exclusion regex vetoes a match.
 */
struct PatternRule {
    std::string source;
    std::regex regex;
    bool match_full_path;
    bool has_exclusion;
    std::regex exclusion;

    explicit PatternRule(const std::string& pattern, const std::string& exclude = "");

    bool matches(const std::string& file_path) const;
};

/**
 * @brief Deterministic, rule-ordered classifier mapping a path to a ChangeType
 *
 * Rules are evaluated in a fixed order (TEST, DOCS, BUILD, CONFIG, STYLE)
 * and the first match wins. Unmatched source files fall back to keyword
 * inspection of the path, everything else is a CHORE.
 */
class ChangeClassifier {
public:
    ChangeClassifier();

    /**
     * @brief Classify a repository-relative path
     * @param file_path Path of the changed file
     * @return The change type assigned to the file
     */
    ChangeType classify(const std::string& file_path) const;

    /**
     * @brief Check the path against the TEST rules only
     * @param file_path Path of the changed file
     * @return true if the path looks like a test file
     */
    bool isTestFile(const std::string& file_path) const;

    /**
     * @brief Processing priority of a change type (lower runs first)
     */
    static int getPriority(ChangeType type);

    static bool isSourceExtension(const std::string& extension);

    static std::vector<ChangeType> getAllChangeTypes();

private:
    std::vector<std::pair<ChangeType, std::vector<PatternRule>>> m_rules;

    void initializeDefaultRules();

    const std::vector<PatternRule>& rulesFor(ChangeType type) const;
};

/**
 * @brief Lowercase name of a change type ("feature", "fix", ...)
 */
std::string changeTypeToString(ChangeType type);

/**
 * @brief Parse a change type name, case-insensitive; unknown names map to CHORE
 */
ChangeType stringToChangeType(const std::string& name);

} // namespace Loom
