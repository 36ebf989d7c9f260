// =================================================================
// src/Loom/ChangeClassifier.cpp
// =================================================================
// Implementation for path-based change type classification.

#include "Loom/ChangeClassifier.hpp"
#include "Loom/PathUtils.hpp"
#include <unordered_set>

namespace Loom {

namespace {

const auto kPatternFlags = std::regex_constants::ECMAScript | std::regex_constants::icase;

const std::vector<PatternRule> kNoRules;

} // namespace

PatternRule::PatternRule(const std::string& pattern, const std::string& exclude)
    : source(pattern),
      regex(pattern, kPatternFlags),
      match_full_path(pattern.find('/') != std::string::npos),
      has_exclusion(!exclude.empty()) {
    if (has_exclusion) {
        exclusion = std::regex(exclude, kPatternFlags);
    }
}

bool PatternRule::matches(const std::string& file_path) const {
    const std::string target = match_full_path ? file_path : PathUtils::getFileName(file_path);
    if (!std::regex_search(target, regex)) {
        return false;
    }
    return !(has_exclusion && std::regex_search(target, exclusion));
}

ChangeClassifier::ChangeClassifier() {
    initializeDefaultRules();
}

void ChangeClassifier::initializeDefaultRules() {
    // Row order is significant: BUILD must be evaluated before CONFIG so
    // package.json is not swallowed by the generic .json rule.
    m_rules.emplace_back(ChangeType::TEST, std::vector<PatternRule>{
        PatternRule(R"(test[s]?/)"),
        PatternRule(R"(test_.*\.py$)"),
        PatternRule(R"(.*_test\.py$)"),
        PatternRule(R"(.*\.test\.[jt]sx?$)"),
        PatternRule(R"(.*\.spec\.[jt]sx?$)"),
        PatternRule(R"(__tests__/)")
    });

    m_rules.emplace_back(ChangeType::DOCS, std::vector<PatternRule>{
        PatternRule(R"(\.md$)"),
        PatternRule(R"(\.rst$)"),
        PatternRule(R"(docs?/)"),
        PatternRule(R"(README)"),
        PatternRule(R"(CHANGELOG)"),
        PatternRule(R"(LICENSE)"),
        PatternRule(R"(\.txt$)", R"(requirements\.txt$)")
    });

    m_rules.emplace_back(ChangeType::BUILD, std::vector<PatternRule>{
        PatternRule(R"(package\.json$)"),
        PatternRule(R"(package-lock\.json$)"),
        PatternRule(R"(requirements\.txt$)"),
        PatternRule(R"(pyproject\.toml$)"),
        PatternRule(R"(setup\.py$)"),
        PatternRule(R"(Makefile$)"),
        PatternRule(R"(CMakeLists\.txt$)"),
        PatternRule(R"(\.gradle$)"),
        PatternRule(R"(pom\.xml$)")
    });

    m_rules.emplace_back(ChangeType::CONFIG, std::vector<PatternRule>{
        PatternRule(R"(\.yaml$)"),
        PatternRule(R"(\.yml$)"),
        PatternRule(R"(\.toml$)"),
        PatternRule(R"(\.ini$)"),
        PatternRule(R"(\.cfg$)"),
        PatternRule(R"(\.conf$)"),
        PatternRule(R"(\.env)"),
        PatternRule(R"(Dockerfile)"),
        PatternRule(R"(docker-compose)"),
        PatternRule(R"(\.gitignore$)"),
        PatternRule(R"(\.json$)")
    });

    m_rules.emplace_back(ChangeType::STYLE, std::vector<PatternRule>{
        PatternRule(R"(\.css$)"),
        PatternRule(R"(\.scss$)"),
        PatternRule(R"(\.sass$)"),
        PatternRule(R"(\.less$)"),
        PatternRule(R"(\.styl$)")
    });
}

ChangeType ChangeClassifier::classify(const std::string& file_path) const {
    for (const auto& [change_type, rules] : m_rules) {
        for (const auto& rule : rules) {
            if (rule.matches(file_path)) {
                return change_type;
            }
        }
    }

    std::string extension = PathUtils::toLower(PathUtils::getSuffix(file_path));
    if (isSourceExtension(extension)) {
        std::string lower_path = PathUtils::toLower(file_path);
        if (lower_path.find("fix") != std::string::npos || lower_path.find("bug") != std::string::npos) {
            return ChangeType::FIX;
        }
        if (lower_path.find("feature") != std::string::npos || lower_path.find("feat") != std::string::npos) {
            return ChangeType::FEATURE;
        }
        // Unclassified source edits are assumed to be refactors
        return ChangeType::REFACTOR;
    }

    return ChangeType::CHORE;
}

bool ChangeClassifier::isTestFile(const std::string& file_path) const {
    for (const auto& rule : rulesFor(ChangeType::TEST)) {
        if (rule.matches(file_path)) {
            return true;
        }
    }
    return false;
}

const std::vector<PatternRule>& ChangeClassifier::rulesFor(ChangeType type) const {
    for (const auto& [change_type, rules] : m_rules) {
        if (change_type == type) {
            return rules;
        }
    }
    return kNoRules;
}

int ChangeClassifier::getPriority(ChangeType type) {
    switch (type) {
        case ChangeType::TEST: return 0;
        case ChangeType::FEATURE:
        case ChangeType::FIX:
        case ChangeType::PERF: return 1;
        case ChangeType::REFACTOR: return 2;
        case ChangeType::DOCS:
        case ChangeType::STYLE: return 3;
        case ChangeType::BUILD:
        case ChangeType::CONFIG: return 4;
        case ChangeType::CHORE:
        default: return 5;
    }
}

bool ChangeClassifier::isSourceExtension(const std::string& extension) {
    static const std::unordered_set<std::string> source_extensions = {
        ".py", ".js", ".jsx", ".ts", ".tsx", ".java", ".go",
        ".cpp", ".c", ".h", ".hpp", ".rs", ".rb", ".php",
        ".swift", ".kt", ".scala", ".cs", ".vb", ".f90"
    };
    return source_extensions.count(extension) > 0;
}

std::vector<ChangeType> ChangeClassifier::getAllChangeTypes() {
    return {
        ChangeType::FEATURE,
        ChangeType::FIX,
        ChangeType::TEST,
        ChangeType::DOCS,
        ChangeType::REFACTOR,
        ChangeType::STYLE,
        ChangeType::CHORE,
        ChangeType::CONFIG,
        ChangeType::BUILD,
        ChangeType::PERF
    };
}

std::string changeTypeToString(ChangeType type) {
    switch (type) {
        case ChangeType::FEATURE: return "feature";
        case ChangeType::FIX: return "fix";
        case ChangeType::TEST: return "test";
        case ChangeType::DOCS: return "docs";
        case ChangeType::REFACTOR: return "refactor";
        case ChangeType::STYLE: return "style";
        case ChangeType::CONFIG: return "config";
        case ChangeType::BUILD: return "build";
        case ChangeType::PERF: return "perf";
        case ChangeType::CHORE:
        default: return "chore";
    }
}

ChangeType stringToChangeType(const std::string& name) {
    std::string normalized = PathUtils::toLower(name);

    for (ChangeType type : ChangeClassifier::getAllChangeTypes()) {
        if (changeTypeToString(type) == normalized) {
            return type;
        }
    }
    return ChangeType::CHORE;
}

} // namespace Loom
