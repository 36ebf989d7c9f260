// =================================================================
// src/Loom/RelationshipDetector.cpp
// =================================================================
// Implementation for pairwise relationship detection.

#include "Loom/RelationshipDetector.hpp"
#include "Loom/PathUtils.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <unordered_set>

namespace Loom {

namespace {

std::set<std::string> splitNameParts(const std::string& stem) {
    static const std::regex separators(R"([_\-.])");

    std::set<std::string> parts;
    std::sregex_token_iterator it(stem.begin(), stem.end(), separators, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        std::string part = *it;
        if (!part.empty()) {
            parts.insert(part);
        }
    }
    return parts;
}

} // namespace

RelationshipDetector::RelationshipDetector(const ChangeClassifier& classifier)
    : m_classifier(classifier) {}

std::vector<FileRelationship> RelationshipDetector::detectRelationships(
    const std::vector<ChangedFile>& files) const {
    std::vector<FileRelationship> relationships;

    for (size_t i = 0; i < files.size(); ++i) {
        for (size_t j = i + 1; j < files.size(); ++j) {
            auto relationship = findRelationship(files[i].path, files[j].path);
            if (relationship) {
                relationships.push_back(*relationship);
            }
        }
    }

    return relationships;
}

std::optional<FileRelationship> RelationshipDetector::findRelationship(const std::string& path1,
                                                                       const std::string& path2) const {
    if (isTestImplementationPair(path1, path2)) {
        return FileRelationship(path1, path2, RelationshipType::TEST_IMPLEMENTATION, 1.0);
    }

    if (isComponentPair(path1, path2)) {
        return FileRelationship(path1, path2, RelationshipType::COMPONENT_PAIR, 0.9);
    }

    // Similar naming outranks plain directory locality
    if (hasSimilarNaming(path1, path2)) {
        return FileRelationship(path1, path2, RelationshipType::SIMILAR_NAMING, 0.6);
    }

    if (PathUtils::getParent(path1) == PathUtils::getParent(path2)) {
        return FileRelationship(path1, path2, RelationshipType::SAME_DIRECTORY, 0.7);
    }

    if (isParentChildDirectory(path1, path2)) {
        return FileRelationship(path1, path2, RelationshipType::DIRECTORY_HIERARCHY, 0.5);
    }

    return std::nullopt;
}

bool RelationshipDetector::isTestImplementationPair(const std::string& path1,
                                                    const std::string& path2) const {
    auto [test_path, impl_path] = identifyTestAndImplementation(path1, path2);
    if (!test_path || !impl_path) {
        return false;
    }

    std::string test_name = stripTestMarkers(PathUtils::getStem(*test_path));
    std::string impl_name = PathUtils::getStem(*impl_path);

    return test_name == impl_name ||
           impl_name.find(test_name) != std::string::npos ||
           test_name.find(impl_name) != std::string::npos;
}

std::pair<std::optional<std::string>, std::optional<std::string>>
RelationshipDetector::identifyTestAndImplementation(const std::string& path1,
                                                    const std::string& path2) const {
    bool is_test1 = m_classifier.isTestFile(path1);
    bool is_test2 = m_classifier.isTestFile(path2);

    if (is_test1 && !is_test2) {
        return {path1, path2};
    }
    if (is_test2 && !is_test1) {
        return {path2, path1};
    }
    return {std::nullopt, std::nullopt};
}

bool RelationshipDetector::isComponentPair(const std::string& path1, const std::string& path2) {
    static const std::unordered_set<std::string> component_extensions = {
        ".tsx", ".jsx", ".ts", ".js", ".css", ".scss", ".sass", ".less", ".module.css"
    };

    std::string suffix1 = PathUtils::getSuffix(path1);
    std::string suffix2 = PathUtils::getSuffix(path2);

    if (PathUtils::getStem(path1) != PathUtils::getStem(path2) ||
        PathUtils::getParent(path1) != PathUtils::getParent(path2) ||
        suffix1 == suffix2) {
        return false;
    }

    return component_extensions.count(suffix1) > 0 || component_extensions.count(suffix2) > 0;
}

bool RelationshipDetector::hasSimilarNaming(const std::string& path1, const std::string& path2) {
    auto parts1 = splitNameParts(PathUtils::toLower(PathUtils::getStem(path1)));
    auto parts2 = splitNameParts(PathUtils::toLower(PathUtils::getStem(path2)));

    std::vector<std::string> common;
    std::set_intersection(parts1.begin(), parts1.end(), parts2.begin(), parts2.end(),
                          std::back_inserter(common));
    if (common.empty()) {
        return false;
    }

    std::vector<std::string> all_parts;
    std::set_union(parts1.begin(), parts1.end(), parts2.begin(), parts2.end(),
                   std::back_inserter(all_parts));

    double ratio = static_cast<double>(common.size()) / static_cast<double>(all_parts.size());
    return ratio >= 0.3;
}

bool RelationshipDetector::isParentChildDirectory(const std::string& path1, const std::string& path2) {
    std::string parent1 = PathUtils::getParent(path1);
    std::string parent2 = PathUtils::getParent(path2);

    auto ancestors1 = PathUtils::getAncestors(path1);
    auto ancestors2 = PathUtils::getAncestors(path2);

    return std::find(ancestors2.begin(), ancestors2.end(), parent1) != ancestors2.end() ||
           std::find(ancestors1.begin(), ancestors1.end(), parent2) != ancestors1.end();
}

std::string RelationshipDetector::stripTestMarkers(const std::string& stem) {
    static const std::regex markers(R"((test_|_test|\.test|\.spec))");
    return std::regex_replace(stem, markers, "");
}

} // namespace Loom
