// =================================================================
// include/Loom/RelationshipDetector.hpp
// =================================================================
// Header for pairwise semantic relationship detection between files.

#pragma once

#include "Loom/ChangeClassifier.hpp"
#include "Loom/ChangedFile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Relationship tags, in the order the detector evaluates them
 */
namespace RelationshipType {
    inline const std::string TEST_IMPLEMENTATION = "test-implementation";
    inline const std::string COMPONENT_PAIR = "component-pair";
    inline const std::string SIMILAR_NAMING = "similar-naming";
    inline const std::string SAME_DIRECTORY = "same-directory";
    inline const std::string DIRECTORY_HIERARCHY = "directory-hierarchy";
}

/**
 * @brief An unordered pair of files with the strongest detected link
 */
struct FileRelationship {
    std::string file1;
    std::string file2;
    std::string relationship_type;
    double strength;    ///< 0.0 to 1.0

    FileRelationship(const std::string& a, const std::string& b,
                     const std::string& type, double s)
        : file1(a), file2(b), relationship_type(type), strength(s) {}
};

/**
 * @brief Detects at most one relationship per file pair
 *
 * Rules run in fixed priority order: test-implementation, component-pair,
 * similar-naming, same-directory, directory-hierarchy. The first rule that
 * holds decides the relationship.
 */
class RelationshipDetector {
public:
    explicit RelationshipDetector(const ChangeClassifier& classifier);

    /**
     * @brief Scan every unordered pair (i < j) of the input
     * @param files Changed files, in caller order
     * @return Relationships in pair-scan order
     */
    std::vector<FileRelationship> detectRelationships(const std::vector<ChangedFile>& files) const;

    /**
     * @brief Evaluate the rule chain for a single pair
     */
    std::optional<FileRelationship> findRelationship(const std::string& path1,
                                                     const std::string& path2) const;

    bool isTestImplementationPair(const std::string& path1, const std::string& path2) const;

    /**
     * @brief Split a relationship into (test, implementation)
     * @return Both values set only when exactly one side is a test file
     */
    std::pair<std::optional<std::string>, std::optional<std::string>>
    identifyTestAndImplementation(const std::string& path1, const std::string& path2) const;

    static bool isComponentPair(const std::string& path1, const std::string& path2);
    static bool hasSimilarNaming(const std::string& path1, const std::string& path2);
    static bool isParentChildDirectory(const std::string& path1, const std::string& path2);

    /// Remove test_/_test/.test/.spec markers from a stem
    static std::string stripTestMarkers(const std::string& stem);

private:
    const ChangeClassifier& m_classifier;
};

} // namespace Loom
