// =================================================================
// include/Loom/SmartGrouper.hpp
// =================================================================
// Header for the grouping engine that partitions changed files into
// commit-sized, semantically coherent groups.

#pragma once

#include "Loom/ChangeClassifier.hpp"
#include "Loom/ChangedFile.hpp"
#include "Loom/DependencyExtractor.hpp"
#include "Loom/FileSource.hpp"
#include "Loom/RelationshipDetector.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Tunable thresholds for the grouping engine
 */
struct GroupingConfig {
    size_t max_group_size = 5;                          ///< Larger groups are split into parts
    size_t small_group_threshold = 3;                   ///< At or below this a bucket stays whole
    std::uintmax_t max_file_size_for_analysis = 200000; ///< Bytes; larger files are not scanned
};

/**
 * @brief A commit-sized set of files with the reasoning behind it
 */
struct FileGroup {
    std::vector<ChangedFile> files;
    ChangeType change_type = ChangeType::CHORE;
    std::string reason;
    double confidence = 0.0;
    std::vector<std::string> dependencies;  ///< Paths outside the group that members import

    /// Member paths in group order, as handed to staging
    std::vector<std::string> getPaths() const;
};

/**
 * @brief Partitions changed files into groups
 *
 * Every input file ends up in exactly one group. Each call to buildGroups()
 * starts from fresh state, so repeated calls with the same input and the
 * same file contents give identical output.
 */
class SmartGrouper {
public:
    explicit SmartGrouper(const FileSource& source, const GroupingConfig& config = GroupingConfig());

    /**
     * @brief Classify, relate and partition the given files
     * @param files Changed files; paths are assumed unique
     * @return Groups in processing order; empty for empty input
     */
    std::vector<FileGroup> buildGroups(const std::vector<ChangedFile>& files);

    /**
     * @brief Render a multi-line, human-readable description of a group
     */
    std::string getGroupSummary(const FileGroup& group) const;

    /// Relationships detected during the last buildGroups() call
    const std::vector<FileRelationship>& getRelationships() const { return m_relationships; }

    const GroupingConfig& getConfig() const { return m_config; }
    const ChangeClassifier& getClassifier() const { return m_classifier; }

private:
    using Bucket = std::pair<ChangeType, std::vector<ChangedFile>>;

    GroupingConfig m_config;
    ChangeClassifier m_classifier;
    RelationshipDetector m_detector;
    DependencyExtractor m_extractor;
    std::vector<FileRelationship> m_relationships;

    std::vector<Bucket> groupByChangeType(const std::vector<ChangedFile>& files) const;

    std::vector<FileGroup> refineGroups(const std::vector<Bucket>& buckets,
                                        const std::map<std::string, ChangedFile>& lookup,
                                        const DependencyMap& dependencies) const;

    std::vector<FileGroup> groupTestsWithImplementations(const std::vector<ChangedFile>& test_files,
                                                         const std::map<std::string, ChangedFile>& lookup,
                                                         const DependencyMap& dependencies,
                                                         std::set<std::string>& assigned) const;

    std::vector<FileGroup> splitByModule(const std::vector<ChangedFile>& files, ChangeType type) const;

    std::vector<FileGroup> splitLargeGroups(const std::vector<FileGroup>& groups) const;

    static void enrichGroupsWithDependencies(std::vector<FileGroup>& groups,
                                             const DependencyMap& dependencies);
};

} // namespace Loom
