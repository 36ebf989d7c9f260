// =================================================================
// src/Loom/SmartGrouper.cpp
// =================================================================
// Implementation of the grouping engine.

#include "Loom/SmartGrouper.hpp"
#include "Loom/Logger.hpp"
#include "Loom/PathUtils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Loom {

std::vector<std::string> FileGroup::getPaths() const {
    std::vector<std::string> paths;
    paths.reserve(files.size());
    for (const auto& file : files) {
        paths.push_back(file.path);
    }
    return paths;
}

SmartGrouper::SmartGrouper(const FileSource& source, const GroupingConfig& config)
    : m_config(config),
      m_classifier(),
      m_detector(m_classifier),
      m_extractor(source, config.max_file_size_for_analysis) {
    if (m_config.max_group_size == 0) {
        LOOM_LOG_WARNING("SmartGrouper", "max_group_size of 0 is invalid, using 1");
        m_config.max_group_size = 1;
    }
}

std::vector<FileGroup> SmartGrouper::buildGroups(const std::vector<ChangedFile>& files) {
    m_relationships.clear();
    if (files.empty()) {
        return {};
    }

    auto buckets = groupByChangeType(files);
    m_relationships = m_detector.detectRelationships(files);
    DependencyMap dependencies = m_extractor.extractDependencies(files);

    std::map<std::string, ChangedFile> lookup;
    for (const auto& file : files) {
        lookup.emplace(file.path, file);
    }

    auto refined = refineGroups(buckets, lookup, dependencies);
    auto groups = splitLargeGroups(refined);
    enrichGroupsWithDependencies(groups, dependencies);

    Logger::getInstance().logGrouping(files.size(), groups.size(), m_relationships.size());
    return groups;
}

std::vector<SmartGrouper::Bucket> SmartGrouper::groupByChangeType(const std::vector<ChangedFile>& files) const {
    std::vector<Bucket> buckets;

    for (const auto& file : files) {
        ChangeType type = m_classifier.classify(file.path);
        auto it = std::find_if(buckets.begin(), buckets.end(),
                               [type](const Bucket& bucket) { return bucket.first == type; });
        if (it == buckets.end()) {
            buckets.emplace_back(type, std::vector<ChangedFile>{file});
        } else {
            it->second.push_back(file);
        }
    }

    return buckets;
}

std::vector<FileGroup> SmartGrouper::refineGroups(const std::vector<Bucket>& buckets,
                                                  const std::map<std::string, ChangedFile>& lookup,
                                                  const DependencyMap& dependencies) const {
    std::vector<FileGroup> refined;
    std::set<std::string> assigned;

    // Priority first, then discovery order
    std::vector<size_t> order(buckets.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&buckets](size_t a, size_t b) {
        return ChangeClassifier::getPriority(buckets[a].first) < ChangeClassifier::getPriority(buckets[b].first);
    });

    for (size_t index : order) {
        const ChangeType type = buckets[index].first;

        std::vector<ChangedFile> available;
        for (const auto& file : buckets[index].second) {
            if (assigned.count(file.path) == 0) {
                available.push_back(file);
            }
        }
        if (available.empty()) {
            continue;
        }

        if (type == ChangeType::TEST) {
            auto test_groups = groupTestsWithImplementations(available, lookup, dependencies, assigned);
            refined.insert(refined.end(), test_groups.begin(), test_groups.end());
        } else if (available.size() <= m_config.small_group_threshold) {
            FileGroup group;
            group.files = available;
            group.change_type = type;
            group.reason = "All " + changeTypeToString(type) + " changes";
            group.confidence = 0.8;
            for (const auto& file : available) {
                assigned.insert(file.path);
            }
            refined.push_back(std::move(group));
        } else {
            for (auto& group : splitByModule(available, type)) {
                for (const auto& file : group.files) {
                    assigned.insert(file.path);
                }
                refined.push_back(std::move(group));
            }
        }
    }

    return refined;
}

std::vector<FileGroup> SmartGrouper::groupTestsWithImplementations(
    const std::vector<ChangedFile>& test_files,
    const std::map<std::string, ChangedFile>& lookup,
    const DependencyMap& dependencies,
    std::set<std::string>& assigned) const {

    std::vector<FileGroup> groups;

    std::set<std::string> test_paths;
    for (const auto& file : test_files) {
        test_paths.insert(file.path);
    }

    // Implementation -> linked tests, implementations kept in first-seen order
    std::vector<std::pair<std::string, std::set<std::string>>> implementation_to_tests;
    for (const auto& relationship : m_relationships) {
        if (relationship.relationship_type != RelationshipType::TEST_IMPLEMENTATION) {
            continue;
        }

        auto [test_path, impl_path] = m_detector.identifyTestAndImplementation(relationship.file1,
                                                                                relationship.file2);
        if (!test_path || !impl_path) {
            continue;
        }
        if (test_paths.count(*test_path) == 0 || lookup.count(*impl_path) == 0) {
            continue;
        }

        auto it = std::find_if(implementation_to_tests.begin(), implementation_to_tests.end(),
                               [&impl_path](const auto& entry) { return entry.first == *impl_path; });
        if (it == implementation_to_tests.end()) {
            implementation_to_tests.emplace_back(*impl_path, std::set<std::string>{*test_path});
        } else {
            it->second.insert(*test_path);
        }
    }

    for (const auto& [impl_path, tests] : implementation_to_tests) {
        if (assigned.count(impl_path) > 0) {
            continue;
        }

        std::vector<std::string> candidate_tests;
        for (const auto& test : tests) {
            if (assigned.count(test) == 0) {
                candidate_tests.push_back(test);
            }
        }
        if (candidate_tests.empty()) {
            continue;
        }

        std::set<std::string> group_paths(candidate_tests.begin(), candidate_tests.end());
        group_paths.insert(impl_path);

        FileGroup group;
        for (const auto& path : group_paths) {
            group.files.push_back(lookup.at(path));
            assigned.insert(path);
        }
        group.change_type = ChangeType::TEST;
        if (candidate_tests.size() == 1) {
            group.reason = "Test with linked implementation";
            group.confidence = 0.9;
        } else {
            group.reason = "Test suite with implementation";
            group.confidence = 0.95;
        }
        groups.push_back(std::move(group));
    }

    for (const auto& test_file : test_files) {
        if (assigned.count(test_file.path) > 0) {
            continue;
        }

        std::set<std::string> related_paths = {test_file.path};
        auto deps_it = dependencies.find(test_file.path);
        if (deps_it != dependencies.end()) {
            for (const auto& dependency : deps_it->second) {
                if (assigned.count(dependency) == 0 && lookup.count(dependency) > 0) {
                    related_paths.insert(dependency);
                }
            }
        }

        FileGroup group;
        for (const auto& path : related_paths) {
            group.files.push_back(lookup.at(path));
            assigned.insert(path);
        }
        group.change_type = ChangeType::TEST;
        if (group.files.size() == 1) {
            group.reason = "Isolated test change";
            group.confidence = 0.7;
        } else {
            group.reason = "Test with supporting files";
            group.confidence = 0.78;
        }
        groups.push_back(std::move(group));
    }

    return groups;
}

std::vector<FileGroup> SmartGrouper::splitByModule(const std::vector<ChangedFile>& files, ChangeType type) const {
    std::vector<std::pair<std::string, std::vector<ChangedFile>>> modules;

    for (const auto& file : files) {
        std::string module = PathUtils::getTopLevelModule(file.path);
        auto it = std::find_if(modules.begin(), modules.end(),
                               [&module](const auto& entry) { return entry.first == module; });
        if (it == modules.end()) {
            modules.emplace_back(module, std::vector<ChangedFile>{file});
        } else {
            it->second.push_back(file);
        }
    }

    std::vector<FileGroup> groups;
    for (auto& [module, module_files] : modules) {
        FileGroup group;
        group.files = std::move(module_files);
        group.change_type = type;
        group.reason = changeTypeToString(type) + " changes in " + module + " module";
        group.confidence = 0.7;
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<FileGroup> SmartGrouper::splitLargeGroups(const std::vector<FileGroup>& groups) const {
    std::vector<FileGroup> final_groups;
    const size_t limit = m_config.max_group_size;

    for (const auto& group : groups) {
        if (group.files.size() <= limit) {
            final_groups.push_back(group);
            continue;
        }

        for (size_t start = 0; start < group.files.size(); start += limit) {
            size_t end = std::min(start + limit, group.files.size());

            FileGroup part;
            part.files.assign(group.files.begin() + start, group.files.begin() + end);
            part.change_type = group.change_type;
            part.reason = group.reason + " (part " + std::to_string(start / limit + 1) + ")";
            part.confidence = group.confidence * 0.9;
            final_groups.push_back(std::move(part));
        }
    }

    return final_groups;
}

void SmartGrouper::enrichGroupsWithDependencies(std::vector<FileGroup>& groups,
                                                const DependencyMap& dependencies) {
    for (auto& group : groups) {
        std::set<std::string> members;
        for (const auto& file : group.files) {
            members.insert(file.path);
        }

        std::set<std::string> external;
        for (const auto& file : group.files) {
            auto it = dependencies.find(file.path);
            if (it == dependencies.end()) {
                continue;
            }
            for (const auto& dependency : it->second) {
                if (members.count(dependency) == 0) {
                    external.insert(dependency);
                }
            }
        }

        group.dependencies.assign(external.begin(), external.end());
    }
}

std::string SmartGrouper::getGroupSummary(const FileGroup& group) const {
    std::ostringstream summary;

    summary << "Group: " << changeTypeToString(group.change_type) << "\n";
    summary << "Reason: " << group.reason << "\n";
    summary << "Confidence: " << std::fixed << std::setprecision(1) << group.confidence * 100.0 << "%\n";

    summary << "Files: ";
    for (size_t i = 0; i < group.files.size(); ++i) {
        if (i > 0) summary << ", ";
        summary << group.files[i].path;
    }
    summary << "\n";

    summary << "Dependencies: ";
    if (group.dependencies.empty()) {
        summary << "None";
    } else {
        for (size_t i = 0; i < group.dependencies.size(); ++i) {
            if (i > 0) summary << ", ";
            summary << group.dependencies[i];
        }
    }

    return summary.str();
}

} // namespace Loom
