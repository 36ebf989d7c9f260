// =================================================================
// src/Loom/BatchPlanner.cpp
// =================================================================
// Implementation for batch planning.

#include "Loom/BatchPlanner.hpp"
#include "Loom/Logger.hpp"
#include <algorithm>

namespace Loom {

BatchPlanner::BatchPlanner(const LoomConfig& config, const FileSource& source)
    : m_config(config), m_grouper(source, config.grouping) {}

std::vector<FileGroup> BatchPlanner::planBatches(const std::vector<ChangedFile>& files) {
    if (m_config.smart_grouping) {
        return m_grouper.buildGroups(files);
    }

    LOOM_LOG_INFO("BatchPlanner", "Smart grouping disabled, using fixed-size batches",
                  "Batch size: " + std::to_string(m_config.max_files_threshold));
    return planFixedBatches(files, m_config.max_files_threshold);
}

std::vector<FileGroup> BatchPlanner::planFixedBatches(const std::vector<ChangedFile>& files, size_t batch_size) {
    std::vector<FileGroup> batches;
    if (files.empty()) {
        return batches;
    }
    if (batch_size == 0) {
        batch_size = 1;
    }

    const size_t total_batches = (files.size() + batch_size - 1) / batch_size;
    for (size_t start = 0; start < files.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, files.size());

        FileGroup batch;
        batch.files.assign(files.begin() + start, files.begin() + end);
        batch.change_type = ChangeType::CHORE;
        batch.reason = "Batch " + std::to_string(batches.size() + 1) + " of " + std::to_string(total_batches);
        batch.confidence = 1.0;
        batches.push_back(std::move(batch));
    }

    return batches;
}

} // namespace Loom
