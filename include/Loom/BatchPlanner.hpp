// =================================================================
// include/Loom/BatchPlanner.hpp
// =================================================================
// Header for splitting staged changes into commit batches.

#pragma once

#include "Loom/ChangedFile.hpp"
#include "Loom/FileSource.hpp"
#include "Loom/LoomConfig.hpp"
#include "Loom/SmartGrouper.hpp"
#include <vector>

namespace Loom {

/**
 * @brief Chooses between smart grouping and fixed-size batches
 */
class BatchPlanner {
public:
    /**
     * @param config Supplies the grouping settings and batch size; must outlive this object
     * @param source File contents for dependency detection; must outlive this object
     */
    BatchPlanner(const LoomConfig& config, const FileSource& source);

    /**
     * @brief Plan the batches for a set of staged files
     * @return Smart groups, or fixed chunks when smart grouping is disabled
     */
    std::vector<FileGroup> planBatches(const std::vector<ChangedFile>& files);

    /**
     * @brief Consecutive chunks of at most batch_size files, labelled "Batch N of M"
     */
    static std::vector<FileGroup> planFixedBatches(const std::vector<ChangedFile>& files, size_t batch_size);

    const SmartGrouper& getGrouper() const { return m_grouper; }

private:
    const LoomConfig& m_config;
    SmartGrouper m_grouper;
};

} // namespace Loom
