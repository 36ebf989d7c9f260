// =================================================================
// include/Loom/FileSource.hpp
// =================================================================
// Defines the read-only filesystem collaborator used for import scanning.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Loom {

/**
 * @brief Read access to changed file contents
 *
 * Implementations report absence with std::nullopt and never throw; callers
 * enforce their own size limits using fileSize().
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    /**
     * @brief Size of a regular file in bytes
     * @return std::nullopt if the path is missing, a directory or unreadable
     */
    virtual std::optional<std::uintmax_t> fileSize(const std::string& path) const = 0;

    /**
     * @brief Entire content of a regular file
     * @return std::nullopt if the file cannot be read
     */
    virtual std::optional<std::string> readBytes(const std::string& path) const = 0;
};

/**
 * @brief FileSource backed by the local filesystem, relative to a root directory
 */
class DiskFileSource : public FileSource {
public:
    explicit DiskFileSource(const std::string& root_path = ".");

    std::optional<std::uintmax_t> fileSize(const std::string& path) const override;
    std::optional<std::string> readBytes(const std::string& path) const override;

private:
    std::string m_root_path;

    std::string resolve(const std::string& path) const;
};

} // namespace Loom
