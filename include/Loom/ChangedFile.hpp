// =================================================================
// include/Loom/ChangedFile.hpp
// =================================================================
// Plain description of a staged file as reported by the VCS.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Loom {

/**
 * @brief A changed file in the working tree, keyed by its repository-relative path
 */
struct ChangedFile {
    std::string path;                     ///< Repository-relative path (unique key)
    bool is_binary = false;               ///< Binary files are never scanned for imports
    std::optional<std::uintmax_t> size;   ///< Blob size in bytes, when known
    std::optional<std::string> hash;      ///< Staged blob hash, when known

    ChangedFile() = default;
    explicit ChangedFile(const std::string& file_path, bool binary = false)
        : path(file_path), is_binary(binary) {}
};

} // namespace Loom
