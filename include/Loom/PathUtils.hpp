// =================================================================
// include/Loom/PathUtils.hpp
// =================================================================
// Lexical helpers for repository-relative paths.

#pragma once

#include <string>
#include <vector>

namespace Loom {

/**
 * @brief Purely lexical path decomposition; nothing here touches the disk.
 *
 * Parent directories of top-level files are reported as ".", and "." is
 * treated as an ancestor of every relative path.
 */
class PathUtils {
public:
    /// Base name including the extension ("src/app.py" -> "app.py")
    static std::string getFileName(const std::string& path);

    /// Base name without the last extension ("Button.module.css" -> "Button.module")
    static std::string getStem(const std::string& path);

    /// Last extension including the dot, empty for dot-files ("a.tar.gz" -> ".gz")
    static std::string getSuffix(const std::string& path);

    /// Parent directory, or "." for top-level entries
    static std::string getParent(const std::string& path);

    /// Non-empty path components, with "." components removed
    static std::vector<std::string> splitParts(const std::string& path);

    /// All ancestors of a path, nearest first, always ending with "."
    static std::vector<std::string> getAncestors(const std::string& path);

    /// Parent components joined with '/', followed by the stem
    static std::string getStemPath(const std::string& path);

    /// First path component, or "root" for top-level files
    static std::string getTopLevelModule(const std::string& path);

    static std::string toLower(const std::string& text);
};

} // namespace Loom
