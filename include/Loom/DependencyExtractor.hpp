// =================================================================
// include/Loom/DependencyExtractor.hpp
// =================================================================
// Header for regex-based import extraction between changed files.

#pragma once

#include "Loom/ChangedFile.hpp"
#include "Loom/FileSource.hpp"
#include <cstdint>
#include <map>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Loom {

/**
 * @brief Direct, single-hop dependencies between changed files
 *
 * Maps a source path to the sorted, de-duplicated list of other changed
 * paths it imports. Files without detected dependencies have no entry.
 */
using DependencyMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Best-effort import scanner driven by per-language regex tables
 *
 * This is a heuristic, not a parser: imports are captured by regex,
 * normalised, and matched against the other changed paths by substring
 * and stem comparison.
 */
class DependencyExtractor {
public:
    static constexpr std::uintmax_t DEFAULT_MAX_FILE_SIZE = 200000;

    /// Longest stretch of text a single import match may cover
    static constexpr size_t MAX_IMPORT_SPAN = 2048;

    /**
     * @brief One entry of a language's import table
     *
     * Every pattern begins with a literal keyword. Matching starts only at
     * occurrences of that keyword and never looks further than
     * MAX_IMPORT_SPAN characters, so long minified lines stay cheap.
     */
    struct ImportPattern {
        std::string keyword;
        std::regex regex;
    };

    /**
     * @brief Construct an extractor over a file source
     * @param source Where file contents are read from
     * @param max_file_size Larger files are treated as empty
     */
    explicit DependencyExtractor(const FileSource& source,
                                 std::uintmax_t max_file_size = DEFAULT_MAX_FILE_SIZE);

    /**
     * @brief Build the dependency map for a set of changed files
     *
     * Clears the content cache first, so each call is independent.
     */
    DependencyMap extractDependencies(const std::vector<ChangedFile>& files);

    /**
     * @brief Extract raw import strings from a file's content
     * @param file_path File to scan
     * @param language Language key ("python", "javascript", ...)
     */
    std::vector<std::string> extractImports(const std::string& file_path, const std::string& language);

    /**
     * @brief Run a language's import table over a piece of source text
     */
    std::vector<std::string> extractImportsFromContent(const std::string& content,
                                                       const std::string& language) const;

    /// Language key for an extension, or an empty string if unsupported
    static std::string getLanguageFromExtension(const std::string& extension);

    /// Strip whitespace, surrounding quotes and leading "./" characters
    static std::string normalizeImportPath(const std::string& import_path);

    /// Heuristic match of a normalised import against a changed path
    static bool importMatchesFile(const std::string& import_path, const std::string& file_path);

    size_t getCachedFileCount() const { return m_contents_cache.size(); }

private:
    const FileSource& m_source;
    std::uintmax_t m_max_file_size;
    std::unordered_map<std::string, std::vector<ImportPattern>> m_import_patterns;
    std::unordered_map<std::string, std::string> m_contents_cache;

    void initializeImportPatterns();

    /**
     * @brief Cached, size-capped file read; failures yield empty content
     */
    const std::string& getFileContents(const std::string& file_path);
};

} // namespace Loom
