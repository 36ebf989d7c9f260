// =================================================================
// src/Loom/DependencyExtractor.cpp
// =================================================================
// Implementation for regex-based import extraction.

#include "Loom/DependencyExtractor.hpp"
#include "Loom/Logger.hpp"
#include "Loom/PathUtils.hpp"
#include <algorithm>
#include <set>

namespace Loom {

DependencyExtractor::DependencyExtractor(const FileSource& source, std::uintmax_t max_file_size)
    : m_source(source), m_max_file_size(max_file_size) {
    initializeImportPatterns();
}

void DependencyExtractor::initializeImportPatterns() {
    const std::vector<ImportPattern> script_patterns = {
        {"import", std::regex(R"(import\s+.*\s+from\s+['"]([^'"]+)['"])")},
        {"require", std::regex(R"(require\(['"]([^'"]+)['"]\))")},
        {"from", std::regex(R"(from\s+['"]([^'"]+)['"])")}
    };

    m_import_patterns["python"] = {
        {"from", std::regex(R"(from\s+([.\w]+)\s+import)")},
        {"import", std::regex(R"(import\s+([.\w]+))")},
        {"from", std::regex(R"(from\s+\.+(\w+))")}
    };
    m_import_patterns["javascript"] = script_patterns;
    m_import_patterns["typescript"] = script_patterns;
    m_import_patterns["java"] = {
        {"import", std::regex(R"(import\s+([\w.]+);)")}
    };
    m_import_patterns["go"] = {
        {"import", std::regex(R"re(import\s+"([^"]+)")re")},
        {"import", std::regex(R"(import\s+\([^)]+\))")}
    };
}

DependencyMap DependencyExtractor::extractDependencies(const std::vector<ChangedFile>& files) {
    m_contents_cache.clear();
    DependencyMap dependencies;

    for (const auto& file : files) {
        if (file.is_binary) {
            continue;
        }

        std::string extension = PathUtils::toLower(PathUtils::getSuffix(file.path));
        std::string language = getLanguageFromExtension(extension);
        if (language.empty()) {
            continue;
        }

        auto raw_imports = extractImports(file.path, language);
        if (raw_imports.empty()) {
            continue;
        }

        std::set<std::string> matched;
        for (const auto& raw_import : raw_imports) {
            std::string normalized = normalizeImportPath(raw_import);
            if (normalized.empty()) {
                continue;
            }

            for (const auto& other : files) {
                if (other.path == file.path) {
                    continue;
                }
                if (importMatchesFile(normalized, other.path)) {
                    matched.insert(other.path);
                }
            }
        }

        if (!matched.empty()) {
            dependencies[file.path] = std::vector<std::string>(matched.begin(), matched.end());
            LOOM_LOG_DEBUG("DependencyExtractor",
                           file.path + " depends on " + std::to_string(matched.size()) + " changed file(s)");
        }
    }

    return dependencies;
}

std::vector<std::string> DependencyExtractor::extractImports(const std::string& file_path,
                                                             const std::string& language) {
    const std::string& content = getFileContents(file_path);
    if (content.empty()) {
        return {};
    }
    return extractImportsFromContent(content, language);
}

std::vector<std::string> DependencyExtractor::extractImportsFromContent(const std::string& content,
                                                                        const std::string& language) const {
    std::vector<std::string> imports;

    auto patterns_it = m_import_patterns.find(language);
    if (patterns_it == m_import_patterns.end()) {
        return imports;
    }

    for (const auto& pattern : patterns_it->second) {
        // Matches of one pattern do not overlap, as with a whole-text scan
        size_t search_from = 0;
        size_t keyword_at = 0;

        while ((keyword_at = content.find(pattern.keyword, search_from)) != std::string::npos) {
            auto window_begin = content.begin() + static_cast<std::ptrdiff_t>(keyword_at);
            auto window_end = content.begin()
                + static_cast<std::ptrdiff_t>(std::min(content.size(), keyword_at + MAX_IMPORT_SPAN));

            std::smatch match;
            if (!std::regex_search(window_begin, window_end, match, pattern.regex,
                                   std::regex_constants::match_continuous)) {
                search_from = keyword_at + 1;
                continue;
            }
            search_from = keyword_at + std::max<size_t>(1, static_cast<size_t>(match.length(0)));

            if (pattern.regex.mark_count() == 0) {
                // Patterns without a capture group contribute the whole match
                if (match.length(0) > 0) {
                    imports.push_back(match.str(0));
                }
                continue;
            }

            for (size_t group = 1; group < match.size(); ++group) {
                if (match[group].matched && match.length(group) > 0) {
                    imports.push_back(match.str(group));
                }
            }
        }
    }

    return imports;
}

std::string DependencyExtractor::getLanguageFromExtension(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> extension_map = {
        {".py", "python"},
        {".js", "javascript"},
        {".jsx", "javascript"},
        {".ts", "typescript"},
        {".tsx", "typescript"},
        {".java", "java"},
        {".go", "go"}
    };

    auto it = extension_map.find(extension);
    return it != extension_map.end() ? it->second : "";
}

std::string DependencyExtractor::normalizeImportPath(const std::string& import_path) {
    const std::string whitespace = " \t\n\r\f\v";

    size_t first = import_path.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = import_path.find_last_not_of(whitespace);
    std::string normalized = import_path.substr(first, last - first + 1);

    first = normalized.find_first_not_of("\"'");
    if (first == std::string::npos) {
        return "";
    }
    last = normalized.find_last_not_of("\"'");
    normalized = normalized.substr(first, last - first + 1);

    first = normalized.find_first_not_of("./");
    if (first == std::string::npos) {
        return "";
    }
    return normalized.substr(first);
}

bool DependencyExtractor::importMatchesFile(const std::string& import_path, const std::string& file_path) {
    std::string import_str = import_path;
    std::replace(import_str.begin(), import_str.end(), '.', '/');

    std::string file_str = PathUtils::getStemPath(file_path);
    if (file_str.find(import_str) != std::string::npos) {
        return true;
    }

    size_t last_separator = import_str.rfind('/');
    std::string last_part = last_separator == std::string::npos
        ? import_str
        : import_str.substr(last_separator + 1);

    return last_part == PathUtils::getStem(file_path);
}

const std::string& DependencyExtractor::getFileContents(const std::string& file_path) {
    auto cached = m_contents_cache.find(file_path);
    if (cached != m_contents_cache.end()) {
        return cached->second;
    }

    std::string content;
    auto size = m_source.fileSize(file_path);
    if (!size) {
        LOOM_LOG_DEBUG("DependencyExtractor", "Unreadable or missing file: " + file_path);
    } else if (*size > m_max_file_size) {
        LOOM_LOG_DEBUG("DependencyExtractor", "Skipping oversized file: " + file_path,
                       std::to_string(*size) + " bytes");
    } else if (auto bytes = m_source.readBytes(file_path)) {
        content = std::move(*bytes);
    }

    return m_contents_cache.emplace(file_path, std::move(content)).first->second;
}

} // namespace Loom
