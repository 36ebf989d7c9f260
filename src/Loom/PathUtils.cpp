// =================================================================
// src/Loom/PathUtils.cpp
// =================================================================
// Implementation for lexical path helpers.

#include "Loom/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace Loom {

namespace fs = std::filesystem;

std::string PathUtils::getFileName(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string PathUtils::getStem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::string PathUtils::getSuffix(const std::string& path) {
    return fs::path(path).extension().string();
}

std::string PathUtils::getParent(const std::string& path) {
    auto parts = splitParts(path);
    if (parts.size() <= 1) {
        return ".";
    }

    std::string parent = parts[0];
    for (size_t i = 1; i + 1 < parts.size(); ++i) {
        parent += "/" + parts[i];
    }
    return parent;
}

std::vector<std::string> PathUtils::splitParts(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;

    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty() && current != ".") {
                parts.push_back(current);
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") {
        parts.push_back(current);
    }

    return parts;
}

std::vector<std::string> PathUtils::getAncestors(const std::string& path) {
    std::vector<std::string> ancestors;
    std::string parent = getParent(path);

    while (parent != ".") {
        ancestors.push_back(parent);
        parent = getParent(parent);
    }
    ancestors.push_back(".");

    return ancestors;
}

std::string PathUtils::getStemPath(const std::string& path) {
    std::string parent = getParent(path);
    std::string stem = getStem(path);
    if (parent == ".") {
        return stem;
    }
    return parent + "/" + stem;
}

std::string PathUtils::getTopLevelModule(const std::string& path) {
    auto parts = splitParts(path);
    if (parts.size() > 1) {
        return parts[0];
    }
    return "root";
}

std::string PathUtils::toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace Loom
