// =================================================================
// src/Loom/FileSource.cpp
// =================================================================
// Implementation for the filesystem-backed file source.

#include "Loom/FileSource.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Loom {

namespace fs = std::filesystem;

DiskFileSource::DiskFileSource(const std::string& root_path)
    : m_root_path(root_path) {}

std::string DiskFileSource::resolve(const std::string& path) const {
    fs::path candidate(path);
    if (candidate.is_absolute() || m_root_path.empty() || m_root_path == ".") {
        return candidate.string();
    }
    return (fs::path(m_root_path) / candidate).string();
}

std::optional<std::uintmax_t> DiskFileSource::fileSize(const std::string& path) const {
    std::error_code ec;
    fs::path resolved(resolve(path));

    if (!fs::is_regular_file(resolved, ec) || ec) {
        return std::nullopt;
    }

    auto size = fs::file_size(resolved, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

std::optional<std::string> DiskFileSource::readBytes(const std::string& path) const {
    std::ifstream file_stream(resolve(path), std::ios::binary);
    if (!file_stream) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace Loom
