// =================================================================
// src/Loom/SysInteraction.cpp
// =================================================================
// Implementation for the operating system layer.

#include "Loom/SysInteraction.hpp"
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>

namespace Loom {

namespace fs = std::filesystem;

CommandResult SysInteraction::executeCommand(const std::string& program,
                                             const std::vector<std::string>& args,
                                             bool capture_stderr) {
    const std::string command_line = buildCommandLine(program, args, capture_stderr);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_line.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to start command: " + command_line);
    }

    CommandResult result;
    std::array<char, 4096> chunk;
    size_t count = 0;
    while ((count = fread(chunk.data(), 1, chunk.size(), pipe.get())) > 0) {
        result.output.append(chunk.data(), count);
    }

    // pclose reports a wait status, not the exit code itself
    int status = pclose(pipe.release());
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

std::string SysInteraction::buildCommandLine(const std::string& program,
                                             const std::vector<std::string>& args,
                                             bool capture_stderr) {
    std::string command_line = quoteArgument(program);
    for (const auto& arg : args) {
        command_line += ' ';
        command_line += quoteArgument(arg);
    }
    command_line += capture_stderr ? " 2>&1" : " 2>/dev/null";
    return command_line;
}

std::string SysInteraction::quoteArgument(const std::string& arg) {
    static const std::string plain =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_./=:@%+,";

    if (!arg.empty() && arg.find_first_not_of(plain) == std::string::npos) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

bool SysInteraction::fileExists(const std::string& file_path) const {
    std::error_code ec;
    return fs::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const std::string& dir_path) const {
    std::error_code ec;
    return fs::is_directory(dir_path, ec);
}

bool SysInteraction::createDirectory(const std::string& dir_path) const {
    std::error_code ec;
    fs::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) const {
    std::ofstream out(file_path, std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    return out.good();
}

} // namespace Loom
