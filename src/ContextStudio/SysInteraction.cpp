// =================================================================
// src/ContextStudio/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "ContextStudio/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <cstdio>
#include <cstdlib>
#include <memory>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace ContextStudio {

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

std::string SysInteraction::findExecutable(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr || name.empty()) {
        return "";
    }

#if defined(_WIN32)
    const char separator = ';';
    const std::string suffix = ".exe";
#else
    const char separator = ':';
    const std::string suffix;
#endif

    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, separator)) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name + suffix;
        struct stat buffer;
        if (stat(candidate.c_str(), &buffer) != 0 || !S_ISREG(buffer.st_mode)) {
            continue;
        }
#if !defined(_WIN32)
        if (access(candidate.c_str(), X_OK) != 0) {
            continue;
        }
#endif
        return candidate;
    }
    return "";
}

int SysInteraction::pipeToCommand(const std::string& command, const std::vector<std::string>& args,
                                  const std::string& input) {
    // Build the full command string, the executable path included
    std::string full_command = quoteArgument(command);
    for (const auto& arg : args) {
        full_command += " " + quoteArgument(arg);
    }

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "w"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    size_t written = std::fwrite(input.data(), 1, input.size(), pipe.get());

    // Get the exit status
    int exit_status = pclose(pipe.release());

    if (written != input.size()) {
        throw std::runtime_error("Failed to write to command: " + full_command);
    }

    // On Unix-like systems, pclose returns the exit status in a special format
#if !defined(_WIN32)
    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        // Process terminated abnormally
        exit_status = -1;
    }
#endif

    return exit_status;
}

std::string SysInteraction::quoteArgument(const std::string& word) {
#if defined(_WIN32)
    std::string quoted = "\"";
    for (char c : word) {
        if (c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
#else
    // Single quotes disable every expansion; an embedded quote is closed, escaped and reopened
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
#endif
}

} // namespace ContextStudio
