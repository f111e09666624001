// =================================================================
// include/ContextStudio/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like writing
// files and feeding data to external processes.

#pragma once

#include <string>
#include <vector>

namespace ContextStudio {

class SysInteraction {
public:
    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Looks up an executable in the PATH.
     * @return Full path of the executable, or an empty string if not found.
     */
    std::string findExecutable(const std::string& name);

    /**
     * @brief Runs an external command and writes input to its stdin.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @param input Data written to the command's standard input.
     * @return The exit code of the command.
     * @throws std::runtime_error if the process cannot be started.
     */
    int pipeToCommand(const std::string& command, const std::vector<std::string>& args,
                      const std::string& input);

    /**
     * @brief Quotes one word for the shell used by popen.
     */
    static std::string quoteArgument(const std::string& word);
};

} // namespace ContextStudio
