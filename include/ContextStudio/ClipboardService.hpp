// =================================================================
// include/ContextStudio/ClipboardService.hpp
// =================================================================
// Defines the clipboard collaborator and its backends.

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

namespace ContextStudio {

class Logger;
class SysInteraction;

/**
 * @brief Thrown by a backend when the system clipboard tooling is missing
 */
class ClipboardUnavailableError : public std::runtime_error {
public:
    explicit ClipboardUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Abstract access to the OS clipboard
 */
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    /**
     * @brief Place text on the clipboard
     * @throws ClipboardUnavailableError if no clipboard mechanism is installed
     * @throws std::runtime_error for any other failure
     */
    virtual void copy(const std::string& text) = 0;
};

/**
 * @brief Clipboard backed by command-line tools (wl-copy, xclip, xsel, pbcopy)
 */
class CommandClipboardBackend : public ClipboardBackend {
public:
    struct Tool {
        std::string command;
        std::vector<std::string> args;
    };

    CommandClipboardBackend();
    explicit CommandClipboardBackend(std::vector<Tool> tools);
    ~CommandClipboardBackend() override;

    void copy(const std::string& text) override;

    static std::vector<Tool> defaultTools();

private:
    std::vector<Tool> m_tools;
    std::unique_ptr<SysInteraction> m_sys;
};

/**
 * @brief Copies text to the clipboard and reports a user-facing message
 *
 * Never throws; every failure becomes a (false, message) result.
 */
class ClipboardService {
public:
    explicit ClipboardService(std::unique_ptr<ClipboardBackend> backend);
    ClipboardService(std::unique_ptr<ClipboardBackend> backend, Logger& logger);

    /**
     * @brief Copy text to the clipboard
     * @param text The content to copy
     * @return (true, "Copied to clipboard!") on success, (false, reason) otherwise
     */
    std::pair<bool, std::string> copyText(const std::string& text);

private:
    std::unique_ptr<ClipboardBackend> m_backend;
    Logger& m_logger;
};

} // namespace ContextStudio
