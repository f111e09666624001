// =================================================================
// src/ContextStudio/ClipboardService.cpp
// =================================================================
// Implementation for the clipboard collaborator.

#include "ContextStudio/ClipboardService.hpp"
#include "ContextStudio/Logger.hpp"
#include "ContextStudio/SysInteraction.hpp"

namespace ContextStudio {

CommandClipboardBackend::CommandClipboardBackend()
    : CommandClipboardBackend(defaultTools()) {}

CommandClipboardBackend::CommandClipboardBackend(std::vector<Tool> tools)
    : m_tools(std::move(tools)), m_sys(std::make_unique<SysInteraction>()) {}

CommandClipboardBackend::~CommandClipboardBackend() = default;

std::vector<CommandClipboardBackend::Tool> CommandClipboardBackend::defaultTools() {
    return {
        {"wl-copy", {}},
        {"xclip", {"-selection", "clipboard"}},
        {"xsel", {"--clipboard", "--input"}},
        {"pbcopy", {}},
        {"clip", {}}
    };
}

void CommandClipboardBackend::copy(const std::string& text) {
    for (const auto& tool : m_tools) {
        std::string executable = m_sys->findExecutable(tool.command);
        if (executable.empty()) {
            continue;
        }

        int exit_code = m_sys->pipeToCommand(executable, tool.args, text);
        if (exit_code != 0) {
            throw std::runtime_error(tool.command + " exited with code " + std::to_string(exit_code));
        }
        return;
    }

    throw ClipboardUnavailableError("No clipboard tool found in PATH");
}

ClipboardService::ClipboardService(std::unique_ptr<ClipboardBackend> backend)
    : ClipboardService(std::move(backend), Logger::getInstance()) {}

ClipboardService::ClipboardService(std::unique_ptr<ClipboardBackend> backend, Logger& logger)
    : m_backend(std::move(backend)), m_logger(logger) {}

std::pair<bool, std::string> ClipboardService::copyText(const std::string& text) {
    if (text.empty()) {
        m_logger.warning("Clipboard", "Clipboard copy aborted: Input text is empty.");
        return {false, "Nothing to copy."};
    }

    if (!m_backend) {
        m_logger.error("Clipboard", "No clipboard backend configured");
        return {false, "Clipboard error occurred."};
    }

    try {
        m_backend->copy(text);
        m_logger.info("Clipboard", "Text successfully copied to clipboard.");
        return {true, "Copied to clipboard!"};
    } catch (const ClipboardUnavailableError& e) {
        const std::string message = "Clipboard failed: Missing system dependency (install xclip or xsel).";
        m_logger.error("Clipboard", message, e.what());
        return {false, message};
    } catch (const std::exception& e) {
        m_logger.error("Clipboard", std::string("Clipboard failed: ") + e.what());
        return {false, "Clipboard error occurred."};
    }
}

} // namespace ContextStudio
