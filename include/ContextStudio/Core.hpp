// =================================================================
// include/ContextStudio/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "ContextStudio/CliParser.hpp"
#include "ContextStudio/StudioConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace ContextStudio {
    class StudioSession;
    class SysInteraction;
    class SelectionTree;
}

namespace ContextStudio {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Loads the project, applies the selection and emits the outputs.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief The session of the last run(), or nullptr before the first one.
     */
    const StudioSession* session() const { return m_session.get(); }

    /**
     * @brief Renders the tree with [x], [ ] and [~] markers, one entry per line.
     */
    static std::string renderTree(const SelectionTree& tree);

    /**
     * @brief "Files: <n> | Est. Tokens: <m>", with a warning above the threshold.
     */
    static std::string formatStatus(size_t file_count, size_t token_count, size_t warning_threshold);

private:
    bool loadConfig();
    int applySelection();
    int emitOutputs();

    const Commands& m_commands;
    StudioConfig m_config;
    std::unique_ptr<StudioSession> m_session;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace ContextStudio
