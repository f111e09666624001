// =================================================================
// include/ContextStudio/ContextBuilder.hpp
// =================================================================
// Header for assembling selected files into one prompt document.

#pragma once

#include "ContextStudio/FileReader.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace ContextStudio {

class Logger;

/**
 * @brief Document produced from a selection, with statistics
 */
struct ContextResult {
    std::string document;
    size_t estimated_tokens = 0;
    size_t files_requested = 0;   ///< Paths handed to build()
    size_t files_included = 0;    ///< Emitted as code blocks, placeholders included
    size_t files_empty = 0;       ///< Zero-byte files left out
    size_t files_failed = 0;      ///< Emitted as error placeholders
};

/**
 * @brief Builds the context document fed to an LLM prompt
 *
 * Layout, in order: a fixed preamble, the trimmed content of
 * context_header.md from the root (if any), one "## File:" section with a
 * fenced code block per selected file, and the trimmed content of
 * context_footer.md (if any). Per-file failures become inline placeholders
 * so a build always completes.
 *
 * Only <root>/context_header.md and <root>/context_footer.md are left out
 * of the per-file sections. Files with those names in subdirectories are
 * ordinary selected files and get their own section.
 */
class ContextBuilder {
public:
    static constexpr const char* kHeaderFilename = "context_header.md";
    static constexpr const char* kFooterFilename = "context_footer.md";

    explicit ContextBuilder(Logger& logger);
    ContextBuilder();

    /**
     * @brief Build the document for a selection
     * @param root_path Project root, used for relative paths and header/footer lookup
     * @param selected_files Absolute paths in output order
     * @return Document, token estimate and statistics
     */
    ContextResult build(const std::filesystem::path& root_path,
                        const std::vector<std::filesystem::path>& selected_files) const;

    /**
     * @brief Rough token estimate: characters / 4
     *
     * Counts UTF-8 code points. This is a heuristic for display, not a
     * tokenizer.
     */
    static size_t estimateTokens(const std::string& text);

    /**
     * @brief Fenced code block tag for a file: lower-cased extension, or "text"
     */
    static std::string languageTag(const std::filesystem::path& file_path);

private:
    Logger& m_logger;
    FileReader m_reader;

    /**
     * @brief Read context_header.md / context_footer.md
     * @return Trimmed content, or an empty string when absent or unreadable
     */
    std::string readDecoration(const std::filesystem::path& file_path) const;

    /**
     * @brief Path relative to the root with '/' separators, base name if outside the root
     */
    std::string relativePath(const std::filesystem::path& file_path,
                             const std::filesystem::path& root_path) const;

    std::string formatFileSection(const std::string& relative_path,
                                  const std::string& language,
                                  const std::string& content) const;
};

} // namespace ContextStudio
