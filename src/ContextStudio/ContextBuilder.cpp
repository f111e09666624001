// =================================================================
// src/ContextStudio/ContextBuilder.cpp
// =================================================================
// Implementation for assembling selected files into one prompt document.

#include "ContextStudio/ContextBuilder.hpp"
#include "ContextStudio/Logger.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace ContextStudio {

namespace {

const char* const kPreambleTitle = "# Context Injection\n";
const char* const kPreambleText =
    "The following codebase context was automatically defined as important for this prompt:\n";

std::string trim(const std::string& s) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    fs::path result = fs::absolute(path, ec);
    if (ec) {
        result = path;
    }
    result = result.lexically_normal();
    if (result.has_parent_path() && result.filename().empty()) {
        result = result.parent_path();
    }
    return result;
}

} // namespace

ContextBuilder::ContextBuilder(Logger& logger)
    : m_logger(logger), m_reader(logger) {}

ContextBuilder::ContextBuilder() : ContextBuilder(Logger::getInstance()) {}

ContextResult ContextBuilder::build(const fs::path& root_path,
                                    const std::vector<fs::path>& selected_files) const {
    ContextResult result;
    result.files_requested = selected_files.size();

    const fs::path root = normalized(root_path);
    const fs::path header_path = root / kHeaderFilename;
    const fs::path footer_path = root / kFooterFilename;

    m_logger.debug("ContextBuilder", "Building context from " + std::to_string(selected_files.size()) + " files",
                   root.string());

    std::vector<std::string> parts;
    parts.emplace_back(kPreambleTitle);
    parts.emplace_back(kPreambleText);

    std::string header = readDecoration(header_path);
    if (!header.empty()) {
        parts.push_back(header + "\n");
    }

    for (const auto& selected : selected_files) {
        fs::path file_path = normalized(selected);

        // Already injected outside the code blocks
        if (file_path == header_path || file_path == footer_path) {
            m_logger.debug("ContextBuilder", "Skipping decoration file in selection", file_path.string());
            continue;
        }

        ReadResult content = m_reader.read(file_path);
        if (content.isEmpty()) {
            ++result.files_empty;
            continue;
        }
        if (content.isError()) {
            ++result.files_failed;
        }

        parts.push_back(formatFileSection(relativePath(file_path, root), languageTag(file_path), content.text));
        ++result.files_included;
    }

    std::string footer = readDecoration(footer_path);
    if (!footer.empty()) {
        parts.push_back("\n" + footer);
    }

    std::ostringstream document;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            document << '\n';
        }
        document << parts[i];
    }

    result.document = document.str();
    result.estimated_tokens = estimateTokens(result.document);

    m_logger.logContextBuilding(result.files_requested, result.files_included, result.files_empty,
                                result.files_failed, result.estimated_tokens);
    return result;
}

size_t ContextBuilder::estimateTokens(const std::string& text) {
    // Heuristic: roughly 4 characters per token for English and code
    size_t characters = std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    });
    return characters / 4;
}

std::string ContextBuilder::languageTag(const fs::path& file_path) {
    std::string extension = file_path.extension().string();
    if (extension.size() <= 1) {
        return "text";
    }

    std::string tag = extension.substr(1);
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (tag == "txt") {
        return "text";
    }
    return tag;
}

std::string ContextBuilder::readDecoration(const fs::path& file_path) const {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        return "";
    }

    // Placeholders are never shown for decorations, only real content
    ReadResult content = m_reader.read(file_path);
    if (!content.hasContent()) {
        m_logger.debug("ContextBuilder", "Decoration file not usable", file_path.string());
        return "";
    }
    return trim(content.text);
}

std::string ContextBuilder::relativePath(const fs::path& file_path, const fs::path& root_path) const {
    auto root_it = root_path.begin();
    auto file_it = file_path.begin();
    for (; root_it != root_path.end(); ++root_it, ++file_it) {
        if (file_it == file_path.end() || *root_it != *file_it) {
            break;
        }
    }

    if (root_it != root_path.end() || file_it == file_path.end()) {
        m_logger.error("ContextBuilder", "File is not relative to root",
                       file_path.string() + " (root " + root_path.string() + ")");
        return file_path.filename().string();
    }

    std::string relative;
    for (; file_it != file_path.end(); ++file_it) {
        if (!relative.empty()) {
            relative += '/';
        }
        relative += file_it->string();
    }
    return relative;
}

std::string ContextBuilder::formatFileSection(const std::string& relative_path,
                                              const std::string& language,
                                              const std::string& content) const {
    std::ostringstream section;
    section << "## File: " << relative_path << "\n";
    section << "```" << language << "\n";
    section << content << "\n";
    section << "```\n";
    return section.str();
}

} // namespace ContextStudio
