// =================================================================
// include/ContextStudio/FileReader.hpp
// =================================================================
// Header for size-bounded, encoding-tolerant file reading.

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <filesystem>

namespace ContextStudio {

class Logger;

/**
 * @brief Outcome of reading one file
 */
enum class ReadStatus {
    Content,            ///< Decoded text
    Empty,              ///< Zero-byte file
    NotFound,           ///< Path vanished before the read
    TooLarge,           ///< Above the size ceiling
    PermissionDenied,   ///< Open refused by the OS
    Undecodable,        ///< No decoder accepted the bytes
    Error               ///< Any other I/O or metadata failure
};

/**
 * @brief Tagged read result
 *
 * For every status other than Content and Empty, text holds a
 * human-readable "[Error: ...]" placeholder.
 */
struct ReadResult {
    ReadStatus status = ReadStatus::Empty;
    std::string text;

    bool hasContent() const { return status == ReadStatus::Content; }
    bool isEmpty() const { return status == ReadStatus::Empty; }
    bool isError() const { return status != ReadStatus::Content && status != ReadStatus::Empty; }
};

/**
 * @brief Reads files for context assembly without ever throwing
 *
 * Files above the ceiling are not read. Content is decoded with an ordered
 * list of decoders (UTF-8, UTF-8 with byte-order mark, Latin-1); the first
 * one that accepts the bytes wins. Plain UTF-8 comes first, so a leading
 * byte-order mark stays in the text as U+FEFF. Data containing NUL bytes is
 * treated as binary. Decoded text is returned as UTF-8 without newline
 * translation.
 */
class FileReader {
public:
    static constexpr std::uintmax_t kMaxFileSizeBytes = 1000000;

    /**
     * @brief A decoder turns raw bytes into UTF-8 text or rejects them
     */
    struct Decoder {
        std::string name;
        std::function<bool(const std::string& bytes, std::string& text)> decode;
    };

    explicit FileReader(Logger& logger);
    FileReader();

    /**
     * @brief Read a file according to the size and encoding policy
     * @param path File to read
     * @return Tagged result, never throws
     */
    ReadResult read(const std::filesystem::path& path) const;

    /**
     * @brief Decoders tried in order
     */
    const std::vector<Decoder>& decoders() const { return m_decoders; }

    // Individual decoders, exposed for reuse and testing
    static bool decodeUtf8Bom(const std::string& bytes, std::string& text);
    static bool decodeUtf8(const std::string& bytes, std::string& text);
    static bool decodeLatin1(const std::string& bytes, std::string& text);

    static bool isValidUtf8(const std::string& bytes);

private:
    Logger& m_logger;
    std::vector<Decoder> m_decoders;

    ReadResult readChecked(const std::filesystem::path& path) const;
};

} // namespace ContextStudio
