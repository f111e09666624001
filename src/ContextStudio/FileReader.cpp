// =================================================================
// src/ContextStudio/FileReader.cpp
// =================================================================
// Implementation for size-bounded, encoding-tolerant file reading.

#include "ContextStudio/FileReader.hpp"
#include "ContextStudio/Logger.hpp"
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace ContextStudio {

FileReader::FileReader(Logger& logger)
    : m_logger(logger)
{
    m_decoders = {
        {"utf-8", &FileReader::decodeUtf8},
        {"utf-8-sig", &FileReader::decodeUtf8Bom},
        {"latin-1", &FileReader::decodeLatin1}
    };
}

FileReader::FileReader() : FileReader(Logger::getInstance()) {}

ReadResult FileReader::read(const fs::path& path) const {
    try {
        return readChecked(path);
    } catch (const std::exception& e) {
        m_logger.error("FileReader", "Unexpected error reading file", path.string() + ": " + e.what());
        return {ReadStatus::Error, std::string("[Error: system error ") + e.what() + "]"};
    }
}

ReadResult FileReader::readChecked(const fs::path& path) const {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        // Deleted after the scan
        m_logger.warning("FileReader", "File not found during read", path.string());
        return {ReadStatus::NotFound, "[Error: File not found]"};
    }

    std::uintmax_t size = 0;
    if (!ec) {
        size = fs::file_size(path, ec);
    }
    if (ec) {
        m_logger.error("FileReader", "Could not stat file", path.string() + ": " + ec.message());
        return {ReadStatus::Error, "[Error: Could not access file metadata]"};
    }

    if (size > kMaxFileSizeBytes) {
        m_logger.warning("FileReader", "File skipped (too large)",
                         path.string() + ": " + std::to_string(size) + " bytes");
        return {ReadStatus::TooLarge,
                "[Error: File too large to include (" + std::to_string(size) + " bytes)]"};
    }
    if (size == 0) {
        return {ReadStatus::Empty, ""};
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int open_errno = errno;
        if (open_errno == EACCES || open_errno == EPERM) {
            m_logger.error("FileReader", "Permission denied reading file", path.string());
            return {ReadStatus::PermissionDenied, "[Error: Permission denied]"};
        }
        std::string reason = open_errno != 0 ? std::strerror(open_errno) : "Failed to open file";
        m_logger.error("FileReader", "OS error reading file", path.string() + ": " + reason);
        return {ReadStatus::Error, "[Error: system error " + reason + "]"};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        m_logger.error("FileReader", "OS error reading file", path.string() + ": read failed");
        return {ReadStatus::Error, "[Error: system error read failed]"};
    }

    std::string bytes = buffer.str();
    if (bytes.empty()) {
        // Truncated between stat and read
        return {ReadStatus::Empty, ""};
    }

    if (bytes.find('\0') == std::string::npos) {
        for (const auto& decoder : m_decoders) {
            std::string text;
            if (decoder.decode(bytes, text)) {
                m_logger.debug("FileReader", "Decoded " + path.string(), decoder.name);
                return {ReadStatus::Content, text};
            }
        }
    }

    m_logger.warning("FileReader", "Could not decode file", path.string());
    return {ReadStatus::Undecodable, "[Error: Binary or unsupported encoding]"};
}

bool FileReader::decodeUtf8Bom(const std::string& bytes, std::string& text) {
    static const std::string bom = "\xEF\xBB\xBF";
    if (bytes.compare(0, bom.size(), bom) != 0) {
        return false;
    }
    std::string rest = bytes.substr(bom.size());
    if (!isValidUtf8(rest)) {
        return false;
    }
    text = std::move(rest);
    return true;
}

bool FileReader::decodeUtf8(const std::string& bytes, std::string& text) {
    if (!isValidUtf8(bytes)) {
        return false;
    }
    text = bytes;
    return true;
}

bool FileReader::decodeLatin1(const std::string& bytes, std::string& text) {
    std::string decoded;
    decoded.reserve(bytes.size() + bytes.size() / 4);
    for (char c : bytes) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            decoded.push_back(c);
        } else {
            decoded.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            decoded.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    text = std::move(decoded);
    return true;
}

bool FileReader::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > n) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            unsigned char cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += length;
    }
    return true;
}

} // namespace ContextStudio
