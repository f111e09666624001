// =================================================================
// tests/ContextBuilderTest.cpp
// =================================================================
// Unit tests for ContextBuilder component.

#include "ContextStudio/ContextBuilder.hpp"
#include "ContextStudio/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::string kPreamble =
    "# Context Injection\n"
    "\n"
    "The following codebase context was automatically defined as important for this prompt:\n";

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

class ContextBuilderTest {
private:
    std::string test_dir;
    std::string outside_dir;
    ContextStudio::Logger logger;

    void writeFile(const std::string& relative, const std::string& bytes) {
        fs::path path = fs::path(test_dir) / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    fs::path root() const {
        return fs::canonical(test_dir);
    }

    void setupTestFiles() {
        cleanupTestFiles();
        fs::create_directories(test_dir);
        writeFile("a.txt", "hello");
        writeFile("sub/b.py", "print(1)");
    }

    void cleanupTestFiles() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::remove_all(outside_dir, ec);
    }

public:
    ContextBuilderTest() : test_dir("test_context_builder"), outside_dir("test_context_outside") {
        logger.setFileLogging(false);
        logger.setConsoleLogging(false);
    }

    void testDocumentLayout() {
        std::cout << "Testing document layout with a header..." << std::endl;

        setupTestFiles();
        writeFile("context_header.md", "\n  INTRO  \n\n");

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {root() / "a.txt", root() / "sub" / "b.py"});

        const std::string expected =
            "# Context Injection\n"
            "\n"
            "The following codebase context was automatically defined as important for this prompt:\n"
            "\n"
            "INTRO\n"
            "\n"
            "## File: a.txt\n"
            "```text\n"
            "hello\n"
            "```\n"
            "\n"
            "## File: sub/b.py\n"
            "```py\n"
            "print(1)\n"
            "```\n";
        assert(result.document == expected && "Document layout must match exactly");
        assert(result.files_requested == 2);
        assert(result.files_included == 2);
        assert(result.files_failed == 0);
        assert(result.estimated_tokens == ContextStudio::ContextBuilder::estimateTokens(expected));

        cleanupTestFiles();
        std::cout << "✓ Document layout test passed" << std::endl;
    }

    void testEmptySelection() {
        std::cout << "Testing empty selection..." << std::endl;

        setupTestFiles();

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {});
        assert(result.document == kPreamble && "Only the preamble without header or files");
        assert(result.files_included == 0);

        cleanupTestFiles();
        std::cout << "✓ Empty selection test passed" << std::endl;
    }

    void testFooterAppended() {
        std::cout << "Testing footer placement..." << std::endl;

        setupTestFiles();
        writeFile("context_footer.md", "  OUTRO \n");

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {root() / "a.txt"});

        assert(endsWith(result.document, "```text\nhello\n```\n\n\nOUTRO") && "Footer is the last part");
        assert(result.document.find("INTRO") == std::string::npos && "No header file, no header");

        cleanupTestFiles();
        std::cout << "✓ Footer test passed" << std::endl;
    }

    void testDecorationsNotDuplicated() {
        std::cout << "Testing selected header and footer files..." << std::endl;

        setupTestFiles();
        writeFile("context_header.md", "INTRO");
        writeFile("context_footer.md", "OUTRO");
        writeFile("docs/context_header.md", "nested header is ordinary");

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {
            root() / "context_header.md",
            root() / "a.txt",
            root() / "context_footer.md",
            root() / "docs" / "context_header.md"
        });

        assert(countOccurrences(result.document, "INTRO") == 1 && "Header appears once");
        assert(countOccurrences(result.document, "OUTRO") == 1 && "Footer appears once");
        assert(result.document.find("## File: context_header.md") == std::string::npos);
        assert(result.document.find("## File: context_footer.md") == std::string::npos);
        assert(result.document.find("## File: docs/context_header.md") != std::string::npos &&
               "Only the root-level decoration files are special");
        assert(result.files_included == 2);

        cleanupTestFiles();
        std::cout << "✓ Decoration de-duplication test passed" << std::endl;
    }

    void testZeroByteFileOmitted() {
        std::cout << "Testing zero-byte file omission..." << std::endl;

        setupTestFiles();
        writeFile("blank.md", "");

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {root() / "blank.md", root() / "a.txt"});

        assert(result.document.find("blank.md") == std::string::npos && "Empty file contributes nothing");
        assert(result.files_empty == 1);
        assert(result.files_included == 1);

        cleanupTestFiles();
        std::cout << "✓ Zero-byte file test passed" << std::endl;
    }

    void testErrorPlaceholders() {
        std::cout << "Testing inline error placeholders..." << std::endl;

        setupTestFiles();
        writeFile("big.log", std::string(1000001, 'x'));

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {root() / "big.log", root() / "vanished.txt"});

        assert(result.document.find(
                   "## File: big.log\n```log\n[Error: File too large to include (1000001 bytes)]\n```\n") !=
               std::string::npos);
        assert(result.document.find(
                   "## File: vanished.txt\n```text\n[Error: File not found]\n```\n") != std::string::npos);
        assert(result.files_failed == 2);
        assert(result.files_included == 2);

        cleanupTestFiles();
        std::cout << "✓ Error placeholder test passed" << std::endl;
    }

    void testUnusableHeaderSuppressed() {
        std::cout << "Testing unreadable header suppression..." << std::endl;

        setupTestFiles();
        writeFile("context_header.md", std::string("bin\0ary", 7));

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {root() / "a.txt"});

        assert(result.document.find("[Error") == std::string::npos && "Header placeholders are never shown");
        assert(result.document.find(kPreamble + "\n## File: a.txt") == 0);

        cleanupTestFiles();
        std::cout << "✓ Unusable header test passed" << std::endl;
    }

    void testHeaderTextLookingLikeError() {
        std::cout << "Testing header whose text starts with [Error..." << std::endl;

        setupTestFiles();
        writeFile("context_header.md", "[Error handling conventions] apply to this repo");

        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {});

        assert(result.document.find("[Error handling conventions] apply to this repo\n") != std::string::npos &&
               "Real content is kept whatever it starts with");

        cleanupTestFiles();
        std::cout << "✓ Error-like header test passed" << std::endl;
    }

    void testFileOutsideRoot() {
        std::cout << "Testing file outside the root..." << std::endl;

        setupTestFiles();
        fs::create_directories(outside_dir);
        std::ofstream(outside_dir + "/notes.md") << "outside";

        logger.clearHistory();
        ContextStudio::ContextBuilder builder(logger);
        auto result = builder.build(root(), {fs::canonical(outside_dir) / "notes.md"});

        assert(result.document.find("## File: notes.md\n```md\noutside\n```\n") != std::string::npos &&
               "Falls back to the base name");

        bool logged = false;
        for (const auto& entry : logger.recentEntries()) {
            if (entry.level == ContextStudio::LogLevel::ERROR && entry.component == "ContextBuilder") {
                logged = true;
            }
        }
        assert(logged && "Outside-root path should be reported as an error");

        cleanupTestFiles();
        std::cout << "✓ Outside root test passed" << std::endl;
    }

    void testLanguageTags() {
        std::cout << "Testing language tags..." << std::endl;

        using ContextStudio::ContextBuilder;
        assert(ContextBuilder::languageTag("src/main.cpp") == "cpp");
        assert(ContextBuilder::languageTag("tool/RUN.PY") == "py" && "Tags are lower-cased");
        assert(ContextBuilder::languageTag("notes.txt") == "text");
        assert(ContextBuilder::languageTag("Makefile") == "text" && "No extension gives text");
        assert(ContextBuilder::languageTag(".gitignore") == "text");
        assert(ContextBuilder::languageTag("archive.tar.gz") == "gz" && "Last extension only");

        std::cout << "✓ Language tag test passed" << std::endl;
    }

    void testTokenEstimate() {
        std::cout << "Testing token estimate..." << std::endl;

        using ContextStudio::ContextBuilder;
        assert(ContextBuilder::estimateTokens("") == 0);
        assert(ContextBuilder::estimateTokens(std::string(400, 'a')) == 100);
        assert(ContextBuilder::estimateTokens(std::string(403, 'a')) == 100 && "Integer division");
        assert(ContextBuilder::estimateTokens("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9") == 1 &&
               "Counts characters, not bytes");

        std::cout << "✓ Token estimate test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContextBuilder unit tests..." << std::endl;

        testDocumentLayout();
        testEmptySelection();
        testFooterAppended();
        testDecorationsNotDuplicated();
        testZeroByteFileOmitted();
        testErrorPlaceholders();
        testUnusableHeaderSuppressed();
        testHeaderTextLookingLikeError();
        testFileOutsideRoot();
        testLanguageTags();
        testTokenEstimate();

        std::cout << "All ContextBuilder tests passed!" << std::endl;
    }
};

int main() {
    try {
        ContextBuilderTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ContextBuilder component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
