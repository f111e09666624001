// =================================================================
// tests/StudioConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading.

#include "ContextStudio/StudioConfig.hpp"
#include "ContextStudio/CliParser.hpp"
#include "ContextStudio/FileScanner.hpp"
#include "ContextStudio/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class StudioConfigTest {
private:
    std::string test_dir;
    ContextStudio::Logger logger;

    void setupTestDir() {
        cleanupTestDir();
        fs::create_directories(test_dir);
    }

    void cleanupTestDir() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

public:
    StudioConfigTest() : test_dir("test_studio_config") {
        logger.setFileLogging(false);
        logger.setConsoleLogging(false);
    }

    void testDefaults() {
        std::cout << "Testing default values..." << std::endl;

        ContextStudio::StudioConfig config;
        assert(config.excluded_dirs.empty());
        assert(config.log_dir == ".context_studio/logs");
        assert(config.console_level == ContextStudio::LogLevel::INFO);
        assert(config.file_logging);
        assert(config.token_warning_threshold == 32000);
        assert(config.validate(logger) && "Defaults are valid");
        assert(config.getMergedExcludedDirs() == ContextStudio::defaultExcludedDirs());
        assert(std::string(ContextStudio::StudioConfig::defaultConfigFilename()) == ".context_studio.yml");

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testLoadFromString() {
        std::cout << "Testing YAML parsing..." << std::endl;

        ContextStudio::StudioConfig config;
        bool loaded = config.loadFromString(
            "scanner:\n"
            "  excluded_dirs: [build, dist]\n"
            "logging:\n"
            "  directory: /tmp/cs-logs\n"
            "  console_level: debug\n"
            "  file_enabled: false\n"
            "status:\n"
            "  token_warning_threshold: 8000\n",
            logger);

        assert(loaded && "Valid YAML should load");
        assert(config.excluded_dirs.size() == 2);
        assert(config.excluded_dirs[0] == "build" && config.excluded_dirs[1] == "dist");
        assert(config.log_dir == "/tmp/cs-logs");
        assert(config.console_level == ContextStudio::LogLevel::DEBUG);
        assert(!config.file_logging);
        assert(config.token_warning_threshold == 8000);

        std::cout << "✓ YAML parsing test passed" << std::endl;
    }

    void testInvalidValuesKeepDefaults() {
        std::cout << "Testing invalid values..." << std::endl;

        ContextStudio::StudioConfig config;
        bool loaded = config.loadFromString(
            "scanner:\n"
            "  excluded_dirs: build\n"
            "logging:\n"
            "  console_level: chatty\n"
            "  file_enabled: sometimes\n"
            "status:\n"
            "  token_warning_threshold: lots\n",
            logger);

        assert(loaded && "Bad values are skipped, not fatal");
        assert(config.excluded_dirs.empty() && "A scalar is not a list");
        assert(config.console_level == ContextStudio::LogLevel::INFO);
        assert(config.file_logging);
        assert(config.token_warning_threshold == 32000);

        std::cout << "✓ Invalid values test passed" << std::endl;
    }

    void testMalformedDocuments() {
        std::cout << "Testing malformed documents..." << std::endl;

        ContextStudio::StudioConfig broken;
        assert(!broken.loadFromString("scanner: [unclosed", logger) && "Syntax errors are reported");

        ContextStudio::StudioConfig list_root;
        assert(!list_root.loadFromString("- a\n- b\n", logger) && "Root must be a mapping");

        ContextStudio::StudioConfig empty;
        assert(empty.loadFromString("", logger) && "An empty document keeps defaults");
        assert(empty.token_warning_threshold == 32000);

        std::cout << "✓ Malformed documents test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing file loading..." << std::endl;

        setupTestDir();
        std::ofstream(test_dir + "/config.yml") << "status:\n  token_warning_threshold: 100\n";

        ContextStudio::StudioConfig config;
        assert(config.loadFromFile(test_dir + "/config.yml", logger));
        assert(config.token_warning_threshold == 100);

        ContextStudio::StudioConfig missing;
        assert(!missing.loadFromFile(test_dir + "/absent.yml", logger) && "Missing file returns false");

        cleanupTestDir();
        std::cout << "✓ File loading test passed" << std::endl;
    }

    void testMergedExcludedDirs() {
        std::cout << "Testing merged excluded directories..." << std::endl;

        ContextStudio::StudioConfig config;
        config.excluded_dirs = {"build", ".git", "build", "dist"};

        auto merged = config.getMergedExcludedDirs();
        const auto& defaults = ContextStudio::defaultExcludedDirs();
        assert(merged.size() == defaults.size() + 2 && "Duplicates are dropped");
        assert(std::equal(defaults.begin(), defaults.end(), merged.begin()) && "Defaults come first");
        assert(merged[defaults.size()] == "build");
        assert(merged.back() == "dist");

        std::cout << "✓ Merged excluded directories test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        ContextStudio::StudioConfig nested;
        nested.excluded_dirs = {"src/generated"};
        assert(!nested.validate(logger) && "Excluded entries are names, not paths");

        ContextStudio::StudioConfig zero;
        zero.token_warning_threshold = 0;
        assert(!zero.validate(logger));

        ContextStudio::StudioConfig no_dir;
        no_dir.log_dir.clear();
        assert(!no_dir.validate(logger));

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        ContextStudio::Commands commands;
        commands.exclude = {"target"};
        commands.verbose = true;

        ContextStudio::StudioConfig config;
        config.excluded_dirs = {"build"};
        config.applyCommandOverrides(commands);
        assert(config.excluded_dirs.size() == 2 && config.excluded_dirs[1] == "target");
        assert(config.console_level == ContextStudio::LogLevel::DEBUG);

        ContextStudio::Commands quiet;
        quiet.quiet = true;
        ContextStudio::StudioConfig quiet_config;
        quiet_config.applyCommandOverrides(quiet);
        assert(quiet_config.console_level == ContextStudio::LogLevel::ERROR);

        std::cout << "✓ Command override test passed" << std::endl;
    }

    void testLogLevelParsing() {
        std::cout << "Testing log level names..." << std::endl;

        using ContextStudio::Logger;
        using ContextStudio::LogLevel;
        assert(Logger::parseLevel("DEBUG") == LogLevel::DEBUG);
        assert(Logger::parseLevel("warn") == LogLevel::WARNING);
        assert(Logger::parseLevel("Critical") == LogLevel::CRITICAL);

        bool thrown = false;
        try {
            Logger::parseLevel("loud");
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown && "Unknown level names are rejected");

        std::cout << "✓ Log level parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StudioConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromString();
        testInvalidValuesKeepDefaults();
        testMalformedDocuments();
        testLoadFromFile();
        testMergedExcludedDirs();
        testValidation();
        testCommandOverrides();
        testLogLevelParsing();

        std::cout << "All StudioConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        StudioConfigTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All StudioConfig component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
