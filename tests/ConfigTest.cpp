// =================================================================
// tests/ConfigTest.cpp
// =================================================================
// Unit tests for the layered YAML configuration.

#include "Fcc/Config.hpp"
#include "Fcc/Errors.hpp"
#include "Fcc/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <cstdlib>
#include <string>

namespace fs = std::filesystem;

class ConfigTest {
private:
    fs::path test_dir;
    fs::path home_dir;
    fs::path project_dir;
    std::string saved_home;
    bool had_home;

    static Fcc::LoggerOptions quietOptions() {
        Fcc::LoggerOptions options;
        options.console_enabled = false;
        return options;
    }

    static bool throwsConfigError(const std::string& key, const std::string& value) {
        Fcc::Config config;
        try {
            Fcc::ConfigManager::setValue(config, key, value);
        } catch (const Fcc::ConfigError&) {
            return true;
        }
        return false;
    }

    void setupDirectories() {
        fs::remove_all(test_dir);
        fs::create_directories(home_dir / ".fcc");
        fs::create_directories(project_dir);
        setenv("HOME", home_dir.c_str(), 1);
        unsetenv("FCC_MAX_FILE_SIZE");
        unsetenv("FCC_MAX_TOTAL_FILES");
        unsetenv("FCC_READ_TIMEOUT_MS");
        unsetenv("FCC_OUTPUT_FORMAT");
        unsetenv("FCC_LOG_LEVEL");
    }

    void cleanupDirectories() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

public:
    ConfigTest()
        : test_dir(fs::temp_directory_path() / "fcc_config_test"),
          home_dir(test_dir / "home"),
          project_dir(test_dir / "project"),
          had_home(std::getenv("HOME") != nullptr) {
        if (had_home) {
            saved_home = std::getenv("HOME");
        }
    }

    ~ConfigTest() {
        if (had_home) {
            setenv("HOME", saved_home.c_str(), 1);
        }
        cleanupDirectories();
    }

    void testDefaults() {
        std::cout << "Testing built-in defaults..." << std::endl;

        Fcc::Config config;
        assert(config.limits.max_file_size_mb == 10);
        assert(config.limits.max_total_files == 1000);
        assert(config.defaults.output_format == "markdown");
        assert(config.defaults.exclude_patterns.size() == 5);
        assert(config.server.port == 8000);
        assert(config.formatConfig("markdown").include_metadata);
        assert(!config.formatConfig("unknown").include_line_numbers);

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testLayeredLoad() {
        std::cout << "Testing global, project and environment layers..." << std::endl;

        setupDirectories();
        std::ofstream(home_dir / ".fcc" / "config.yml")
            << "limits:\n  max_total_files: 50\n  max_file_size_mb: 2\nproject:\n  name: Global\n";
        std::ofstream(project_dir / ".fcc.yml")
            << "project:\n  name: Local\nlanguages:\n  .tpl: jinja\nformats:\n  txt:\n    include_metadata: false\n";
        setenv("FCC_MAX_TOTAL_FILES", "7", 1);

        Fcc::Logger logger(quietOptions());
        Fcc::ConfigManager manager(logger);
        Fcc::Config config = manager.load(project_dir);

        assert(config.limits.max_file_size_mb == 2 && "Global layer applies");
        assert(config.project.name == "Local" && "Project layer overrides global");
        assert(config.limits.max_total_files == 7 && "Environment overrides files");
        assert(config.languages.at(".tpl") == "jinja");
        assert(!config.formatConfig("txt").include_metadata);
        assert(config.formatConfig("markdown").include_metadata);

        unsetenv("FCC_MAX_TOTAL_FILES");
        cleanupDirectories();
        std::cout << "✓ Layered load test passed" << std::endl;
    }

    void testMalformedFileSkipped() {
        std::cout << "Testing malformed configuration files..." << std::endl;

        setupDirectories();
        std::ofstream(home_dir / ".fcc" / "config.yml") << "limits: [unclosed\n";
        std::ofstream(project_dir / ".fcc.yml") << "server:\n  port: 99999\n";
        setenv("FCC_READ_TIMEOUT_MS", "soon", 1);

        Fcc::Logger logger(quietOptions());
        Fcc::ConfigManager manager(logger);
        Fcc::Config config = manager.load(project_dir);

        assert(config.limits.max_total_files == 1000 && "Malformed file is skipped as a whole");
        assert(config.server.port == 8000 && "Out-of-range port rejected");
        assert(config.limits.read_timeout_ms == 10000 && "Invalid environment value ignored");

        size_t warnings = 0;
        for (const auto& entry : logger.entries()) {
            if (entry.level == Fcc::LogLevel::WARNING) {
                warnings++;
            }
        }
        assert(warnings == 3);

        unsetenv("FCC_READ_TIMEOUT_MS");
        cleanupDirectories();
        std::cout << "✓ Malformed file test passed" << std::endl;
    }

    void testGetAndSet() {
        std::cout << "Testing dotted key access..." << std::endl;

        Fcc::Config config;
        Fcc::ConfigManager::setValue(config, "limits.max_total_files", "25");
        assert(config.limits.max_total_files == 25);
        assert(Fcc::ConfigManager::getValue(config, "limits.max_total_files") == "25");

        Fcc::ConfigManager::setValue(config, "defaults.exclude_patterns", "dist/, *.min.js");
        assert(config.defaults.exclude_patterns.size() == 2);
        assert(config.defaults.exclude_patterns[0] == "dist/");
        assert(config.defaults.exclude_patterns[1] == "*.min.js");

        Fcc::ConfigManager::setValue(config, "defaults.exclude_patterns", "[build/, out/]");
        assert(config.defaults.exclude_patterns.size() == 2);
        assert(config.defaults.exclude_patterns[1] == "out/");

        Fcc::ConfigManager::setValue(config, "formats.markdown.include_line_numbers", "true");
        assert(config.formatConfig("markdown").include_line_numbers);

        Fcc::ConfigManager::setValue(config, "languages..tpl", "jinja");
        assert(config.languages.at(".tpl") == "jinja");

        Fcc::ConfigManager::setValue(config, "project.name", "Demo");
        assert(Fcc::ConfigManager::getValue(config, "project.name") == "Demo");

        assert(throwsConfigError("limits.unknown", "1"));
        assert(throwsConfigError("nosuch.section", "1"));
        assert(throwsConfigError("limits.max_total_files", "many"));
        assert(throwsConfigError("server.port", "70000"));
        assert(throwsConfigError("formats.txt.colour", "true"));

        bool threw = false;
        try {
            Fcc::ConfigManager::getValue(config, "limits.nothing");
        } catch (const Fcc::ConfigError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Dotted key test passed" << std::endl;
    }

    void testSaveRoundTrip() {
        std::cout << "Testing save and reload..." << std::endl;

        setupDirectories();
        Fcc::Logger logger(quietOptions());
        Fcc::ConfigManager manager(logger);

        Fcc::Config config;
        config.project.name = "Saved";
        config.limits.read_workers = 3;
        config.languages[".tpl"] = "jinja";

        fs::path target = home_dir / "nested" / "config.yml";
        manager.save(config, target);
        assert(fs::exists(target));

        Fcc::Config reloaded;
        assert(manager.mergeFile(reloaded, target));
        assert(reloaded.project.name == "Saved");
        assert(reloaded.limits.read_workers == 3);
        assert(reloaded.languages.at(".tpl") == "jinja");
        assert(reloaded.defaults.exclude_patterns == config.defaults.exclude_patterns);

        cleanupDirectories();
        std::cout << "✓ Save round trip test passed" << std::endl;
    }

    void testDerivedOptions() {
        std::cout << "Testing pipeline and format options..." << std::endl;

        setupDirectories();
        Fcc::Config config;
        config.limits.max_file_size_mb = 2;
        config.languages[".tpl"] = "jinja";

        auto pipeline = Fcc::ConfigManager::pipelineOptions(config, project_dir, {"*.tmp"}, true);
        assert(pipeline.max_file_size == 2 * 1024 * 1024);
        assert(pipeline.max_total_files == 1000);
        assert(pipeline.exclude_patterns.size() == 1);
        assert(pipeline.default_patterns == config.defaults.exclude_patterns);
        assert(pipeline.language_overrides.at(".tpl") == "jinja");
        assert(pipeline.per_selection);

        auto format = Fcc::ConfigManager::formatOptions(config, "markdown", project_dir);
        assert(format.project_name == "project" && "Title falls back to the base directory name");
        assert(format.include_metadata);

        config.project.name = "Named";
        assert(Fcc::ConfigManager::formatOptions(config, "txt", project_dir).project_name == "Named");

        assert(Fcc::ConfigManager::projectConfigPath(project_dir) == project_dir / ".fcc.yml");
        assert(Fcc::ConfigManager::globalConfigPath() == home_dir / ".fcc" / "config.yml");
        assert(!Fcc::ConfigManager::knownKeys().empty());

        cleanupDirectories();
        std::cout << "✓ Derived options test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Config unit tests..." << std::endl;

        testDefaults();
        testLayeredLoad();
        testMalformedFileSkipped();
        testGetAndSet();
        testSaveRoundTrip();
        testDerivedOptions();

        std::cout << "All Config tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Config component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
