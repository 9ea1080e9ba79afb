// =================================================================
// tests/OutputWriterTest.cpp
// =================================================================
// Unit tests for file and directory delivery.

#include "Fcc/OutputWriter.hpp"
#include "Fcc/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class OutputWriterTest {
private:
    fs::path test_dir;

    static Fcc::LoggerOptions quietOptions() {
        Fcc::LoggerOptions options;
        options.console_enabled = false;
        return options;
    }

    static std::string readBack(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    size_t countEntries(const fs::path& dir) const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            (void)entry;
            count++;
        }
        return count;
    }

public:
    OutputWriterTest() : test_dir(fs::temp_directory_path() / "fcc_output_writer_test") {
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    ~OutputWriterTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testWriteFile() {
        std::cout << "Testing single file output..." << std::endl;

        Fcc::Logger logger(quietOptions());
        Fcc::OutputWriter writer(logger);
        std::vector<Fcc::Warning> warnings;

        fs::path target = test_dir / "out" / "nested" / "context.md";
        assert(writer.writeFile(target.string(), "# one\n", warnings));
        assert(warnings.empty());
        assert(readBack(target) == "# one\n");

        assert(writer.writeFile(target.string(), "# two\n", warnings) && "Existing files are replaced");
        assert(readBack(target) == "# two\n");
        assert(countEntries(target.parent_path()) == 1 && "No temporary file left behind");

        std::cout << "✓ Single file test passed" << std::endl;
    }

    void testWriteFailure() {
        std::cout << "Testing output write failure..." << std::endl;

        Fcc::Logger logger(quietOptions());
        Fcc::OutputWriter writer(logger);
        std::vector<Fcc::Warning> warnings;

        // A regular file where a directory is expected
        std::ofstream(test_dir / "blocker") << "x";
        fs::path target = test_dir / "blocker" / "context.md";

        assert(!writer.writeFile(target.string(), "text", warnings));
        assert(warnings.size() == 1);
        assert(warnings[0].kind == Fcc::ErrorKind::OUTPUT_WRITE_FAILURE);
        assert(warnings[0].subject == target.string());
        assert(readBack(test_dir / "blocker") == "x");

        std::cout << "✓ Write failure test passed" << std::endl;
    }

    void testWriteDirectory() {
        std::cout << "Testing per-selection directory output..." << std::endl;

        Fcc::Logger logger(quietOptions());
        Fcc::OutputWriter writer(logger);
        std::vector<Fcc::Warning> warnings;

        std::vector<Fcc::RenderedOutput> outputs = {
            {"src.md", "# src\n"},
            {"docs.md", "# docs\n"}
        };

        fs::path dir = test_dir / "per-selection";
        assert(writer.writeDirectory(dir.string(), outputs, warnings) == 2);
        assert(warnings.empty());
        assert(readBack(dir / "src.md") == "# src\n");
        assert(readBack(dir / "docs.md") == "# docs\n");
        assert(countEntries(dir) == 2);

        std::ofstream(test_dir / "not-a-dir") << "x";
        assert(writer.writeDirectory((test_dir / "not-a-dir").string(), outputs, warnings) == 0);
        assert(warnings.size() == 1);

        std::cout << "✓ Directory output test passed" << std::endl;
    }

    void testClipboardCommands() {
        std::cout << "Testing clipboard command list..." << std::endl;

        auto commands = Fcc::OutputWriter::clipboardCommands();
        assert(!commands.empty());
        for (const auto& command : commands) {
            assert(!command.empty());
        }

        std::cout << "✓ Clipboard command list test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running OutputWriter unit tests..." << std::endl;

        testWriteFile();
        testWriteFailure();
        testWriteDirectory();
        testClipboardCommands();

        std::cout << "All OutputWriter tests passed!" << std::endl;
    }
};

int main() {
    try {
        OutputWriterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All OutputWriter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
