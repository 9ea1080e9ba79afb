// =================================================================
// tests/TestRunner.cpp
// =================================================================
// Runs the component test executables built next to it.

#include <iostream>
#include <vector>
#include <string>
#include <chrono>
#include <cstdlib>

namespace {

// Component names; each one is built as ./<Name>Test
const std::vector<std::string> SUITES = {
    "Logger",
    "IgnorePattern",
    "LanguageClassifier",
    "ContentReader",
    "PathResolver",
    "Formatter",
    "Pipeline",
    "Config",
    "OutputWriter",
    "InteractiveSelector",
    "ApiServer"
};

bool knownSuite(const std::string& name) {
    for (const auto& suite : SUITES) {
        if (suite == name) {
            return true;
        }
    }
    return false;
}

int runSuite(const std::string& name) {
    std::cout << "Running " << name << " tests..." << std::endl;
    std::cout << std::string(40, '-') << std::endl;

    auto start = std::chrono::steady_clock::now();
    int result = std::system(("./" + name + "Test").c_str());
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result == 0) {
        std::cout << "✅ " << name << " PASSED (" << took.count() << "ms)" << std::endl;
    } else {
        std::cout << "❌ " << name << " FAILED (status " << result << ")" << std::endl;
    }
    std::cout << std::endl;
    return result;
}

int runAll() {
    std::cout << "🚀 fcc test suites" << std::endl << std::endl;

    size_t failed = 0;
    for (const auto& suite : SUITES) {
        if (runSuite(suite) != 0) {
            failed++;
        }
    }

    std::cout << "Suites: " << SUITES.size() << ", passed: " << SUITES.size() - failed
              << ", failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << "🎉 All tests passed!" << std::endl;
        return 0;
    }
    std::cout << "💥 " << failed << " suite(s) failed!" << std::endl;
    return 1;
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--list | --test <name>]" << std::endl;
    std::cout << "  (no arguments)      Run all test suites" << std::endl;
    std::cout << "  --list, -l          List test suites" << std::endl;
    std::cout << "  --test <name>       Run one suite, e.g. --test PathResolver" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc == 1) {
        return runAll();
    }

    std::string arg = argv[1];

    if (arg == "--list" || arg == "-l") {
        for (const auto& suite : SUITES) {
            std::cout << "  - " << suite << std::endl;
        }
        return 0;
    }

    if (arg == "--test" && argc == 3) {
        if (!knownSuite(argv[2])) {
            std::cerr << "Unknown test suite '" << argv[2] << "'. Use --list." << std::endl;
            return 1;
        }
        return runSuite(argv[2]) == 0 ? 0 : 1;
    }

    printUsage(argv[0]);
    return arg == "--help" || arg == "-h" ? 0 : 1;
}
