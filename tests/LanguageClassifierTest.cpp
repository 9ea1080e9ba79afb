// =================================================================
// tests/LanguageClassifierTest.cpp
// =================================================================
// Unit tests for LanguageClassifier and NotebookNormalizer.

#include "Fcc/LanguageClassifier.hpp"
#include "Fcc/NotebookNormalizer.hpp"
#include "Fcc/Errors.hpp"
#include <iostream>
#include <cassert>
#include <map>
#include <string>

class LanguageClassifierTest {
public:
    void testExtensions() {
        std::cout << "Testing extension lookup..." << std::endl;

        Fcc::LanguageClassifier classifier;

        assert(classifier.classify("main.py") == "python");
        assert(classifier.classify("src/core/Engine.cpp") == "cpp");
        assert(classifier.classify("README.md") == "markdown");
        assert(classifier.classify("config.yml") == "yaml");
        assert(classifier.classify("App.TSX") == "tsx" && "Extensions are case-insensitive");
        assert(classifier.classify("archive.tar.gz").empty() && "Only the last extension counts");
        assert(classifier.classify("notes").empty() && "No extension yields no tag");

        std::cout << "✓ Extension lookup test passed" << std::endl;
    }

    void testSpecialFilenames() {
        std::cout << "Testing special file names..." << std::endl;

        Fcc::LanguageClassifier classifier;

        assert(classifier.classify("Dockerfile") == "dockerfile");
        assert(classifier.classify("deploy/Dockerfile.prod") == "dockerfile");
        assert(classifier.classify("Makefile") == "makefile");
        assert(classifier.classify("CMakeLists.txt") == "cmake" && "File name beats the .txt extension");
        assert(classifier.classify(".gitignore") == "gitignore");
        assert(classifier.classify("other.txt").empty());

        std::cout << "✓ Special file names test passed" << std::endl;
    }

    void testOverrides() {
        std::cout << "Testing configured overrides..." << std::endl;

        std::map<std::string, std::string> overrides = {
            {".H", "cpp"},
            {".tpl", "jinja"},
            {"Justfile", "make"}
        };
        Fcc::LanguageClassifier classifier(overrides);

        assert(classifier.classify("api.h") == "cpp" && "Override keys are lowercased");
        assert(classifier.classify("page.tpl") == "jinja");
        assert(classifier.classify("Justfile") == "make");
        assert(classifier.classify("main.py") == "python" && "Built-ins remain");

        std::cout << "✓ Overrides test passed" << std::endl;
    }

    void testLowercaseExtension() {
        std::cout << "Testing extension extraction..." << std::endl;

        assert(Fcc::LanguageClassifier::lowercaseExtension("a/b/File.JSON") == ".json");
        assert(Fcc::LanguageClassifier::lowercaseExtension(".bashrc").empty());
        assert(Fcc::LanguageClassifier::lowercaseExtension("dir.d/file").empty());

        std::cout << "✓ Extension extraction test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running LanguageClassifier unit tests..." << std::endl;

        testExtensions();
        testSpecialFilenames();
        testOverrides();
        testLowercaseExtension();

        std::cout << "All LanguageClassifier tests passed!" << std::endl;
    }
};

class NotebookNormalizerTest {
private:
    Fcc::NotebookNormalizer normalizer;

    bool throwsMalformed(const std::string& text) {
        try {
            normalizer.normalize(text);
        } catch (const Fcc::MalformedNotebook&) {
            return true;
        }
        return false;
    }

public:
    void testCellFlattening() {
        std::cout << "Testing cell flattening..." << std::endl;

        const std::string notebook = R"({
            "metadata": {"kernelspec": {"language": "python", "name": "python3"}},
            "cells": [
                {"cell_type": "markdown", "source": ["# Title\n", "Intro text"]},
                {"cell_type": "code", "source": "print('hi')\n"},
                {"cell_type": "code", "source": []},
                {"cell_type": "raw", "source": "  raw text  "}
            ]
        })";

        auto blocks = normalizer.normalize(notebook);

        assert(blocks.size() == 3 && "Empty cells are dropped");
        assert(blocks[0].language == "markdown");
        assert(blocks[0].content == "# Title\nIntro text");
        assert(blocks[1].language == "python");
        assert(blocks[1].content == "print('hi')");
        assert(blocks[2].language == "python" && "Raw cells take the kernel language");
        assert(blocks[2].content == "raw text");

        std::cout << "✓ Cell flattening test passed" << std::endl;
    }

    void testKernelFallbacks() {
        std::cout << "Testing kernel language fallbacks..." << std::endl;

        auto from_info = normalizer.normalize(
            R"({"metadata": {"language_info": {"name": "R"}}, "cells": [{"cell_type": "code", "source": "x <- 1"}]})");
        assert(from_info.size() == 1);
        assert(from_info[0].language == "r");

        auto no_metadata = normalizer.normalize(R"({"cells": [{"cell_type": "code", "source": "1 + 1"}]})");
        assert(no_metadata.size() == 1);
        assert(no_metadata[0].language == Fcc::NotebookNormalizer::GENERIC_LANGUAGE);

        assert(Fcc::NotebookNormalizer::kernelTag("Python3") == "python");
        assert(Fcc::NotebookNormalizer::kernelTag("C++17") == "cpp");
        assert(Fcc::NotebookNormalizer::kernelTag("cobol") == "text");
        assert(Fcc::NotebookNormalizer::kernelTag("") == "text");

        std::cout << "✓ Kernel fallbacks test passed" << std::endl;
    }

    void testEmptyNotebook() {
        std::cout << "Testing notebook without content..." << std::endl;

        auto blocks = normalizer.normalize(R"({"cells": []})");
        assert(blocks.empty());

        std::cout << "✓ Empty notebook test passed" << std::endl;
    }

    void testMalformed() {
        std::cout << "Testing malformed notebooks..." << std::endl;

        assert(throwsMalformed("{not json"));
        assert(throwsMalformed("[1, 2, 3]"));
        assert(throwsMalformed(R"({"metadata": {}})") && "Missing cells list");
        assert(throwsMalformed(R"({"cells": "nope"})"));
        assert(throwsMalformed(R"({"cells": [42]})"));
        assert(throwsMalformed(R"({"cells": [{"source": 7}]})"));
        assert(throwsMalformed(R"({"cells": [{"cell_type": 3, "source": "x"}]})"));

        std::cout << "✓ Malformed notebooks test passed" << std::endl;
    }

    void testNotebookPath() {
        std::cout << "Testing notebook path detection..." << std::endl;

        assert(Fcc::NotebookNormalizer::isNotebookPath("analysis/Explore.IPYNB"));
        assert(!Fcc::NotebookNormalizer::isNotebookPath("notebook.json"));

        std::cout << "✓ Notebook path test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running NotebookNormalizer unit tests..." << std::endl;

        testCellFlattening();
        testKernelFallbacks();
        testEmptyNotebook();
        testMalformed();
        testNotebookPath();

        std::cout << "All NotebookNormalizer tests passed!" << std::endl;
    }
};

int main() {
    try {
        LanguageClassifierTest classifier_tests;
        classifier_tests.runAllTests();

        std::cout << std::endl;

        NotebookNormalizerTest notebook_tests;
        notebook_tests.runAllTests();

        std::cout << "\n🎉 All LanguageClassifier component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
