// =================================================================
// tests/FormatterTest.cpp
// =================================================================
// Unit tests for the markdown and plain-text formatters.

#include "Fcc/Formatter.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class FormatterTest {
private:
    static Fcc::FileRecord textRecord(const std::string& path, const std::string& language,
                                      const std::string& content) {
        Fcc::FileRecord record;
        record.path = path;
        record.language = language;
        record.status = content.empty() ? Fcc::FileStatus::EMPTY : Fcc::FileStatus::OK;
        record.blocks.emplace_back(language, content);
        record.size = content.size();
        return record;
    }

    static Fcc::FileRecord skippedRecord(const std::string& path, Fcc::FileStatus status,
                                         const std::string& reason) {
        Fcc::FileRecord record;
        record.path = path;
        record.status = status;
        record.reason = reason;
        return record;
    }

    static Fcc::FormatOptions plainOptions() {
        Fcc::FormatOptions options;
        options.project_name = "demo";
        options.include_metadata = false;
        return options;
    }

public:
    void testMarkdownLayout() {
        std::cout << "Testing markdown layout..." << std::endl;

        Fcc::Document document;
        document.label = ".";
        document.records.push_back(textRecord("a.py", "python", "print(1)\n"));
        document.records.push_back(skippedRecord("b.bin", Fcc::FileStatus::BINARY, "binary content"));

        Fcc::MarkdownFormatter formatter;
        std::string text = formatter.render(document, "demo", plainOptions());

        const std::string expected =
            "# demo\n\n"
            "## Files Processed: 1\n\n"
            "**`a.py`**\n\n"
            "```python\nprint(1)\n```"
            "\n\n---\n\n"
            "**`b.bin`**\n\n"
            "> Skipped: binary content\n";
        assert(text == expected);

        std::cout << "✓ Markdown layout test passed" << std::endl;
    }

    void testMarkdownEdgeContent() {
        std::cout << "Testing markdown edge content..." << std::endl;

        Fcc::MarkdownFormatter formatter;

        Fcc::Document empty_doc;
        empty_doc.records.push_back(textRecord("empty.txt", "", ""));
        std::string empty_text = formatter.render(empty_doc, "demo", plainOptions());
        assert(empty_text.find("**`empty.txt`**\n\n```\n```") != std::string::npos);
        assert(empty_text.find("Skipped") == std::string::npos && "Empty files are blocks, not notices");

        Fcc::Document fenced_doc;
        fenced_doc.records.push_back(textRecord("README.md", "markdown", "```bash\nls\n```"));
        std::string fenced_text = formatter.render(fenced_doc, "demo", plainOptions());
        assert(fenced_text.find("````markdown\n```bash\nls\n```\n````") != std::string::npos);

        Fcc::Document ticked_doc;
        ticked_doc.records.push_back(textRecord("odd`name.txt", "", "x\n"));
        ticked_doc.records.push_back(skippedRecord("`edge`.bin", Fcc::FileStatus::BINARY, "binary content"));
        std::string ticked_text = formatter.render(ticked_doc, "demo", plainOptions());
        assert(ticked_text.find("**``odd`name.txt``**\n\n") != std::string::npos &&
               "Label span outruns backticks in the path");
        assert(ticked_text.find("**`` `edge`.bin ``**\n\n> Skipped") != std::string::npos);

        Fcc::Document untitled;
        std::string untitled_text = formatter.render(untitled, "", plainOptions());
        assert(untitled_text == "# Project\n\n## Files Processed: 0\n");

        std::cout << "✓ Markdown edge content test passed" << std::endl;
    }

    void testMarkdownMetadata() {
        std::cout << "Testing markdown metadata..." << std::endl;

        Fcc::Document document;
        document.records.push_back(textRecord("a.py", "python", "x = 1\ny = 2\n"));
        document.records.push_back(textRecord("b.py", "python", "z = 3"));
        document.records.push_back(textRecord("notes", "", "hello\n"));
        document.records.push_back(skippedRecord("c.log", Fcc::FileStatus::IGNORED, "matched ignore rules"));

        Fcc::FormatOptions options = plainOptions();
        options.include_metadata = true;
        options.project_description = "A sample project";

        Fcc::MarkdownFormatter formatter;
        std::string text = formatter.render(document, "demo", options);

        assert(text.find("# demo\n\nA sample project\n\n## Project Information\n") == 0);
        assert(text.find("- **Total Files:** 3\n") != std::string::npos);
        assert(text.find("- **Total Lines:** 4\n") != std::string::npos);
        assert(text.find("- **Skipped Files:** 1") != std::string::npos);
        assert(text.find("  - python: 2 files") != std::string::npos);
        assert(text.find("  - unknown: 1 file") != std::string::npos);
        assert(text.find("## Files Processed: 3") != std::string::npos);

        std::cout << "✓ Markdown metadata test passed" << std::endl;
    }

    void testTxtLayout() {
        std::cout << "Testing plain-text layout..." << std::endl;

        Fcc::Document document;
        document.records.push_back(textRecord("a.py", "python", "print(1)\n"));
        document.records.push_back(skippedRecord("big.dat", Fcc::FileStatus::UNREADABLE, "read timed out"));

        Fcc::TxtFormatter formatter;
        std::string text = formatter.render(document, "demo", plainOptions());

        const std::string rule(50, '=');
        const std::string expected =
            "PROJECT: DEMO\n"
            "FILES: 1\n"
            "SIZE: 9.0 B\n"
            "LINES: 1\n"
            "\n"
            "a.py (python, 9 bytes)\n" + rule + "\n"
            "print(1)\n" + rule + "\n"
            "\n"
            "big.dat (skipped: read timed out)\n" + rule + "\n";
        assert(text == expected);

        Fcc::Document notebook;
        Fcc::FileRecord cells;
        cells.path = "nb.ipynb";
        cells.language = "jupyter-notebook";
        cells.blocks.emplace_back("markdown", "# Notes");
        cells.blocks.emplace_back("python", "print(2)");
        cells.size = 100;
        notebook.records.push_back(cells);
        std::string nb_text = formatter.render(notebook, "demo", plainOptions());
        assert(nb_text.find("[markdown]\n# Notes\n\n[python]\nprint(2)\n") != std::string::npos);

        std::cout << "✓ Plain-text layout test passed" << std::endl;
    }

    void testOutputModes() {
        std::cout << "Testing combined and per-selection modes..." << std::endl;

        std::vector<Fcc::Document> documents(3);
        documents[0].label = "src";
        documents[0].records.push_back(textRecord("src/a.py", "python", "a\n"));
        documents[1].label = "src/";
        documents[1].records.push_back(textRecord("src/b.py", "python", "b\n"));
        documents[2].label = "*.md";
        documents[2].records.push_back(textRecord("README.md", "markdown", "# r\n"));

        Fcc::MarkdownFormatter formatter;

        auto combined = formatter.format(documents, Fcc::OutputMode::COMBINED, plainOptions());
        assert(combined.size() == 1);
        assert(combined[0].name == "combined.md");
        assert(combined[0].text.find("# demo\n") == 0);
        assert(combined[0].text.find("## Files Processed: 3") != std::string::npos);
        assert(combined[0].text.find("src/a.py") < combined[0].text.find("README.md"));

        auto separate = formatter.format(documents, Fcc::OutputMode::PER_SELECTION, plainOptions());
        assert(separate.size() == 3);
        assert(separate[0].name == "src.md");
        assert(separate[1].name == "src_.md");
        assert(separate[2].name == "stardotmd.md");
        assert(separate[0].text.find("# src\n") == 0 && "Each output is titled with its label");

        std::vector<Fcc::Document> clashing(2);
        clashing[0].label = "a/b";
        clashing[1].label = "a_b";
        auto renamed = formatter.format(clashing, Fcc::OutputMode::PER_SELECTION, plainOptions());
        assert(renamed[0].name == "a_b.md");
        assert(renamed[1].name == "a_b-2.md");

        std::cout << "✓ Output modes test passed" << std::endl;
    }

    void testDeterminism() {
        std::cout << "Testing deterministic rendering..." << std::endl;

        Fcc::Document document;
        document.records.push_back(textRecord("a.py", "python", "print(1)\n"));

        Fcc::FormatOptions options = plainOptions();
        options.include_metadata = true;

        Fcc::MarkdownFormatter markdown;
        Fcc::TxtFormatter txt;
        assert(markdown.render(document, "demo", options) == markdown.render(document, "demo", options));
        assert(txt.render(document, "demo", options) == txt.render(document, "demo", options));

        std::cout << "✓ Determinism test passed" << std::endl;
    }

    void testHelpers() {
        std::cout << "Testing formatter helpers..." << std::endl;

        assert(Fcc::Formatter::sanitizeLabel("src/*.py") == "src_stardotpy");
        assert(Fcc::Formatter::sanitizeLabel(".") == "dot");
        assert(Fcc::Formatter::sanitizeLabel("") == "root");
        assert(Fcc::Formatter::sanitizeLabel("my dir") == "my_dir");

        assert(Fcc::Formatter::fenceFor("no ticks") == "```");
        assert(Fcc::Formatter::fenceFor("a ``` b") == "````");
        assert(Fcc::Formatter::fenceFor("`````") == "``````");

        assert(Fcc::Formatter::inlineCode("src/a.py") == "`src/a.py`");
        assert(Fcc::Formatter::inlineCode("a``b") == "```a``b```");
        assert(Fcc::Formatter::inlineCode("`x") == "`` `x ``");

        assert(Fcc::Formatter::addLineNumbers("a\nb\n") == "1: a\n2: b\n");
        assert(Fcc::Formatter::addLineNumbers("a\nb") == "1: a\n2: b");
        std::string ten_lines;
        for (int i = 0; i < 10; ++i) {
            ten_lines += "x\n";
        }
        assert(Fcc::Formatter::addLineNumbers(ten_lines).find(" 1: x\n") == 0);

        assert(Fcc::Formatter::formatSize(0) == "0.0 B");
        assert(Fcc::Formatter::formatSize(1536) == "1.5 KB");
        assert(Fcc::Formatter::formatSize(3 * 1024 * 1024) == "3.0 MB");

        assert(Fcc::Formatter::create("markdown") != nullptr);
        assert(Fcc::Formatter::create("md")->getName() == "markdown");
        assert(Fcc::Formatter::create("text")->getExtension() == ".txt");
        assert(Fcc::Formatter::create("html") == nullptr);
        assert(Fcc::Formatter::availableFormats().size() == 2);

        std::cout << "✓ Helpers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Formatter unit tests..." << std::endl;

        testMarkdownLayout();
        testMarkdownEdgeContent();
        testMarkdownMetadata();
        testTxtLayout();
        testOutputModes();
        testDeterminism();
        testHelpers();

        std::cout << "All Formatter tests passed!" << std::endl;
    }
};

int main() {
    try {
        FormatterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Formatter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
