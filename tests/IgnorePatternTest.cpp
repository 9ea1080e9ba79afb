// =================================================================
// tests/IgnorePatternTest.cpp
// =================================================================
// Unit tests for gitignore-style pattern matching.

#include "Fcc/IgnorePattern.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing basic pattern matching..." << std::endl;

        Fcc::IgnorePattern pattern("*.log");

        assert(pattern.matches("debug.log") && "Should match simple wildcard");
        assert(pattern.matches("logs/debug.log") && "Unanchored pattern matches at any depth");
        assert(!pattern.matches("debug.txt") && "Should not match other extensions");
        assert(!pattern.matches("debug.log.txt") && "Should not match partial names");

        Fcc::IgnorePattern question("file?.txt");
        assert(question.matches("file1.txt"));
        assert(!question.matches("file10.txt"));

        Fcc::IgnorePattern char_class("data[0-9].csv");
        assert(char_class.matches("data3.csv"));
        assert(!char_class.matches("datax.csv"));

        Fcc::IgnorePattern negated_class("v[!a].txt");
        assert(negated_class.matches("vb.txt"));
        assert(!negated_class.matches("va.txt"));

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testAnchoring() {
        std::cout << "Testing anchored patterns..." << std::endl;

        Fcc::IgnorePattern leading("/build");
        assert(leading.isAnchored());
        assert(leading.matches("build", true));
        assert(!leading.matches("src/build", true) && "Leading slash anchors to the base");

        Fcc::IgnorePattern middle("docs/*.md");
        assert(middle.isAnchored() && "A slash in the middle anchors");
        assert(middle.matches("docs/README.md"));
        assert(!middle.matches("sub/docs/README.md"));
        assert(!middle.matches("docs/api/index.md") && "Single star never crosses a separator");

        Fcc::IgnorePattern unanchored("build");
        assert(!unanchored.isAnchored());
        assert(unanchored.matches("a/b/build", true));

        std::cout << "✓ Anchoring test passed" << std::endl;
    }

    void testDirectoryOnly() {
        std::cout << "Testing directory-only patterns..." << std::endl;

        Fcc::IgnorePattern pattern("node_modules/");

        assert(pattern.isDirectoryOnly());
        assert(pattern.matches("node_modules", true));
        assert(pattern.matches("web/node_modules", true));
        assert(!pattern.matches("node_modules", false) && "Files with the same name are not matched");

        std::cout << "✓ Directory-only test passed" << std::endl;
    }

    void testDoubleStar() {
        std::cout << "Testing recursive wildcards..." << std::endl;

        Fcc::IgnorePattern leading("**/temp");
        assert(leading.matches("temp"));
        assert(leading.matches("a/b/temp"));

        Fcc::IgnorePattern trailing("logs/**");
        assert(trailing.matches("logs/a.txt"));
        assert(trailing.matches("logs/deep/b.txt"));
        assert(!trailing.matches("other/logs/a.txt"));

        Fcc::IgnorePattern middle("a/**/b");
        assert(middle.matches("a/b"));
        assert(middle.matches("a/x/b"));
        assert(middle.matches("a/x/y/b"));
        assert(!middle.matches("a/x/c"));

        std::cout << "✓ Recursive wildcard test passed" << std::endl;
    }

    void testCommentsAndEscapes() {
        std::cout << "Testing comments and escapes..." << std::endl;

        assert(Fcc::IgnorePattern("# comment").isEmpty());
        assert(Fcc::IgnorePattern("   ").isEmpty());
        assert(Fcc::IgnorePattern("").isEmpty());

        Fcc::IgnorePattern hash("\\#notes");
        assert(!hash.isEmpty());
        assert(!hash.isNegation());
        assert(hash.matches("#notes"));

        Fcc::IgnorePattern bang("\\!important");
        assert(!bang.isNegation());
        assert(bang.matches("!important"));

        Fcc::IgnorePattern trailing_space("*.tmp   ");
        assert(trailing_space.matches("x.tmp") && "Trailing whitespace is not significant");

        std::cout << "✓ Comments and escapes test passed" << std::endl;
    }

    void testNegationOrdering() {
        std::cout << "Testing negation and rule order..." << std::endl;

        Fcc::IgnorePatternSet set;
        set.addPattern("*.log");
        set.addPattern("!keep.log");

        assert(set.shouldIgnore("debug.log"));
        assert(!set.shouldIgnore("keep.log") && "Later negation re-includes");

        Fcc::IgnorePatternSet reversed;
        reversed.addPattern("!keep.log");
        reversed.addPattern("*.log");
        assert(reversed.shouldIgnore("keep.log") && "Last matching rule wins");

        std::cout << "✓ Negation ordering test passed" << std::endl;
    }

    void testIgnoredAncestor() {
        std::cout << "Testing negation under an ignored directory..." << std::endl;

        Fcc::IgnorePatternSet set;
        set.addPattern("build/");
        set.addPattern("!build/keep.txt");

        assert(set.shouldIgnore("build", true));
        assert(set.shouldIgnore("build/keep.txt") && "Ancestor exclusion cannot be undone");
        assert(set.shouldIgnore("build/sub/file.c"));
        assert(!set.shouldIgnore("src/build.c"));

        std::cout << "✓ Ignored ancestor test passed" << std::endl;
    }

    void testNormalization() {
        std::cout << "Testing path normalization..." << std::endl;

        assert(Fcc::IgnorePatternSet::normalizePath("./a/b/") == "a/b");
        assert(Fcc::IgnorePatternSet::normalizePath("a\\b\\c") == "a/b/c");
        assert(Fcc::IgnorePatternSet::normalizePath(".").empty());

        Fcc::IgnorePatternSet set;
        set.addPattern("*");
        assert(!set.shouldIgnore(".") && "The base itself is never ignored");
        assert(!set.shouldIgnore(""));

        std::cout << "✓ Normalization test passed" << std::endl;
    }

    void testCompileOrder() {
        std::cout << "Testing compile order (defaults, .gitignore, excludes)..." << std::endl;

        fs::path dir = fs::temp_directory_path() / "fcc_ignore_compile_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
        {
            std::ofstream gitignore(dir / ".gitignore");
            gitignore << "# generated\n";
            gitignore << "*.log\r\n";
            gitignore << "!keep.pyc\n";
            gitignore << "\n";
        }

        auto set = Fcc::IgnorePatternSet::compile(dir, {"!debug.log", "secret.txt"}, {"*.pyc", ".git/"});

        assert(set.size() == 6);
        assert(set.shouldIgnore("a.pyc"));
        assert(!set.shouldIgnore("keep.pyc") && ".gitignore overrides defaults");
        assert(set.shouldIgnore("trace.log") && "CRLF line endings are tolerated");
        assert(!set.shouldIgnore("debug.log") && "Excludes override .gitignore");
        assert(set.shouldIgnore("secret.txt"));
        assert(set.shouldIgnore(".git/config"));

        auto without_gitignore = Fcc::IgnorePatternSet::compile(dir / "missing", {}, {});
        assert(without_gitignore.size() == 0);
        assert(!without_gitignore.shouldIgnore("anything.log"));

        fs::remove_all(dir);
        std::cout << "✓ Compile order test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testAnchoring();
        testDirectoryOnly();
        testDoubleStar();
        testCommentsAndEscapes();
        testNegationOrdering();
        testIgnoredAncestor();
        testNormalization();
        testCompileOrder();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

int main() {
    try {
        IgnorePatternTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All IgnorePattern component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
