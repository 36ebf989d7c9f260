// =================================================================
// tests/PathFilterTest.cpp
// =================================================================
// Unit tests for gitignore-style filtering of staged paths.

#include "Loom/PathFilter.hpp"
#include "Loom/Logger.hpp"
#include "Loom/LoomConfig.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <vector>
#include <string>

class PathFilterTest {
private:
    static Loom::IgnoreRule rule(const std::string& pattern) {
        auto parsed = Loom::IgnoreRule::parse(pattern);
        assert(parsed.has_value() && "Test pattern should compile");
        return *parsed;
    }

public:
    void testBasicGlobs() {
        std::cout << "Testing basic glob patterns..." << std::endl;

        auto log = rule("*.log");
        assert(log.matches("debug.log") && "Extension glob matches at the root");
        assert(log.matches("logs/app.log") && "Unanchored rules match at any depth");
        assert(!log.matches("app.log.txt") && "Glob must cover the whole name");

        auto single = rule("file?.txt");
        assert(single.matches("file1.txt") && "? matches one character");
        assert(!single.matches("file10.txt") && "? does not match two characters");

        auto bracket = rule("[!a]*.c");
        assert(bracket.matches("src/b.c") && "Negated class accepts other characters");
        assert(!bracket.matches("a.c") && "Negated class rejects listed characters");

        auto crlf = rule("*.tmp\r");
        assert(crlf.pattern == "*.tmp" && "Line ending is dropped");
        assert(crlf.matches("cache/a.tmp") && "CRLF lines still match");

        auto escaped = rule("\\*.txt");
        assert(escaped.matches("*.txt") && "Escaped star is literal");
        assert(!escaped.matches("notes.txt") && "Escaped star is not a wildcard");

        std::cout << "✓ Basic glob patterns test passed" << std::endl;
    }

    void testAnchorsAndDirectories() {
        std::cout << "Testing anchored and directory rules..." << std::endl;

        auto anchored = rule("/config.yml");
        assert(anchored.anchored && "Leading slash anchors");
        assert(anchored.matches("config.yml") && "Anchored rule matches at the root");
        assert(!anchored.matches("sub/config.yml") && "Anchored rule does not match deeper");

        auto build = rule("build/");
        assert(build.directory_only && "Trailing slash marks a directory rule");
        assert(build.matches("build/out.o") && "Files inside the directory match");
        assert(build.matches("src/build/gen/x.cpp") && "Nested directories match");
        assert(build.matches("build", true) && "The directory itself matches");
        assert(!build.matches("build") && "A file named like the directory does not match");
        assert(!build.matches("builder/x.o") && "Prefix names do not match");

        auto deep = rule("**/generated/*.ts");
        assert(deep.matches("generated/api.ts") && "** matches zero directories");
        assert(deep.matches("web/src/generated/api.ts") && "** matches several directories");

        auto tree = rule("doc/**");
        assert(tree.matches("doc/a/b.md") && "Trailing ** matches everything below");

        std::cout << "✓ Anchored and directory rules test passed" << std::endl;
    }

    void testSkippedLines() {
        std::cout << "Testing comments and blank lines..." << std::endl;

        assert(!Loom::IgnoreRule::parse("# comment") && "Comments are skipped");
        assert(!Loom::IgnoreRule::parse("   ") && "Blank lines are skipped");
        assert(!Loom::IgnoreRule::parse("!") && "A bare negation is skipped");

        Loom::PathFilter filter({"", "# nothing", "*.bak"});
        assert(filter.size() == 1 && "Only real rules are kept");
        assert(!filter.addPattern("# later") && "addPattern reports skipped lines");

        std::cout << "✓ Comments and blank lines test passed" << std::endl;
    }

    void testRulePrecedence() {
        std::cout << "Testing rule precedence..." << std::endl;

        Loom::PathFilter filter({"*.md", "!README.md"});
        assert(filter.isIgnored("docs/guide.md") && "Positive rule applies");
        assert(!filter.isIgnored("README.md") && "Later negation re-includes");
        assert(!filter.isIgnored("docs/README.md") && "Negation applies at any depth");

        const Loom::IgnoreRule* deciding = filter.findDecidingRule("README.md");
        assert(deciding != nullptr && deciding->negated && deciding->pattern == "!README.md"
               && "Deciding rule is the last match");
        assert(filter.findDecidingRule("src/app.py") == nullptr && "Unmatched paths have no rule");

        filter.addPattern("docs/README.md");
        assert(filter.isIgnored("docs/README.md") && "Last matching rule wins");

        assert(filter.isIgnored("docs\\notes.md") && "Backslashes are normalised");
        assert(filter.isIgnored("./docs/notes.md") && "Leading ./ is dropped");

        filter.clear();
        assert(!filter.isIgnored("docs/guide.md") && "Cleared filter ignores nothing");

        std::cout << "✓ Rule precedence test passed" << std::endl;
    }

    void testIgnoreFile() {
        std::cout << "Testing ignore file loading..." << std::endl;

        auto path = std::filesystem::temp_directory_path() / "loom_path_filter_test.ignore";
        {
            std::ofstream out(path);
            out << "# generated sources\r\n*.pb.go\r\n\r\nfixtures/\n";
        }

        Loom::PathFilter filter;
        assert(filter.loadFromFile(path.string()) == 2 && "Two rules in the file");
        assert(filter.isIgnored("api/service.pb.go") && "Glob rule loaded");
        assert(filter.isIgnored("tests/fixtures/data.json") && "Directory rule loaded");
        assert(filter.loadFromFile("/nonexistent/.loomignore") == 0 && "Missing file adds nothing");

        std::filesystem::remove(path);

        std::cout << "✓ Ignore file loading test passed" << std::endl;
    }

    void testDefaultPatterns() {
        std::cout << "Testing default ignore patterns..." << std::endl;

        Loom::PathFilter defaults(Loom::LoomConfig::getDefaultIgnorePatterns());

        assert(defaults.isIgnored("package-lock.json") && "npm lock file ignored");
        assert(defaults.isIgnored("web/yarn.lock") && "Nested lock file ignored");
        assert(defaults.isIgnored(".env") && ".env ignored");
        assert(defaults.isIgnored(".env.local") && ".env variants ignored");
        assert(defaults.isIgnored("web/node_modules/pkg/index.js") && "node_modules ignored");
        assert(defaults.isIgnored("dist/app.js") && "dist ignored");
        assert(defaults.isIgnored("static/app.min.js") && "Minified files ignored");
        assert(defaults.isIgnored("pkg/__pycache__/mod.cpython-312.pyc") && "Bytecode ignored");

        assert(!defaults.isIgnored("src/environment.py") && "Names containing env are kept");
        assert(!defaults.isIgnored("src/dist.py") && "Names containing dist are kept");
        assert(!defaults.isIgnored("package.json") && "Manifests are kept");
        assert(!defaults.isIgnored(".envrc") && ".envrc is not .env");

        std::cout << "✓ Default ignore patterns test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PathFilter Tests..." << std::endl;
        std::cout << "===========================" << std::endl;

        testBasicGlobs();
        std::cout << std::endl;

        testAnchorsAndDirectories();
        std::cout << std::endl;

        testSkippedLines();
        std::cout << std::endl;

        testRulePrecedence();
        std::cout << std::endl;

        testIgnoreFile();
        std::cout << std::endl;

        testDefaultPatterns();
        std::cout << std::endl;

        std::cout << "All PathFilter tests passed!" << std::endl;
    }
};

int main() {
    try {
        Loom::Logger::getInstance().setConsoleLogging(false);
        Loom::Logger::getInstance().setFileLogging(false);

        PathFilterTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PathFilter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
