// =================================================================
// tests/DependencyExtractorTest.cpp
// =================================================================
// Unit tests for DependencyExtractor component.

#include "Loom/DependencyExtractor.hpp"
#include "Loom/Logger.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <map>
#include <vector>
#include <string>

// In-memory file source so tests never touch the disk
class MemoryFileSource : public Loom::FileSource {
public:
    std::map<std::string, std::string> files;
    mutable int reads = 0;

    std::optional<std::uintmax_t> fileSize(const std::string& path) const override {
        auto it = files.find(path);
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second.size();
    }

    std::optional<std::string> readBytes(const std::string& path) const override {
        auto it = files.find(path);
        if (it == files.end()) {
            return std::nullopt;
        }
        reads++;
        return it->second;
    }
};

class DependencyExtractorTest {
private:
    static bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

public:
    void testPythonImports() {
        std::cout << "Testing Python dependency extraction..." << std::endl;

        MemoryFileSource source;
        source.files["src/main.py"] = "from src.utils import helper\nimport os\n";
        source.files["src/utils.py"] = "import json\n";

        Loom::DependencyExtractor extractor(source);
        auto dependencies = extractor.extractDependencies({
            Loom::ChangedFile("src/main.py"),
            Loom::ChangedFile("src/utils.py")
        });

        assert(dependencies.size() == 1 && "Only main.py imports another changed file");
        assert(dependencies.count("src/main.py") == 1 && "main.py should have an entry");
        assert(dependencies["src/main.py"].size() == 1 && dependencies["src/main.py"][0] == "src/utils.py"
               && "main.py should depend on utils.py");
        assert(dependencies.count("src/utils.py") == 0 && "Files without matches have no entry");

        std::cout << "✓ Python dependency extraction test passed" << std::endl;
    }

    void testJavaScriptImports() {
        std::cout << "Testing JavaScript dependency extraction..." << std::endl;

        MemoryFileSource source;
        source.files["src/app.js"] =
            "import { Button } from './components/Button';\n"
            "const api = require('./api/client');\n";
        source.files["src/components/Button.jsx"] = "export const Button = () => null;\n";
        source.files["src/api/client.ts"] = "export default {};\n";

        Loom::DependencyExtractor extractor(source);
        auto dependencies = extractor.extractDependencies({
            Loom::ChangedFile("src/app.js"),
            Loom::ChangedFile("src/components/Button.jsx"),
            Loom::ChangedFile("src/api/client.ts")
        });

        const auto& app_deps = dependencies["src/app.js"];
        assert(app_deps.size() == 2 && "Duplicate captures should be collapsed");
        assert(contains(app_deps, "src/components/Button.jsx") && "ES import should resolve");
        assert(contains(app_deps, "src/api/client.ts") && "require() should resolve");
        assert(std::is_sorted(app_deps.begin(), app_deps.end()) && "Dependencies should be sorted");

        std::cout << "✓ JavaScript dependency extraction test passed" << std::endl;
    }

    void testSkippedFiles() {
        std::cout << "Testing skipped and unreadable files..." << std::endl;

        MemoryFileSource source;
        source.files["src/big.py"] = "from src.utils import helper\n# padding to exceed the cap\n";
        source.files["src/utils.py"] = "";
        source.files["src/lib.rb"] = "require 'utils'\n";
        source.files["assets/logo.py"] = "from src.utils import x\n";

        Loom::DependencyExtractor extractor(source, 10);
        auto dependencies = extractor.extractDependencies({
            Loom::ChangedFile("src/big.py"),
            Loom::ChangedFile("src/utils.py"),
            Loom::ChangedFile("src/lib.rb"),
            Loom::ChangedFile("assets/logo.py", true),
            Loom::ChangedFile("src/missing.py")
        });

        assert(dependencies.empty() && "Oversized, unsupported, binary and missing files yield nothing");
        assert(source.reads == 1 && "Only files within the size cap should be read");

        std::cout << "✓ Skipped and unreadable files test passed" << std::endl;
    }

    void testMinifiedBundle() {
        std::cout << "Testing long single-line sources..." << std::endl;

        MemoryFileSource source;
        source.files["dist/app.js"] =
            "import a from 'b';" + std::string(150000, 'x') + "require('./c');import z from" + std::string(4000, ' ');
        source.files["src/b.js"] = "export default 1;\n";
        source.files["src/c.js"] = "export default 2;\n";

        Loom::DependencyExtractor extractor(source);
        auto dependencies = extractor.extractDependencies({
            Loom::ChangedFile("dist/app.js"),
            Loom::ChangedFile("src/b.js"),
            Loom::ChangedFile("src/c.js")
        });

        assert(dependencies["dist/app.js"] == (std::vector<std::string>{"src/b.js", "src/c.js"})
               && "Imports at both ends of a minified line should resolve");

        // Continuation across lines is still allowed inside the match span
        auto wrapped = extractor.extractImportsFromContent("import {\n  x\n} from\n  './wrapped';\n", "javascript");
        assert(contains(wrapped, "./wrapped") && "Imports spread over several lines should be captured");

        std::cout << "✓ Long single-line sources test passed" << std::endl;
    }

    void testContentCache() {
        std::cout << "Testing content cache..." << std::endl;

        MemoryFileSource source;
        source.files["a.py"] = "import b\n";
        source.files["b.py"] = "import a\n";

        Loom::DependencyExtractor extractor(source);
        std::vector<Loom::ChangedFile> files = {Loom::ChangedFile("a.py"), Loom::ChangedFile("b.py")};

        auto first = extractor.extractDependencies(files);
        assert(extractor.getCachedFileCount() == 2 && "Both files should be cached");
        assert(first["a.py"] == std::vector<std::string>{"b.py"} && "a imports b");
        assert(first["b.py"] == std::vector<std::string>{"a.py"} && "b imports a");

        // Cache is dropped between calls so edits are picked up
        source.files["a.py"] = "x = 1\n";
        auto second = extractor.extractDependencies(files);
        assert(second.count("a.py") == 0 && "Updated content should be re-read");
        assert(source.reads == 4 && "Each call should re-read each file once");

        std::cout << "✓ Content cache test passed" << std::endl;
    }

    void testImportTables() {
        std::cout << "Testing per-language import tables..." << std::endl;

        MemoryFileSource source;
        Loom::DependencyExtractor extractor(source);

        auto java = extractor.extractImportsFromContent("import com.acme.billing.Invoice;\n", "java");
        assert(java.size() == 1 && java[0] == "com.acme.billing.Invoice" && "Java import should be captured");

        auto go = extractor.extractImportsFromContent("import \"github.com/acme/log\"\n", "go");
        assert(go.size() == 1 && go[0] == "github.com/acme/log" && "Single Go import should be captured");

        // The grouped form has no capture group and yields the whole block
        auto go_block = extractor.extractImportsFromContent("import (\n\t\"fmt\"\n)\n", "go");
        assert(go_block.size() == 1 && go_block[0].find("\"fmt\"") != std::string::npos
               && "Grouped Go import should be captured whole");

        auto relative = extractor.extractImportsFromContent("from ..models import User\n", "python");
        assert(contains(relative, "models") && "Relative Python import should be captured");

        assert(extractor.extractImportsFromContent("import x", "cobol").empty() && "Unknown languages yield nothing");

        std::cout << "✓ Per-language import tables test passed" << std::endl;
    }

    void testHelpers() {
        std::cout << "Testing extractor helpers..." << std::endl;

        using Loom::DependencyExtractor;

        assert(DependencyExtractor::getLanguageFromExtension(".py") == "python" && ".py is python");
        assert(DependencyExtractor::getLanguageFromExtension(".tsx") == "typescript" && ".tsx is typescript");
        assert(DependencyExtractor::getLanguageFromExtension(".jsx") == "javascript" && ".jsx is javascript");
        assert(DependencyExtractor::getLanguageFromExtension(".rs").empty() && ".rs is unsupported");

        assert(DependencyExtractor::normalizeImportPath("  './foo/bar'  ") == "foo/bar" && "Quotes and ./ stripped");
        assert(DependencyExtractor::normalizeImportPath("../shared") == "shared" && "Leading ../ stripped");
        assert(DependencyExtractor::normalizeImportPath("...").empty() && "Only dots normalises to empty");
        assert(DependencyExtractor::normalizeImportPath("   ").empty() && "Whitespace normalises to empty");

        assert(DependencyExtractor::importMatchesFile("src.utils", "src/utils.py") && "Dotted module matches path");
        assert(DependencyExtractor::importMatchesFile("billing.Invoice", "lib/Invoice.java") && "Last part matches stem");
        assert(!DependencyExtractor::importMatchesFile("os", "src/utils.py") && "Unrelated import does not match");

        std::cout << "✓ Extractor helpers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DependencyExtractor Tests..." << std::endl;
        std::cout << "====================================" << std::endl;

        testPythonImports();
        std::cout << std::endl;

        testJavaScriptImports();
        std::cout << std::endl;

        testSkippedFiles();
        std::cout << std::endl;

        testMinifiedBundle();
        std::cout << std::endl;

        testContentCache();
        std::cout << std::endl;

        testImportTables();
        std::cout << std::endl;

        testHelpers();
        std::cout << std::endl;

        std::cout << "All DependencyExtractor tests passed!" << std::endl;
    }
};

int main() {
    try {
        Loom::Logger::getInstance().setConsoleLogging(false);
        Loom::Logger::getInstance().setFileLogging(false);

        DependencyExtractorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All DependencyExtractor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
