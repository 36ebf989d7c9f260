// =================================================================
// tests/TestRunner.cpp
// =================================================================
// Main test runner for all unit tests.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>
#include <cstdlib>

namespace {

// Suite executables live next to the runner
std::string g_test_dir = ".";

int runSuiteExecutable(const std::string& executable) {
    std::string command = "\"" + g_test_dir + "/" + executable + "\"";
    return std::system(command.c_str());
}

int runChangeClassifierTests() { return runSuiteExecutable("ChangeClassifierTest"); }
int runRelationshipDetectorTests() { return runSuiteExecutable("RelationshipDetectorTest"); }
int runDependencyExtractorTests() { return runSuiteExecutable("DependencyExtractorTest"); }
int runSmartGrouperTests() { return runSuiteExecutable("SmartGrouperTest"); }
int runPathFilterTests() { return runSuiteExecutable("PathFilterTest"); }
int runGitOperationsTests() { return runSuiteExecutable("GitOperationsTest"); }
int runCommitAnalyzerTests() { return runSuiteExecutable("CommitAnalyzerTest"); }
int runAiServiceTests() { return runSuiteExecutable("AiServiceTest"); }
int runLoomConfigTests() { return runSuiteExecutable("LoomConfigTest"); }
int runCommitOrchestratorTests() { return runSuiteExecutable("CommitOrchestratorTest"); }

} // namespace

struct TestSuite {
    std::string name;
    std::function<int()> test_function;
};

class TestRunner {
private:
    std::vector<TestSuite> test_suites;
    
public:
    TestRunner() {
        // Register all test suites
        test_suites = {
            {"ChangeClassifier", runChangeClassifierTests},
            {"RelationshipDetector", runRelationshipDetectorTests},
            {"DependencyExtractor", runDependencyExtractorTests},
            {"SmartGrouper", runSmartGrouperTests},
            {"PathFilter", runPathFilterTests},
            {"GitOperations", runGitOperationsTests},
            {"CommitAnalyzer", runCommitAnalyzerTests},
            {"AiService", runAiServiceTests},
            {"LoomConfig", runLoomConfigTests},
            {"CommitOrchestrator", runCommitOrchestratorTests}
        };
    }
    
    int runAllTests() {
        std::cout << "🚀 Starting Loom Unit Test Suite" << std::endl;
        std::cout << "=================================" << std::endl << std::endl;
        
        auto start_time = std::chrono::steady_clock::now();
        
        int total_tests = test_suites.size();
        int passed_tests = 0;
        int failed_tests = 0;
        
        for (const auto& suite : test_suites) {
            std::cout << "Running " << suite.name << " tests..." << std::endl;
            std::cout << std::string(40, '-') << std::endl;
            
            auto suite_start = std::chrono::steady_clock::now();
            
            try {
                int result = suite.test_function();
                auto suite_end = std::chrono::steady_clock::now();
                auto suite_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    suite_end - suite_start);
                
                if (result == 0) {
                    std::cout << "✅ " << suite.name << " tests PASSED";
                    std::cout << " (took " << suite_duration.count() << "ms)" << std::endl;
                    passed_tests++;
                } else {
                    std::cout << "❌ " << suite.name << " tests FAILED";
                    std::cout << " (exit code: " << result << ")" << std::endl;
                    failed_tests++;
                }
            } catch (const std::exception& e) {
                auto suite_end = std::chrono::steady_clock::now();
                auto suite_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    suite_end - suite_start);
                
                std::cout << "❌ " << suite.name << " tests FAILED with exception: " 
                          << e.what() << std::endl;
                std::cout << " (took " << suite_duration.count() << "ms)" << std::endl;
                failed_tests++;
            }
            
            std::cout << std::endl;
        }
        
        auto end_time = std::chrono::steady_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        
        // Print summary
        std::cout << "Test Summary" << std::endl;
        std::cout << "============" << std::endl;
        std::cout << "Total test suites: " << total_tests << std::endl;
        std::cout << "Passed: " << passed_tests << std::endl;
        std::cout << "Failed: " << failed_tests << std::endl;
        std::cout << "Total time: " << total_duration.count() << "ms" << std::endl;
        
        if (failed_tests == 0) {
            std::cout << std::endl << "🎉 All tests passed!" << std::endl;
            return 0;
        } else {
            std::cout << std::endl << "💥 " << failed_tests << " test suite(s) failed!" << std::endl;
            return 1;
        }
    }
    
    int runSpecificTest(const std::string& test_name) {
        for (const auto& suite : test_suites) {
            if (suite.name == test_name) {
                std::cout << "Running " << test_name << " tests only..." << std::endl;
                return suite.test_function();
            }
        }
        
        std::cerr << "Test suite '" << test_name << "' not found!" << std::endl;
        std::cerr << "Available test suites:" << std::endl;
        for (const auto& suite : test_suites) {
            std::cerr << "  - " << suite.name << std::endl;
        }
        return 1;
    }
    
    void listTests() {
        std::cout << "Available test suites:" << std::endl;
        for (const auto& suite : test_suites) {
            std::cout << "  - " << suite.name << std::endl;
        }
    }
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --help, -h          Show this help message" << std::endl;
    std::cout << "  --list, -l          List available test suites" << std::endl;
    std::cout << "  --test <name>       Run specific test suite" << std::endl;
    std::cout << "  (no arguments)      Run all test suites" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << "                    # Run all tests" << std::endl;
    std::cout << "  " << program_name << " --test SmartGrouper     # Run only SmartGrouper tests" << std::endl;
    std::cout << "  " << program_name << " --list                  # List available test suites" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string self = argv[0];
    size_t slash = self.find_last_of('/');
    if (slash != std::string::npos) {
        g_test_dir = self.substr(0, slash);
    }

    TestRunner runner;
    
    if (argc == 1) {
        // No arguments - run all tests
        return runner.runAllTests();
    }
    
    std::string arg1 = argv[1];
    
    if (arg1 == "--help" || arg1 == "-h") {
        printUsage(argv[0]);
        return 0;
    }
    
    if (arg1 == "--list" || arg1 == "-l") {
        runner.listTests();
        return 0;
    }
    
    if (arg1 == "--test" && argc == 3) {
        return runner.runSpecificTest(argv[2]);
    }
    
    std::cerr << "Invalid arguments!" << std::endl;
    printUsage(argv[0]);
    return 1;
}