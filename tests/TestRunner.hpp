#pragma once

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "ipc/IpcManager.h"
#include "service/SeatpoolNode.h"
#include "tests/TestConfig.hpp"
#include "tests/TestValidator.hpp"
#include "utils/TimeHelper.h"

namespace Test {

class TestRunner {
public:
    std::vector<TestResult> runAll(const std::vector<TestScenario> &scenarios) {
        std::cout << "seatpool test suite: " << scenarios.size() << " scenarios\n";
        std::vector<TestResult> results;
        results.reserve(scenarios.size());
        for (const TestScenario &scenario: scenarios) results.push_back(runTest(scenario));
        printSummary(results);
        return results;
    }

    TestResult runTest(const TestScenario &scenario) {
        std::cout << "\n>> " << scenario.name << ": " << scenario.description << std::endl;

        TestResult result;
        result.testName = scenario.name;
        const int64_t startMs = TimeHelper::monotonicMs();

        char dir[] = "/tmp/seatpool_test_XXXXXX";
        if (mkdtemp(dir) == nullptr) {
            result.addFailure("cannot create key directory");
            printTestResult(result);
            return result;
        }

        try {
            const IpcKeys keys = IpcKeys::fromPath(dir);
            IpcManager ipc(keys);
            ipc.initSemaphores();
            ipc.initState(getpid(), time(nullptr));

            auto client = std::make_unique<ScriptedMembershipClient>();
            ScriptedMembershipClient &scripted = *client;
            SeatpoolNode node(keys, Logger::Source::Other, std::move(client));

            TestEnv env{keys, ipc, node, scripted, result};
            scenario.run(env);

            result.zombieProcesses = TestValidator::checkForZombies();
            if (result.zombieProcesses > 0) {
                result.addFailure("ZOMBIES DETECTED: " + std::to_string(result.zombieProcesses) +
                                  " child process(es) not joined");
            }
        } catch (const std::exception &e) {
            result.addFailure(std::string("EXCEPTION: ") + e.what());
        }

        rmdir(dir);
        result.durationMs = TimeHelper::monotonicMs() - startMs;
        printTestResult(result);
        return result;
    }

private:
    static constexpr size_t MAX_NOTES_SHOWN = 5;

    static void printTestResult(const TestResult &result) {
        std::cout << (result.passed ? "   PASSED" : "   FAILED") << " after " << result.checks << " checks, "
                << result.durationMs << " ms";
        if (result.childProcesses > 0) std::cout << ", " << result.childProcesses << " children";
        std::cout << "\n";
        for (const std::string &failure: result.failures) std::cout << "   - " << failure << "\n";
        for (size_t i = 0; i < result.warnings.size() && i < MAX_NOTES_SHOWN; ++i) {
            std::cout << "   . " << result.warnings[i] << "\n";
        }
        if (result.warnings.size() > MAX_NOTES_SHOWN) {
            std::cout << "   . " << result.warnings.size() - MAX_NOTES_SHOWN << " more notes\n";
        }
    }

    static void printSummary(const std::vector<TestResult> &results) {
        size_t failed = 0;
        std::cout << "\n";
        for (const TestResult &r: results) {
            if (r.passed) continue;
            ++failed;
            std::cout << "FAILED: " << r.testName << "\n";
        }
        std::cout << results.size() - failed << " of " << results.size() << " scenarios passed\n";
    }
};

} // namespace Test
