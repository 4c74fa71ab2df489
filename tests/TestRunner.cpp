#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "core/Config.h"
#include "tests/TestConfig.hpp"
#include "tests/TestRunner.hpp"
#include "tests/scenarios/DispatchScenarios.hpp"
#include "tests/scenarios/ReconcileScenarios.hpp"
#include "tests/scenarios/SeatScenarios.hpp"
#include "tests/scenarios/ServiceScenarios.hpp"
#include "tests/scenarios/ThrottleScenarios.hpp"

namespace {
    struct ScenarioGroup {
        const char *name;
        std::vector<Test::TestScenario> (*make)();
    };

    constexpr ScenarioGroup GROUPS[] = {
        {"seats", Test::Scenarios::seatScenarios},
        {"throttle", Test::Scenarios::throttleScenarios},
        {"dispatch", Test::Scenarios::dispatchScenarios},
        {"reconcile", Test::Scenarios::reconcileScenarios},
        {"service", Test::Scenarios::serviceScenarios},
    };

    struct Selection {
        std::string group; ///< empty: every group
        int number{0}; ///< 1-based within the selected scenarios, 0: all of them
        std::string outputFile;
        bool list{false};
    };

    void printUsage(const char *program) {
        std::cout << "Usage: " << program << " [--group <name>] [--test <n>] [--list] [--output <file>]\n\n"
                << "  --group <name>  Only scenarios of one group:";
        for (const ScenarioGroup &g: GROUPS) std::cout << ' ' << g.name;
        std::cout << "\n  --test <n>      Only scenario n of the selection (see --list)\n"
                << "  --list          Print the selection and exit\n"
                << "  --output <file> Also write the results to file\n";
    }

    /** @return -1 to exit successfully, 1 on a usage error, 0 to run */
    int parseArgs(const int argc, char *argv[], Selection &sel) {
        for (int i = 1; i < argc; ++i) {
            const std::string opt = argv[i];
            if (opt == "--help" || opt == "-h") {
                printUsage(argv[0]);
                return -1;
            }
            if (opt == "--list") {
                sel.list = true;
                continue;
            }
            if (opt == "--all") continue;
            if (opt != "--group" && opt != "--test" && opt != "--output" && opt != "-o") {
                std::cerr << "Unknown option: " << opt << "\n";
                printUsage(argv[0]);
                return 1;
            }
            if (i + 1 >= argc) {
                std::cerr << opt << " needs a value\n";
                return 1;
            }
            const char *value = argv[++i];
            if (opt == "--group") sel.group = value;
            else if (opt == "--test") sel.number = atoi(value);
            else sel.outputFile = value;
        }
        return 0;
    }

    bool collect(const Selection &sel, std::vector<Test::TestScenario> &out) {
        bool known = sel.group.empty();
        for (const ScenarioGroup &g: GROUPS) {
            if (!sel.group.empty() && sel.group != g.name) continue;
            known = true;
            auto scenarios = g.make();
            out.insert(out.end(), scenarios.begin(), scenarios.end());
        }
        if (!known) std::cerr << "Unknown group: " << sel.group << "\n";
        return known;
    }

    void writeReport(std::ostream &out, const std::vector<Test::TestResult> &results) {
        char stamp[32];
        const time_t now = time(nullptr);
        tm local{};
        localtime_r(&now, &local);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
        out << "seatpool test results, " << stamp << "\n\n";

        size_t failed = 0;
        for (const Test::TestResult &r: results) {
            if (!r.passed) ++failed;
            out << (r.passed ? "[PASS] " : "[FAIL] ") << r.testName << "  (" << r.checks << " checks, "
                    << r.childProcesses << " children, " << r.zombieProcesses << " zombies, " << r.durationMs
                    << " ms)\n";
            for (const std::string &f: r.failures) out << "    failure: " << f << "\n";
            for (const std::string &w: r.warnings) out << "    note: " << w << "\n";
        }
        out << "\n" << results.size() - failed << "/" << results.size() << " passed\n";
    }
}

int main(int argc, char *argv[]) {
    Selection sel;
    if (const int rc = parseArgs(argc, argv, sel); rc != 0) return rc < 0 ? 0 : rc;

    std::vector<Test::TestScenario> scenarios;
    if (!collect(sel, scenarios)) return 1;

    if (sel.list) {
        for (size_t i = 0; i < scenarios.size(); ++i) {
            std::cout << i + 1 << ". " << scenarios[i].name << "\n   " << scenarios[i].description << "\n";
        }
        return 0;
    }
    if (sel.number < 0 || sel.number > static_cast<int>(scenarios.size())) {
        std::cerr << "--test must be between 1 and " << scenarios.size() << "\n";
        return 1;
    }

    Test::applyTestEnvironment();
    try {
        Config::loadEnvFile();
    } catch (const std::exception &e) {
        std::cerr << "Note: " << e.what() << ", using built-in defaults\n";
    }
    try {
        Config::validate();
    } catch (const std::exception &e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    Test::TestRunner runner;
    const std::vector<Test::TestResult> results = sel.number == 0
                                                      ? runner.runAll(scenarios)
                                                      : std::vector<Test::TestResult>{
                                                          runner.runTest(scenarios[sel.number - 1])
                                                      };

    if (!sel.outputFile.empty()) {
        std::ofstream file(sel.outputFile);
        if (file) {
            writeReport(file, results);
            std::cout << "Results saved to: " << sel.outputFile << "\n";
        } else {
            std::cerr << "Cannot write " << sel.outputFile << "\n";
        }
    }

    for (const Test::TestResult &r: results) {
        if (!r.passed) return 1;
    }
    return 0;
}
