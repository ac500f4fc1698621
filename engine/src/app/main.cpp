#include "io/ScenarioReader.h"
#include "io/ScenarioRunner.h"
#include "utils/Logging.h"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <scenario.yaml> [options]\n"
              << "  --csv <path>         write the emission table as CSV\n"
              << "  --log-level <level>  trace|debug|info|warn|error|off\n"
              << "  --log-file <path>    log to file instead of stderr\n"
              << "  --quiet              do not print the text report\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string scenarioPath;
    std::string csvPath;
    std::string logLevel;
    std::string logFile;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& opt) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << opt << "\n";
                printUsage(argv[0]);
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--csv") {
            csvPath = needValue(arg);
        } else if (arg == "--log-level") {
            logLevel = needValue(arg);
        } else if (arg == "--log-file") {
            logFile = needValue(arg);
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else if (scenarioPath.empty()) {
            scenarioPath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (scenarioPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }
    if (!logLevel.empty() && !landgem::isLogLevel(logLevel)) {
        std::cerr << "Unknown log level: " << logLevel << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        landgem::initLogging(logLevel.empty() ? "warn" : logLevel);
        landgem::Scenario scenario = landgem::ScenarioReader::readFromFile(scenarioPath);

        // command line wins over the scenario file
        if (!logLevel.empty()) scenario.output.logLevel = logLevel;
        if (!csvPath.empty()) scenario.output.csvPath = csvPath;
        if (logFile.empty()) {
            landgem::initLogging(scenario.output.logLevel);
        } else {
            landgem::initLogging(scenario.output.logLevel, logFile);
        }

        landgem::RunResult result = landgem::runScenario(scenario);
        if (!quiet) {
            std::cout << result.report;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }
    return 0;
}
