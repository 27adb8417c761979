#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/AppServices.hpp"
#include "domain/TaskErrors.hpp"
#include "infrastructure/CallerIdentity.hpp"
#include "infrastructure/EventLogs.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TaskJson.hpp"

using namespace taskledger;

namespace {

void PrintUsage() {
    std::cerr << "Usage: taskledger [--as <caller>] [--data-dir <dir>] <command>\n"
              << "Commands:\n"
              << "  list                    List the caller's tasks\n"
              << "  create <name>           Create a task with status TODO\n"
              << "  status <name> <status>  Replace a task's status\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string caller;
    bool callerGiven = false;
    std::string dataDir;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--as" && i + 1 < argc) {
            caller = argv[++i];
            callerGiven = true;
        } else if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage();
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        PrintUsage();
        return 2;
    }

    if (dataDir.empty()) {
        dataDir = infrastructure::PathUtils::GetLedgerDir().string();
    }

    std::shared_ptr<domain::CallerIdentityResolver> resolver;
    // An explicit --as is used verbatim, even when empty
    if (!callerGiven) {
        resolver = std::make_shared<infrastructure::EnvCallerIdentity>();
    } else {
        resolver = std::make_shared<infrastructure::FixedCallerIdentity>(caller);
    }

    auto services = application::BuildAppServices(
        dataDir, resolver, std::make_shared<infrastructure::StderrEventLog>());

    const std::string& command = positional[0];
    int exitCode = 0;
    try {
        if (command == "list" && positional.size() == 1) {
            std::cout << infrastructure::TasksToJson(services.endpoint->getTasks()).dump(2) << std::endl;
        } else if (command == "create" && positional.size() == 2) {
            std::cout << infrastructure::TaskToJson(services.endpoint->insertTask(positional[1])).dump(2) << std::endl;
        } else if (command == "status" && positional.size() == 3) {
            auto task = services.endpoint->updateTask(positional[1], positional[2]);
            std::cout << infrastructure::TaskToJson(task).dump(2) << std::endl;
        } else {
            PrintUsage();
            exitCode = 2;
        }
    } catch (const domain::TaskLedgerError& e) {
        std::cerr << "[TaskLedger] Error: " << e.what() << std::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        std::cerr << "[TaskLedger] Unexpected error: " << e.what() << std::endl;
        exitCode = 1;
    }

    services.persistenceService->stop();
    if (services.persistenceService->failedWrites() > 0) {
        std::cerr << "[TaskLedger] " << services.persistenceService->failedWrites()
                  << " write(s) could not be saved to " << dataDir << std::endl;
        return 1;
    }
    return exitCode;
}
