#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/TaskEndpoint.hpp"
#include "domain/TaskErrors.hpp"
#include "infrastructure/CallerIdentity.hpp"
#include "infrastructure/EventLogs.hpp"
#include "infrastructure/OwnerIndexFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"

using namespace taskledger::domain;
using namespace taskledger::application;
using namespace taskledger::infrastructure;

// Sink that always fails
class BrokenEventLog : public EventLog {
public:
    void log(const std::string&) override {
        throw std::runtime_error("log backend offline");
    }
};

// Caller identity that can be switched between calls
class SwitchableCaller : public CallerIdentityResolver {
public:
    std::string caller = "alice";
    std::string currentCaller() const override { return caller; }
};

static std::shared_ptr<TaskService> makeService() {
    return std::make_shared<TaskService>(
        std::make_shared<RecordStoreFs>("", nullptr),
        std::make_shared<OwnerIndexFs>("", nullptr));
}

int main() {
    std::cout << "[Test] Starting TaskEndpoint Test..." << std::endl;

    // alice: insert then get
    {
        auto log = std::make_shared<MemoryEventLog>();
        TaskEndpoint endpoint(makeService(), std::make_shared<FixedCallerIdentity>("alice"), log);

        Task created = endpoint.insertTask("task_a");
        assert((created == Task{"alice.task_a", "task_a", "TODO"}));

        auto tasks = endpoint.getTasks();
        assert(tasks.size() == 1);
        assert((tasks[0] == Task{"alice.task_a", "task_a", "TODO"}));

        auto messages = log->messages();
        assert(messages.size() == 1);
        assert(messages[0] == "Insert new task task_a");
        std::cout << "[PASS] insert then get for alice." << std::endl;
    }

    // john: insert, update, get
    {
        auto log = std::make_shared<MemoryEventLog>();
        TaskEndpoint endpoint(makeService(), std::make_shared<FixedCallerIdentity>("john"), log);

        endpoint.insertTask("task_a");
        Task updated = endpoint.updateTask("task_a", "DONE");
        assert((updated == Task{"john.task_a", "task_a", "DONE"}));
        assert(endpoint.getTasks()[0].status == "DONE");

        auto messages = log->messages();
        assert(messages.size() == 2);
        assert(messages[1] == "Update task task_a to DONE");
        std::cout << "[PASS] insert, update then get for john." << std::endl;
    }

    // Tasks follow the resolved caller
    {
        auto caller = std::make_shared<SwitchableCaller>();
        TaskEndpoint endpoint(makeService(), caller, nullptr);

        endpoint.insertTask("task_a");
        caller->caller = "bob";
        assert(endpoint.getTasks().empty());
        endpoint.insertTask("task_b");
        assert(endpoint.getTasks().size() == 1);
        assert(endpoint.getTasks()[0].id == "bob.task_b");

        caller->caller = "alice";
        assert(endpoint.getTasks().size() == 1);
        assert(endpoint.getTasks()[0].id == "alice.task_a");
        std::cout << "[PASS] operations are scoped to the resolved caller." << std::endl;
    }

    // A failing log sink never aborts the operation
    {
        TaskEndpoint endpoint(makeService(), std::make_shared<FixedCallerIdentity>("alice"),
                              std::make_shared<BrokenEventLog>());
        endpoint.insertTask("task_a");
        endpoint.updateTask("task_a", "DONE");
        assert(endpoint.getTasks().size() == 1);
        assert(endpoint.getTasks()[0].status == "DONE");
        std::cout << "[PASS] broken event log is tolerated." << std::endl;
    }

    // Domain errors still propagate, after the log line is written
    {
        auto log = std::make_shared<MemoryEventLog>();
        TaskEndpoint endpoint(makeService(), std::make_shared<FixedCallerIdentity>("alice"), log);
        bool thrown = false;
        try {
            endpoint.updateTask("never_created", "DONE");
        } catch (const TaskNotFoundError& e) {
            thrown = true;
            assert(e.id() == "alice.never_created");
        }
        assert(thrown);
        assert(log->messages().size() == 1);
        assert(endpoint.getTasks().empty());
        std::cout << "[PASS] update on an unknown task reports TaskNotFoundError." << std::endl;
    }

    std::cout << "[PASS] TaskEndpoint Test." << std::endl;
    return 0;
}
