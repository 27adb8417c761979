#include <cassert>
#include <iostream>
#include <memory>

#include "application/TaskService.hpp"
#include "infrastructure/OwnerIndexFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"

using namespace taskledger::domain;
using namespace taskledger::application;
using namespace taskledger::infrastructure;

// strictInvariants = false must behave exactly like the original ledger,
// including its two known defects.
int main() {
    std::cout << "[Test] Starting Legacy Mode Test..." << std::endl;

    auto records = std::make_shared<RecordStoreFs>("", nullptr);
    auto index = std::make_shared<OwnerIndexFs>("", nullptr);
    TaskServiceOptions options;
    options.strictInvariants = false;
    TaskService service(records, index, options);

    // Repeated create appends a duplicate id
    service.create("alice", "task_a");
    service.changeStatus("alice", "task_a", "DONE");
    service.create("alice", "task_a");

    auto ids = index->get("alice");
    assert(ids && ids->size() == 2);
    assert((*ids)[0] == "alice.task_a" && (*ids)[1] == "alice.task_a");

    auto tasks = service.list("alice");
    assert(tasks.size() == 2);
    assert(tasks[0] == tasks[1]);
    assert(tasks[0].status == "TODO");
    assert(records->size() == 1);
    std::cout << "[PASS] repeated create duplicates the index entry." << std::endl;

    // changeStatus fabricates a record that list cannot reach
    Task orphan = service.changeStatus("bob", "ghost", "DONE");
    assert(orphan.id == "bob.ghost");
    assert(records->contains("bob.ghost"));
    assert(!index->get("bob"));
    assert(service.list("bob").empty());
    std::cout << "[PASS] changeStatus on an unknown task fabricates an orphan record." << std::endl;

    // Separator collisions silently overwrite
    service.create("a", "b.c");
    service.create("a.b", "c");
    assert(service.list("a")[0].name == "c");
    std::cout << "[PASS] colliding keys overwrite each other." << std::endl;

    std::cout << "[PASS] Legacy Mode Test." << std::endl;
    return 0;
}
