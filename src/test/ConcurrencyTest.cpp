#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/TaskService.hpp"
#include "infrastructure/OwnerIndexFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RecordStoreFs.hpp"

using namespace taskledger::domain;
using namespace taskledger::application;
using namespace taskledger::infrastructure;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    std::string testRoot = "test_ledger_root_concurrency";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto persistence = std::make_shared<PersistenceService>();
    auto records = std::make_shared<RecordStoreFs>(testRoot + "/tasks.json", persistence);
    auto index = std::make_shared<OwnerIndexFs>(testRoot + "/tasks_by_owner.json", persistence);
    TaskService service(records, index);

    const int NUM_THREADS = 8;
    const int TASKS_PER_THREAD = 25;
    std::vector<std::thread> threads;
    std::atomic<int> listed{0};

    std::cout << "[Test] Spawning " << NUM_THREADS << " writer threads..." << std::endl;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&service, &listed, t]() {
            for (int i = 0; i < TASKS_PER_THREAD; ++i) {
                std::string name = "task_" + std::to_string(i);
                // Every thread hits the same names, so creates race on the same ids
                service.create("shared", name);
                service.changeStatus("shared", name, "T" + std::to_string(t));
                service.create("owner" + std::to_string(t), name);
                // Index and store must stay consistent under contention
                listed += static_cast<int>(service.list("shared").size());
            }
        });
    }

    for (auto& th : threads) {
        if (th.joinable()) th.join();
    }

    auto shared = service.list("shared");
    std::cout << "[Test] Shared owner size: " << shared.size() << std::endl;
    assert(shared.size() == TASKS_PER_THREAD);

    std::set<std::string> ids;
    for (const auto& task : shared) {
        ids.insert(task.id);
        assert(task.status.size() >= 1);
    }
    assert(ids.size() == static_cast<size_t>(TASKS_PER_THREAD));

    for (int t = 0; t < NUM_THREADS; ++t) {
        auto own = service.list("owner" + std::to_string(t));
        assert(own.size() == TASKS_PER_THREAD);
        assert(own.front().name == "task_0");
        assert(own.back().name == "task_" + std::to_string(TASKS_PER_THREAD - 1));
    }
    assert(records->size() == static_cast<size_t>(TASKS_PER_THREAD * (NUM_THREADS + 1)));
    assert(listed > 0);

    persistence->stop();
    assert(persistence->failedWrites() == 0);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Concurrency Stress Test." << std::endl;
    return 0;
}
