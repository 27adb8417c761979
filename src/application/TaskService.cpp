/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"
#include <utility>
#include <algorithm>
#include "domain/TaskErrors.hpp"

namespace taskledger::application {

using domain::Task;
using domain::TaskKey;

TaskService::TaskService(std::shared_ptr<domain::IRecordStore> records,
                         std::shared_ptr<domain::IOwnerIndex> index,
                         TaskServiceOptions options)
    : m_records(std::move(records)), m_index(std::move(index)), m_options(options) {}

std::vector<Task> TaskService::list(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Task> tasks;
    auto ids = m_index->get(owner);
    if (!ids) {
        return tasks;
    }

    tasks.reserve(ids->size());
    for (const auto& id : *ids) {
        auto task = m_records->get(id);
        if (!task) {
            throw domain::CorruptIndexError(owner, id);
        }
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

Task TaskService::create(const std::string& owner, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);

    TaskKey key{owner, name};
    Task task = key.makeTask(domain::kInitialStatus);

    if (!m_options.strictInvariants) {
        m_records->put(task.id, task);
        m_index->append(owner, task.id);
        return task;
    }

    auto existing = m_records->get(task.id);
    if (existing && !key.matches(*existing)) {
        throw domain::KeyCollisionError(task.id, existing->name, name);
    }

    // Record first: the index must never point at an id the store lacks
    m_records->put(task.id, task);

    auto ids = m_index->get(owner);
    bool indexed = ids && std::find(ids->begin(), ids->end(), task.id) != ids->end();
    if (!indexed) {
        m_index->append(owner, task.id);
    }
    return task;
}

Task TaskService::changeStatus(const std::string& owner, const std::string& name, const std::string& status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    TaskKey key{owner, name};
    Task task = key.makeTask(status);

    if (m_options.strictInvariants) {
        auto existing = m_records->get(task.id);
        if (!existing || !key.matches(*existing)) {
            throw domain::TaskNotFoundError(task.id);
        }
    }

    m_records->put(task.id, task);
    return task;
}

} // namespace taskledger::application
