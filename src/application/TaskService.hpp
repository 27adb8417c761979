/**
 * @file TaskService.hpp
 * @brief Application service composing the record store and the owner index.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/Task.hpp"
#include "domain/repositories/IOwnerIndex.hpp"
#include "domain/repositories/IRecordStore.hpp"

namespace taskledger::application {

/**
 * @struct TaskServiceOptions
 * @brief Behavior switches.
 */
struct TaskServiceOptions {
    /**
     * When true (default): repeated create never duplicates an id in the owner
     * index, changeStatus on an unknown key throws TaskNotFoundError, and id
     * collisions between distinct keys throw KeyCollisionError.
     * When false: legacy behavior, both maps are written unconditionally.
     */
    bool strictInvariants = true;
};

/**
 * @class TaskService
 * @brief Owner-scoped task operations over the two stores.
 *
 * Every operation holds one mutex across both stores, so the index and the
 * record table are never observed half-updated.
 */
class TaskService {
public:
    TaskService(std::shared_ptr<domain::IRecordStore> records,
                std::shared_ptr<domain::IOwnerIndex> index,
                TaskServiceOptions options = {});

    /**
     * @brief Tasks created by owner, in creation order.
     * @return Empty for an owner that never created a task.
     * @throws domain::CorruptIndexError if the index references a missing record.
     */
    std::vector<domain::Task> list(const std::string& owner) const;

    /**
     * @brief Creates (or resets to TODO) the task owner.name.
     * @throws domain::KeyCollisionError in strict mode when the id belongs to another key.
     */
    domain::Task create(const std::string& owner, const std::string& name);

    /**
     * @brief Replaces the status of owner.name. Any string is accepted.
     * @throws domain::TaskNotFoundError in strict mode when the task was never created.
     */
    domain::Task changeStatus(const std::string& owner, const std::string& name, const std::string& status);

    const TaskServiceOptions& options() const { return m_options; }

private:
    std::shared_ptr<domain::IRecordStore> m_records;
    std::shared_ptr<domain::IOwnerIndex> m_index;
    TaskServiceOptions m_options;

    mutable std::mutex m_mutex;
};

} // namespace taskledger::application
