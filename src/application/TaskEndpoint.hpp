/**
 * @file TaskEndpoint.hpp
 * @brief Caller-facing task operations: the owner is whoever is calling.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/TaskService.hpp"
#include "domain/CallerContext.hpp"

namespace taskledger::application {

/**
 * @class TaskEndpoint
 * @brief Resolves the caller, writes the event log line, then delegates to TaskService.
 *
 * A failing EventLog never aborts an operation.
 */
class TaskEndpoint {
public:
    TaskEndpoint(std::shared_ptr<TaskService> service,
                 std::shared_ptr<domain::CallerIdentityResolver> caller,
                 std::shared_ptr<domain::EventLog> log);

    /** @brief The caller's tasks, in creation order. */
    std::vector<domain::Task> getTasks() const;

    /** @brief Logs "Insert new task <name>" and creates it for the caller. */
    domain::Task insertTask(const std::string& name);

    /** @brief Logs "Update task <name> to <status>" and applies it for the caller. */
    domain::Task updateTask(const std::string& name, const std::string& status);

private:
    void emit(const std::string& message) const;

    std::shared_ptr<TaskService> m_service;
    std::shared_ptr<domain::CallerIdentityResolver> m_caller;
    std::shared_ptr<domain::EventLog> m_log;
};

} // namespace taskledger::application
