#include "application/TaskEndpoint.hpp"
#include <utility>
#include <exception>
#include <iostream>

namespace taskledger::application {

TaskEndpoint::TaskEndpoint(std::shared_ptr<TaskService> service,
                           std::shared_ptr<domain::CallerIdentityResolver> caller,
                           std::shared_ptr<domain::EventLog> log)
    : m_service(std::move(service)), m_caller(std::move(caller)), m_log(std::move(log)) {}

std::vector<domain::Task> TaskEndpoint::getTasks() const {
    return m_service->list(m_caller->currentCaller());
}

domain::Task TaskEndpoint::insertTask(const std::string& name) {
    emit("Insert new task " + name);
    return m_service->create(m_caller->currentCaller(), name);
}

domain::Task TaskEndpoint::updateTask(const std::string& name, const std::string& status) {
    emit("Update task " + name + " to " + status);
    return m_service->changeStatus(m_caller->currentCaller(), name, status);
}

void TaskEndpoint::emit(const std::string& message) const {
    if (!m_log) return;
    try {
        m_log->log(message);
    } catch (const std::exception& e) {
        std::cerr << "[TaskEndpoint] Event log failed (" << e.what() << "): " << message << std::endl;
    }
}

} // namespace taskledger::application
