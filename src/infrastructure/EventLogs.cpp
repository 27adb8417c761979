#include "infrastructure/EventLogs.hpp"
#include <iostream>

namespace taskledger::infrastructure {

void StderrEventLog::log(const std::string& message) {
    std::cerr << "[TaskLedger] " << message << std::endl;
}

void MemoryEventLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_messages.push_back(message);
}

std::vector<std::string> MemoryEventLog::messages() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_messages;
}

} // namespace taskledger::infrastructure
