/**
 * @file EventLogs.hpp
 * @brief EventLog sinks: stderr for the CLI, in-memory for tests.
 */

#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "domain/CallerContext.hpp"

namespace taskledger::infrastructure {

/** @brief Writes "[TaskLedger] <message>" lines to std::cerr. */
class StderrEventLog : public domain::EventLog {
public:
    void log(const std::string& message) override;
};

/** @brief Collects messages so tests can inspect them. */
class MemoryEventLog : public domain::EventLog {
public:
    void log(const std::string& message) override;
    std::vector<std::string> messages() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_messages;
};

} // namespace taskledger::infrastructure
