/**
 * @file TaskErrors.hpp
 * @brief Exception hierarchy for task ledger failures.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace taskledger::domain {

/**
 * @class TaskLedgerError
 * @brief Base class for every error raised by the ledger.
 */
class TaskLedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief No record exists for the requested key. */
class TaskNotFoundError : public TaskLedgerError {
public:
    explicit TaskNotFoundError(const std::string& id)
        : TaskLedgerError("Task not found: " + id), m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

/**
 * @brief The owner index references an id the record store does not hold.
 * Internal consistency violation, never retried.
 */
class CorruptIndexError : public TaskLedgerError {
public:
    CorruptIndexError(const std::string& owner, const std::string& id)
        : TaskLedgerError("Corrupt index: owner '" + owner + "' references missing task '" + id + "'"),
          m_owner(owner), m_id(id) {}

    const std::string& owner() const { return m_owner; }
    const std::string& id() const { return m_id; }

private:
    std::string m_owner;
    std::string m_id;
};

/** @brief Two distinct (owner, name) keys flatten to the same storage id. */
class KeyCollisionError : public TaskLedgerError {
public:
    KeyCollisionError(const std::string& id, const std::string& existingName, const std::string& requestedName)
        : TaskLedgerError("Id '" + id + "' already holds task '" + existingName +
                          "', cannot store '" + requestedName + "'") {}
};

/** @brief A persisted file exists but could not be read back. */
class StorageError : public TaskLedgerError {
public:
    using TaskLedgerError::TaskLedgerError;
};

} // namespace taskledger::domain
