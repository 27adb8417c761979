/**
 * @file Task.hpp
 * @brief Domain entity for a tracked task and its composite key.
 */

#pragma once
#include <string>
#include <utility>

namespace taskledger::domain {

/// Status assigned to every freshly created task.
inline const std::string kInitialStatus = "TODO";

/// Separator used when a TaskKey is serialized into a storage identifier.
constexpr char kIdSeparator = '.';

/**
 * @struct Task
 * @brief A named record with a free-form status label.
 */
struct Task {
    std::string id;     ///< Storage identifier, immutable after creation.
    std::string name;   ///< Caller supplied name, unique per owner only.
    std::string status; ///< Free-form label, no transition rules.

    bool operator==(const Task& other) const {
        return id == other.id && name == other.name && status == other.status;
    }
    bool operator!=(const Task& other) const { return !(*this == other); }
};

/**
 * @struct TaskKey
 * @brief Structured (owner, name) key. Only flattened to a string id at the storage boundary.
 */
struct TaskKey {
    std::string owner;
    std::string name;

    /** @brief Serialized storage identifier, "owner.name". */
    std::string toId() const {
        return owner + kIdSeparator + name;
    }

    /**
     * @brief Checks that a stored record was written for this key and not for
     * another key that flattens to the same id (e.g. "a"+"b.c" vs "a.b"+"c").
     */
    bool matches(const Task& task) const {
        return task.id == toId() && task.name == name;
    }

    /** @brief Builds the record a key maps to. */
    Task makeTask(std::string status) const {
        return Task{toId(), name, std::move(status)};
    }
};

} // namespace taskledger::domain
