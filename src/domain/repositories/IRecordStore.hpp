/**
 * @file IRecordStore.hpp
 * @brief Interface for the primary id -> Task table.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "../Task.hpp"

namespace taskledger::domain {

class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    // Unconditional upsert
    virtual void put(const std::string& id, const Task& task) = 0;

    // Empty when no record is stored under id
    virtual std::optional<Task> get(const std::string& id) const = 0;

    virtual bool contains(const std::string& id) const = 0;
    virtual std::size_t size() const = 0;
};

} // namespace taskledger::domain
