/**
 * @file IOwnerIndex.hpp
 * @brief Interface for the owner -> ordered task ids index.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace taskledger::domain {

class IOwnerIndex {
public:
    virtual ~IOwnerIndex() = default;

    // Empty when the owner has never created a task
    virtual std::optional<std::vector<std::string>> get(const std::string& owner) const = 0;

    // Creates the entry on first use, otherwise appends at the end. No dedup here.
    virtual void append(const std::string& owner, const std::string& id) = 0;
};

} // namespace taskledger::domain
