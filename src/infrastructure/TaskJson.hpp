/**
 * @file TaskJson.hpp
 * @brief JSON mapping for Task records, shared by the record file and the CLI output.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "domain/Task.hpp"
#include "domain/TaskErrors.hpp"

namespace taskledger::infrastructure {

inline nlohmann::json TaskToJson(const domain::Task& task) {
    return {
        {"id", task.id},
        {"name", task.name},
        {"status", task.status}
    };
}

// Throws nlohmann::json::exception on missing or mistyped fields
inline domain::Task TaskFromJson(const nlohmann::json& j) {
    return domain::Task{
        j.at("id").get<std::string>(),
        j.at("name").get<std::string>(),
        j.at("status").get<std::string>()
    };
}

inline nlohmann::json TasksToJson(const std::vector<domain::Task>& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tasks) {
        arr.push_back(TaskToJson(t));
    }
    return arr;
}

/**
 * @brief Serializes a store snapshot for disk.
 * @throws domain::StorageError if a key or value is not valid UTF-8 (json type_error 316).
 */
inline std::string DumpForStorage(const nlohmann::json& snapshot, const std::string& filePath) {
    try {
        return snapshot.dump(2);
    } catch (const nlohmann::json::type_error& e) {
        throw domain::StorageError("Cannot encode " + filePath + ": " + e.what());
    }
}

} // namespace taskledger::infrastructure
