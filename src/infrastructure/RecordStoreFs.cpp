/**
 * @file RecordStoreFs.cpp
 * @brief Implementation of RecordStoreFs.
 */

#include "infrastructure/RecordStoreFs.hpp"
#include <utility>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "domain/TaskErrors.hpp"
#include "infrastructure/TaskJson.hpp"

namespace taskledger::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

RecordStoreFs::RecordStoreFs(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {}

void RecordStoreFs::put(const std::string& id, const domain::Task& task) {
    ensureLoaded();
    if (m_filePath.empty() || !m_persistence) {
        m_records[id] = task;
        return;
    }

    // Encode first: a record that cannot be written must not enter the table
    json j = snapshot();
    j[id] = TaskToJson(task);
    std::string content = DumpForStorage(j, m_filePath);

    m_records[id] = task;
    m_persistence->saveTextAsync(m_filePath, content);
}

std::optional<domain::Task> RecordStoreFs::get(const std::string& id) const {
    ensureLoaded();
    auto it = m_records.find(id);
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

bool RecordStoreFs::contains(const std::string& id) const {
    ensureLoaded();
    return m_records.count(id) > 0;
}

std::size_t RecordStoreFs::size() const {
    ensureLoaded();
    return m_records.size();
}

void RecordStoreFs::ensureLoaded() const {
    if (m_loaded) return;
    m_loaded = true;
    if (m_filePath.empty()) return;

    std::error_code ec;
    bool present = fs::exists(m_filePath, ec);
    if (ec) {
        std::cerr << "[RecordStoreFs] Cannot access " << m_filePath << ": " << ec.message() << std::endl;
        m_loaded = false;
        throw domain::StorageError("Cannot access task records at " + m_filePath + ": " + ec.message());
    }
    if (!present) return;

    try {
        std::ifstream f(m_filePath);
        json j = json::parse(f);
        for (auto it = j.begin(); it != j.end(); ++it) {
            m_records[it.key()] = TaskFromJson(it.value());
        }
    } catch (const json::exception& e) {
        std::cerr << "[RecordStoreFs] Error reading " << m_filePath << ": " << e.what() << std::endl;
        m_records.clear();
        m_loaded = false;
        throw domain::StorageError("Cannot load task records from " + m_filePath + ": " + e.what());
    }
}

json RecordStoreFs::snapshot() const {
    json j = json::object();
    for (const auto& [id, task] : m_records) {
        j[id] = TaskToJson(task);
    }
    return j;
}

} // namespace taskledger::infrastructure
