/**
 * @file OwnerIndexFs.cpp
 * @brief Implementation of OwnerIndexFs.
 */

#include "infrastructure/OwnerIndexFs.hpp"
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

OwnerIndexFs::OwnerIndexFs(std::string filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {}

std::optional<std::vector<std::string>> OwnerIndexFs::get(const std::string& owner) const {
    ensureLoaded();
    auto it = m_entries.find(owner);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

void OwnerIndexFs::append(const std::string& owner, const std::string& id) {
    ensureLoaded();
    if (m_filePath.empty() || !m_persistence) {
        m_entries[owner].push_back(id);
        return;
    }

    json j = snapshot();
    j[owner].push_back(id);
    std::string content = DumpForStorage(j, m_filePath);

    m_entries[owner].push_back(id);
    m_persistence->saveTextAsync(m_filePath, content);
}

void OwnerIndexFs::ensureLoaded() const {
    if (m_loaded) return;
    m_loaded = true;
    if (m_filePath.empty()) return;

    std::error_code ec;
    bool present = fs::exists(m_filePath, ec);
    if (ec) {
        std::cerr << "[OwnerIndexFs] Cannot access " << m_filePath << ": " << ec.message() << std::endl;
        m_loaded = false;
        throw domain::StorageError("Cannot access owner index at " + m_filePath + ": " + ec.message());
    }
    if (!present) return;

    try {
        std::ifstream f(m_filePath);
        json j = json::parse(f);
        for (auto it = j.begin(); it != j.end(); ++it) {
            m_entries[it.key()] = it.value().get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OwnerIndexFs] Error reading " << m_filePath << ": " << e.what() << std::endl;
        m_entries.clear();
        m_loaded = false;
        throw domain::StorageError("Cannot load owner index from " + m_filePath + ": " + e.what());
    }
}

json OwnerIndexFs::snapshot() const {
    json j = json::object();
    for (const auto& [owner, ids] : m_entries) {
        j[owner] = ids;
    }
    return j;
}

} // namespace taskledger::infrastructure
