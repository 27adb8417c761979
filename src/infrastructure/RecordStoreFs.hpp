/**
 * @file RecordStoreFs.hpp
 * @brief JSON-file backed record table (id -> Task).
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/repositories/IRecordStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskledger::infrastructure {

/**
 * @class RecordStoreFs
 * @brief Keeps the table in memory and rewrites the whole file after each put.
 *
 * The file is read on first access. An empty path keeps the store in memory only.
 * put() throws domain::StorageError, leaving the table unchanged, when the
 * record cannot be encoded (keys and values must be valid UTF-8 on disk).
 * Not synchronized: callers serialize access (TaskService holds the lock).
 */
class RecordStoreFs : public domain::IRecordStore {
public:
    RecordStoreFs(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    void put(const std::string& id, const domain::Task& task) override;
    std::optional<domain::Task> get(const std::string& id) const override;
    bool contains(const std::string& id) const override;
    std::size_t size() const override;

private:
    void ensureLoaded() const;
    nlohmann::json snapshot() const;

    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::map<std::string, domain::Task> m_records;
    mutable bool m_loaded = false;
};

} // namespace taskledger::infrastructure
