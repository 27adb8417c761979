/**
 * @file OwnerIndexFs.hpp
 * @brief JSON-file backed owner index (owner -> ordered task ids).
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/repositories/IOwnerIndex.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskledger::infrastructure {

/**
 * @class OwnerIndexFs
 * @brief Same storage strategy as RecordStoreFs. Sequences are append-only.
 */
class OwnerIndexFs : public domain::IOwnerIndex {
public:
    OwnerIndexFs(std::string filePath, std::shared_ptr<PersistenceService> persistence);

    std::optional<std::vector<std::string>> get(const std::string& owner) const override;
    void append(const std::string& owner, const std::string& id) override;

private:
    void ensureLoaded() const;
    nlohmann::json snapshot() const;

    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::map<std::string, std::vector<std::string>> m_entries;
    mutable bool m_loaded = false;
};

} // namespace taskledger::infrastructure
