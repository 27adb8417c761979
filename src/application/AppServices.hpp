/**
 * @file AppServices.hpp
 * @brief Container for the wired ledger services, to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include <string>
#include "application/TaskEndpoint.hpp"
#include "application/TaskService.hpp"
#include "domain/CallerContext.hpp"
#include "domain/repositories/IOwnerIndex.hpp"
#include "domain/repositories/IRecordStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskledger::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::IRecordStore> recordStore;
    std::shared_ptr<domain::IOwnerIndex> ownerIndex;
    std::shared_ptr<TaskService> taskService;
    std::unique_ptr<TaskEndpoint> endpoint;
};

/**
 * @brief Reads settings.json from dataDir and wires file-backed stores under it.
 */
AppServices BuildAppServices(const std::string& dataDir,
                             std::shared_ptr<domain::CallerIdentityResolver> caller,
                             std::shared_ptr<domain::EventLog> log);

} // namespace taskledger::application
