#include "application/AppServices.hpp"
#include <utility>
#include <filesystem>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OwnerIndexFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"

namespace taskledger::application {

AppServices BuildAppServices(const std::string& dataDir,
                             std::shared_ptr<domain::CallerIdentityResolver> caller,
                             std::shared_ptr<domain::EventLog> log) {
    namespace fs = std::filesystem;
    auto config = infrastructure::ConfigLoader::Load(dataDir);

    AppServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.recordStore = std::make_shared<infrastructure::RecordStoreFs>(
        (fs::path(dataDir) / config.recordsFile).string(), services.persistenceService);
    services.ownerIndex = std::make_shared<infrastructure::OwnerIndexFs>(
        (fs::path(dataDir) / config.indexFile).string(), services.persistenceService);

    TaskServiceOptions options;
    options.strictInvariants = config.strictInvariants;
    services.taskService = std::make_shared<TaskService>(services.recordStore, services.ownerIndex, options);
    services.endpoint = std::make_unique<TaskEndpoint>(services.taskService, std::move(caller), std::move(log));
    return services;
}

} // namespace taskledger::application
