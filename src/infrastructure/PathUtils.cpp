#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace taskledger::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

// Not created here; PersistenceService creates parents on first write
fs::path PathUtils::GetLedgerDir() {
    return GetDataHome() / "TaskLedger";
}

} // namespace taskledger::infrastructure
