// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace taskledger::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetLedgerDir();
};

} // namespace taskledger::infrastructure
