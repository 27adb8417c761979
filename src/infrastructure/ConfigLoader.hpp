/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the ledger settings (settings.json).
 *
 * Keeps JSON parsing of configuration in one place instead of scattering it
 * through the stores and services.
 */

#pragma once

#include <string>

namespace taskledger::infrastructure {

/**
 * @struct LedgerConfig
 * @brief Effective settings after defaults are applied.
 */
struct LedgerConfig {
    bool strictInvariants = true;                   ///< false replays the legacy duplicate/orphan behavior.
    std::string recordsFile = "tasks.json";         ///< Relative to the data directory.
    std::string indexFile = "tasks_by_owner.json";  ///< Relative to the data directory.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the data directory.
     * @param dataDir Directory holding settings.json and the ledger files.
     * @return Defaults for anything missing. A malformed file is reported and ignored.
     */
    static LedgerConfig Load(const std::string& dataDir);

    /**
     * @brief Writes the given settings, preserving unrelated keys already in the file.
     * @return false if the file could not be written.
     */
    static bool Save(const std::string& dataDir, const LedgerConfig& config);
};

} // namespace taskledger::infrastructure
