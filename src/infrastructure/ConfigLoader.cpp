/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <system_error>

namespace taskledger::infrastructure {

namespace {
const char* kSettingsFile = "settings.json";
}

LedgerConfig ConfigLoader::Load(const std::string& dataDir) {
    LedgerConfig config;
    std::filesystem::path configPath = std::filesystem::path(dataDir) / kSettingsFile;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot access " << configPath << ": " << ec.message() << std::endl;
        }
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.strictInvariants = j.value("strict_invariants", config.strictInvariants);
        config.recordsFile = j.value("records_file", config.recordsFile);
        config.indexFile = j.value("index_file", config.indexFile);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return LedgerConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const std::string& dataDir, const LedgerConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(dataDir) / kSettingsFile;
    nlohmann::json j = nlohmann::json::object();

    std::error_code existsEc;
    if (std::filesystem::exists(configPath, existsEc)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["strict_invariants"] = config.strictInvariants;
    j["records_file"] = config.recordsFile;
    j["index_file"] = config.indexFile;

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(dataDir), ec);
    if (ec) {
        std::cerr << "[ConfigLoader] Cannot create " << dataDir << ": " << ec.message() << std::endl;
        return false;
    }

    std::ofstream f(configPath, std::ios::trunc);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace taskledger::infrastructure
