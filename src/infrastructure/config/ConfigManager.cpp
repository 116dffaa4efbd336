#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace portprobe::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configPath)
    : configPath_(configPath) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file {} not found, writing defaults", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config_ = AppConfig{};
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto parent = configPath_.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Scanner
    j["scanner"]["concurrency"] = config_.scanner.concurrency;
    j["scanner"]["timeout_ms"] = config_.scanner.timeoutMs;

    // Logging
    j["logging"]["level"] = config_.logging.level;
    j["logging"]["file"] = config_.logging.file;

    // Output
    j["output"]["indent"] = config_.jsonIndent;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig loaded;

    // Scanner
    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        loaded.scanner.concurrency =
            s.value("concurrency", core::ScannerSettings::kDefaultConcurrency);
        loaded.scanner.timeoutMs = s.value("timeout_ms", core::ScannerSettings::kDefaultTimeoutMs);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        loaded.logging.level = l.value("level", "warn");
        loaded.logging.file = l.value("file", "");
    }

    // Output
    if (j.contains("output")) {
        loaded.jsonIndent = j["output"].value("indent", 2);
    }

    config_ = loaded;
}

} // namespace portprobe::infra
