#pragma once

#include "core/types/ScanSettings.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace portprobe::infra {

/**
 * @brief Logging preferences.
 */
struct LoggingConfig {
    std::string level{"warn"}; ///< spdlog level name ("trace" ... "off").
    std::string file;          ///< Rotating log file path; empty disables file logging.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    core::ScannerSettings scanner; ///< Worker pool size and probe timeout.
    LoggingConfig logging;         ///< Log level and optional log file.
    int jsonIndent{2};             ///< Indentation of saved JSON reports.
};

/**
 * @brief Manages configuration persistence.
 *
 * Handles loading and saving of the configuration from a JSON file.
 * Missing keys keep their defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(const std::filesystem::path& configPath);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with the default settings.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Returns a mutable reference to the configuration.
     * @return Reference to AppConfig.
     */
    AppConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     * @return Const reference to AppConfig.
     */
    const AppConfig& config() const { return config_; }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace portprobe::infra
