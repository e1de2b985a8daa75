#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace customrpc::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains all user-configurable settings of the agent: startup behaviour,
 * automatic connection, command channel and single-instance policy.
 */
struct AppConfig {
    // General settings
    bool startMinimized{false};         ///< Start without announcing the agent window.
    std::string logLevel{"info"};       ///< Console log level ("debug", "info", ...).
    bool notifyOnStatusChange{true};    ///< Log connection state changes at info level.

    // Connection
    bool autoConnect{false};            ///< Connect with autoConnectProfile at startup.
    std::string autoConnectProfile;     ///< Profile used for automatic connection.
    std::string lastProfile;            ///< Last profile connected or loaded.
    int livenessIntervalSeconds{10};    ///< Seconds between liveness probes.

    // Command channel
    uint16_t preferredPort{0};          ///< Loopback port to try first (0 = ephemeral).
    int commandTimeoutMs{5000};         ///< Bound on one forwarded command.

    // Single instance
    bool autoRecoverStaleLock{true};    ///< Take over a lock left by a dead process.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration from config.json in the
 * per-user configuration directory and derives the paths of every other
 * per-user file from that directory.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory, created if missing.
     * @throws std::filesystem::filesystem_error if the directory cannot be created.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with the defaults. A corrupt file leaves the
     * defaults in place.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    const std::filesystem::path& configDir() const { return configDir_; }

    /**
     * @brief Returns the directory holding one JSON file per profile.
     */
    std::filesystem::path profilesDir() const { return configDir_ / "profiles"; }

    std::filesystem::path logsDir() const { return configDir_ / "logs"; }

    /**
     * @brief Returns the single-instance lock file path.
     */
    std::filesystem::path lockPath() const { return configDir_ / ".lock"; }

    /**
     * @brief Returns the file announcing the owner's command port.
     */
    std::filesystem::path portPath() const { return configDir_ / ".port"; }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace customrpc::infra
