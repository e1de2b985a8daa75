#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace customrpc::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec)) {
        spdlog::info("No configuration at {}, writing defaults", configPath_.string());
        return save();
    }

    std::ifstream in(configPath_);
    if (!in) {
        spdlog::error("Cannot open {}", configPath_.string());
        return false;
    }

    auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        config_ = AppConfig{};
        spdlog::error("{} is not a JSON object, keeping defaults", configPath_.string());
        return false;
    }

    try {
        fromJson(document);
    } catch (const nlohmann::json::exception& e) {
        config_ = AppConfig{};
        spdlog::error("{} has a field of the wrong type, keeping defaults: {}",
                      configPath_.string(), e.what());
        return false;
    }

    spdlog::debug("Configuration loaded from {}", configPath_.string());
    return true;
}

bool ConfigManager::save() {
    // Staged beside the target, then renamed over it
    auto staging = configPath_;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write {}", staging.string());
            return false;
        }
        out << toJson().dump(2);
        if (!out.flush()) {
            spdlog::error("Short write to {}", staging.string());
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, configPath_, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", configPath_.string(), ec.message());
        std::filesystem::remove(staging, ec);
        return false;
    }
    return true;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["start_minimized"] = config_.startMinimized;
    j["general"]["log_level"] = config_.logLevel;
    j["general"]["notify_on_status_change"] = config_.notifyOnStatusChange;

    // Connection
    j["connection"]["auto_connect"] = config_.autoConnect;
    j["connection"]["auto_connect_profile"] = config_.autoConnectProfile;
    j["connection"]["last_profile"] = config_.lastProfile;
    j["connection"]["liveness_interval_seconds"] = config_.livenessIntervalSeconds;

    // Command channel
    j["ipc"]["preferred_port"] = config_.preferredPort;
    j["ipc"]["command_timeout_ms"] = config_.commandTimeoutMs;

    // Single instance
    j["instance"]["auto_recover_stale_lock"] = config_.autoRecoverStaleLock;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;

    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.startMinimized = g.value("start_minimized", defaults.startMinimized);
        config_.logLevel = g.value("log_level", defaults.logLevel);
        config_.notifyOnStatusChange =
            g.value("notify_on_status_change", defaults.notifyOnStatusChange);
    }

    // Connection
    if (j.contains("connection")) {
        const auto& c = j["connection"];
        config_.autoConnect = c.value("auto_connect", defaults.autoConnect);
        config_.autoConnectProfile = c.value("auto_connect_profile", defaults.autoConnectProfile);
        config_.lastProfile = c.value("last_profile", defaults.lastProfile);
        config_.livenessIntervalSeconds =
            c.value("liveness_interval_seconds", defaults.livenessIntervalSeconds);
        if (config_.livenessIntervalSeconds < 1) {
            spdlog::warn("Invalid liveness interval {}, using {}",
                         config_.livenessIntervalSeconds, defaults.livenessIntervalSeconds);
            config_.livenessIntervalSeconds = defaults.livenessIntervalSeconds;
        }
    }

    // Command channel
    if (j.contains("ipc")) {
        const auto& i = j["ipc"];
        config_.preferredPort = i.value("preferred_port", defaults.preferredPort);
        config_.commandTimeoutMs = i.value("command_timeout_ms", defaults.commandTimeoutMs);
        if (config_.commandTimeoutMs < 1) {
            config_.commandTimeoutMs = defaults.commandTimeoutMs;
        }
    }

    // Single instance
    if (j.contains("instance")) {
        config_.autoRecoverStaleLock =
            j["instance"].value("auto_recover_stale_lock", defaults.autoRecoverStaleLock);
    }
}

} // namespace customrpc::infra
