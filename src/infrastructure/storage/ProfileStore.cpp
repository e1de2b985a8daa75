#include "infrastructure/storage/ProfileStore.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace customrpc::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> stringToTimePoint(const std::string& str) {
    std::tm tm{};
    std::istringstream iss(str);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

std::optional<std::string> optionalText(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    auto value = j[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> optionalTimestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    auto value = j[key].is_number_float() ? static_cast<int64_t>(j[key].get<double>())
                                          : j[key].get<int64_t>();
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

void putText(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

ProfileStore::ProfileStore(std::filesystem::path profilesDir)
    : profilesDir_(std::move(profilesDir)) {}

std::string ProfileStore::sanitizeName(const std::string& name) {
    std::string safe;
    safe.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == ' ' || c == '-' || c == '_') {
            safe.push_back(static_cast<char>(c));
        }
    }

    auto start = safe.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    auto end = safe.find_last_not_of(' ');
    return safe.substr(start, end - start + 1);
}

std::filesystem::path ProfileStore::pathFor(const std::string& name) const {
    return profilesDir_ / (sanitizeName(name) + ".json");
}

bool ProfileStore::exists(const std::string& name) const {
    if (sanitizeName(name).empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(pathFor(name), ec);
}

std::vector<std::string> ProfileStore::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!std::filesystem::is_directory(profilesDir_, ec)) {
        return names;
    }

    for (const auto& entry : std::filesystem::directory_iterator(profilesDir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        try {
            std::ifstream file(entry.path());
            if (!file) {
                spdlog::error("Failed to open profile {}", entry.path().filename().string());
                continue;
            }
            nlohmann::json j;
            file >> j;
            names.push_back(j.value("name", entry.path().stem().string()));
        } catch (const std::exception& e) {
            spdlog::error("Failed to read profile {}: {}", entry.path().filename().string(),
                          e.what());
        }
    }
    if (ec) {
        spdlog::error("Failed to list profiles in {}: {}", profilesDir_.string(), ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::optional<core::Profile> ProfileStore::load(const std::string& name) const {
    if (!exists(name)) {
        spdlog::debug("Profile '{}' not found", name);
        return std::nullopt;
    }

    auto path = pathFor(name);
    try {
        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open profile file: {}", path.string());
            return std::nullopt;
        }
        nlohmann::json j;
        file >> j;
        auto profile = fromJson(j, name);
        spdlog::debug("Loaded profile '{}'", profile.name);
        return profile;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load profile '{}': {}", name, e.what());
        return std::nullopt;
    }
}

bool ProfileStore::save(core::Profile& profile) {
    if (sanitizeName(profile.name).empty()) {
        spdlog::error("Cannot save profile with unusable name '{}'", profile.name);
        return false;
    }

    try {
        std::filesystem::create_directories(profilesDir_);

        auto now = std::chrono::system_clock::now();
        if (!profile.createdAt) {
            auto existing = load(profile.name);
            profile.createdAt = existing && existing->createdAt ? existing->createdAt : now;
        }
        profile.updatedAt = now;

        auto path = pathFor(profile.name);
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to open profile file for writing: {}", path.string());
            return false;
        }
        file << toJson(profile).dump(2);
        file.flush();
        if (!file) {
            spdlog::error("Failed to write profile file: {}", path.string());
            return false;
        }

        spdlog::info("Saved profile '{}'", profile.name);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save profile '{}': {}", profile.name, e.what());
        return false;
    }
}

bool ProfileStore::remove(const std::string& name) {
    if (!exists(name)) {
        spdlog::error("Profile '{}' not found", name);
        return false;
    }

    std::error_code ec;
    std::filesystem::remove(pathFor(name), ec);
    if (ec) {
        spdlog::error("Failed to delete profile '{}': {}", name, ec.message());
        return false;
    }
    spdlog::info("Deleted profile '{}'", name);
    return true;
}

nlohmann::json ProfileStore::toJson(const core::Profile& profile) {
    const auto& p = profile.presence;
    nlohmann::json j;

    j["name"] = profile.name;
    j["app_id"] = profile.appId;
    putText(j, "display_name", p.displayName);
    putText(j, "details", p.details);
    putText(j, "state", p.state);
    if (p.startTimestamp) {
        j["start_timestamp"] = *p.startTimestamp;
    }
    if (p.endTimestamp) {
        j["end_timestamp"] = *p.endTimestamp;
    }
    putText(j, "large_image_key", p.largeImage.key);
    putText(j, "large_image_text", p.largeImage.text);
    putText(j, "small_image_key", p.smallImage.key);
    putText(j, "small_image_text", p.smallImage.text);
    if (p.party) {
        j["party_size"] = p.party->current;
        j["party_max"] = p.party->max;
    }

    j["buttons"] = nlohmann::json::array();
    for (const auto& button : p.buttons) {
        j["buttons"].push_back({{"label", button.label}, {"url", button.url}});
    }

    if (p.instance) {
        j["instance"] = *p.instance;
    }
    if (profile.createdAt) {
        j["created_at"] = timePointToString(*profile.createdAt);
    }
    if (profile.updatedAt) {
        j["updated_at"] = timePointToString(*profile.updatedAt);
    }
    return j;
}

core::Profile ProfileStore::fromJson(const nlohmann::json& j, const std::string& fallbackName) {
    core::Profile profile;
    auto& p = profile.presence;

    profile.name = optionalText(j, "name").value_or(fallbackName);
    profile.appId = optionalText(j, "app_id").value_or("");

    p.displayName = optionalText(j, "display_name");
    if (!p.displayName) {
        p.displayName = optionalText(j, "game_name");
    }
    p.details = optionalText(j, "details");
    p.state = optionalText(j, "state");
    p.startTimestamp = optionalTimestamp(j, "start_timestamp");
    p.endTimestamp = optionalTimestamp(j, "end_timestamp");
    p.largeImage.key = optionalText(j, "large_image_key");
    p.largeImage.text = optionalText(j, "large_image_text");
    p.smallImage.key = optionalText(j, "small_image_key");
    p.smallImage.text = optionalText(j, "small_image_text");

    auto partySize = j.contains("party_size") && j["party_size"].is_number_integer()
                         ? j["party_size"].get<int>()
                         : 0;
    auto partyMax = j.contains("party_max") && j["party_max"].is_number_integer()
                        ? j["party_max"].get<int>()
                        : 0;
    if (partyMax > 0) {
        p.party = core::PresenceParty{partySize, partyMax};
    }

    if (j.contains("buttons") && j["buttons"].is_array()) {
        for (const auto& b : j["buttons"]) {
            core::PresenceButton button;
            button.label = b.value("label", "");
            button.url = b.value("url", "");
            if (!button.label.empty() || !button.url.empty()) {
                p.buttons.push_back(std::move(button));
            }
        }
    }

    if (j.contains("instance") && j["instance"].is_boolean()) {
        p.instance = j["instance"].get<bool>();
    }

    if (auto created = optionalText(j, "created_at")) {
        profile.createdAt = stringToTimePoint(*created);
    }
    if (auto updated = optionalText(j, "updated_at")) {
        profile.updatedAt = stringToTimePoint(*updated);
    }
    return profile;
}

} // namespace customrpc::infra
