#pragma once

#include "core/types/Profile.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace customrpc::infra {

/**
 * @brief Persists presence profiles as one JSON file per profile.
 *
 * Files live in the profiles directory and are named after the sanitized
 * profile name. Errors are logged and reported through the return values.
 */
class ProfileStore {
public:
    /**
     * @brief Constructs a ProfileStore; the directory is created on first save.
     * @param profilesDir Directory holding the profile files.
     */
    explicit ProfileStore(std::filesystem::path profilesDir);

    /**
     * @brief Lists all readable profiles.
     * @return Profile names in lexicographic order. Unreadable files are skipped.
     */
    std::vector<std::string> list() const;

    /**
     * @brief Loads a profile by name.
     * @return The profile, or nullopt if it does not exist or cannot be parsed.
     */
    std::optional<core::Profile> load(const std::string& name) const;

    /**
     * @brief Writes a profile, creating or replacing its file.
     *
     * Keeps the creation time of an existing file and stamps the update time.
     * The stored timestamps are written back into @p profile.
     *
     * @return True on success.
     */
    bool save(core::Profile& profile);

    /**
     * @brief Deletes a profile file.
     * @return True if the file existed and was removed.
     */
    bool remove(const std::string& name);

    bool exists(const std::string& name) const;

    std::filesystem::path pathFor(const std::string& name) const;

    const std::filesystem::path& directory() const { return profilesDir_; }

    /**
     * @brief Keeps alphanumerics, space, '-' and '_' and trims surrounding spaces.
     */
    static std::string sanitizeName(const std::string& name);

    static nlohmann::json toJson(const core::Profile& profile);

    /**
     * @brief Builds a profile from its stored JSON object.
     * @param j Stored object; unknown keys are ignored.
     * @param fallbackName Name used when the object has none.
     * @throws nlohmann::json::exception if a present field has the wrong type.
     */
    static core::Profile fromJson(const nlohmann::json& j, const std::string& fallbackName);

private:
    std::filesystem::path profilesDir_;
};

} // namespace customrpc::infra
