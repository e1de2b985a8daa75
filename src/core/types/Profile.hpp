/**
 * @file Profile.hpp
 * @brief Stored presence profile: an application id plus the presence to show.
 */

#pragma once

#include "core/types/PresencePayload.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace customrpc::core {

/**
 * @brief A named, persisted presence configuration.
 */
struct Profile {
    std::string name;  ///< Unique profile name (also the file name stem)
    std::string appId; ///< Discord application id used for the handshake
    PresencePayload presence; ///< Presence published after connecting
    std::optional<std::chrono::system_clock::time_point> createdAt; ///< First save
    std::optional<std::chrono::system_clock::time_point> updatedAt; ///< Last save

    /**
     * @brief Checks that the application id is 17 to 20 decimal digits.
     */
    [[nodiscard]] bool hasValidAppId() const;

    /**
     * @brief Returns the payload to publish, normalized to the service limits.
     */
    [[nodiscard]] PresencePayload toPayload() const { return presence.normalized(); }

    bool operator==(const Profile& other) const = default;
};

/**
 * @brief Validates a Discord application id.
 * @param appId Candidate id.
 * @return True if the id has 17 to 20 characters, all decimal digits.
 */
[[nodiscard]] bool isValidApplicationId(const std::string& appId);

} // namespace customrpc::core
