/**
 * @file PresencePayload.hpp
 * @brief Typed rich presence state published to the presence service.
 *
 * This file defines the PresencePayload structure and the field limits the
 * presence service enforces. Serialization to the wire activity object is an
 * explicit mapping in toActivityJson().
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace customrpc::core {

/**
 * @brief Length limits (in characters) enforced before a payload is sent.
 */
struct PresenceLimits {
    static constexpr size_t MaxTextLength = 128;        ///< details, state, name, image fields
    static constexpr size_t MaxButtonLabelLength = 32;  ///< Button caption
    static constexpr size_t MaxButtonUrlLength = 512;   ///< Button target URL
    static constexpr size_t MaxButtons = 2;             ///< Buttons shown per activity
};

/**
 * @brief A clickable button attached to the presence.
 */
struct PresenceButton {
    std::string label; ///< Caption shown on the button
    std::string url;   ///< http(s) URL opened on click

    /**
     * @brief Checks label and URL against the service limits.
     * @return True if the label is non-empty and the URL is a bounded http(s) URL.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const PresenceButton& other) const = default;
};

/**
 * @brief Image key plus hover text pair.
 */
struct PresenceImage {
    std::optional<std::string> key;  ///< Asset key or external image URL
    std::optional<std::string> text; ///< Hover text

    [[nodiscard]] bool isEmpty() const { return !key && !text; }

    bool operator==(const PresenceImage& other) const = default;
};

/**
 * @brief Party occupancy shown as "current of max".
 */
struct PresenceParty {
    int current{0}; ///< Members currently in the party
    int max{0};     ///< Party capacity

    /**
     * @brief Checks 0 <= current <= max and max > 0.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const PresenceParty& other) const = default;
};

/**
 * @brief State published to the presence service.
 *
 * Every member is optional. Absent members are omitted from the wire object,
 * never serialized as null.
 */
struct PresencePayload {
    std::optional<std::string> displayName;   ///< Activity name override
    std::optional<std::string> details;       ///< First text line
    std::optional<std::string> state;         ///< Second text line
    std::optional<int64_t> startTimestamp;    ///< Seconds since epoch
    std::optional<int64_t> endTimestamp;      ///< Seconds since epoch, >= start
    PresenceImage largeImage;                 ///< Large image and hover text
    PresenceImage smallImage;                 ///< Small image and hover text
    std::optional<PresenceParty> party;       ///< Party occupancy
    std::vector<PresenceButton> buttons;      ///< At most two buttons
    std::optional<bool> instance;             ///< Instanced activity flag

    /**
     * @brief Returns a copy that satisfies every service limit.
     *
     * Text fields are truncated on a UTF-8 boundary, empty strings become
     * absent, invalid buttons are dropped and the list is capped at two, an
     * invalid party is removed and an end timestamp earlier than the start
     * timestamp is removed.
     */
    [[nodiscard]] PresencePayload normalized() const;

    /**
     * @brief Checks whether the payload carries no visible field at all.
     */
    [[nodiscard]] bool isEmpty() const;

    /**
     * @brief Maps the normalized payload to the presence service activity object.
     * @return JSON object containing only the present fields.
     */
    [[nodiscard]] nlohmann::json toActivityJson() const;

    bool operator==(const PresencePayload& other) const = default;
};

/**
 * @brief Truncates a UTF-8 string to at most maxChars code points.
 * @param text Input text (assumed UTF-8).
 * @param maxChars Maximum number of code points to keep.
 * @return The truncated text, never splitting a multi-byte sequence.
 */
std::string truncateUtf8(const std::string& text, size_t maxChars);

} // namespace customrpc::core
