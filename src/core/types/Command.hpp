/**
 * @file Command.hpp
 * @brief Commands accepted by the running agent over the command channel.
 */

#pragma once

#include <optional>
#include <string>

namespace customrpc::core {

/**
 * @brief The fixed vocabulary of actions a command can carry.
 */
enum class CommandAction : int {
    Connect = 0,      ///< Connect, optionally with a named profile
    Disconnect = 1,   ///< Drop the presence connection
    Quit = 2,         ///< Shut the running agent down
    ListProfiles = 3, ///< List stored profile names
    LoadProfile = 4   ///< Select a profile as the current one
};

/**
 * @brief One action plus its optional profile argument.
 */
struct Command {
    CommandAction action{CommandAction::ListProfiles};
    std::optional<std::string> profile;

    /**
     * @brief Returns the wire name of the action (e.g. "list_profiles").
     */
    [[nodiscard]] std::string actionToString() const;

    /**
     * @brief Parses a wire action name.
     * @param str Action name as sent on the wire.
     * @return The action, or nullopt if the name is not part of the vocabulary.
     */
    static std::optional<CommandAction> actionFromString(const std::string& str);

    bool operator==(const Command& other) const = default;
};

} // namespace customrpc::core
