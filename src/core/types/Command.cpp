#include "core/types/Command.hpp"

namespace customrpc::core {

std::string Command::actionToString() const {
    switch (action) {
    case CommandAction::Connect:
        return "connect";
    case CommandAction::Disconnect:
        return "disconnect";
    case CommandAction::Quit:
        return "quit";
    case CommandAction::ListProfiles:
        return "list_profiles";
    case CommandAction::LoadProfile:
        return "load_profile";
    }
    return "list_profiles";
}

std::optional<CommandAction> Command::actionFromString(const std::string& str) {
    if (str == "connect")
        return CommandAction::Connect;
    if (str == "disconnect")
        return CommandAction::Disconnect;
    if (str == "quit")
        return CommandAction::Quit;
    if (str == "list_profiles")
        return CommandAction::ListProfiles;
    if (str == "load_profile")
        return CommandAction::LoadProfile;
    return std::nullopt;
}

} // namespace customrpc::core
