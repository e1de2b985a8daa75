#include "app/CliOptions.hpp"

namespace customrpc::app {

bool CliOptions::isHeadless() const {
    return connect || disconnect || quit || listProfiles || profile.has_value();
}

std::optional<core::Command> CliOptions::toCommand() const {
    core::Command command;
    if (listProfiles) {
        command.action = core::CommandAction::ListProfiles;
    } else if (quit) {
        command.action = core::CommandAction::Quit;
    } else if (disconnect) {
        command.action = core::CommandAction::Disconnect;
    } else if (connect) {
        command.action = core::CommandAction::Connect;
        command.profile = profile;
    } else if (profile) {
        command.action = core::CommandAction::LoadProfile;
        command.profile = profile;
    } else {
        return std::nullopt;
    }
    return command;
}

CliParser::CliParser()
    : profileOption_(QStringList{"p", "profile"}, "Load the profile <name>.", "name"),
      connectOption_(QStringList{"c", "connect"}, "Connect to Discord RPC."),
      disconnectOption_(QStringList{"d", "disconnect"}, "Disconnect from Discord RPC."),
      quitOption_(QStringList{"q", "quit"}, "Quit the running instance."),
      listProfilesOption_(QStringList{"l", "list-profiles"}, "List available profiles."),
      minimizedOption_(QStringList{"m", "minimized"}, "Start without announcing the agent."),
      debugOption_("debug", "Enable debug logging."),
      helpOption_(QStringList{"h", "help"}, "Display this help."),
      versionOption_(QStringList{"v", "version"}, "Display version information.") {
    parser_.setApplicationDescription("Discord Rich Presence agent");
    parser_.addOption(profileOption_);
    parser_.addOption(connectOption_);
    parser_.addOption(disconnectOption_);
    parser_.addOption(quitOption_);
    parser_.addOption(listProfilesOption_);
    parser_.addOption(minimizedOption_);
    parser_.addOption(debugOption_);
    parser_.addOption(helpOption_);
    parser_.addOption(versionOption_);
}

bool CliParser::parse(const QStringList& arguments) {
    options_ = CliOptions{};
    if (!parser_.parse(arguments)) {
        return false;
    }

    if (parser_.isSet(profileOption_)) {
        options_.profile = parser_.value(profileOption_).toStdString();
    }
    options_.connect = parser_.isSet(connectOption_);
    options_.disconnect = parser_.isSet(disconnectOption_);
    options_.quit = parser_.isSet(quitOption_);
    options_.listProfiles = parser_.isSet(listProfilesOption_);
    options_.minimized = parser_.isSet(minimizedOption_);
    options_.debug = parser_.isSet(debugOption_);
    options_.help = parser_.isSet(helpOption_);
    options_.version = parser_.isSet(versionOption_);
    return true;
}

} // namespace customrpc::app
