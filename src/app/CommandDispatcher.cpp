#include "app/CommandDispatcher.hpp"

#include <spdlog/spdlog.h>

namespace customrpc::app {

CommandDispatcher::CommandDispatcher(infra::ConnectionSupervisor& supervisor,
                                     infra::ProfileStore& profiles, infra::ConfigManager& config,
                                     QuitCallback onQuit)
    : supervisor_(supervisor), profiles_(profiles), config_(config), onQuit_(std::move(onQuit)) {}

core::Response CommandDispatcher::dispatch(const core::Command& command) {
    spdlog::info("Processing command: {}", command.actionToString());

    std::ostringstream out;
    try {
        switch (command.action) {
        case core::CommandAction::ListProfiles:
            return listProfiles(out);
        case core::CommandAction::Connect:
            return connect(command, out);
        case core::CommandAction::Disconnect:
            return disconnect(out);
        case core::CommandAction::Quit:
            return quit(out);
        case core::CommandAction::LoadProfile:
            return loadProfile(command, out);
        }
        return core::Response::failure("Unsupported action '" + command.actionToString() + "'");
    } catch (const std::exception& e) {
        spdlog::error("Command {} failed: {}", command.actionToString(), e.what());
        return core::Response::failure(e.what(), out.str());
    }
}

core::Response CommandDispatcher::listProfiles(std::ostringstream& out) {
    auto names = profiles_.list();
    if (names.empty()) {
        out << "No profiles found.\n";
    }
    for (const auto& name : names) {
        out << name << "\n";
    }
    return core::Response::ok(out.str());
}

core::Response CommandDispatcher::connect(const core::Command& command, std::ostringstream& out) {
    auto name = command.profile.value_or(config_.config().lastProfile);
    if (name.empty()) {
        return core::Response::failure("No profile specified and no last profile found");
    }

    auto profile = profiles_.load(name);
    if (!profile) {
        out << "Profile '" << name << "' not found\n";
        return core::Response::ok(out.str());
    }

    if (!profile->hasValidAppId()) {
        return core::Response::failure("Profile '" + name + "' has an invalid application ID",
                                       out.str());
    }

    auto outcome = supervisor_.connect(profile->appId);
    if (outcome != core::ConnectOutcome::Connected) {
        return core::Response::failure("Failed to connect to Discord RPC: " +
                                           core::connectOutcomeToString(outcome),
                                       out.str());
    }

    if (!supervisor_.publish(profile->toPayload())) {
        return core::Response::failure("Failed to update activity: " + supervisor_.lastError(),
                                       out.str());
    }

    rememberProfile(profile->name);
    out << "Connected to Discord RPC with profile: " << profile->name << "\n";
    return core::Response::ok(out.str());
}

core::Response CommandDispatcher::disconnect(std::ostringstream& out) {
    supervisor_.disconnect();
    out << "Disconnected from Discord RPC\n";
    return core::Response::ok(out.str());
}

core::Response CommandDispatcher::quit(std::ostringstream& out) {
    out << "Quitting application...\n";
    if (onQuit_) {
        onQuit_();
    }
    return core::Response::ok(out.str());
}

core::Response CommandDispatcher::loadProfile(const core::Command& command,
                                              std::ostringstream& out) {
    if (!command.profile || command.profile->empty()) {
        return core::Response::failure("No profile name given");
    }

    const auto& name = *command.profile;
    auto profile = profiles_.load(name);
    if (!profile) {
        out << "Profile '" << name << "' not found\n";
        return core::Response::ok(out.str());
    }

    rememberProfile(profile->name);
    out << "Loaded profile '" << profile->name << "'\n";
    return core::Response::ok(out.str());
}

void CommandDispatcher::rememberProfile(const std::string& name) {
    if (config_.config().lastProfile == name) {
        return;
    }
    config_.config().lastProfile = name;
    if (!config_.save()) {
        spdlog::warn("Could not persist last profile '{}'", name);
    }
}

} // namespace customrpc::app
