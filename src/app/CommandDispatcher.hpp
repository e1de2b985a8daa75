#pragma once

#include "core/types/Command.hpp"
#include "core/types/Response.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/presence/ConnectionSupervisor.hpp"
#include "infrastructure/storage/ProfileStore.hpp"

#include <functional>
#include <sstream>

namespace customrpc::app {

/**
 * @brief Executes commands against the supervisor, the profiles and the config.
 *
 * Used as the command server handler in the owner process and for commands
 * given on the owner's own command line. Every command yields a Response;
 * exceptions become failures carrying the output produced so far.
 */
class CommandDispatcher {
public:
    /**
     * @brief Requests shutdown of the host loop.
     *
     * Called while the quit response is still unsent, so it must only queue
     * the shutdown.
     */
    using QuitCallback = std::function<void()>;

    CommandDispatcher(infra::ConnectionSupervisor& supervisor, infra::ProfileStore& profiles,
                      infra::ConfigManager& config, QuitCallback onQuit = {});

    core::Response dispatch(const core::Command& command);

    core::Response operator()(const core::Command& command) { return dispatch(command); }

private:
    core::Response listProfiles(std::ostringstream& out);
    core::Response connect(const core::Command& command, std::ostringstream& out);
    core::Response disconnect(std::ostringstream& out);
    core::Response quit(std::ostringstream& out);
    core::Response loadProfile(const core::Command& command, std::ostringstream& out);

    void rememberProfile(const std::string& name);

    infra::ConnectionSupervisor& supervisor_;
    infra::ProfileStore& profiles_;
    infra::ConfigManager& config_;
    QuitCallback onQuit_;
};

} // namespace customrpc::app
