#pragma once

#include "app/CliOptions.hpp"
#include "core/types/Response.hpp"
#include "infrastructure/instance/InstanceLock.hpp"
#include "infrastructure/ipc/CommandServer.hpp"

#include <chrono>
#include <iostream>
#include <optional>

namespace customrpc::app {

enum class RouteDecision : int {
    Owner = 0,    ///< This process owns the lock and serves commands
    Forwarded = 1 ///< Another process owns the lock; this one is done
};

struct RouteResult {
    RouteDecision decision{RouteDecision::Forwarded};
    int exitCode{0}; ///< Process exit status when forwarded
};

/**
 * @brief Decides whether this process becomes the agent or forwards to it.
 *
 * The owner starts the command server and announces its port; any other
 * invocation sends its command line intent to the owner and reports the
 * response.
 */
class InstanceRouter {
public:
    /**
     * @param lock Single-instance lock shared by all invocations.
     * @param server Command server started when this process becomes the owner.
     * @param forwardTimeout Bound on one forwarded command.
     * @param out Stream receiving command output.
     * @param err Stream receiving errors.
     */
    InstanceRouter(infra::InstanceLock& lock, infra::CommandServer& server,
                   std::chrono::milliseconds forwardTimeout, std::ostream& out = std::cout,
                   std::ostream& err = std::cerr);

    ~InstanceRouter();

    InstanceRouter(const InstanceRouter&) = delete;
    InstanceRouter& operator=(const InstanceRouter&) = delete;

    /**
     * @brief Acquires the lock or forwards the command line intent.
     *
     * As owner, registers @p handler, starts the server on @p preferredPort
     * (falling back to an ephemeral port) and persists the bound port.
     *
     * @throws std::runtime_error if the owner cannot bind the command server;
     *         the lock is released first.
     */
    RouteResult start(const CliOptions& cli, infra::CommandServer::CommandHandler handler,
                      uint16_t preferredPort = 0);

    /**
     * @brief Serves one pending command connection, if any.
     */
    std::optional<core::Command> pollCommands();

    /**
     * @brief Stops the server and releases the lock. Idempotent.
     */
    void shutdown();

    bool isOwner() const { return owner_; }

    /**
     * @brief Prints a response: output to @p out, error to @p err.
     * @return 0 on success, 1 on failure.
     */
    static int report(const core::Response& response, std::ostream& out, std::ostream& err);

private:
    RouteResult forward(const CliOptions& cli);

    infra::InstanceLock& lock_;
    infra::CommandServer& server_;
    std::chrono::milliseconds forwardTimeout_;
    std::ostream& out_;
    std::ostream& err_;
    bool owner_{false};
};

} // namespace customrpc::app
