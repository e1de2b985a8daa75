#include "app/InstanceRouter.hpp"

#include "infrastructure/ipc/CommandClient.hpp"

#include <spdlog/spdlog.h>

namespace customrpc::app {

InstanceRouter::InstanceRouter(infra::InstanceLock& lock, infra::CommandServer& server,
                               std::chrono::milliseconds forwardTimeout, std::ostream& out,
                               std::ostream& err)
    : lock_(lock), server_(server), forwardTimeout_(forwardTimeout), out_(out), err_(err) {}

InstanceRouter::~InstanceRouter() {
    shutdown();
}

RouteResult InstanceRouter::start(const CliOptions& cli,
                                  infra::CommandServer::CommandHandler handler,
                                  uint16_t preferredPort) {
    if (!lock_.acquire()) {
        return forward(cli);
    }

    server_.setHandler(std::move(handler));
    uint16_t port = 0;
    try {
        port = server_.start(preferredPort);
    } catch (const std::exception& e) {
        spdlog::critical("Cannot start command server: {}", e.what());
        lock_.release();
        throw;
    }

    if (!lock_.writeOwnerPort(port)) {
        spdlog::warn("Command port {} could not be announced; other invocations cannot "
                     "reach this instance",
                     port);
    }

    owner_ = true;
    spdlog::info("Running as primary instance, command server on port {}", port);
    return {RouteDecision::Owner, 0};
}

RouteResult InstanceRouter::forward(const CliOptions& cli) {
    auto command = cli.toCommand();
    if (!command) {
        out_ << "CustomRPC is already running.\n";
        return {RouteDecision::Forwarded, 0};
    }

    auto port = lock_.readOwnerPort();
    if (!port) {
        err_ << "Cannot reach running instance\n";
        return {RouteDecision::Forwarded, 1};
    }

    spdlog::debug("Forwarding {} to running instance on port {}", command->actionToString(),
                  *port);
    auto response = infra::CommandClient::send(*port, *command, forwardTimeout_);
    return {RouteDecision::Forwarded, report(response, out_, err_)};
}

std::optional<core::Command> InstanceRouter::pollCommands() {
    if (!owner_ || !server_.isRunning()) {
        return std::nullopt;
    }
    return server_.acceptOne();
}

void InstanceRouter::shutdown() {
    if (!owner_) {
        return;
    }
    owner_ = false;
    server_.stop();
    lock_.release();
}

int InstanceRouter::report(const core::Response& response, std::ostream& out,
                           std::ostream& err) {
    if (response.output) {
        out << *response.output;
        out.flush();
    }
    if (!response.success) {
        err << "Error: " << response.error << "\n";
        return 1;
    }
    return 0;
}

} // namespace customrpc::app
