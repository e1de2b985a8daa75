#include "app/SignalWatcher.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace customrpc::app {

SignalWatcher::SignalWatcher(infra::AsioContext& context, CancellationToken& token)
    : signals_(context.getContext(), SIGINT, SIGTERM), token_(token) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    signals_.async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        token_.cancel();
    });
}

void SignalWatcher::stop() {
    asio::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        spdlog::debug("Cancelling signal wait failed: {}", ec.message());
    }
}

} // namespace customrpc::app
