#pragma once

#include "app/CancellationToken.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>

namespace customrpc::app {

/**
 * @brief Turns SIGINT and SIGTERM into a cancellation of the shared token.
 *
 * Signals are delivered through asio on the background context; the handler
 * does nothing but cancel the token.
 */
class SignalWatcher {
public:
    SignalWatcher(infra::AsioContext& context, CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();
    void stop();

private:
    asio::signal_set signals_;
    CancellationToken& token_;
};

} // namespace customrpc::app
