#pragma once

#include "core/types/Command.hpp"
#include "core/types/Response.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace customrpc::infra {

/**
 * @brief Loopback listener that serves one command per connection.
 *
 * The server never blocks waiting for a client: acceptOne() performs a single
 * non-blocking accept, so the host event loop calls it only when the
 * listening socket reports readability. An accepted connection is read,
 * decoded, handed to the registered handler, answered and closed before
 * acceptOne() returns. All socket I/O on an accepted connection is bounded by
 * the I/O timeout.
 *
 * @note Not thread-safe; all calls must come from the host thread.
 */
class CommandServer {
public:
    /**
     * @brief Handler invoked for every successfully decoded command.
     */
    using CommandHandler = std::function<core::Response(const core::Command&)>;

    /**
     * @brief Constructs a stopped server.
     * @param ioTimeout Bound on reading the request and writing the response.
     */
    explicit CommandServer(std::chrono::milliseconds ioTimeout = std::chrono::seconds(2));

    /**
     * @brief Destructor. Stops the server if running.
     */
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    /**
     * @brief Binds the listener on 127.0.0.1.
     *
     * If the preferred port cannot be bound an ephemeral port is used instead.
     *
     * @param preferredPort Port to bind, 0 for an OS-assigned ephemeral port.
     * @return The port actually bound; the caller persists it for clients.
     * @throws std::runtime_error if no loopback port can be bound.
     */
    uint16_t start(uint16_t preferredPort = 0);

    /**
     * @brief Serves at most one pending connection.
     *
     * Returns immediately when no connection is pending. Malformed requests
     * are answered with a failure response and yield nullopt.
     *
     * @return The command that was served, or nullopt.
     */
    std::optional<core::Command> acceptOne();

    /**
     * @brief Closes the listener. Safe to call multiple times.
     */
    void stop();

    bool isRunning() const { return acceptor_ && acceptor_->is_open(); }

    uint16_t port() const { return port_; }

    /**
     * @brief Returns the listening socket descriptor for readiness notification.
     * @return The descriptor, or -1 when the server is not running.
     */
    intptr_t nativeHandle();

    /**
     * @brief Registers the command handler.
     *
     * Without a handler every decoded command is answered with the legacy
     * "OK" acknowledgment.
     */
    void setHandler(CommandHandler handler) { handler_ = std::move(handler); }

private:
    bool bindAndListen(uint16_t port);
    std::string buildReply(const std::string& request, std::optional<core::Command>& served);

    asio::io_context io_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    CommandHandler handler_;
    std::chrono::milliseconds ioTimeout_;
    uint16_t port_{0};
};

} // namespace customrpc::infra
