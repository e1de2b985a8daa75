/**
 * @file IPresenceClient.hpp
 * @brief Interface for the external rich presence service connection.
 *
 * This file defines the abstract client used by the connection supervisor
 * and the error type it raises on failure.
 */

#pragma once

#include "core/types/PresencePayload.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace customrpc::core {

/**
 * @brief Failure categories reported by a presence client.
 */
enum class PresenceErrorKind : int {
    InvalidId = 0,   ///< The application id was rejected
    Unreachable = 1, ///< The service is not running or refused the connection
    Generic = 2      ///< Any other protocol or I/O failure
};

/**
 * @brief Error raised by IPresenceClient operations.
 */
class PresenceError : public std::runtime_error {
public:
    PresenceError(PresenceErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] PresenceErrorKind kind() const noexcept { return kind_; }

private:
    PresenceErrorKind kind_;
};

/**
 * @brief Connection to the rich presence service.
 *
 * Implementations are used from one thread at a time; the connection
 * supervisor serializes all calls.
 */
class IPresenceClient {
public:
    virtual ~IPresenceClient() = default;

    /**
     * @brief Opens the connection and performs the handshake.
     * @param serviceId Application id presented during the handshake.
     * @throws PresenceError on failure.
     */
    virtual void connect(const std::string& serviceId) = 0;

    /**
     * @brief Publishes a presence.
     * @param payload The presence to show; serialized via toActivityJson().
     * @throws PresenceError on failure.
     */
    virtual void update(const PresencePayload& payload) = 0;

    /**
     * @brief Removes the currently shown presence.
     * @throws PresenceError on failure.
     */
    virtual void clear() = 0;

    /**
     * @brief Closes the connection. Never throws; safe to call repeatedly.
     */
    virtual void close() noexcept = 0;
};

/**
 * @brief Creates a fresh, unconnected client for each connect attempt.
 */
using PresenceClientFactory = std::function<std::unique_ptr<IPresenceClient>()>;

} // namespace customrpc::core
