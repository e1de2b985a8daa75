#pragma once

#include "core/services/IPresenceClient.hpp"
#include "core/types/ConnectionState.hpp"
#include "core/types/PresencePayload.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace customrpc::infra {

/**
 * @brief Owns the presence service connection and keeps it alive.
 *
 * All state transitions happen under one mutex, both from callers on the host
 * thread and from the liveness timer running on the background AsioContext.
 *
 * While connected, a liveness timer re-publishes the last known payload every
 * interval. When that probe fails the supervisor drops to Disconnected,
 * reconnects once with the remembered application id and republishes the
 * payload. A failed reconnect leaves it Disconnected and is retried on the
 * following ticks; a rejected application id ends recovery. An update the
 * service rejected leaves it in Error until the next tick reconnects.
 *
 * @note This class is non-copyable.
 */
class ConnectionSupervisor {
public:
    using StateListener = std::function<void(core::ConnectionState)>;

    static constexpr std::chrono::milliseconds DefaultLivenessInterval{10000};

    /**
     * @brief Constructs a disconnected supervisor.
     * @param context Background context running the liveness timer. It must
     *        have exactly one worker thread, which the destructor relies on
     *        to drain a tick still in flight.
     * @param factory Creates a fresh client for every connect attempt.
     * @param livenessInterval Time between liveness probes.
     * @throws std::invalid_argument if the context has more than one worker.
     */
    ConnectionSupervisor(AsioContext& context, core::PresenceClientFactory factory,
                         std::chrono::milliseconds livenessInterval = DefaultLivenessInterval);

    /**
     * @brief Destructor. Disconnects and waits for a running liveness tick.
     */
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Connects to the presence service with the given application id.
     *
     * Returns immediately if already connected with the same id. Otherwise any
     * existing connection is torn down and its payload forgotten. No retry is
     * made on failure; the state becomes Error.
     *
     * @param serviceId Application id used for the handshake.
     * @return The outcome of the attempt.
     */
    core::ConnectOutcome connect(const std::string& serviceId);

    /**
     * @brief Publishes a presence. Requires the Connected state.
     * @return True if the service accepted the payload, which then becomes
     *         the last known payload.
     */
    bool publish(const core::PresencePayload& payload);

    /**
     * @brief Clears the shown presence and forgets the last known payload.
     * @return True on success; false when not connected or the call failed.
     */
    bool clear();

    /**
     * @brief Stops the liveness loop and closes the connection. Idempotent.
     */
    void disconnect();

    /**
     * @brief Runs one liveness check immediately on the calling thread.
     */
    void checkLiveness();

    core::ConnectionState state() const;
    bool isConnected() const;
    std::string serviceId() const;
    std::optional<core::PresencePayload> lastPayload() const;
    std::string lastError() const;

    /**
     * @brief Sets a callback invoked after every state change.
     *
     * The callback runs outside the supervisor lock, either on the caller's
     * thread or on the background context.
     */
    void setStateListener(StateListener listener);

    std::chrono::milliseconds livenessInterval() const { return livenessInterval_; }

private:
    using Transitions = std::vector<core::ConnectionState>;

    core::ConnectOutcome openClientLocked(const std::string& serviceId, Transitions& transitions);
    void closeClientLocked();
    void teardownLocked();
    void setStateLocked(core::ConnectionState state, Transitions& transitions);
    void handlePresenceFailureLocked(const core::PresenceError& error, const char* operation,
                                     Transitions& transitions);
    void recoverLocked(Transitions& transitions);
    void livenessTickLocked(Transitions& transitions);
    void scheduleTickLocked();
    void onTimer(uint64_t generation);
    void notify(const Transitions& transitions);

    AsioContext& context_;
    core::PresenceClientFactory factory_;
    std::chrono::milliseconds livenessInterval_;

    mutable std::mutex mutex_;
    asio::steady_timer timer_;
    std::unique_ptr<core::IPresenceClient> client_;
    core::ConnectionState state_{core::ConnectionState::Disconnected};
    std::string serviceId_;
    std::optional<core::PresencePayload> lastPayload_;
    std::string lastError_;
    uint64_t generation_{0};
    bool loopActive_{false};
    StateListener listener_;
    std::shared_ptr<int> alive_;
};

} // namespace customrpc::infra
