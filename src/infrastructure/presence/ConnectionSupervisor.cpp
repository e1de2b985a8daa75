#include "infrastructure/presence/ConnectionSupervisor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace customrpc::infra {

namespace {

core::ConnectOutcome outcomeFor(core::PresenceErrorKind kind) {
    switch (kind) {
    case core::PresenceErrorKind::InvalidId:
        return core::ConnectOutcome::InvalidId;
    case core::PresenceErrorKind::Unreachable:
        return core::ConnectOutcome::Unreachable;
    case core::PresenceErrorKind::Generic:
        break;
    }
    return core::ConnectOutcome::Failed;
}

} // namespace

ConnectionSupervisor::ConnectionSupervisor(AsioContext& context,
                                           core::PresenceClientFactory factory,
                                           std::chrono::milliseconds livenessInterval)
    : context_(context), factory_(std::move(factory)), livenessInterval_(livenessInterval),
      timer_(context.getContext()), alive_(std::make_shared<int>(0)) {
    if (context_.threadCount() != 1) {
        throw std::invalid_argument("ConnectionSupervisor needs a single-threaded context, got " +
                                    std::to_string(context_.threadCount()) + " workers");
    }
}

ConnectionSupervisor::~ConnectionSupervisor() {
    {
        std::lock_guard lock(mutex_);
        teardownLocked();
        alive_.reset();
    }

    // A tick that passed its liveness check may still be waiting for the lock
    context_.drain();
}

core::ConnectOutcome ConnectionSupervisor::connect(const std::string& serviceId) {
    Transitions transitions;
    core::ConnectOutcome outcome;
    {
        std::lock_guard lock(mutex_);
        if (state_ == core::ConnectionState::Connected && serviceId_ == serviceId) {
            return core::ConnectOutcome::Connected;
        }

        teardownLocked();
        serviceId_.clear();

        spdlog::info("Connecting to presence service with application {}", serviceId);
        outcome = openClientLocked(serviceId, transitions);
        if (outcome == core::ConnectOutcome::Connected) {
            serviceId_ = serviceId;
            loopActive_ = true;
            scheduleTickLocked();
        } else {
            spdlog::error("Connection failed ({}): {}", core::connectOutcomeToString(outcome),
                          lastError_);
            setStateLocked(core::ConnectionState::Error, transitions);
        }
    }
    notify(transitions);
    return outcome;
}

bool ConnectionSupervisor::publish(const core::PresencePayload& payload) {
    Transitions transitions;
    bool published = false;
    {
        std::lock_guard lock(mutex_);
        if (state_ != core::ConnectionState::Connected || !client_) {
            lastError_ = "Not connected to the presence service";
            spdlog::warn("Cannot publish presence: not connected");
            return false;
        }

        try {
            client_->update(payload);
            lastPayload_ = payload;
            published = true;
            spdlog::debug("Presence published");
        } catch (const core::PresenceError& e) {
            handlePresenceFailureLocked(e, "Publishing presence", transitions);
        } catch (const std::exception& e) {
            handlePresenceFailureLocked(
                core::PresenceError(core::PresenceErrorKind::Generic, e.what()),
                "Publishing presence", transitions);
        }
    }
    notify(transitions);
    return published;
}

bool ConnectionSupervisor::clear() {
    Transitions transitions;
    bool cleared = false;
    {
        std::lock_guard lock(mutex_);
        if (state_ != core::ConnectionState::Connected || !client_) {
            lastError_ = "Not connected to the presence service";
            return false;
        }

        try {
            client_->clear();
            lastPayload_.reset();
            cleared = true;
            spdlog::debug("Presence cleared");
        } catch (const core::PresenceError& e) {
            handlePresenceFailureLocked(e, "Clearing presence", transitions);
        } catch (const std::exception& e) {
            handlePresenceFailureLocked(
                core::PresenceError(core::PresenceErrorKind::Generic, e.what()),
                "Clearing presence", transitions);
        }
    }
    notify(transitions);
    return cleared;
}

void ConnectionSupervisor::disconnect() {
    Transitions transitions;
    {
        std::lock_guard lock(mutex_);
        bool wasActive = state_ != core::ConnectionState::Disconnected || client_ || loopActive_;
        teardownLocked();
        serviceId_.clear();
        lastError_.clear();
        setStateLocked(core::ConnectionState::Disconnected, transitions);
        if (wasActive) {
            spdlog::info("Disconnected from presence service");
        }
    }
    notify(transitions);
}

void ConnectionSupervisor::checkLiveness() {
    Transitions transitions;
    {
        std::lock_guard lock(mutex_);
        if (!loopActive_) {
            return;
        }
        livenessTickLocked(transitions);
    }
    notify(transitions);
}

core::ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool ConnectionSupervisor::isConnected() const {
    std::lock_guard lock(mutex_);
    return state_ == core::ConnectionState::Connected;
}

std::string ConnectionSupervisor::serviceId() const {
    std::lock_guard lock(mutex_);
    return serviceId_;
}

std::optional<core::PresencePayload> ConnectionSupervisor::lastPayload() const {
    std::lock_guard lock(mutex_);
    return lastPayload_;
}

std::string ConnectionSupervisor::lastError() const {
    std::lock_guard lock(mutex_);
    return lastError_;
}

void ConnectionSupervisor::setStateListener(StateListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

core::ConnectOutcome ConnectionSupervisor::openClientLocked(const std::string& serviceId,
                                                            Transitions& transitions) {
    setStateLocked(core::ConnectionState::Connecting, transitions);

    auto client = factory_ ? factory_() : nullptr;
    if (!client) {
        lastError_ = "No presence client available";
        return core::ConnectOutcome::Failed;
    }

    try {
        client->connect(serviceId);
    } catch (const core::PresenceError& e) {
        client->close();
        lastError_ = e.what();
        return outcomeFor(e.kind());
    } catch (const std::exception& e) {
        client->close();
        lastError_ = e.what();
        return core::ConnectOutcome::Failed;
    }

    client_ = std::move(client);
    lastError_.clear();
    setStateLocked(core::ConnectionState::Connected, transitions);
    return core::ConnectOutcome::Connected;
}

void ConnectionSupervisor::closeClientLocked() {
    if (client_) {
        client_->close();
        client_.reset();
    }
}

void ConnectionSupervisor::teardownLocked() {
    ++generation_;
    loopActive_ = false;
    timer_.cancel();
    closeClientLocked();
    lastPayload_.reset();
}

void ConnectionSupervisor::setStateLocked(core::ConnectionState state, Transitions& transitions) {
    if (state_ == state) {
        return;
    }
    spdlog::debug("Connection state {} -> {}", core::connectionStateToString(state_),
                  core::connectionStateToString(state));
    state_ = state;
    transitions.push_back(state);
}

void ConnectionSupervisor::handlePresenceFailureLocked(const core::PresenceError& error,
                                                       const char* operation,
                                                       Transitions& transitions) {
    lastError_ = error.what();
    spdlog::error("{} failed: {}", operation, lastError_);

    if (error.kind() == core::PresenceErrorKind::Unreachable) {
        // The liveness loop reconnects on its next tick
        closeClientLocked();
        setStateLocked(core::ConnectionState::Disconnected, transitions);
        return;
    }
    setStateLocked(core::ConnectionState::Error, transitions);
}

void ConnectionSupervisor::recoverLocked(Transitions& transitions) {
    spdlog::info("Reconnecting to presence service with application {}", serviceId_);

    auto outcome = openClientLocked(serviceId_, transitions);
    if (outcome == core::ConnectOutcome::Connected) {
        if (lastPayload_) {
            try {
                client_->update(*lastPayload_);
            } catch (const std::exception& e) {
                lastError_ = e.what();
                spdlog::warn("Republishing presence after reconnect failed: {}", lastError_);
                closeClientLocked();
                setStateLocked(core::ConnectionState::Disconnected, transitions);
                return;
            }
        }
        spdlog::info("Reconnected to presence service");
        return;
    }

    if (outcome == core::ConnectOutcome::InvalidId) {
        spdlog::error("Application id {} rejected during reconnect: {}", serviceId_, lastError_);
        lastPayload_.reset();
        loopActive_ = false;
        setStateLocked(core::ConnectionState::Error, transitions);
        return;
    }

    spdlog::warn("Reconnect failed ({}), retrying in {} ms", lastError_,
                 livenessInterval_.count());
    setStateLocked(core::ConnectionState::Disconnected, transitions);
}

void ConnectionSupervisor::livenessTickLocked(Transitions& transitions) {
    if (state_ == core::ConnectionState::Disconnected) {
        recoverLocked(transitions);
        return;
    }

    if (state_ == core::ConnectionState::Error && !serviceId_.empty()) {
        // Retried with a fresh client
        spdlog::info("Retrying presence connection after error: {}", lastError_);
        closeClientLocked();
        recoverLocked(transitions);
        return;
    }

    if (state_ != core::ConnectionState::Connected || !client_ || !lastPayload_) {
        return;
    }

    try {
        client_->update(*lastPayload_);
        spdlog::debug("Liveness probe succeeded");
        return;
    } catch (const std::exception& e) {
        lastError_ = e.what();
        spdlog::warn("Liveness probe failed: {}", lastError_);
    }

    closeClientLocked();
    setStateLocked(core::ConnectionState::Disconnected, transitions);
    recoverLocked(transitions);
}

void ConnectionSupervisor::scheduleTickLocked() {
    timer_.expires_after(livenessInterval_);
    timer_.async_wait([this, alive = std::weak_ptr<int>(alive_),
                       generation = generation_](const asio::error_code& ec) {
        if (ec || alive.expired()) {
            return;
        }
        onTimer(generation);
    });
}

void ConnectionSupervisor::onTimer(uint64_t generation) {
    Transitions transitions;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_ || !loopActive_) {
            return;
        }
        livenessTickLocked(transitions);
        if (loopActive_ && generation == generation_) {
            scheduleTickLocked();
        }
    }
    notify(transitions);
}

void ConnectionSupervisor::notify(const Transitions& transitions) {
    if (transitions.empty()) {
        return;
    }

    StateListener listener;
    {
        std::lock_guard lock(mutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }
    for (auto state : transitions) {
        listener(state);
    }
}

} // namespace customrpc::infra
