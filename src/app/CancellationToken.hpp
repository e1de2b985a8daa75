#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace customrpc::app {

/**
 * @brief Shared shutdown flag observed by every long-running part of the agent.
 *
 * cancel() is idempotent and may be called from any thread. Subscribers run
 * exactly once, on the thread that cancels; a subscriber added after
 * cancellation runs immediately.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using SubscriptionId = uint64_t;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Registers a callback run on cancellation.
     * @return Id for unsubscribe().
     */
    SubscriptionId subscribe(Callback callback);

    void unsubscribe(SubscriptionId id);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<SubscriptionId, Callback> callbacks_;
    SubscriptionId nextId_{1};
};

} // namespace customrpc::app
