#include "app/CancellationToken.hpp"

#include <vector>

namespace customrpc::app {

void CancellationToken::cancel() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        for (auto& [id, callback] : callbacks_) {
            callbacks.push_back(std::move(callback));
        }
        callbacks_.clear();
    }

    for (auto& callback : callbacks) {
        callback();
    }
}

CancellationToken::SubscriptionId CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled_.load()) {
            auto id = nextId_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    callbacks_.erase(id);
}

} // namespace customrpc::app
