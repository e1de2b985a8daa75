#pragma once

#include "core/services/IPresenceClient.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace customrpc::test {

/**
 * @brief Fresh temporary directory removed again on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("customrpc_" + name + "_" + uniqueSuffix())) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    static std::string uniqueSuffix() {
        static std::atomic<int> counter{0};
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return std::to_string(now) + "_" + std::to_string(counter++);
    }

    std::filesystem::path path_;
};

/**
 * @brief Shared state of the fake presence service seen by every fake client.
 */
struct FakePresenceService {
    std::mutex mutex;
    bool reachable{true};
    bool failUpdates{false};
    bool failClears{false};
    int dropNextUpdates{0};
    std::set<std::string> rejectedIds;
    int connectCount{0};
    int updateCount{0};
    int clearCount{0};
    int closeCount{0};
    std::string lastId;
    std::optional<core::PresencePayload> shown;

    void setReachable(bool value) {
        std::lock_guard lock(mutex);
        reachable = value;
    }

    void setFailUpdates(bool value) {
        std::lock_guard lock(mutex);
        failUpdates = value;
    }

    int updates() {
        std::lock_guard lock(mutex);
        return updateCount;
    }

    int connects() {
        std::lock_guard lock(mutex);
        return connectCount;
    }
};

class FakePresenceClient : public core::IPresenceClient {
public:
    explicit FakePresenceClient(std::shared_ptr<FakePresenceService> service)
        : service_(std::move(service)) {}

    void connect(const std::string& serviceId) override {
        std::lock_guard lock(service_->mutex);
        ++service_->connectCount;
        if (!service_->reachable) {
            throw core::PresenceError(core::PresenceErrorKind::Unreachable, "service not running");
        }
        if (service_->rejectedIds.count(serviceId) > 0) {
            throw core::PresenceError(core::PresenceErrorKind::InvalidId, "Invalid Client ID");
        }
        service_->lastId = serviceId;
        connected_ = true;
    }

    void update(const core::PresencePayload& payload) override {
        std::lock_guard lock(service_->mutex);
        if (!connected_ || !service_->reachable) {
            throw core::PresenceError(core::PresenceErrorKind::Unreachable, "connection lost");
        }
        if (service_->dropNextUpdates > 0) {
            --service_->dropNextUpdates;
            throw core::PresenceError(core::PresenceErrorKind::Unreachable, "pipe closed");
        }
        if (service_->failUpdates) {
            throw core::PresenceError(core::PresenceErrorKind::Generic, "update rejected");
        }
        ++service_->updateCount;
        service_->shown = payload;
    }

    void clear() override {
        std::lock_guard lock(service_->mutex);
        if (!connected_ || !service_->reachable) {
            throw core::PresenceError(core::PresenceErrorKind::Unreachable, "connection lost");
        }
        if (service_->failClears) {
            throw core::PresenceError(core::PresenceErrorKind::Generic, "clear rejected");
        }
        ++service_->clearCount;
        service_->shown.reset();
    }

    void close() noexcept override {
        std::lock_guard lock(service_->mutex);
        if (connected_) {
            ++service_->closeCount;
        }
        connected_ = false;
    }

private:
    std::shared_ptr<FakePresenceService> service_;
    bool connected_{false};
};

inline core::PresenceClientFactory fakeClientFactory(std::shared_ptr<FakePresenceService> service) {
    return [service]() { return std::make_unique<FakePresenceClient>(service); };
}

/**
 * @brief Polls a condition until it holds or the timeout passes.
 */
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace customrpc::test
