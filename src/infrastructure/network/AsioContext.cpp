#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace customrpc::infra {

AsioContext::AsioContext(std::string name, size_t threadCount)
    : name_(std::move(name)), threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
    spdlog::debug("Context '{}' started with {} worker(s)", name_, threadCount_);
}

void AsioContext::workerLoop(size_t index) {
    while (true) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            // Keep serving the remaining handlers
            spdlog::error("Context '{}' worker {}: handler failed: {}", name_, index, e.what());
        }
    }
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("Context '{}' stopped", name_);
}

bool AsioContext::runningInThisThread() {
    return ioContext_.get_executor().running_in_this_thread();
}

void AsioContext::drain() {
    if (!isRunning() || runningInThisThread()) {
        return;
    }

    std::promise<void> drained;
    auto done = drained.get_future();
    post([&drained] { drained.set_value(); });
    done.wait();
}

} // namespace customrpc::infra
