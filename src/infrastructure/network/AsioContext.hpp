#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace customrpc::infra {

/**
 * @brief Background execution context for timers and signal handling.
 *
 * Wraps an asio::io_context driven by a small set of worker threads. The
 * agent runs one of these with a single thread so that the liveness timer
 * and the signal watcher never run concurrently with each other.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param name Name used in log messages.
     * @param threadCount Number of worker threads (at least one).
     */
    explicit AsioContext(std::string name = "background", size_t threadCount = 1);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the io_context and joins the workers.
     *
     * Pending handlers are abandoned; the context can be started again.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    size_t threadCount() const { return threadCount_; }

    /**
     * @brief Checks whether the caller is one of this context's workers.
     */
    bool runningInThisThread();

    /**
     * @brief Waits until every handler queued before this call has run.
     *
     * Returns at once when the context is stopped or when called from a
     * worker, where waiting would deadlock. With more than one worker a
     * handler queued earlier may still be running on another thread.
     */
    void drain();

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on a worker thread.
     * @tparam Handler Callable type.
     * @param handler The handler to execute.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void workerLoop(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace customrpc::infra
