#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Manages an Asio I/O context served by a fixed pool of worker threads.
 *
 * Handlers posted to the context run on at most threadCount() threads at a
 * time. A work guard keeps the threads alive until join() or stop() is called.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the I/O context and worker threads.
     *
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Waits until every posted handler has run, then joins the workers.
     *
     * Releases the work guard so the worker threads return once the queue is
     * empty. Nothing is abandoned.
     */
    void join();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Handlers still queued are discarded.
     */
    void stop();

    /**
     * @brief Returns the number of worker threads.
     */
    size_t threadCount() const { return threadCount_; }

    /**
     * @brief Checks whether the worker threads are running.
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Posts a handler to be executed asynchronously.
     * @tparam Handler Callable type (function, lambda, etc.).
     * @param handler The handler to execute on the worker pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void joinThreads();

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace portprobe::infra
