/**
 * @file thread_pool.hpp
 * @brief Bounded worker pool used to convert independent files in parallel.
 */

#ifndef QSHIFT_THREAD_POOL_HPP
#define QSHIFT_THREAD_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace qshift {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * @details Each task receives the std::stop_token of the worker that runs
 * it. That token is only signalled when the pool is destroyed; cancelling a
 * batch is the caller's job, through a stop source of its own that the task
 * observes alongside the worker token (see ConversionExecutor::run).
 * Destruction stops accepting tasks, requests stop on every worker and joins
 * them; tasks still queued are dropped and their futures report
 * std::future_errc::broken_promise.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param threads Number of workers. Zero is treated as one.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task.
     *
     * @tparam F Callable taking a `std::stop_token`.
     * @param f The task to execute.
     * @return Future for the task result. Exceptions thrown by the task are
     *         stored in the future.
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto result = task->get_future();
        {
            std::lock_guard lock(mtx_);
            if (closed_) throw std::runtime_error("enqueue on a ThreadPool that is shutting down");
            queue_.emplace_back([task](std::stop_token st) { (*task)(std::move(st)); });
        }
        wake_.notify_one();
        return result;
    }

    /// @return Number of worker threads.
    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

private:
    using Task = std::function<void(std::stop_token)>;

    void work(const std::stop_token& st);
    std::optional<Task> next(const std::stop_token& st);

    std::mutex mtx_;                        ///< Protects queue_ and closed_
    std::condition_variable_any wake_;      ///< Signals new tasks or shutdown
    std::deque<Task> queue_;
    bool closed_{false};
    std::vector<std::jthread> workers_;     ///< Declared last: joined before the queue goes away
};

} // namespace qshift

#endif // QSHIFT_THREAD_POOL_HPP
