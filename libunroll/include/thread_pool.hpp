/**
 * @file thread_pool.hpp
 * @brief Fixed-size pool of std::jthread workers.
 *
 * Used by BatchExecutor to run independent ingestions side by side.
 */

#ifndef UNROLL_THREAD_POOL_HPP
#define UNROLL_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool with cooperative cancellation.
 *
 * @details Tasks receive the worker's std::stop_token. request_stop() drops
 * queued tasks (their futures report std::future_error broken_promise) and
 * signals running ones; the destructor joins every worker.
 */
class ThreadPool {
public:
    /**
     * @param threads Worker count; 0 means one worker.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a callable taking a std::stop_token.
     * @throws std::runtime_error if the pool was stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /// Blocks until the queue is empty and no task is running.
    void wait_idle();

    /// Discards queued tasks and asks running ones to stop.
    void request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;
    std::condition_variable_any condition_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::size_t pending_{0}; ///< Queued plus running
    std::vector<std::jthread> workers_;
};

#endif // UNROLL_THREAD_POOL_HPP
