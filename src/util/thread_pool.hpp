#ifndef PIIGUARD_UTIL_THREAD_POOL_HPP
#define PIIGUARD_UTIL_THREAD_POOL_HPP

#include <vector>
#include <deque>
#include <future>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>
#include <algorithm>
#include <stdexcept>
#include <type_traits>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by BatchRunner to anonymize documents
 *        in parallel.
 *
 * Every submitted job comes back as a TaskHandle: the job's result, plus the
 * moment a worker picked the job up. Callers that enforce a time limit per
 * job measure it from that moment, so time spent waiting in the queue behind
 * slower jobs is not charged to the job itself.
 *
 * USAGE EXAMPLE:
 *  @code
 *    piiguard::util::ThreadPool pool(4);
 *    auto handle = pool.submit([text] { return text.size(); });
 *    auto deadline = handle.started.get() + std::chrono::milliseconds(50);
 *    if (handle.result.wait_until(deadline) == std::future_status::ready) {
 *        std::size_t n = handle.result.get();
 *    }
 *  @endcode
 */

namespace piiguard {
namespace util {

/**
 * @struct TaskHandle
 * @brief Result of ThreadPool::submit.
 *
 * started becomes ready when a worker dequeues the job, holding the
 * steady_clock time at that point. result holds the job's return value or
 * the exception it threw.
 */
template<typename R>
struct TaskHandle
{
    std::future<R> result;
    std::shared_future<std::chrono::steady_clock::time_point> started;
};

/**
 * @class ThreadPool
 * @brief Fixed number of workers draining a FIFO job queue.
 *
 * The destructor stops intake, lets the workers finish everything already
 * queued and joins them, so jobs whose handles were abandoned still run to
 * completion before the pool goes away.
 */
class ThreadPool
{
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param threadCount Number of worker threads to create. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { run(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        wake_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking no arguments.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    TaskHandle<typename std::invoke_result<F>::type> submit(F &&job)
    {
        using R = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
        auto startedAt = std::make_shared<std::promise<Clock::time_point>>();

        TaskHandle<R> handle;
        handle.result = task->get_future();
        handle.started = startedAt->get_future().share();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw std::runtime_error("ThreadPool: submit on a closed pool");
            }
            jobs_.emplace_back([task, startedAt] {
                startedAt->set_value(Clock::now());
                (*task)();
            });
        }
        wake_.notify_one();
        return handle;
    }

    size_t threadCount() const
    {
        return workers_.size();
    }

private:
    void run()
    {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool closed_ = false;
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_THREAD_POOL_HPP
