#ifndef PIIREDACTOR_UTIL_THREAD_POOL_HPP
#define PIIREDACTOR_UTIL_THREAD_POOL_HPP

#include <deque>
#include <vector>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <tuple>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

/**
 * @file thread_pool.hpp
 * @brief Fixed set of workers draining a FIFO of tasks. The pipeline uses one per
 *        session to anonymize independent paragraphs; the job service keeps one
 *        for its whole lifetime.
 *
 *  @code
 *    piiredactor::util::ThreadPool pool(4);
 *    auto digest = pool.enqueue([](const std::string &p) { return hashing::sha256(p); },
 *                               paragraph);
 *    std::string hex = digest.get();
 *  @endcode
 */

namespace piiredactor {
namespace util {

class ThreadPool
{
public:
    // 0 means one worker per hardware thread.
    explicit ThreadPool(size_t threadCount = 0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    /// Runs every task already queued, then joins.
    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
        }
        wake_.notify_all();
        for (std::thread &w : workers_) {
            w.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    /// Tasks queued and not yet picked up by a worker.
    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    /**
     * @brief Queue f(args...). An exception thrown by f is rethrown from future::get().
     * @throw std::runtime_error once the pool is being destroyed.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using Result = std::invoke_result_t<F, Args...>;

        auto job = std::make_shared<std::packaged_task<Result()>>(
            [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(fn, bound);
            });
        std::future<Result> result = job->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_) {
                throw std::runtime_error("ThreadPool is shutting down");
            }
            tasks_.emplace_back([job]() { (*job)(); });
        }
        wake_.notify_one();
        return result;
    }

private:
    void workerLoop()
    {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return closing_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;   // closing and drained
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> tasks_;
    bool closing_ = false;
    std::vector<std::thread> workers_;   // last: threads start after the rest is built
};

} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_THREAD_POOL_HPP
