#ifndef SUDOKU_THREAD_POOL_H
#define SUDOKU_THREAD_POOL_H

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include <condition_variable>

namespace sudoku
{

/// A very simple thread pool. Every solver is private to the task that
/// owns it, so puzzles are solved side by side without sharing state.
class thread_pool
{
public:
    /// [size] of 0 picks the hardware concurrency.
    explicit thread_pool(std::size_t size);
    ~thread_pool();

    std::size_t size() const { return workers_.size(); }

    /// Add a single task to the pool.
    template<
        typename F,
        typename ...Args,
        typename ret_type = typename std::result_of<F(Args...)>::type
    >
    std::future<ret_type> add_task(F&& f, Args&&... args)
    {
        // Turn [ret_type F(Args...)] into [ret_type F2()] and wrap it into
        // a shared ptr.
        auto task = std::make_shared<std::packaged_task<ret_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ret_type> p = task->get_future();
        {
            std::unique_lock<std::mutex> lock(m_);

            if (done_)
                throw std::runtime_error("added task to stopped pool");

            tasks_.emplace([task]{ (*task)(); });
        }

        condition_.notify_one();
        return p;
    }

private:
    void run();

    bool done_;

    /// Workers themselves.
    std::vector<std::thread> workers_;

    /// Task queue.
    std::queue<std::function<void()>> tasks_;

    /// Synchronization primitives.
    std::mutex m_;
    std::condition_variable condition_;
};

}   // namespace sudoku
#endif
