#include <algorithm>
#include "thread_pool.h"

namespace sudoku
{

thread_pool::thread_pool(std::size_t size)
    : done_(false)
{
    if (size == 0)
        size = std::max(1u, std::thread::hardware_concurrency());

    for (std::size_t i = 0; i < size; i++)
        workers_.emplace_back([this] { run(); });
}

thread_pool::~thread_pool()
{
    {
        std::unique_lock<std::mutex> lock(m_);
        done_ = true;
    }

    // Reap child threads.
    condition_.notify_all();
    for (auto &t : workers_)
        t.join();
}

void thread_pool::run()
{
    for (;;)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_);
            condition_.wait(
                lock,
                [this]{ return !tasks_.empty() || done_; }
            );

            // Queued tasks are drained before the worker exits.
            if (done_ && tasks_.empty())
                return;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

}   // namespace sudoku
