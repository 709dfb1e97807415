// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.cpp
/// @brief ThreadPool implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/concurrency/ThreadPool.hpp>

#include <algorithm>

namespace spc::concurrency {

ThreadPool::ThreadPool(core::u32 threadCount)
{
    // hardware_concurrency() reports 0 when it cannot tell.
    const core::u32 count = threadCount != 0
        ? threadCount
        : std::max(1u, std::thread::hardware_concurrency());

    threads_.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        threads_.emplace_back([this] { run(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_)
        {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();

    for (auto& thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

bool ThreadPool::isStopping() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return stopping_;
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(threads_.size());
}

core::usize ThreadPool::pendingTasks() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return queue_.size();
}

bool ThreadPool::push(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_)
        {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    wake_.notify_one();
    return true;
}

void ThreadPool::run()
{
    std::unique_lock<std::mutex> lock{mutex_};
    for (;;)
    {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return;
        }

        auto task = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        task();
        lock.lock();
    }
}

} // namespace spc::concurrency
