// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.hpp
/// @brief Worker threads that run side effects off the ingestion path.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/core/NonCopyable.hpp>
#include <spc/core/Types.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace spc::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadPool
/// @brief FIFO task queue served by a fixed set of threads.
///
/// The alert dispatcher runs one worker so deliveries keep their posting
/// order.  After @ref shutdown, submissions are refused: @ref enqueue
/// returns an invalid future and @ref enqueueDetached returns false.
/// Tasks already queued still run before the workers exit.
// /////////////////////////////////////////////////////////////////////////////
class ThreadPool final : public core::NonCopyable<ThreadPool>
{
public:
    /// @param threadCount Worker count; 0 picks the hardware concurrency.
    explicit ThreadPool(core::u32 threadCount = 0);
    ~ThreadPool();

    // --------------------------------------------------------------------- //
    //  Submission                                                            //
    // --------------------------------------------------------------------- //

    /// @brief Queue @p func with @p args bound; the future carries its result.
    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F&& func, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /// @return false once the pool is stopping.
    template <typename F>
    bool enqueueDetached(F&& func);

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Refuse new tasks, run the queued ones, join the workers.
    void shutdown();

    [[nodiscard]] bool isStopping() const;
    [[nodiscard]] core::u32 threadCount() const noexcept;
    [[nodiscard]] core::usize pendingTasks() const;

private:
    bool push(std::function<void()> task);
    void run();

    std::vector<std::thread>          threads_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex                mutex_;
    std::condition_variable           wake_;
    bool                              stopping_{false};
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& func, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using Result = std::invoke_result_t<F, Args...>;

    auto job = std::make_shared<std::packaged_task<Result()>>(
        [fn = std::forward<F>(func), ... bound = std::forward<Args>(args)]() mutable {
            return std::invoke(fn, bound...);
        });

    auto future = job->get_future();
    if (!push([job] { (*job)(); }))
        return {};
    return future;
}

template <typename F>
bool ThreadPool::enqueueDetached(F&& func)
{
    return push(std::function<void()>(std::forward<F>(func)));
}

} // namespace spc::concurrency
