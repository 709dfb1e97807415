// /////////////////////////////////////////////////////////////////////////////
/// @file AlertDispatcher.cpp
/// @brief AlertDispatcher implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/alert/AlertDispatcher.hpp>
#include <spc/core/Log.hpp>

#include <exception>
#include <format>

namespace spc::alert {

namespace {

constexpr core::usize indexOf(Domain domain) noexcept
{
    return static_cast<core::usize>(domain);
}

} // namespace

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

AlertDispatcher::AlertDispatcher(IAlertSink &sink, bool useWorker)
    : sink_{sink}
{
    if (useWorker)
    {
        worker_ = std::make_unique<concurrency::ThreadPool>(1);
    }
}

AlertDispatcher::~AlertDispatcher()
{
    if (worker_)
    {
        worker_->shutdown();
    }
    drain();
}

// -------------------------------------------------------------------------- //
//  Public API                                                                //
// -------------------------------------------------------------------------- //

core::ExpectedVoid AlertDispatcher::post(const Alert &alert)
{
    const core::usize idx = indexOf(alert.domain);
    if (idx >= kDomainCount)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "alert domain out of range");
    }

    {
        std::lock_guard<std::mutex> lock{producerMutexes_[idx]};
        if (!queues_[idx].tryPush(alert))
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            core::Log::error("ALERT", std::format(
                "{} queue full, dropping '{}' alert", domainName(alert.domain), alert.level));
            return core::makeError(core::ErrorCode::kQueueFull,
                std::format("{} alert queue is full", domainName(alert.domain)));
        }
    }

    if (!worker_ || !worker_->enqueueDetached([this] { drain(); }))
    {
        drain();
    }
    return {};
}

void AlertDispatcher::flush()
{
    if (worker_)
    {
        auto done = worker_->enqueue([this] { drain(); });
        if (done.valid())
        {
            done.get();
            return;
        }
    }
    drain();
}

core::u64 AlertDispatcher::deliveredCount() const noexcept
{
    return delivered_.load(std::memory_order_relaxed);
}

core::u64 AlertDispatcher::droppedCount() const noexcept
{
    return dropped_.load(std::memory_order_relaxed);
}

core::u64 AlertDispatcher::failedCount() const noexcept
{
    return failed_.load(std::memory_order_relaxed);
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void AlertDispatcher::drain()
{
    std::lock_guard<std::mutex> lock{consumerMutex_};

    for (auto &queue : queues_)
    {
        queue.consumeAll([this](const Alert &alert) {
            try
            {
                sink_.notify(alert);
                delivered_.fetch_add(1, std::memory_order_relaxed);
            }
            catch (const std::exception &e)
            {
                failed_.fetch_add(1, std::memory_order_relaxed);
                core::Log::error("ALERT", std::format(
                    "sink rejected {} alert: {}", domainName(alert.domain), e.what()));
            }
        });
    }
}

} // namespace spc::alert
