// /////////////////////////////////////////////////////////////////////////////
/// @file AlertDispatcher.hpp
/// @brief Decouples alert production from alert delivery.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/alert/Alert.hpp>
#include <spc/alert/IAlertSink.hpp>
#include <spc/alert/AlertQueue.hpp>
#include <spc/concurrency/ThreadPool.hpp>
#include <spc/core/Constants.hpp>
#include <spc/core/Expected.hpp>
#include <spc/core/NonCopyable.hpp>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>

namespace spc::alert {

// /////////////////////////////////////////////////////////////////////////////
/// @class AlertDispatcher
/// @brief Routes alerts to an IAlertSink off the ingestion path.
///
/// Each Domain owns a bounded SPSC queue.  @ref post pushes the alert
/// into its domain queue and schedules a drain on a single-worker
/// ThreadPool, so a slow sink never stalls signal ingestion.  Alerts of
/// one domain are delivered in posting order.
///
/// When constructed without a worker, @ref post delivers inline on the
/// caller's thread.
// /////////////////////////////////////////////////////////////////////////////
class AlertDispatcher final : public core::NonCopyable<AlertDispatcher>
{
public:
    using Queue = AlertQueue<core::kAlertQueueCapacity>;

    /// @param sink      Alerting collaborator (must outlive the dispatcher).
    /// @param useWorker Deliver on a background worker when true.
    explicit AlertDispatcher(IAlertSink &sink, bool useWorker = true);

    /// @brief Delivers every pending alert, then joins the worker.
    ~AlertDispatcher();

    /// @brief Queues @p alert for delivery.
    /// @return @c kQueueFull when the domain queue is saturated.  The
    ///         alert is dropped, never retried.
    [[nodiscard]] core::ExpectedVoid post(const Alert &alert);

    /// @brief Blocks until every alert posted before the call has been
    ///        handed to the sink.
    void flush();

    [[nodiscard]] bool hasWorker() const noexcept { return worker_ != nullptr; }

    [[nodiscard]] core::u64 deliveredCount() const noexcept;
    [[nodiscard]] core::u64 droppedCount() const noexcept;
    [[nodiscard]] core::u64 failedCount() const noexcept;

private:
    void drain();

    IAlertSink                                       &sink_;
    std::array<Queue, kDomainCount>                   queues_;
    std::array<std::mutex, kDomainCount>              producerMutexes_;
    std::mutex                                        consumerMutex_;
    std::unique_ptr<concurrency::ThreadPool>          worker_;
    std::atomic<core::u64>                            delivered_{0};
    std::atomic<core::u64>                            dropped_{0};
    std::atomic<core::u64>                            failed_{0};
};

} // namespace spc::alert
