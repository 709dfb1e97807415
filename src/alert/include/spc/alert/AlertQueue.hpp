/**
 * @file AlertQueue.hpp
 * @brief Bounded lock-free hand-off queue for one alert domain.
 * @author MasterLaplace
 *
 * Wraps a compile-time sized boost::lockfree::spsc_queue.  One producer
 * (the domain's monitor, serialised by the dispatcher) pushes, the
 * delivery worker consumes.
 *
 * @see https://www.boost.org/doc/libs/release/doc/html/lockfree.html
 */

#pragma once

#include <spc/alert/Alert.hpp>
#include <spc/core/Types.hpp>

#include <bit>
#include <boost/lockfree/policies.hpp>
#include <boost/lockfree/spsc_queue.hpp>
#include <utility>

namespace spc::alert {

/**
 * @brief Fixed-capacity SPSC queue of alerts.
 *
 * @tparam Capacity Number of alerts held before tryPush() refuses
 *                  (power of two).
 *
 * A full queue never overwrites: the newest alert is the one refused.
 */
template <core::usize Capacity>
    requires (std::has_single_bit(Capacity))
class AlertQueue {
public:
    /// @return false when the queue is full.
    [[nodiscard]] bool tryPush(const Alert &alert) { return _ring.push(alert); }

    /**
     * @brief Pop every queued alert in FIFO order.
     * @param consumer Callable with signature void(const Alert&).
     * @return Number of alerts consumed.
     */
    template <typename Consumer>
    core::usize consumeAll(Consumer &&consumer)
    {
        return _ring.consume_all(std::forward<Consumer>(consumer));
    }

    [[nodiscard]] core::usize pending() const noexcept { return _ring.read_available(); }
    [[nodiscard]] bool idle() const noexcept { return pending() == 0; }

    [[nodiscard]] static constexpr core::usize capacity() noexcept { return Capacity; }

private:
    boost::lockfree::spsc_queue<Alert, boost::lockfree::capacity<Capacity>> _ring;
};

} // namespace spc::alert
