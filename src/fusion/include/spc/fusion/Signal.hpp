/**
 * @file Signal.hpp
 * @brief Timestamped unit of evidence and its bounded history.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_SIGNAL_HPP
    #define SPC_FUSION_SIGNAL_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Concepts.hpp>
    #include <spc/core/Types.hpp>

    #include <deque>
    #include <string>
    #include <utility>

namespace spc::fusion {

/**
 * @brief A typed, valued, timestamped observation.
 *
 * Immutable once built; the history never edits a stored signal.
 */
template <core::ScopedEnum Kind>
struct Signal {
    Kind            kind;
    double          value = 0.0;
    core::TimePoint timestamp{};
    std::string     description;
};

/**
 * @brief Bounded FIFO of signals kept in arrival order.
 *
 * Appending past @p Capacity evicts the oldest arrival.  A late signal
 * (older timestamp than the tail) is still appended at the tail.
 */
template <core::ScopedEnum Kind, core::usize Capacity>
class SignalHistory {
public:
    using value_type     = Signal<Kind>;
    using const_iterator = typename std::deque<value_type>::const_iterator;

    void push(value_type signal)
    {
        if (_items.size() == Capacity)
            _items.pop_front();
        _items.push_back(std::move(signal));
    }

    void clear() noexcept { _items.clear(); }

    [[nodiscard]] core::usize size() const noexcept { return _items.size(); }
    [[nodiscard]] bool empty() const noexcept { return _items.empty(); }
    [[nodiscard]] static constexpr core::usize capacity() noexcept { return Capacity; }

    [[nodiscard]] const value_type &front() const { return _items.front(); }
    [[nodiscard]] const value_type &back() const { return _items.back(); }

    [[nodiscard]] const_iterator begin() const noexcept { return _items.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return _items.end(); }

private:
    std::deque<value_type> _items;
};

} // namespace spc::fusion

#endif // SPC_FUSION_SIGNAL_HPP
