/**
 * @file EscalationTracker.hpp
 * @brief Edge detector over a derived escalation level.
 * @author MasterLaplace
 *
 * The level itself is a pure function of the score.  The tracker only
 * remembers the previous level so callers can fire transition events
 * once per boundary crossing.
 */

#pragma once

#include <spc/core/Concepts.hpp>

namespace spc::fusion {

template <core::ScopedEnum Level>
class EscalationTracker {
public:
    struct Transition {
        Level from;
        Level to;
        bool  changed        = false;
        /// True only on the update that moves into the highest level.
        bool  enteredHighest = false;
    };

    constexpr EscalationTracker(Level lowest, Level highest) noexcept
        : _lowest{lowest}, _highest{highest}, _current{lowest}
    {
    }

    constexpr Transition update(Level next) noexcept
    {
        Transition t{_current, next};
        t.changed        = next != _current;
        t.enteredHighest = t.changed && next == _highest;
        _current         = next;
        return t;
    }

    [[nodiscard]] constexpr Level current() const noexcept { return _current; }

    constexpr void reset() noexcept { _current = _lowest; }

private:
    Level _lowest;
    Level _highest;
    Level _current;
};

} // namespace spc::fusion
