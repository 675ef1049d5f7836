#pragma once

#include "steptime/error.hpp"
#include "steptime/time_span.hpp"

#include <compare>

namespace steptime {

/**
 * Absolute point in time as a TimeSpan offset from an arbitrary epoch.
 *
 * The epoch has no calendar or wall-clock meaning; it is whatever the
 * producing Clock chose (its first sample). Stamps are only meaningful
 * relative to other stamps of the same timeline. The type does not stop you
 * comparing stamps of unrelated timelines; keeping them apart is the caller's
 * convention.
 *
 * ## Overflow Policy
 * Same as TimeSpan: checked methods return TimeResult, operators throw
 * TimeException, nothing wraps.
 */
class TimeStamp {
public:
    constexpr TimeStamp() noexcept = default;

    static constexpr TimeStamp epoch() noexcept { return TimeStamp(); }

    static constexpr TimeStamp now_from(TimeSpan since_epoch) noexcept {
        return TimeStamp(since_epoch);
    }

    static constexpr TimeStamp from_epoch(TimeSpan since_epoch) noexcept {
        return TimeStamp(since_epoch);
    }

    constexpr TimeSpan since_epoch() const noexcept { return since_epoch_; }

    /// Exact difference `*this - other`; negative when `other` is later
    TimeResult<TimeSpan> sub(TimeStamp other) const noexcept {
        return since_epoch_.sub(other.since_epoch_);
    }

    TimeResult<TimeSpan> elapsed_since(TimeStamp earlier) const noexcept { return sub(earlier); }

    TimeResult<TimeStamp> add(TimeSpan span) const noexcept {
        return since_epoch_.add(span).map(&from_epoch);
    }

    TimeResult<TimeStamp> sub_span(TimeSpan span) const noexcept {
        return since_epoch_.sub(span).map(&from_epoch);
    }

    // Operators (throw TimeException on overflow)
    TimeStamp& operator+=(TimeSpan span) {
        *this = detail::value_or_throw(add(span));
        return *this;
    }

    TimeStamp& operator-=(TimeSpan span) {
        *this = detail::value_or_throw(sub_span(span));
        return *this;
    }

    friend TimeStamp operator+(TimeStamp stamp, TimeSpan span) {
        stamp += span;
        return stamp;
    }

    friend TimeStamp operator-(TimeStamp stamp, TimeSpan span) {
        stamp -= span;
        return stamp;
    }

    friend TimeSpan operator-(TimeStamp lhs, TimeStamp rhs) {
        return detail::value_or_throw(lhs.sub(rhs));
    }

    // Ordering by offset from epoch
    constexpr auto operator<=>(const TimeStamp&) const noexcept = default;
    constexpr bool operator==(const TimeStamp&) const noexcept = default;

private:
    TimeSpan since_epoch_{};

    constexpr explicit TimeStamp(TimeSpan since_epoch) noexcept : since_epoch_(since_epoch) {}
};

} // namespace steptime
