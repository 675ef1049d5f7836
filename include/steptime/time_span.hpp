#pragma once

#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"
#include "steptime/frequency.hpp"

#include <chrono>
#include <compare>
#include <limits>
#include <optional>
#include <type_traits>

#include <cstdint>

namespace steptime {

/**
 * Signed, exact time interval with nanosecond resolution.
 *
 * ## Storage
 * A single int64_t tick count at the reference frequency
 * (Frequency::nanoseconds()), giving a range of roughly ±292 years.
 *
 * ## Overflow Policy
 * Arithmetic never wraps:
 * - Checked methods (`add`, `sub`, `mul`, ...) return TimeResult and report
 *   TimeError::arithmetic_overflow.
 * - Operators (`+`, `-`, `*`, `/`) forward to the checked methods and throw
 *   TimeException on failure.
 * - `saturating_*` variants clamp to min()/max() and are the only paths that
 *   silently bound a result.
 *
 * ## Units
 * from_frequency()/to_frequency() are the conversion path for external units
 * (seconds, frames, platform counter ticks); all internal math stays on one
 * resolution.
 *
 * This is a core library type: immutable value, no allocation.
 */
class TimeSpan {
public:
    static constexpr int64_t NANOS_PER_MICROSECOND = 1'000LL;
    static constexpr int64_t NANOS_PER_MILLISECOND = 1'000'000LL;
    static constexpr int64_t NANOS_PER_SECOND = 1'000'000'000LL;
    static constexpr int64_t NANOS_PER_MINUTE = 60 * NANOS_PER_SECOND;
    static constexpr int64_t NANOS_PER_HOUR = 60 * NANOS_PER_MINUTE;
    static constexpr int64_t NANOS_PER_DAY = 24 * NANOS_PER_HOUR;
    static constexpr int64_t NANOS_PER_WEEK = 7 * NANOS_PER_DAY;

    // Named constants
    static constexpr TimeSpan zero() noexcept { return TimeSpan(0); }

    static constexpr TimeSpan min() noexcept {
        return TimeSpan(std::numeric_limits<int64_t>::min());
    }

    static constexpr TimeSpan max() noexcept {
        return TimeSpan(std::numeric_limits<int64_t>::max());
    }

    static constexpr TimeSpan nanosecond() noexcept { return TimeSpan(1); }
    static constexpr TimeSpan microsecond() noexcept { return TimeSpan(NANOS_PER_MICROSECOND); }
    static constexpr TimeSpan millisecond() noexcept { return TimeSpan(NANOS_PER_MILLISECOND); }
    static constexpr TimeSpan second() noexcept { return TimeSpan(NANOS_PER_SECOND); }
    static constexpr TimeSpan minute() noexcept { return TimeSpan(NANOS_PER_MINUTE); }
    static constexpr TimeSpan hour() noexcept { return TimeSpan(NANOS_PER_HOUR); }
    static constexpr TimeSpan day() noexcept { return TimeSpan(NANOS_PER_DAY); }
    static constexpr TimeSpan week() noexcept { return TimeSpan(NANOS_PER_WEEK); }

    // Default construction - zero span
    constexpr TimeSpan() noexcept = default;

    static constexpr TimeSpan from_nanoseconds(int64_t ns) noexcept { return TimeSpan(ns); }

    // Checked unit factories
    static TimeResult<TimeSpan> from_microseconds(int64_t us) noexcept {
        return microsecond().mul(us);
    }

    static TimeResult<TimeSpan> from_milliseconds(int64_t ms) noexcept {
        return millisecond().mul(ms);
    }

    static TimeResult<TimeSpan> from_seconds(int64_t s) noexcept { return second().mul(s); }

    /// Hours, minutes and seconds combined; components may be negative
    static TimeResult<TimeSpan> hms(int64_t hours, int64_t minutes, int64_t seconds) noexcept {
        return hour().mul(hours).and_then([&](TimeSpan h) {
            return minute().mul(minutes).and_then([&](TimeSpan m) {
                return second().mul(seconds).and_then([&](TimeSpan s) {
                    return h.add(m).and_then([&](TimeSpan hm) { return hm.add(s); });
                });
            });
        });
    }

    /**
     * Span covering `count` ticks of `freq`, rounded half to even to the
     * nearest nanosecond.
     */
    static TimeResult<TimeSpan> from_frequency(int64_t count, Frequency freq) noexcept {
        return Frequency::convert(count, freq, Frequency::nanoseconds()).map(&from_nanoseconds);
    }

    /**
     * Whole nanoseconds in one period of `freq`, truncated.
     *
     * Rates above 1 GHz have a zero period.
     */
    static TimeResult<TimeSpan> period_of(Frequency freq) noexcept {
        auto ns = detail::mul_div(freq.per(), NANOS_PER_SECOND, freq.ticks(),
                                  detail::Rounding::toward_zero);
        if (!ns) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        auto result = detail::to_signed(*ns, false);
        if (!result) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return TimeSpan(*result);
    }

    /**
     * Span of a std::chrono duration with an integral count.
     *
     * Converted through the duration's period as a Frequency, so periods finer
     * than a nanosecond round half to even.
     *
     * @return arithmetic_overflow if the count does not fit int64 nanoseconds
     */
    template <typename Rep, typename Period>
    static TimeResult<TimeSpan> from_chrono(std::chrono::duration<Rep, Period> duration) noexcept {
        static_assert(std::is_integral_v<Rep> && sizeof(Rep) <= sizeof(int64_t),
                      "from_chrono requires an integral count of at most 64 bits");
        static_assert(Period::num > 0 && Period::den > 0, "duration period must be positive");

        const Rep count = duration.count();
        if constexpr (std::is_unsigned_v<Rep> && sizeof(Rep) == sizeof(int64_t)) {
            if (count > static_cast<Rep>(std::numeric_limits<int64_t>::max())) {
                return make_time_error(TimeError::arithmetic_overflow);
            }
        }
        auto freq = Frequency::create(static_cast<uint64_t>(Period::den),
                                      static_cast<uint64_t>(Period::num));
        if (!freq) {
            return make_time_error(freq.error());
        }
        return from_frequency(static_cast<int64_t>(count), *freq);
    }

    /// Exact: both sides count nanoseconds
    std::chrono::nanoseconds to_chrono() const noexcept { return std::chrono::nanoseconds(nanos_); }

    /// Number of `freq` ticks in this span, rounded half to even
    TimeResult<int64_t> to_frequency(Frequency freq) const noexcept {
        return Frequency::convert(nanos_, Frequency::nanoseconds(), freq);
    }

    // Accessors
    constexpr int64_t nanoseconds() const noexcept { return nanos_; }
    constexpr int64_t as_microseconds() const noexcept { return nanos_ / NANOS_PER_MICROSECOND; }
    constexpr int64_t as_milliseconds() const noexcept { return nanos_ / NANOS_PER_MILLISECOND; }
    constexpr int64_t as_seconds() const noexcept { return nanos_ / NANOS_PER_SECOND; }
    constexpr int64_t as_minutes() const noexcept { return nanos_ / NANOS_PER_MINUTE; }
    constexpr int64_t as_hours() const noexcept { return nanos_ / NANOS_PER_HOUR; }
    constexpr int64_t as_days() const noexcept { return nanos_ / NANOS_PER_DAY; }
    constexpr int64_t as_weeks() const noexcept { return nanos_ / NANOS_PER_WEEK; }

    // For presentation only; internal math never goes through floating point
    constexpr double to_seconds() const noexcept {
        return static_cast<double>(nanos_ / NANOS_PER_SECOND) +
               static_cast<double>(nanos_ % NANOS_PER_SECOND) /
                   static_cast<double>(NANOS_PER_SECOND);
    }

    // Predicates
    constexpr bool is_zero() const noexcept { return nanos_ == 0; }
    constexpr bool is_negative() const noexcept { return nanos_ < 0; }
    constexpr bool is_positive() const noexcept { return nanos_ > 0; }

    // Checked arithmetic
    TimeResult<TimeSpan> add(TimeSpan other) const noexcept {
        return wrap(detail::checked_add(nanos_, other.nanos_));
    }

    TimeResult<TimeSpan> sub(TimeSpan other) const noexcept {
        return wrap(detail::checked_sub(nanos_, other.nanos_));
    }

    TimeResult<TimeSpan> neg() const noexcept { return wrap(detail::checked_sub(0, nanos_)); }

    TimeResult<TimeSpan> abs() const noexcept {
        return nanos_ < 0 ? neg() : TimeResult<TimeSpan>(*this);
    }

    TimeResult<TimeSpan> mul(int64_t scalar) const noexcept {
        return wrap(detail::checked_mul(nanos_, scalar));
    }

    /// Division by scalar, truncating toward zero
    TimeResult<TimeSpan> div(int64_t scalar) const noexcept {
        if (scalar == 0) {
            return make_time_error(TimeError::division_by_zero);
        }
        if (scalar == -1) {
            return neg();
        }
        return TimeSpan(nanos_ / scalar);
    }

    /// Whole number of `other` spans in this span, truncating toward zero
    TimeResult<int64_t> div_span(TimeSpan other) const noexcept {
        if (other.nanos_ == 0) {
            return make_time_error(TimeError::division_by_zero);
        }
        if (other.nanos_ == -1) {
            auto negated = detail::checked_sub(0, nanos_);
            if (!negated) {
                return make_time_error(TimeError::arithmetic_overflow);
            }
            return *negated;
        }
        return nanos_ / other.nanos_;
    }

    /// Remainder of div_span (sign follows this span)
    TimeResult<TimeSpan> rem_span(TimeSpan other) const noexcept {
        if (other.nanos_ == 0) {
            return make_time_error(TimeError::division_by_zero);
        }
        if (other.nanos_ == -1) {
            return zero();
        }
        return TimeSpan(nanos_ % other.nanos_);
    }

    // Saturating arithmetic (explicit opt-in clamping to min()/max())
    constexpr TimeSpan saturating_add(TimeSpan other) const noexcept {
        return TimeSpan(detail::saturate(static_cast<detail::int128>(nanos_) + other.nanos_));
    }

    constexpr TimeSpan saturating_sub(TimeSpan other) const noexcept {
        return TimeSpan(detail::saturate(static_cast<detail::int128>(nanos_) - other.nanos_));
    }

    constexpr TimeSpan saturating_neg() const noexcept {
        return TimeSpan(detail::saturate(-static_cast<detail::int128>(nanos_)));
    }

    constexpr TimeSpan saturating_mul(int64_t scalar) const noexcept {
        return TimeSpan(detail::saturate(static_cast<detail::int128>(nanos_) * scalar));
    }

    // Operators (throw TimeException instead of wrapping)
    TimeSpan& operator+=(TimeSpan other) {
        *this = detail::value_or_throw(add(other));
        return *this;
    }

    TimeSpan& operator-=(TimeSpan other) {
        *this = detail::value_or_throw(sub(other));
        return *this;
    }

    TimeSpan& operator*=(int64_t scalar) {
        *this = detail::value_or_throw(mul(scalar));
        return *this;
    }

    TimeSpan& operator/=(int64_t scalar) {
        *this = detail::value_or_throw(div(scalar));
        return *this;
    }

    TimeSpan operator-() const { return detail::value_or_throw(neg()); }

    friend TimeSpan operator+(TimeSpan lhs, TimeSpan rhs) {
        lhs += rhs;
        return lhs;
    }

    friend TimeSpan operator-(TimeSpan lhs, TimeSpan rhs) {
        lhs -= rhs;
        return lhs;
    }

    friend TimeSpan operator*(TimeSpan span, int64_t scalar) {
        span *= scalar;
        return span;
    }

    friend TimeSpan operator*(int64_t scalar, TimeSpan span) {
        span *= scalar;
        return span;
    }

    friend TimeSpan operator/(TimeSpan span, int64_t scalar) {
        span /= scalar;
        return span;
    }

    // Division of spans yields a whole count
    friend int64_t operator/(TimeSpan lhs, TimeSpan rhs) {
        return detail::value_or_throw(lhs.div_span(rhs));
    }

    friend TimeSpan operator%(TimeSpan lhs, TimeSpan rhs) {
        return detail::value_or_throw(lhs.rem_span(rhs));
    }

    // Comparison is exact on the tick count
    constexpr auto operator<=>(const TimeSpan&) const noexcept = default;
    constexpr bool operator==(const TimeSpan&) const noexcept = default;

private:
    int64_t nanos_{0};

    constexpr explicit TimeSpan(int64_t ns) noexcept : nanos_(ns) {}

    static TimeResult<TimeSpan> wrap(std::optional<int64_t> ns) noexcept {
        if (!ns) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return TimeSpan(*ns);
    }
};

} // namespace steptime
