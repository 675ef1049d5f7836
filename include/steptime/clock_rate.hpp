#pragma once

#include "steptime/clock_step.hpp"
#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"
#include "steptime/fraction.hpp"
#include "steptime/frequency.hpp"
#include "steptime/frequency_ticker.hpp"
#include "steptime/log.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

#include <limits>
#include <numeric>

#include <cstdint>

namespace steptime {

/**
 * @brief Rate-scaled game clock fed by real elapsed spans
 *
 * Each step() advances game time by `real * num / den`. The part of a
 * nanosecond that does not fit is carried (in units of 1/den ns) into the
 * next step, so N steps of any size sum to exactly the scaled total.
 *
 * A rate of 0/1 pauses the clock; 1/2 is slow motion, 2/1 fast forward.
 */
class ClockRate {
public:
    ClockRate() noexcept = default;

    /**
     * Advance by a real span.
     *
     * @return The game stamp reached and the game span covered, or
     *         invalid_argument for a negative span, arithmetic_overflow past
     *         the TimeStamp range (clock unchanged on error)
     */
    TimeResult<ClockStep> step(TimeSpan real) noexcept {
        if (real.is_negative()) {
            return make_time_error(TimeError::invalid_argument);
        }

        const detail::uint128 total =
            static_cast<detail::uint128>(real.nanoseconds()) * num_ + remainder_;
        auto game_ns = detail::to_signed(total / den_, false);
        if (!game_ns) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        const TimeSpan game = TimeSpan::from_nanoseconds(*game_ns);
        auto now = now_.add(game);
        if (!now) {
            return make_time_error(now.error());
        }

        remainder_ = static_cast<uint64_t>(total % den_);
        now_ = *now;
        return ClockStep{now_, game};
    }

    /**
     * Set the rate to num/den (reduced). The carried sub-nanosecond
     * remainder is rescaled to the new denominator.
     *
     * @return invalid_argument if den is zero or either term exceeds INT64_MAX
     */
    TimeResult<void> set_rate(uint64_t num, uint64_t den) noexcept {
        constexpr auto max_term = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (den == 0 || num > max_term || den > max_term) {
            return make_time_error(TimeError::invalid_argument);
        }
        const uint64_t g = num == 0 ? den : std::gcd(num, den);
        num /= g;
        den /= g;

        // remainder_ < den_ so the rescaled value is below the new den
        remainder_ = static_cast<uint64_t>(
            static_cast<detail::uint128>(remainder_) * den / den_);
        num_ = num;
        den_ = den;

        log_message(LogLevel::debug, "clock rate set to %llu/%llu",
                    static_cast<unsigned long long>(num_), static_cast<unsigned long long>(den_));
        return {};
    }

    Fraction rate() const noexcept {
        return Fraction(static_cast<int64_t>(num_), static_cast<int64_t>(den_));
    }

    /// Rate 0; the next set_rate() resumes
    void pause() noexcept {
        num_ = 0;
        log_message(LogLevel::debug, "clock rate paused");
    }

    bool is_paused() const noexcept { return num_ == 0; }

    TimeStamp now() const noexcept { return now_; }

    void set_now(TimeStamp now) noexcept { now_ = now; }

    /// Back to the epoch; the rate is kept
    void reset() noexcept {
        now_ = TimeStamp::epoch();
        remainder_ = 0;
    }

    /**
     * Ticker for `freq` scaled by the current rate, positioned at now().
     *
     * Feed it the same real spans as step(); it then ticks at `freq` in game
     * time.
     *
     * @return invalid_frequency while paused, arithmetic_overflow if the
     *         scaled rate does not fit
     */
    TimeResult<FrequencyTicker> ticker(Frequency freq) const {
        return freq.scaled(num_, den_).map(
            [this](Frequency scaled) { return FrequencyTicker(scaled, now_); });
    }

private:
    TimeStamp now_{};
    uint64_t num_{1};
    uint64_t den_{1};
    uint64_t remainder_{0}; ///< Carried fraction of a game nanosecond, in 1/den_ units
};

} // namespace steptime
