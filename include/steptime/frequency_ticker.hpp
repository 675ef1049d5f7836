#pragma once

#include "steptime/clock_step.hpp"
#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"
#include "steptime/frequency.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

#include <iterator>
#include <limits>

#include <cstddef>
#include <cstdint>

namespace steptime {

namespace detail {

/**
 * Frequency expressed in "elements": one element is 1/count of a nanosecond,
 * and one period of the frequency is `cycle` elements. Both terms are exact
 * integers for any rational rate, so tick positions never drift.
 */
struct TickGrid {
    uint128 count; ///< Elements per nanosecond
    uint128 cycle; ///< Elements per period

    static TickGrid from(Frequency freq) noexcept {
        // ticks per (per * 1e9) ns; ticks and per are coprime already
        const uint128 ns_per_cycle = static_cast<uint128>(freq.per()) * 1'000'000'000ULL;
        const uint128 g = gcd(freq.ticks(), ns_per_cycle);
        return TickGrid{freq.ticks() / g, ns_per_cycle / g};
    }

    uint128 elements(int64_t ns) const noexcept { return static_cast<uint128>(ns) * count; }

    /// Whole nanoseconds needed to cover `span` elements, rounded up
    uint128 ceil_nanos(uint128 span) const noexcept { return div_ceil(span, count); }
};

} // namespace detail

/**
 * @brief Ticks emitted by one FrequencyTicker::advance() call
 *
 * Each element is a ClockStep whose `now` is the tick instant rounded up to
 * the nanosecond and whose `step` is the span since the previous tick in the
 * batch (the first one measured from the ticker's position before advance()).
 * Ticks that fall inside one nanosecond share a stamp and carry a zero step.
 */
class TickBatch {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ClockStep;
        using difference_type = std::ptrdiff_t;
        using pointer = const ClockStep*;
        using reference = const ClockStep&;

        iterator() noexcept = default;

        reference operator*() const noexcept { return current_; }
        pointer operator->() const noexcept { return &current_; }

        iterator& operator++() noexcept {
            next();
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            next();
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept {
            return done_ == other.done_ && (done_ || emitted_ == other.emitted_);
        }

    private:
        friend class TickBatch;

        explicit iterator(const TickBatch& batch) noexcept
            : grid_(batch.grid_),
              span_(batch.span_),
              until_next_(batch.until_next_),
              now_ns_(batch.start_ns_),
              done_(false) {
            next();
        }

        void next() noexcept {
            if (pending_zero_steps_ > 0) {
                --pending_zero_steps_;
                current_ = ClockStep{current_.now, TimeSpan::zero()};
                ++emitted_;
                return;
            }
            if (span_ < until_next_) {
                done_ = true;
                return;
            }

            // Move to the first whole nanosecond at or after the tick; any
            // further ticks passed on the way share that nanosecond
            const detail::uint128 step_ns = grid_.ceil_nanos(until_next_);
            const detail::uint128 advance = step_ns * grid_.count;
            const detail::uint128 overshoot = advance - until_next_;

            pending_zero_steps_ = overshoot / grid_.cycle;
            until_next_ = grid_.cycle - overshoot % grid_.cycle;
            span_ -= advance;
            now_ns_ += static_cast<int64_t>(step_ns);

            current_ = ClockStep{TimeStamp::from_epoch(TimeSpan::from_nanoseconds(now_ns_)),
                                 TimeSpan::from_nanoseconds(static_cast<int64_t>(step_ns))};
            ++emitted_;
        }

        detail::TickGrid grid_{1, 1};
        detail::uint128 span_{0};
        detail::uint128 until_next_{0};
        detail::uint128 pending_zero_steps_{0};
        int64_t now_ns_{0};
        uint64_t emitted_{0};
        ClockStep current_{};
        bool done_{true};
    };

    /// Number of ticks in the batch, saturated to the uint64_t range
    uint64_t count() const noexcept {
        if (span_ < until_next_) {
            return 0;
        }
        const detail::uint128 ticks = 1 + (span_ - until_next_) / grid_.cycle;
        return ticks > std::numeric_limits<uint64_t>::max()
                   ? std::numeric_limits<uint64_t>::max()
                   : static_cast<uint64_t>(ticks);
    }

    bool empty() const noexcept { return span_ < until_next_; }

    iterator begin() const noexcept { return iterator(*this); }
    iterator end() const noexcept { return iterator(); }

private:
    friend class FrequencyTicker;

    TickBatch(detail::TickGrid grid, detail::uint128 span, detail::uint128 until_next,
              int64_t start_ns) noexcept
        : grid_(grid),
          span_(span),
          until_next_(until_next),
          start_ns_(start_ns) {}

    detail::TickGrid grid_;
    detail::uint128 span_;
    detail::uint128 until_next_;
    int64_t start_ns_;
};

/**
 * @brief Emits ticks at an exact rational frequency as time is fed in
 *
 * Tick positions are tracked in elements of 1/count nanosecond (see
 * detail::TickGrid), so a rate such as 3 ticks per 10 ns produces exactly
 * three ticks every 10 ns forever, never 2 or 4 from accumulated rounding.
 *
 * @code
 *   FrequencyTicker ticker(*Frequency::from_hz(30), TimeStamp::epoch());
 *   auto ticks = ticker.advance(frame.step);
 *   for (const ClockStep& tick : *ticks) {
 *       network.send_snapshot(tick.now);
 *   }
 * @endcode
 */
class FrequencyTicker {
public:
    /**
     * @param freq          Tick rate
     * @param start         Ticker position
     * @param delay_periods Whole periods to skip before the first tick
     * @throws TimeException (arithmetic_overflow) if the delay is too long to
     *         represent
     */
    FrequencyTicker(Frequency freq, TimeStamp start, uint64_t delay_periods = 0)
        : freq_(freq),
          grid_(detail::TickGrid::from(freq)),
          now_(start) {
        const detail::uint128 periods = static_cast<detail::uint128>(delay_periods) + 1;
        if (periods > detail::UINT128_MAX_VALUE / grid_.cycle) {
            throw TimeException(TimeError::arithmetic_overflow);
        }
        until_next_ = grid_.cycle * periods;
    }

    /**
     * Advance by `span` and return the ticks passed on the way.
     *
     * @return The batch, invalid_argument for a negative span, or
     *         arithmetic_overflow if the ticker position leaves the int64
     *         range (ticker unchanged on error)
     */
    TimeResult<TickBatch> advance(TimeSpan span) noexcept {
        if (span.is_negative()) {
            return make_time_error(TimeError::invalid_argument);
        }
        auto end = now_.add(span);
        if (!end) {
            return make_time_error(end.error());
        }

        const detail::uint128 elements = grid_.elements(span.nanoseconds());
        TickBatch batch(grid_, elements, until_next_, now_.since_epoch().nanoseconds());

        if (elements >= until_next_) {
            until_next_ = grid_.cycle - (elements - until_next_) % grid_.cycle;
        } else {
            until_next_ -= elements;
        }
        now_ = *end;
        return batch;
    }

    /// Advance by `span` and return only the number of ticks passed
    TimeResult<uint64_t> tick_count(TimeSpan span) noexcept {
        return advance(span).map([](const TickBatch& batch) { return batch.count(); });
    }

    /**
     * Instant of the next tick, rounded up to the nanosecond.
     *
     * @return arithmetic_overflow if it lies beyond the TimeStamp range
     */
    TimeResult<TimeStamp> next_tick() const noexcept {
        auto ns = detail::to_signed(grid_.ceil_nanos(until_next_), false);
        if (!ns) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return now_.add(TimeSpan::from_nanoseconds(*ns));
    }

    /// Position of the ticker (start plus everything advanced)
    TimeStamp now() const noexcept { return now_; }

    Frequency frequency() const noexcept { return freq_; }

    /**
     * Switch to a new rate.
     *
     * The time remaining until the next tick is kept (rounded up to the new
     * element size). With `clip_period` the next tick is additionally pulled
     * in to at most one new period away.
     *
     * @return arithmetic_overflow if the remaining time cannot be expressed at
     *         the new rate without clipping (ticker unchanged)
     */
    TimeResult<void> set_frequency(Frequency freq, bool clip_period) noexcept {
        const detail::TickGrid grid = detail::TickGrid::from(freq);
        auto until_next =
            detail::mul_div(until_next_, grid.count, grid_.count, detail::Rounding::away_from_zero);

        if (clip_period && (!until_next || *until_next > grid.cycle)) {
            until_next = grid.cycle;
        }
        if (!until_next) {
            return make_time_error(TimeError::arithmetic_overflow);
        }

        freq_ = freq;
        grid_ = grid;
        until_next_ = *until_next;
        return {};
    }

private:
    Frequency freq_;
    detail::TickGrid grid_;
    detail::uint128 until_next_{0};
    TimeStamp now_;
};

} // namespace steptime
