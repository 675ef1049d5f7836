#pragma once

#include "steptime/clock_source.hpp"
#include "steptime/clock_step.hpp"
#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"
#include "steptime/frequency.hpp"
#include "steptime/log.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include <cstdint>

namespace steptime {

/// Behaviour of the first step() on a clock that has not been started
enum class FirstStepPolicy : uint8_t {
    zero_delta,    ///< First step() samples the source, anchors the epoch and returns zero
    explicit_start ///< step() fails with clock_not_started until start() is called
};

/// Behaviour when the source reports an instant earlier than the previous one
enum class BackwardsPolicy : uint8_t {
    reject, ///< step() fails with non_monotonic_source, state unchanged
    clamp   ///< step() returns a zero delta, now() does not move
};

struct ClockConfig {
    FirstStepPolicy first_step = FirstStepPolicy::zero_delta;
    BackwardsPolicy backwards = BackwardsPolicy::reject;
};

/**
 * @brief Monotonic clock over an injected ClockSource
 *
 * Maps raw source readings into the TimeStamp domain using the source's
 * declared Frequency and reports the elapsed span between successive samples.
 *
 * ## Mapping
 * `stamp = anchor_stamp + from_frequency(raw - anchor_raw, source.frequency())`
 *
 * The anchor is taken at start() (or the first step() under
 * FirstStepPolicy::zero_delta). Every stamp is computed from the anchor rather
 * than by summing per-step deltas, so rounding never accumulates and the
 * mapping is monotonic non-decreasing in the raw reading.
 *
 * ## Policies
 * Chosen once through ClockConfig; see FirstStepPolicy and BackwardsPolicy.
 * Neither path ever yields a negative delta.
 *
 * @note Single-writer: step()/start()/reset() need external synchronization
 *       when shared between threads. The source is read only from those calls.
 */
class Clock {
public:
    /**
     * @param source Raw instant provider (shared with the caller, e.g. a test
     *               harness that keeps scripting it)
     * @param config First-step and backwards-reading policies
     * @throws std::invalid_argument if source is null
     */
    explicit Clock(std::shared_ptr<ClockSource> source, ClockConfig config = {})
        : source_(require_source(std::move(source))),
          frequency_(source_->frequency()),
          config_(config) {}

    /**
     * Anchor the raw-to-stamp mapping at the current source reading.
     *
     * now() is kept, so the next step() measures from this instant. Calling
     * start() on a running clock re-anchors it and skips any time since the
     * last step.
     */
    void start() {
        const RawInstant raw = source_->read();
        anchor_raw_ = raw;
        last_raw_ = raw;
        anchor_stamp_ = now_;
        started_ = true;
        clamping_ = false;
    }

    /**
     * Sample the source and advance.
     *
     * @return The new stamp and the span since the previous sample, or
     *         - clock_not_started before start() under explicit_start
     *         - non_monotonic_source for a backwards reading under reject
     *         - arithmetic_overflow if the mapped stamp leaves the int64 range
     */
    TimeResult<ClockStep> step() {
        if (!started_) {
            if (config_.first_step == FirstStepPolicy::explicit_start) {
                return make_time_error(TimeError::clock_not_started);
            }
            start();
            return ClockStep{now_, TimeSpan::zero()};
        }

        const RawInstant raw = source_->read();
        if (raw < last_raw_) {
            if (config_.backwards == BackwardsPolicy::reject) {
                log_message(LogLevel::debug, "clock source went backwards (%lld < %lld), rejected",
                            static_cast<long long>(raw), static_cast<long long>(last_raw_));
                return make_time_error(TimeError::non_monotonic_source);
            }
            // One warning per excursion below the high-water mark
            if (!clamping_) {
                log_message(LogLevel::warning,
                            "clock source went backwards by %lld ticks, clamped to zero delta",
                            static_cast<long long>(last_raw_ - raw));
                clamping_ = true;
            }
            return ClockStep{now_, TimeSpan::zero()};
        }
        clamping_ = false;

        auto stamp = map_raw(raw);
        if (!stamp) {
            return make_time_error(stamp.error());
        }
        auto delta = stamp->sub(now_);
        if (!delta) {
            return make_time_error(delta.error());
        }

        last_raw_ = raw;
        now_ = *stamp;
        return ClockStep{now_, *delta};
    }

    /// Stamp reached by the last successful step
    TimeStamp now() const noexcept { return now_; }

    bool started() const noexcept { return started_; }

    /// Frequency of the source, captured at construction
    Frequency source_frequency() const noexcept { return frequency_; }

    const ClockConfig& config() const noexcept { return config_; }

    /**
     * Raw source reading that maps to `stamp`; the inverse of the mapping
     * step() applies, taken from the same anchor.
     *
     * Sources slower than 1 GHz round to the nearest tick (half to even).
     *
     * @return clock_not_started before the clock is anchored, or
     *         arithmetic_overflow if the reading leaves the int64 range
     */
    TimeResult<RawInstant> stamp_raw(TimeStamp stamp) const noexcept {
        if (!started_) {
            return make_time_error(TimeError::clock_not_started);
        }
        return stamp.sub(anchor_stamp_)
            .and_then([this](TimeSpan offset) { return offset.to_frequency(frequency_); })
            .and_then([this](int64_t ticks) -> TimeResult<RawInstant> {
                auto raw = detail::checked_add(anchor_raw_, ticks);
                if (!raw) {
                    return make_time_error(TimeError::arithmetic_overflow);
                }
                return *raw;
            });
    }

    /// Return to the epoch; the next start() or first step re-anchors
    void reset() noexcept {
        started_ = false;
        now_ = TimeStamp::epoch();
        anchor_stamp_ = TimeStamp::epoch();
        anchor_raw_ = 0;
        last_raw_ = 0;
        clamping_ = false;
    }

private:
    static std::shared_ptr<ClockSource> require_source(std::shared_ptr<ClockSource> source) {
        if (!source) {
            throw std::invalid_argument("clock source must not be null");
        }
        return source;
    }

    TimeResult<TimeStamp> map_raw(RawInstant raw) const noexcept {
        auto ticks = detail::checked_sub(raw, anchor_raw_);
        if (!ticks) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return TimeSpan::from_frequency(*ticks, frequency_).and_then(
            [this](TimeSpan offset) { return anchor_stamp_.add(offset); });
    }

    std::shared_ptr<ClockSource> source_;
    Frequency frequency_;
    ClockConfig config_;

    bool started_{false};
    bool clamping_{false};
    RawInstant anchor_raw_{0};
    RawInstant last_raw_{0};
    TimeStamp anchor_stamp_{};
    TimeStamp now_{};
};

} // namespace steptime
