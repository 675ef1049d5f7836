#pragma once

#include "steptime/error.hpp"
#include "steptime/fraction.hpp"
#include "steptime/frequency.hpp"
#include "steptime/log.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <cstddef>
#include <cstdint>

namespace steptime {

struct FixedTimerConfig {
    TimeSpan step;                     ///< Fixed simulation step, must be positive
    uint32_t max_steps_per_update = 8; ///< Catch-up cap per advance(), must be non-zero
};

/// One emitted simulation tick
struct FixedStep {
    uint64_t index;      ///< Zero-based step number since construction or reset
    TimeStamp sim_time;  ///< Simulation time at the end of this step
    TimeSpan step;

    constexpr bool operator==(const FixedStep&) const noexcept = default;
};

/**
 * @brief Ticks produced by one FixedTimer::advance() call
 *
 * A lightweight view: iterating it computes each FixedStep on the fly and has
 * no effect on the timer.
 *
 * @code
 *   auto batch = timer.advance(frame.step);
 *   for (const FixedStep& s : *batch) {
 *       world.update(s.step);
 *   }
 * @endcode
 */
class StepBatch {
public:
    class iterator {
    public:
        // Steps are computed on dereference and returned by value
        using iterator_category = std::input_iterator_tag;
        using value_type = FixedStep;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = FixedStep;

        iterator() noexcept = default;

        FixedStep operator*() const noexcept {
            const int64_t end_ns = start_ns_ + step_ns_ * static_cast<int64_t>(pos_ + 1);
            return FixedStep{index_ + pos_,
                             TimeStamp::from_epoch(TimeSpan::from_nanoseconds(end_ns)),
                             TimeSpan::from_nanoseconds(step_ns_)};
        }

        iterator& operator++() noexcept {
            ++pos_;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            ++pos_;
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept { return pos_ == other.pos_; }

    private:
        friend class StepBatch;

        // Batch fields are copied so an iterator stays valid after the batch goes away
        iterator(const StepBatch& batch, uint32_t pos) noexcept
            : index_(batch.first_index_),
              start_ns_(batch.start_.since_epoch().nanoseconds()),
              step_ns_(batch.step_.nanoseconds()),
              pos_(pos) {}

        uint64_t index_{0};
        int64_t start_ns_{0};
        int64_t step_ns_{0};
        uint32_t pos_{0};
    };

    StepBatch() noexcept = default;

    StepBatch(uint64_t first_index, uint32_t count, uint64_t dropped, TimeStamp start,
              TimeSpan step) noexcept
        : first_index_(first_index),
          count_(count),
          dropped_(dropped),
          start_(start),
          step_(step) {}

    /// Ticks emitted (at most max_steps_per_update)
    uint32_t count() const noexcept { return count_; }

    /// Whole steps discarded by the catch-up cap
    uint64_t dropped() const noexcept { return dropped_; }

    bool empty() const noexcept { return count_ == 0; }

    uint64_t first_index() const noexcept { return first_index_; }

    iterator begin() const noexcept { return iterator(*this, 0); }
    iterator end() const noexcept { return iterator(*this, count_); }

private:
    uint64_t first_index_{0};
    uint32_t count_{0};
    uint64_t dropped_{0};
    TimeStamp start_{};
    TimeSpan step_{};
};

/**
 * @brief Fixed-timestep accumulator
 *
 * Converts irregular elapsed spans into a deterministic count of equal
 * simulation steps plus a remainder in `[0, step)`.
 *
 * ## Catch-up cap
 * At most max_steps_per_update ticks are emitted per advance(). Whole steps
 * beyond the cap are discarded, not deferred; only the sub-step remainder is
 * carried. This bounds the work after a long stall (spiral of death).
 *
 * ## Arithmetic
 * Whole steps are counted as `delta / step + (acc + delta % step) / step` in
 * unsigned 64-bit, so no delta can overflow the accumulator. The timer never
 * uses floating point; interpolation() is an exact Fraction.
 *
 * Not thread-safe; one writer per simulation timeline.
 */
class FixedTimer {
public:
    /**
     * @throws std::invalid_argument if step is not positive or the cap is zero
     */
    explicit FixedTimer(FixedTimerConfig config) : config_(config) {
        if (!valid(config)) {
            throw std::invalid_argument("fixed timer needs a positive step and a non-zero cap");
        }
    }

    /// Non-throwing factory; invalid_argument on a bad config
    static TimeResult<FixedTimer> create(FixedTimerConfig config) noexcept {
        if (!valid(config)) {
            return make_time_error(TimeError::invalid_argument);
        }
        return FixedTimer(config, validated_tag{});
    }

    /**
     * Timer stepping at `rate` (step = whole nanoseconds of one period,
     * truncated). Rates above 1 GHz give a zero step and invalid_argument.
     */
    static TimeResult<FixedTimer> from_rate(Frequency rate, uint32_t max_steps_per_update) noexcept {
        return TimeSpan::period_of(rate).and_then([&](TimeSpan step) {
            return create(FixedTimerConfig{step, max_steps_per_update});
        });
    }

    /**
     * Feed an elapsed span and collect the ticks it completes.
     *
     * @return The emitted ticks, or invalid_argument for a negative delta,
     *         arithmetic_overflow if simulation time would leave the int64
     *         range. The timer is unchanged on error.
     */
    TimeResult<StepBatch> advance(TimeSpan delta) {
        if (delta.is_negative()) {
            return make_time_error(TimeError::invalid_argument);
        }

        const auto step_ns = static_cast<uint64_t>(config_.step.nanoseconds());
        const auto delta_ns = static_cast<uint64_t>(delta.nanoseconds());

        // Both terms are below step_ns <= INT64_MAX, the sum fits
        const uint64_t carried = accumulator_ + delta_ns % step_ns;
        const uint64_t whole = delta_ns / step_ns + carried / step_ns;

        const uint64_t emitted = std::min<uint64_t>(whole, config_.max_steps_per_update);
        const uint64_t dropped = whole - emitted;

        auto end = config_.step.mul(static_cast<int64_t>(emitted)).and_then([&](TimeSpan span) {
            return sim_time_.add(span);
        });
        if (!end) {
            return make_time_error(end.error());
        }

        StepBatch batch(total_steps_, static_cast<uint32_t>(emitted), dropped, sim_time_,
                        config_.step);

        accumulator_ = carried % step_ns;
        total_steps_ += emitted;
        dropped_steps_ += dropped;
        sim_time_ = *end;

        if (dropped > 0) {
            log_message(LogLevel::warning,
                        "fixed timer fell behind: dropped %llu steps (cap %u per update)",
                        static_cast<unsigned long long>(dropped),
                        static_cast<unsigned>(config_.max_steps_per_update));
        }
        return batch;
    }

    /// Leftover time below one step
    TimeSpan accumulator() const noexcept {
        return TimeSpan::from_nanoseconds(static_cast<int64_t>(accumulator_));
    }

    TimeSpan step() const noexcept { return config_.step; }
    uint32_t max_steps_per_update() const noexcept { return config_.max_steps_per_update; }

    /// Ticks emitted since construction or reset
    uint64_t total_steps() const noexcept { return total_steps_; }

    /// Whole steps discarded by the cap since construction or reset
    uint64_t dropped_steps() const noexcept { return dropped_steps_; }

    /// Simulation time: one step per emitted tick
    TimeStamp sim_time() const noexcept { return sim_time_; }

    /// accumulator / step in lowest terms, in [0, 1)
    Fraction interpolation() const noexcept {
        return Fraction(static_cast<int64_t>(accumulator_), config_.step.nanoseconds());
    }

    void reset() noexcept {
        accumulator_ = 0;
        total_steps_ = 0;
        dropped_steps_ = 0;
        sim_time_ = TimeStamp::epoch();
    }

private:
    struct validated_tag {};

    FixedTimer(FixedTimerConfig config, validated_tag) noexcept : config_(config) {}

    static bool valid(const FixedTimerConfig& config) noexcept {
        return config.step.is_positive() && config.max_steps_per_update > 0;
    }

    FixedTimerConfig config_;
    uint64_t accumulator_{0};
    uint64_t total_steps_{0};
    uint64_t dropped_steps_{0};
    TimeStamp sim_time_{};
};

} // namespace steptime
