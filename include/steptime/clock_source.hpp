#pragma once

#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"
#include "steptime/frequency.hpp"

#include <chrono>
#include <deque>
#include <initializer_list>

#include <cstddef>
#include <cstdint>

namespace steptime {

/// Raw reading of a clock source, in the source's own tick units
using RawInstant = int64_t;

/**
 * Monotonic instant provider consumed by Clock.
 *
 * read() returns the current raw instant in platform-defined units;
 * frequency() says how many of those units make up a second. Nothing is
 * assumed about the epoch of the readings.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    virtual RawInstant read() = 0;
    virtual Frequency frequency() const = 0;
};

/**
 * std::chrono::steady_clock in its native period.
 */
class SteadyClockSource final : public ClockSource {
public:
    using clock_type = std::chrono::steady_clock;

    static_assert(clock_type::period::num > 0 && clock_type::period::den > 0);

    SteadyClockSource()
        : frequency_(Frequency::create(static_cast<uint64_t>(clock_type::period::den),
                                       static_cast<uint64_t>(clock_type::period::num))
                         .value()) {}

    RawInstant read() override {
        return static_cast<RawInstant>(clock_type::now().time_since_epoch().count());
    }

    Frequency frequency() const override { return frequency_; }

private:
    Frequency frequency_;
};

/**
 * Deterministic source for tests and replay.
 *
 * The current instant is moved explicitly with set()/advance(), or taken from
 * a queue of scripted readings: each read() pops the next scripted value if
 * there is one, otherwise repeats the current instant.
 */
class ManualClockSource final : public ClockSource {
public:
    explicit ManualClockSource(Frequency frequency, RawInstant start = 0) noexcept
        : frequency_(frequency),
          now_(start) {}

    ManualClockSource(Frequency frequency, std::initializer_list<RawInstant> script)
        : frequency_(frequency),
          script_(script) {}

    RawInstant read() override {
        if (!script_.empty()) {
            now_ = script_.front();
            script_.pop_front();
        }
        ++reads_;
        return now_;
    }

    Frequency frequency() const override { return frequency_; }

    void set(RawInstant now) noexcept { now_ = now; }

    /// Move the current instant; fails with arithmetic_overflow and leaves it unchanged
    /// if the result leaves the int64 range
    TimeResult<void> advance(RawInstant ticks) noexcept {
        auto next = detail::checked_add(now_, ticks);
        if (!next) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        now_ = *next;
        return {};
    }

    /// Queue a reading to be returned by a later read()
    void push(RawInstant reading) { script_.push_back(reading); }

    RawInstant current() const noexcept { return now_; }
    std::size_t pending() const noexcept { return script_.size(); }
    std::size_t reads() const noexcept { return reads_; }

private:
    Frequency frequency_;
    RawInstant now_{0};
    std::deque<RawInstant> script_;
    std::size_t reads_{0};
};

} // namespace steptime
