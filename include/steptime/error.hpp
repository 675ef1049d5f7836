#pragma once

#include "steptime/expected.hpp"

#include <stdexcept>
#include <utility>

#include <cstdint>

namespace steptime {

/**
 * Errors reported by time arithmetic, clocks and timers.
 *
 * All errors are local and recoverable: checked operations return them through
 * TimeResult, nothing is retried internally.
 */
enum class TimeError : uint8_t {
    invalid_frequency,    ///< Zero rate or zero denominator at Frequency construction
    arithmetic_overflow,  ///< True result does not fit the 64-bit tick representation
    non_monotonic_source, ///< Clock source reported an instant earlier than the previous one
    invalid_argument,     ///< Precondition violated at the API boundary (e.g. negative delta)
    division_by_zero,     ///< Zero divisor passed to a span division
    clock_not_started     ///< Clock::step() called before start() under explicit-start policy
};

/**
 * Convert TimeError to human-readable string.
 */
constexpr const char* time_error_string(TimeError err) noexcept {
    switch (err) {
        case TimeError::invalid_frequency:
            return "Invalid frequency";
        case TimeError::arithmetic_overflow:
            return "Arithmetic overflow";
        case TimeError::non_monotonic_source:
            return "Clock source went backwards";
        case TimeError::invalid_argument:
            return "Invalid argument";
        case TimeError::division_by_zero:
            return "Division by zero";
        case TimeError::clock_not_started:
            return "Clock not started";
        default:
            return "Unknown error";
    }
}

/**
 * @brief Result type for checked time operations
 *
 * Alias for expected<T, TimeError>.
 *
 * Usage:
 * @code
 *   auto sum = a.add(b);
 *   if (!sum) {
 *       std::cerr << time_error_string(sum.error()) << "\n";
 *   }
 * @endcode
 */
template <typename T>
using TimeResult = expected<T, TimeError>;

/**
 * @brief Factory for the unexpected side of a TimeResult
 */
inline auto make_time_error(TimeError err) noexcept {
    return unexpected<TimeError>(err);
}

/**
 * Exception thrown by the operator forms of span/stamp arithmetic and by
 * the FrequencyTicker constructor when its start delay overflows.
 *
 * Checked methods never throw; they return TimeResult instead.
 */
class TimeException : public std::runtime_error {
public:
    explicit TimeException(TimeError code)
        : std::runtime_error(time_error_string(code)),
          code_(code) {}

    [[nodiscard]] TimeError code() const noexcept { return code_; }

private:
    TimeError code_;
};

namespace detail {

// Unwraps a checked result for the throwing operator forms
template <typename T>
T value_or_throw(TimeResult<T> result) {
    if (!result) {
        throw TimeException(result.error());
    }
    return std::move(*result);
}

} // namespace detail

} // namespace steptime
