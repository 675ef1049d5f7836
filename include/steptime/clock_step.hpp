#pragma once

#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

namespace steptime {

/// Result of advancing a clock: the stamp reached and the span since the
/// previous step
struct ClockStep {
    TimeStamp now;
    TimeSpan step;

    constexpr bool operator==(const ClockStep&) const noexcept = default;
};

} // namespace steptime
