#pragma once

/**
 * @file steptime.hpp
 * @brief Umbrella header for the steptime time-handling library
 *
 * Value types: Frequency, TimeSpan, TimeStamp, Fraction.
 * Stepping: Clock over a ClockSource, FixedTimer, FrequencyTicker, ClockRate.
 */

#include "steptime/clock.hpp"
#include "steptime/clock_rate.hpp"
#include "steptime/clock_source.hpp"
#include "steptime/clock_step.hpp"
#include "steptime/error.hpp"
#include "steptime/expected.hpp"
#include "steptime/fixed_timer.hpp"
#include "steptime/format.hpp"
#include "steptime/fraction.hpp"
#include "steptime/frequency.hpp"
#include "steptime/frequency_ticker.hpp"
#include "steptime/log.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"
