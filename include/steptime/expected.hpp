#pragma once

// Result type for every fallible steptime operation.
//
// steptime::expected is tl::expected re-exported under the library namespace,
// so call sites read the same as std::expected and can move to it unchanged.
// TimeResult<T> (error.hpp) fixes the error side to TimeError:
//
//   TimeResult<TimeStamp> next = clock.now().add(frame);
//   if (!next) {
//       return make_time_error(next.error());
//   }
//
// Checked steps chain with and_then()/map() instead of nested if blocks:
//
//   TimeSpan::from_frequency(ticks, rate).and_then(
//       [&](TimeSpan offset) { return anchor.add(offset); });

#include <tl/expected.hpp>

namespace steptime {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace steptime
