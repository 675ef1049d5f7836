#pragma once

#include "steptime/detail/wide_math.hpp"
#include "steptime/expected.hpp"
#include "steptime/frequency.hpp"
#include "steptime/time_span.hpp"
#include "steptime/time_stamp.hpp"

#include <charconv>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

#include <cstddef>
#include <cstdint>

namespace steptime {

namespace detail {

struct SpanFields {
    uint64_t days;
    uint64_t hours;
    uint64_t minutes;
    uint64_t seconds;
    uint64_t nanos; ///< Below one second
};

inline SpanFields split_span(uint64_t ns) noexcept {
    constexpr auto second = static_cast<uint64_t>(TimeSpan::NANOS_PER_SECOND);
    constexpr auto minute = static_cast<uint64_t>(TimeSpan::NANOS_PER_MINUTE);
    constexpr auto hour = static_cast<uint64_t>(TimeSpan::NANOS_PER_HOUR);
    constexpr auto day = static_cast<uint64_t>(TimeSpan::NANOS_PER_DAY);
    return SpanFields{ns / day, ns % day / hour, ns % hour / minute, ns % minute / second,
                      ns % second};
}

// Writes "N" or "N.ddd" (three digits) for a whole part and a 0..999 fraction
inline void put_with_thousandths(std::ostream& os, uint64_t whole, uint64_t thousandths) {
    os << whole;
    if (thousandths > 0) {
        os << '.' << std::setw(3) << std::setfill('0') << thousandths;
    }
}

} // namespace detail

/**
 * Compact human-readable form, choosing the largest unit present:
 *
 * | Range     | Example          |
 * |-----------|------------------|
 * | zero      | `0`              |
 * | < 1 us    | `17ns`           |
 * | < 1 ms    | `1.500us`        |
 * | < 1 s     | `16.666ms`       |
 * | < 1 min   | `1.250s`         |
 * | < 1 h     | `2:05.100`       |
 * | < 1 day   | `1:02:03`        |
 * | otherwise | `1d02:03:04.005` |
 *
 * Finer digits are truncated; negative spans get a leading '-'.
 */
inline std::string to_string(TimeSpan span) {
    if (span.is_zero()) {
        return "0";
    }

    std::ostringstream oss;
    if (span.is_negative()) {
        oss << '-';
    }
    const uint64_t ns = detail::magnitude(span.nanoseconds());
    const auto f = detail::split_span(ns);
    const uint64_t millis = f.nanos / 1'000'000;

    auto two = [&oss](uint64_t v) -> std::ostream& {
        return oss << std::setw(2) << std::setfill('0') << v;
    };

    if (f.days > 0) {
        oss << f.days << 'd';
        two(f.hours) << ':';
        two(f.minutes);
        if (millis > 0) {
            oss << ':';
            two(f.seconds) << '.' << std::setw(3) << std::setfill('0') << millis;
        } else if (f.seconds > 0) {
            oss << ':';
            two(f.seconds);
        }
    } else if (f.hours > 0) {
        oss << f.hours << ':';
        two(f.minutes) << ':';
        two(f.seconds);
        if (millis > 0) {
            oss << '.' << std::setw(3) << std::setfill('0') << millis;
        }
    } else if (f.minutes > 0) {
        oss << f.minutes << ':';
        two(f.seconds);
        if (millis > 0) {
            oss << '.' << std::setw(3) << std::setfill('0') << millis;
        }
    } else if (f.seconds > 0) {
        detail::put_with_thousandths(oss, f.seconds, millis);
        oss << 's';
    } else if (ns >= 1'000'000) {
        detail::put_with_thousandths(oss, ns / 1'000'000, ns % 1'000'000 / 1'000);
        oss << "ms";
    } else if (ns >= 1'000) {
        detail::put_with_thousandths(oss, ns / 1'000, ns % 1'000);
        oss << "us";
    } else {
        oss << ns << "ns";
    }
    return oss.str();
}

/// Every field at fixed width: `0d00:00:01.500000000`
inline std::string to_string_full(TimeSpan span) {
    std::ostringstream oss;
    if (span.is_negative()) {
        oss << '-';
    }
    const auto f = detail::split_span(detail::magnitude(span.nanoseconds()));
    oss << f.days << 'd' << std::setfill('0') << std::setw(2) << f.hours << ':' << std::setw(2)
        << f.minutes << ':' << std::setw(2) << f.seconds << '.' << std::setw(9) << f.nanos;
    return oss.str();
}

/// Offset from the epoch with an explicit sign: `+1.250s`, `-3ms`
inline std::string to_string(TimeStamp stamp) {
    const TimeSpan offset = stamp.since_epoch();
    return offset.is_negative() ? to_string(offset) : "+" + to_string(offset);
}

inline std::ostream& operator<<(std::ostream& os, TimeSpan span) {
    return os << to_string(span);
}

inline std::ostream& operator<<(std::ostream& os, TimeStamp stamp) {
    return os << to_string(stamp);
}

/// `60 Hz`, or `1001/3 Hz` for a rate that is not a whole number of hertz
inline std::ostream& operator<<(std::ostream& os, Frequency freq) {
    os << freq.ticks();
    if (freq.per() != 1) {
        os << '/' << freq.per();
    }
    return os << " Hz";
}

// =============================================================================
// Parsing
// =============================================================================

/// Longest accepted input, surrounding whitespace included
inline constexpr std::size_t MAX_TIME_SPAN_STRING = 48;

struct SpanParseError {
    enum class Kind : uint8_t {
        empty,                ///< Nothing but whitespace
        non_ascii,            ///< Byte outside 7-bit ASCII
        too_long,             ///< Longer than MAX_TIME_SPAN_STRING
        bad_integer,          ///< Field is empty or not a decimal number
        unexpected_delimiter, ///< Separator not valid at this point
        unexpected_end,       ///< Input stops after a day separator
        unexpected_suffix,    ///< Unit other than s, ms, us, ns
        hours_out_of_range,   ///< Hours above 23 with days present
        minutes_out_of_range, ///< Minutes above 59 with hours present
        seconds_out_of_range, ///< Seconds above 59 with minutes present
        overflow              ///< Value does not fit a TimeSpan
    };

    Kind kind;
    std::size_t position; ///< Offset into the input where the problem starts

    const char* message() const noexcept;

    bool operator==(const SpanParseError&) const noexcept = default;
};

constexpr const char* span_parse_error_string(SpanParseError::Kind kind) noexcept {
    using Kind = SpanParseError::Kind;
    switch (kind) {
        case Kind::empty:
            return "Empty time span";
        case Kind::non_ascii:
            return "Time spans are always ASCII";
        case Kind::too_long:
            return "Time span string is too long";
        case Kind::bad_integer:
            return "Failed to parse integer";
        case Kind::unexpected_delimiter:
            return "Unexpected delimiter";
        case Kind::unexpected_end:
            return "Unexpected end of string";
        case Kind::unexpected_suffix:
            return "Unexpected suffix, only s, ms, us and ns are supported";
        case Kind::hours_out_of_range:
            return "Hours must be in range 0-23 when days are specified";
        case Kind::minutes_out_of_range:
            return "Minutes must be in range 0-59 when hours are specified";
        case Kind::seconds_out_of_range:
            return "Seconds must be in range 0-59 when minutes are specified";
        case Kind::overflow:
            return "Time span out of range";
        default:
            return "Unknown parse error";
    }
}

inline const char* SpanParseError::message() const noexcept {
    return span_parse_error_string(kind);
}

namespace detail {

using SpanParseResult = expected<uint64_t, SpanParseError>;

inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

inline bool is_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline unexpected<SpanParseError> parse_error(SpanParseError::Kind kind, std::size_t pos) {
    return unexpected<SpanParseError>(SpanParseError{kind, pos});
}

/**
 * Field readers over the whole input. Offsets stay relative to the full
 * string so errors point at the right character.
 */
class SpanScanner {
public:
    explicit SpanScanner(std::string_view text) noexcept : text_(text) {}

    /// Unsigned decimal field in [begin, end), surrounding whitespace allowed
    SpanParseResult integer(std::size_t begin, std::size_t end) const {
        while (begin < end && is_space(text_[begin])) {
            ++begin;
        }
        std::size_t last = end;
        while (last > begin && is_space(text_[last - 1])) {
            --last;
        }
        if (begin == last) {
            return parse_error(SpanParseError::Kind::bad_integer, begin);
        }

        uint64_t value = 0;
        const char* first = text_.data() + begin;
        const char* stop = text_.data() + last;
        auto [ptr, ec] = std::from_chars(first, stop, value);
        if (ec == std::errc::result_out_of_range) {
            return parse_error(SpanParseError::Kind::overflow, begin);
        }
        if (ec != std::errc() || ptr != stop) {
            return parse_error(SpanParseError::Kind::bad_integer, begin);
        }
        return value;
    }

    /**
     * Fractional digits in [begin, end) scaled to `unit_ns`, truncated to the
     * nanosecond. Digits past nanosecond precision are validated and ignored.
     */
    SpanParseResult fraction(std::size_t begin, std::size_t end, uint64_t unit_ns) const {
        std::size_t last = end;
        while (last > begin && is_space(text_[last - 1])) {
            --last;
        }
        if (begin == last) {
            return parse_error(SpanParseError::Kind::bad_integer, begin);
        }

        uint128 numer = 0;
        uint128 denom = 1;
        for (std::size_t i = begin; i < last; ++i) {
            if (!is_digit(text_[i])) {
                return parse_error(SpanParseError::Kind::bad_integer, i);
            }
            // 18 digits already resolve any unit below 1e18 ns
            if (i - begin < 18) {
                numer = numer * 10 + static_cast<uint128>(text_[i] - '0');
                denom *= 10;
            }
        }
        return static_cast<uint64_t>(numer * unit_ns / denom);
    }

private:
    std::string_view text_;
};

// whole * unit + extra, or overflow beyond the magnitude limit
inline SpanParseResult scale_field(uint64_t whole, uint64_t unit, uint64_t extra, uint64_t limit,
                                   std::size_t pos) {
    const uint128 total = static_cast<uint128>(whole) * unit + extra;
    if (total > limit) {
        return parse_error(SpanParseError::Kind::overflow, pos);
    }
    return static_cast<uint64_t>(total);
}

} // namespace detail

/**
 * Parse the text form of a TimeSpan.
 *
 * Accepted forms (optional leading '-' negates, whitespace around fields is
 * ignored):
 * - `S`, `S.frac`: seconds
 * - `Ns`, `Nms`, `Nus` (each may carry `.frac`), `Nns`
 * - `M:S[.frac]`, `H:M:S[.frac]`
 * - `DdH:M`, `DdH:M:S[.frac]` (day separator `d`, `D`, `t` or `T`)
 *
 * With a larger unit present the next one down is bounded: hours 0-23 after
 * days, minutes 0-59 after hours, seconds 0-59 after minutes. Fractions are
 * resolved to the nanosecond, truncating finer digits.
 *
 * Strings produced by to_string() and to_string_full() parse back to the
 * printed value.
 */
inline expected<TimeSpan, SpanParseError> parse_time_span(std::string_view text) {
    using Kind = SpanParseError::Kind;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (static_cast<unsigned char>(text[i]) > 0x7F) {
            return detail::parse_error(Kind::non_ascii, i);
        }
    }
    if (text.size() > MAX_TIME_SPAN_STRING) {
        return detail::parse_error(Kind::too_long, MAX_TIME_SPAN_STRING);
    }

    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && detail::is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && detail::is_space(text[end - 1])) {
        --end;
    }
    if (begin == end) {
        return detail::parse_error(Kind::empty, begin);
    }

    bool negative = false;
    if (text[begin] == '-') {
        negative = true;
        ++begin;
    }

    // |INT64_MIN| is representable only when negated
    const uint64_t limit = negative ? 0ULL - static_cast<uint64_t>(INT64_MIN)
                                    : static_cast<uint64_t>(INT64_MAX);
    const detail::SpanScanner scan(text);

    auto finish = [negative](uint64_t magnitude) -> expected<TimeSpan, SpanParseError> {
        return TimeSpan::from_nanoseconds(*detail::to_signed(magnitude, negative));
    };

    // Unit suffix form: trailing letters name the unit
    std::size_t suffix = end;
    while (suffix > begin && detail::is_alpha(text[suffix - 1])) {
        --suffix;
    }
    if (suffix < end) {
        const std::string_view unit = text.substr(suffix, end - suffix);
        uint64_t unit_ns = 0;
        if (unit == "s") {
            unit_ns = static_cast<uint64_t>(TimeSpan::NANOS_PER_SECOND);
        } else if (unit == "ms") {
            unit_ns = static_cast<uint64_t>(TimeSpan::NANOS_PER_MILLISECOND);
        } else if (unit == "us") {
            unit_ns = static_cast<uint64_t>(TimeSpan::NANOS_PER_MICROSECOND);
        } else if (unit == "ns") {
            unit_ns = 1;
        } else if (unit == "d" || unit == "D" || unit == "t" || unit == "T") {
            return detail::parse_error(Kind::unexpected_end, end);
        } else {
            return detail::parse_error(Kind::unexpected_suffix, suffix);
        }

        std::size_t dot = suffix;
        for (std::size_t i = begin; i < suffix; ++i) {
            const char c = text[i];
            if (detail::is_digit(c) || detail::is_space(c)) {
                continue;
            }
            if (c == '.' && dot == suffix && unit_ns > 1) {
                dot = i;
                continue;
            }
            return detail::parse_error(Kind::unexpected_delimiter, i);
        }

        auto whole = scan.integer(begin, dot);
        if (!whole) {
            return unexpected<SpanParseError>(whole.error());
        }
        uint64_t frac = 0;
        if (dot != suffix) {
            auto parsed = scan.fraction(dot + 1, suffix, unit_ns);
            if (!parsed) {
                return unexpected<SpanParseError>(parsed.error());
            }
            frac = *parsed;
        }
        return detail::scale_field(*whole, unit_ns, frac, limit, begin).and_then(finish);
    }

    // Clock form. The separator sequence (day separators folded to 'd') must
    // be one of these shapes.
    constexpr std::string_view shapes[] = {"", ".", ":", ":.", "::", "::.", "d:", "d::", "d::."};
    auto is_prefix_of_shape = [&](std::string_view seq) {
        for (std::string_view shape : shapes) {
            if (shape.substr(0, seq.size()) == seq && shape.size() >= seq.size()) {
                return true;
            }
        }
        return false;
    };

    constexpr std::size_t max_seps = 4;
    std::size_t seps[max_seps];
    char kinds[max_seps];
    std::size_t count = 0;
    for (std::size_t i = begin; i < end; ++i) {
        const char c = text[i];
        if (detail::is_digit(c) || detail::is_space(c)) {
            continue;
        }
        const char kind = (c == 'd' || c == 'D' || c == 't' || c == 'T') ? 'd' : c;
        if (count == max_seps || (kind != ':' && kind != '.' && kind != 'd')) {
            return detail::parse_error(Kind::unexpected_delimiter, i);
        }
        kinds[count] = kind;
        if (!is_prefix_of_shape(std::string_view(kinds, count + 1))) {
            return detail::parse_error(Kind::unexpected_delimiter, i);
        }
        seps[count++] = i;
    }
    const std::string_view shape(kinds, count);
    if (shape == "d") {
        return detail::parse_error(Kind::unexpected_end, end);
    }

    // Field i spans [field_begin(i), field_end(i))
    auto field_begin = [&](std::size_t i) { return i == 0 ? begin : seps[i - 1] + 1; };
    auto field_end = [&](std::size_t i) { return i < count ? seps[i] : end; };

    const bool has_days = count > 0 && kinds[0] == 'd';
    const bool has_frac = count > 0 && kinds[count - 1] == '.';
    const std::size_t int_fields = count + 1 - (has_frac ? 1 : 0);

    uint64_t frac_ns = 0;
    if (has_frac) {
        auto parsed = scan.fraction(field_begin(count), end,
                                    static_cast<uint64_t>(TimeSpan::NANOS_PER_SECOND));
        if (!parsed) {
            return unexpected<SpanParseError>(parsed.error());
        }
        frac_ns = *parsed;
    }

    uint64_t values[4] = {};
    for (std::size_t i = 0; i < int_fields; ++i) {
        auto parsed = scan.integer(field_begin(i), field_end(i));
        if (!parsed) {
            return unexpected<SpanParseError>(parsed.error());
        }
        values[i] = *parsed;
    }

    // Map positional fields to units
    enum Unit : std::size_t { seconds_u, minutes_u, hours_u, days_u, unit_count };
    uint64_t unit_value[unit_count] = {};
    std::size_t unit_pos[unit_count] = {};
    bool present[unit_count] = {};
    auto assign = [&](Unit unit, std::size_t field) {
        unit_value[unit] = values[field];
        unit_pos[unit] = field_begin(field);
        present[unit] = true;
    };
    if (has_days) {
        assign(days_u, 0);
        assign(hours_u, 1);
        assign(minutes_u, 2);
        if (int_fields == 4) {
            assign(seconds_u, 3);
        }
    } else {
        // Right-aligned: S, M:S, H:M:S
        static constexpr Unit order[] = {seconds_u, minutes_u, hours_u};
        for (std::size_t i = 0; i < int_fields; ++i) {
            assign(order[i], int_fields - 1 - i);
        }
    }

    if (present[minutes_u] && unit_value[seconds_u] > 59) {
        return detail::parse_error(Kind::seconds_out_of_range, unit_pos[seconds_u]);
    }
    if (present[hours_u] && unit_value[minutes_u] > 59) {
        return detail::parse_error(Kind::minutes_out_of_range, unit_pos[minutes_u]);
    }
    if (present[days_u] && unit_value[hours_u] > 23) {
        return detail::parse_error(Kind::hours_out_of_range, unit_pos[hours_u]);
    }

    constexpr uint64_t unit_nanos[unit_count] = {
        static_cast<uint64_t>(TimeSpan::NANOS_PER_SECOND),
        static_cast<uint64_t>(TimeSpan::NANOS_PER_MINUTE),
        static_cast<uint64_t>(TimeSpan::NANOS_PER_HOUR),
        static_cast<uint64_t>(TimeSpan::NANOS_PER_DAY)};
    detail::uint128 total = frac_ns;
    for (std::size_t u = 0; u < unit_count; ++u) {
        total += static_cast<detail::uint128>(unit_value[u]) * unit_nanos[u];
    }
    if (total > limit) {
        return detail::parse_error(Kind::overflow, begin);
    }
    return finish(static_cast<uint64_t>(total));
}

} // namespace steptime
