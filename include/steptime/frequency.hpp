#pragma once

#include "steptime/detail/wide_math.hpp"
#include "steptime/error.hpp"

#include <compare>
#include <numeric>

#include <cstdint>

namespace steptime {

/**
 * Exact tick rate: `ticks` occurrences per `per` seconds.
 *
 * ## Representation
 * Two unsigned 64-bit terms, always reduced to lowest terms, never stored as
 * floating point. Two Frequencies describing the same rate therefore compare
 * equal member-wise (60/1 == 120/2).
 *
 * ## Reference Frequency
 * The internal time resolution is one tick per nanosecond:
 * `Frequency::nanoseconds()` == 1'000'000'000 / 1. TimeSpan converts through
 * it and nothing else.
 *
 * ## Rounding
 * convert() forms `count * to.ticks * from.per` in 256 bits, divides by
 * `to.per * from.ticks`, and rounds half to even when inexact. The result is
 * deterministic across platforms.
 *
 * This is a core library type: immutable, no allocation, safe to share.
 */
class Frequency {
public:
    static constexpr uint64_t NANOSECONDS_PER_SECOND = 1'000'000'000ULL;

    /// Internal reference frequency (1 GHz, one tick per nanosecond)
    static constexpr Frequency nanoseconds() noexcept {
        return Frequency(NANOSECONDS_PER_SECOND, 1);
    }

    /**
     * Checked factory.
     *
     * @param ticks Number of ticks (must be non-zero)
     * @param per   Length of the cycle in seconds (must be non-zero)
     * @return Reduced Frequency, or TimeError::invalid_frequency
     */
    static TimeResult<Frequency> create(uint64_t ticks, uint64_t per) noexcept {
        if (ticks == 0 || per == 0) {
            return make_time_error(TimeError::invalid_frequency);
        }
        const uint64_t g = std::gcd(ticks, per);
        return Frequency(ticks / g, per / g);
    }

    static TimeResult<Frequency> from_ratio(uint64_t ticks, uint64_t per) noexcept {
        return create(ticks, per);
    }

    static TimeResult<Frequency> from_hz(uint64_t hz) noexcept { return create(hz, 1); }

    static TimeResult<Frequency> from_khz(uint64_t khz) noexcept {
        return scaled_from(khz, 1'000ULL);
    }

    static TimeResult<Frequency> from_mhz(uint64_t mhz) noexcept {
        return scaled_from(mhz, 1'000'000ULL);
    }

    static TimeResult<Frequency> from_ghz(uint64_t ghz) noexcept {
        return scaled_from(ghz, 1'000'000'000ULL);
    }

    constexpr uint64_t ticks() const noexcept { return ticks_; }
    constexpr uint64_t per() const noexcept { return per_; }

    /**
     * Rescale a tick count from one frequency to another.
     *
     * `count * to.ticks * from.per / (to.per * from.ticks)`, rounded half to
     * even. Cross terms are reduced first to keep the wide product small.
     *
     * @return Rescaled count, or TimeError::arithmetic_overflow if the result
     *         does not fit int64_t
     */
    static TimeResult<int64_t> convert(int64_t count, Frequency from, Frequency to) noexcept {
        if (count == 0) {
            return int64_t{0};
        }

        const uint64_t g_ticks = std::gcd(to.ticks_, from.ticks_);
        const uint64_t g_per = std::gcd(from.per_, to.per_);
        const detail::uint128 num =
            static_cast<detail::uint128>(to.ticks_ / g_ticks) * (from.per_ / g_per);
        const detail::uint128 den =
            static_cast<detail::uint128>(to.per_ / g_per) * (from.ticks_ / g_ticks);

        auto mag = detail::mul_div(detail::magnitude(count), num, den,
                                   detail::Rounding::nearest_even);
        if (!mag) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        auto result = detail::to_signed(*mag, count < 0);
        if (!result) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return *result;
    }

    /**
     * This rate multiplied by num/den, exact then reduced.
     *
     * @return Scaled Frequency; TimeError::invalid_frequency if num or den is
     *         zero, TimeError::arithmetic_overflow if a reduced term exceeds
     *         64 bits
     */
    TimeResult<Frequency> scaled(uint64_t num, uint64_t den) const noexcept {
        if (num == 0 || den == 0) {
            return make_time_error(TimeError::invalid_frequency);
        }
        const uint64_t g_ratio = std::gcd(num, den);
        num /= g_ratio;
        den /= g_ratio;

        // ticks/per and num/den are both coprime; cancelling across them
        // leaves the product in lowest terms
        const uint64_t g1 = std::gcd(ticks_, den);
        const uint64_t g2 = std::gcd(num, per_);
        const detail::uint128 t = static_cast<detail::uint128>(ticks_ / g1) * (num / g2);
        const detail::uint128 p = static_cast<detail::uint128>(per_ / g2) * (den / g1);

        if (t > UINT64_MAX || p > UINT64_MAX) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return Frequency(static_cast<uint64_t>(t), static_cast<uint64_t>(p));
    }

    // Canonical form makes member-wise equality exact
    constexpr bool operator==(const Frequency&) const noexcept = default;

    /// Orders by rate (ticks / per) using exact cross-multiplication
    constexpr std::strong_ordering operator<=>(const Frequency& other) const noexcept {
        const detail::uint128 lhs = static_cast<detail::uint128>(ticks_) * other.per_;
        const detail::uint128 rhs = static_cast<detail::uint128>(other.ticks_) * per_;
        if (lhs < rhs) {
            return std::strong_ordering::less;
        }
        if (lhs > rhs) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

private:
    uint64_t ticks_;
    uint64_t per_;

    // Terms must already be reduced and non-zero
    constexpr Frequency(uint64_t ticks, uint64_t per) noexcept : ticks_(ticks), per_(per) {}

    // value * multiplier Hz, overflow-checked
    static TimeResult<Frequency> scaled_from(uint64_t value, uint64_t multiplier) noexcept {
        const detail::uint128 hz = static_cast<detail::uint128>(value) * multiplier;
        if (hz > UINT64_MAX) {
            return make_time_error(TimeError::arithmetic_overflow);
        }
        return create(static_cast<uint64_t>(hz), 1);
    }
};

} // namespace steptime
