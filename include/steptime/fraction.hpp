#pragma once

#include "steptime/detail/wide_math.hpp"

#include <compare>
#include <numeric>

#include <cstdint>

namespace steptime {

/**
 * Exact signed ratio kept in lowest terms with a positive denominator.
 *
 * Used where a result is naturally a ratio of two tick counts (render
 * interpolation, clock rates). Conversion to floating point is explicit and
 * meant for presentation only.
 *
 * A zero denominator is normalized to 0/1.
 */
struct Fraction {
    int64_t num{0};
    int64_t den{1};

    constexpr Fraction() noexcept = default;

    constexpr Fraction(int64_t n, int64_t d) noexcept : num(n), den(d) { simplify(); }

    template <typename T>
    constexpr explicit operator T() const noexcept {
        return static_cast<T>(num) / static_cast<T>(den);
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return num == 0; }

    // Lowest-terms form makes member-wise equality exact
    constexpr bool operator==(const Fraction&) const noexcept = default;

    constexpr std::strong_ordering operator<=>(const Fraction& other) const noexcept {
        const detail::int128 lhs = static_cast<detail::int128>(num) * other.den;
        const detail::int128 rhs = static_cast<detail::int128>(other.num) * den;
        if (lhs < rhs) {
            return std::strong_ordering::less;
        }
        if (lhs > rhs) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

private:
    constexpr void simplify() noexcept {
        if (den == 0) {
            num = 0;
            den = 1;
            return;
        }
        // Keep the sign on the numerator
        bool negative = (num < 0) != (den < 0);
        uint64_t n = detail::magnitude(num);
        uint64_t d = detail::magnitude(den);
        uint64_t g = std::gcd(n, d);
        if (g > 1) {
            n /= g;
            d /= g;
        }
        // |INT64_MIN| only survives here when the other term is 1; clamp it
        if (d > static_cast<uint64_t>(INT64_MAX)) {
            d = static_cast<uint64_t>(INT64_MAX);
        }
        if (n > static_cast<uint64_t>(INT64_MAX)) {
            num = negative ? INT64_MIN : INT64_MAX;
        } else {
            num = negative ? -static_cast<int64_t>(n) : static_cast<int64_t>(n);
        }
        den = static_cast<int64_t>(d);
    }
};

} // namespace steptime
