// include/steptime/detail/wide_math.hpp
#pragma once

#include <limits>
#include <optional>

#include <cstdint>

namespace steptime::detail {

/**
 * Widened integer arithmetic shared by Frequency, TimeSpan and the tickers.
 *
 * - All time values are 64-bit tick counts; intermediates are computed in
 *   128-bit (and 256-bit for rescaling products) so overflow is detected
 *   before narrowing instead of wrapping.
 * - Helpers return std::nullopt when the exact result does not fit; the
 *   public types translate that into TimeError::arithmetic_overflow.
 * - Nothing here uses floating point.
 */

using int128 = __int128;
using uint128 = unsigned __int128;

inline constexpr uint128 UINT128_MAX_VALUE = ~uint128{0};
inline constexpr uint128 LOW_64_MASK = static_cast<uint128>(~uint64_t{0});

/// Rounding applied when an exact quotient is not an integer
enum class Rounding : uint8_t {
    nearest_even, ///< Round half to even (banker's rounding)
    toward_zero,  ///< Truncate
    away_from_zero ///< Ceiling of the magnitude
};

/// Absolute value as unsigned (0 - cast avoids UB on INT64_MIN)
constexpr uint64_t magnitude(int64_t value) noexcept {
    return value < 0 ? 0ULL - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
}

/// Narrow a 128-bit value to int64_t, nullopt if out of range
constexpr std::optional<int64_t> narrow(int128 value) noexcept {
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

/// Apply a sign to an unsigned magnitude, nullopt if it does not fit int64_t
constexpr std::optional<int64_t> to_signed(uint128 mag, bool negative) noexcept {
    constexpr uint128 max_positive = static_cast<uint128>(std::numeric_limits<int64_t>::max());
    if (negative) {
        if (mag > max_positive + 1) {
            return std::nullopt;
        }
        return static_cast<int64_t>(0ULL - static_cast<uint64_t>(mag));
    }
    if (mag > max_positive) {
        return std::nullopt;
    }
    return static_cast<int64_t>(mag);
}

constexpr std::optional<int64_t> checked_add(int64_t a, int64_t b) noexcept {
    return narrow(static_cast<int128>(a) + static_cast<int128>(b));
}

constexpr std::optional<int64_t> checked_sub(int64_t a, int64_t b) noexcept {
    return narrow(static_cast<int128>(a) - static_cast<int128>(b));
}

constexpr std::optional<int64_t> checked_mul(int64_t a, int64_t b) noexcept {
    return narrow(static_cast<int128>(a) * static_cast<int128>(b));
}

/// Clamp a 128-bit value into int64_t range
constexpr int64_t saturate(int128 value) noexcept {
    if (value > std::numeric_limits<int64_t>::max()) {
        return std::numeric_limits<int64_t>::max();
    }
    if (value < std::numeric_limits<int64_t>::min()) {
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(value);
}

constexpr uint128 gcd(uint128 a, uint128 b) noexcept {
    while (b != 0) {
        uint128 t = a % b;
        a = b;
        b = t;
    }
    return a;
}

/// 256-bit unsigned value as two 128-bit halves
struct Uint256 {
    uint128 hi;
    uint128 lo;
};

/// Full 128x128 -> 256 bit product via 64-bit limbs
constexpr Uint256 mul_wide(uint128 a, uint128 b) noexcept {
    const uint128 a_lo = a & LOW_64_MASK;
    const uint128 a_hi = a >> 64;
    const uint128 b_lo = b & LOW_64_MASK;
    const uint128 b_hi = b >> 64;

    const uint128 ll = a_lo * b_lo;
    const uint128 lh = a_lo * b_hi;
    const uint128 hl = a_hi * b_lo;
    const uint128 hh = a_hi * b_hi;

    // Sum of three values below 2^64 each, cannot overflow
    const uint128 mid = (ll >> 64) + (lh & LOW_64_MASK) + (hl & LOW_64_MASK);

    return Uint256{.hi = hh + (lh >> 64) + (hl >> 64) + (mid >> 64),
                   .lo = (mid << 64) | (ll & LOW_64_MASK)};
}

struct WideQuotient {
    uint128 quotient;
    uint128 remainder;
};

/**
 * Divide a 256-bit value by a non-zero 128-bit divisor.
 *
 * @return Quotient and remainder, or nullopt if the quotient needs more
 *         than 128 bits (or the divisor is zero)
 */
constexpr std::optional<WideQuotient> div_wide(Uint256 n, uint128 divisor) noexcept {
    if (divisor == 0 || n.hi >= divisor) {
        return std::nullopt;
    }
    if (n.hi == 0) {
        return WideQuotient{.quotient = n.lo / divisor, .remainder = n.lo % divisor};
    }

    // Restoring long division; remainder stays below divisor between steps
    uint128 rem = n.hi;
    uint128 quot = 0;
    for (int bit = 127; bit >= 0; --bit) {
        const bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((n.lo >> bit) & 1);
        quot <<= 1;
        if (carry || rem >= divisor) {
            rem -= divisor;
            quot |= 1;
        }
    }
    return WideQuotient{.quotient = quot, .remainder = rem};
}

/**
 * Compute a * b / divisor exactly with the requested rounding.
 *
 * The product is formed in 256 bits, so any pair of 128-bit factors is safe.
 *
 * @return Rounded quotient, or nullopt if it does not fit in 128 bits
 */
constexpr std::optional<uint128> mul_div(uint128 a, uint128 b, uint128 divisor,
                                         Rounding mode) noexcept {
    auto qr = div_wide(mul_wide(a, b), divisor);
    if (!qr) {
        return std::nullopt;
    }

    uint128 quotient = qr->quotient;
    const uint128 rem = qr->remainder;

    bool round_up = false;
    switch (mode) {
        case Rounding::nearest_even: {
            // Compare rem against divisor - rem to avoid doubling rem
            const uint128 complement = divisor - rem;
            round_up = rem > complement || (rem == complement && (quotient & 1) != 0);
            break;
        }
        case Rounding::away_from_zero:
            round_up = rem != 0;
            break;
        case Rounding::toward_zero:
        default:
            break;
    }

    if (round_up) {
        if (quotient == UINT128_MAX_VALUE) {
            return std::nullopt;
        }
        ++quotient;
    }
    return quotient;
}

/// Ceiling division of unsigned values; divisor must be non-zero
constexpr uint128 div_ceil(uint128 value, uint128 divisor) noexcept {
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

} // namespace steptime::detail
