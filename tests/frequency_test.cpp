#include <limits>

#include <cstdint>
#include <gtest/gtest.h>
#include <steptime.hpp>

using namespace steptime;

// ==============================================================================
// Construction
// ==============================================================================

TEST(FrequencyTest, CreateReducesToLowestTerms) {
    auto f = Frequency::create(120, 2);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->ticks(), 60u);
    EXPECT_EQ(f->per(), 1u);
}

TEST(FrequencyTest, EqualRatesCompareEqual) {
    EXPECT_EQ(*Frequency::create(60, 1), *Frequency::create(120, 2));
    EXPECT_EQ(*Frequency::from_khz(1), *Frequency::from_hz(1000));
    EXPECT_EQ(*Frequency::from_ghz(1), Frequency::nanoseconds());
}

TEST(FrequencyTest, ZeroPerIsInvalid) {
    auto f = Frequency::create(60, 0);
    ASSERT_FALSE(f.has_value());
    EXPECT_EQ(f.error(), TimeError::invalid_frequency);
}

TEST(FrequencyTest, ZeroTicksIsInvalid) {
    auto f = Frequency::from_hz(0);
    ASSERT_FALSE(f.has_value());
    EXPECT_EQ(f.error(), TimeError::invalid_frequency);
}

TEST(FrequencyTest, UnitFactories) {
    EXPECT_EQ(Frequency::from_khz(48)->ticks(), 48'000u);
    EXPECT_EQ(Frequency::from_mhz(3)->ticks(), 3'000'000u);
    EXPECT_EQ(Frequency::from_ghz(2)->ticks(), 2'000'000'000u);
}

TEST(FrequencyTest, UnitFactoryOverflow) {
    auto f = Frequency::from_ghz(std::numeric_limits<uint64_t>::max());
    ASSERT_FALSE(f.has_value());
    EXPECT_EQ(f.error(), TimeError::arithmetic_overflow);
}

TEST(FrequencyTest, OrderingByRate) {
    auto ntsc = *Frequency::create(30'000, 1'001); // 29.97 Hz
    auto thirty = *Frequency::from_hz(30);
    EXPECT_LT(ntsc, thirty);
    EXPECT_GT(*Frequency::from_hz(60), thirty);
    EXPECT_NE(ntsc, thirty);
}

// ==============================================================================
// convert()
// ==============================================================================

TEST(FrequencyTest, ConvertExact) {
    auto ms = *Frequency::from_hz(1000);
    auto r = Frequency::convert(16, ms, Frequency::nanoseconds());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 16'000'000);
}

TEST(FrequencyTest, ConvertNegative) {
    auto ms = *Frequency::from_hz(1000);
    EXPECT_EQ(*Frequency::convert(-250, ms, Frequency::nanoseconds()), -250'000'000);
}

TEST(FrequencyTest, ConvertRoundsHalfToEven) {
    // 1 tick at 2 GHz is exactly 0.5 ns
    auto two_ghz = *Frequency::from_ghz(2);
    EXPECT_EQ(*Frequency::convert(1, two_ghz, Frequency::nanoseconds()), 0);
    EXPECT_EQ(*Frequency::convert(3, two_ghz, Frequency::nanoseconds()), 2);  // 1.5 -> 2
    EXPECT_EQ(*Frequency::convert(5, two_ghz, Frequency::nanoseconds()), 2);  // 2.5 -> 2
    EXPECT_EQ(*Frequency::convert(-3, two_ghz, Frequency::nanoseconds()), -2);
}

TEST(FrequencyTest, ConvertRoundsToNearest) {
    // One 60 Hz frame is 16666666.67 ns
    auto hz60 = *Frequency::from_hz(60);
    EXPECT_EQ(*Frequency::convert(1, hz60, Frequency::nanoseconds()), 16'666'667);
    EXPECT_EQ(*Frequency::convert(3, hz60, Frequency::nanoseconds()), 50'000'000);
}

TEST(FrequencyTest, ConvertRoundTrip) {
    auto ms = *Frequency::from_hz(1000);
    auto ns = Frequency::nanoseconds();
    for (int64_t n : {int64_t{0}, int64_t{1}, int64_t{-7}, int64_t{123'456'789},
                      int64_t{-9'000'000'000}}) {
        auto there = Frequency::convert(n, ms, ns);
        ASSERT_TRUE(there.has_value());
        auto back = Frequency::convert(*there, ns, ms);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, n);
    }
}

TEST(FrequencyTest, ConvertRoundTripThroughCoarserRationalRate) {
    // 44.1 kHz samples and 48 kHz samples share a 300 Hz grid
    auto cd = *Frequency::from_hz(44'100);
    auto dat = *Frequency::from_hz(48'000);
    for (int64_t n = 0; n < 44'100 * 3; n += 147) {
        auto there = Frequency::convert(n, cd, dat);
        ASSERT_TRUE(there.has_value());
        EXPECT_EQ(*Frequency::convert(*there, dat, cd), n);
    }
}

TEST(FrequencyTest, ConvertHugeIntermediateDoesNotOverflow) {
    // Coprime terms near 2^64: count * to.ticks * from.per needs ~190 bits
    constexpr uint64_t p = 18'446'744'073'709'551'557ULL; // 2^64 - 59
    auto from = *Frequency::create(p, p - 2);
    auto to = *Frequency::create(p - 2, p);
    ASSERT_EQ(from.ticks(), p);
    ASSERT_EQ(to.ticks(), p - 2);

    // Exact ratio is (1 - 2/p)^2, so 2^60 loses ~0.25 and rounds back up
    const int64_t count = int64_t{1} << 60;
    auto r = Frequency::convert(count, from, to);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, count);
}

TEST(FrequencyTest, ConvertOverflowReported) {
    auto one_hz = *Frequency::from_hz(1);
    auto r = Frequency::convert(std::numeric_limits<int64_t>::max(), one_hz,
                                Frequency::nanoseconds());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TimeError::arithmetic_overflow);
}

TEST(FrequencyTest, ConvertInt64MinToSameRate) {
    auto f = *Frequency::from_hz(1000);
    auto r = Frequency::convert(std::numeric_limits<int64_t>::min(), f, f);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, std::numeric_limits<int64_t>::min());
}

// ==============================================================================
// scaled()
// ==============================================================================

TEST(FrequencyTest, ScaledIsExactAndReduced) {
    auto f = *Frequency::from_hz(60);
    auto half = f.scaled(1, 2);
    ASSERT_TRUE(half.has_value());
    EXPECT_EQ(*half, *Frequency::from_hz(30));

    auto third = f.scaled(1, 7);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->ticks(), 60u);
    EXPECT_EQ(third->per(), 7u);
}

TEST(FrequencyTest, ScaledRejectsZeroTerms) {
    auto f = *Frequency::from_hz(60);
    EXPECT_EQ(f.scaled(0, 1).error(), TimeError::invalid_frequency);
    EXPECT_EQ(f.scaled(1, 0).error(), TimeError::invalid_frequency);
}

TEST(FrequencyTest, ScaledOverflow) {
    auto f = *Frequency::create(std::numeric_limits<uint64_t>::max(), 1);
    auto r = f.scaled(3, 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TimeError::arithmetic_overflow);
}

// ==============================================================================
// Fraction
// ==============================================================================

TEST(FractionTest, NormalizesSignAndTerms) {
    Fraction f(6, -8);
    EXPECT_EQ(f.num, -3);
    EXPECT_EQ(f.den, 4);
    EXPECT_EQ(Fraction(0, 5), Fraction());
    EXPECT_EQ(Fraction(3, 0), Fraction());
}

TEST(FractionTest, OrderingAndConversion) {
    EXPECT_LT(Fraction(1, 3), Fraction(1, 2));
    EXPECT_GT(Fraction(-1, 3), Fraction(-1, 2));
    EXPECT_DOUBLE_EQ(static_cast<double>(Fraction(1, 4)), 0.25);
}
