#include <limits>

#include <cstdint>
#include <gtest/gtest.h>
#include <steptime.hpp>

using namespace steptime;

namespace {

TimeSpan ns(int64_t n) {
    return TimeSpan::from_nanoseconds(n);
}

TimeSpan ms(int64_t n) {
    return *TimeSpan::from_milliseconds(n);
}

} // namespace

TEST(ClockRateTest, DefaultIsRealTime) {
    ClockRate rate;
    EXPECT_EQ(rate.rate(), Fraction(1, 1));
    EXPECT_FALSE(rate.is_paused());

    auto s = rate.step(ms(16));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->step, ms(16));
    EXPECT_EQ(s->now.since_epoch(), ms(16));
}

TEST(ClockRateTest, FastForward) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(2, 1).has_value());
    EXPECT_EQ(rate.step(ms(5))->step, ms(10));
}

TEST(ClockRateTest, SetRateReduces) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(2, 6).has_value());
    EXPECT_EQ(rate.rate(), Fraction(1, 3));
}

TEST(ClockRateTest, SetRateRejectsBadTerms) {
    ClockRate rate;
    EXPECT_EQ(rate.set_rate(1, 0).error(), TimeError::invalid_argument);
    EXPECT_EQ(rate.set_rate(uint64_t{1} << 63, 1).error(), TimeError::invalid_argument);
    EXPECT_EQ(rate.rate(), Fraction(1, 1));
}

TEST(ClockRateTest, ThirdRateSumsExactly) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(1, 3).has_value());

    TimeSpan total;
    for (int i = 0; i < 3; ++i) {
        auto s = rate.step(ns(10));
        ASSERT_TRUE(s.has_value());
        EXPECT_GE(s->step, ns(3));
        EXPECT_LE(s->step, ns(4));
        total += s->step;
    }
    EXPECT_EQ(total, ns(10));
    EXPECT_EQ(rate.now().since_epoch(), ns(10));
}

TEST(ClockRateTest, TinyStepsCarrySubNanosecondRemainder) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(1, 3).has_value());
    EXPECT_TRUE(rate.step(ns(1))->step.is_zero());
    EXPECT_TRUE(rate.step(ns(1))->step.is_zero());
    EXPECT_EQ(rate.step(ns(1))->step, ns(1));
}

TEST(ClockRateTest, RemainderRescaledOnRateChange) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(1, 3).has_value());
    ASSERT_TRUE(rate.step(ns(1))->step.is_zero());

    // 1/3 ns carried becomes 2/6
    ASSERT_TRUE(rate.set_rate(1, 6).has_value());
    EXPECT_EQ(rate.step(ns(4))->step, ns(1));
    EXPECT_EQ(rate.step(ns(5))->step, ns(0));
    EXPECT_EQ(rate.step(ns(1))->step, ns(1));
}

TEST(ClockRateTest, PauseFreezesGameTime) {
    ClockRate rate;
    ASSERT_TRUE(rate.step(ms(10)).has_value());
    rate.pause();
    EXPECT_TRUE(rate.is_paused());
    EXPECT_EQ(rate.rate(), Fraction());

    auto s = rate.step(TimeSpan::second());
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->step.is_zero());
    EXPECT_EQ(rate.now().since_epoch(), ms(10));

    ASSERT_TRUE(rate.set_rate(1, 1).has_value());
    EXPECT_EQ(rate.step(ms(1))->now.since_epoch(), ms(11));
}

TEST(ClockRateTest, ZeroNumeratorPauses) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(0, 5).has_value());
    EXPECT_TRUE(rate.is_paused());
    EXPECT_EQ(rate.rate(), Fraction(0, 1));
}

TEST(ClockRateTest, NegativeSpanRejected) {
    ClockRate rate;
    EXPECT_EQ(rate.step(ns(-1)).error(), TimeError::invalid_argument);
    EXPECT_EQ(rate.now(), TimeStamp::epoch());
}

TEST(ClockRateTest, OverflowLeavesClockUnchanged) {
    ClockRate rate;
    rate.set_now(TimeStamp::from_epoch(TimeSpan::max()));
    EXPECT_EQ(rate.step(ns(1)).error(), TimeError::arithmetic_overflow);
    EXPECT_EQ(rate.now(), TimeStamp::from_epoch(TimeSpan::max()));

    ClockRate fast;
    ASSERT_TRUE(fast.set_rate(4, 1).has_value());
    EXPECT_EQ(fast.step(TimeSpan::max()).error(), TimeError::arithmetic_overflow);
}

TEST(ClockRateTest, ResetKeepsRate) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(1, 2).has_value());
    ASSERT_TRUE(rate.step(ms(7)).has_value());
    rate.reset();
    EXPECT_EQ(rate.now(), TimeStamp::epoch());
    EXPECT_EQ(rate.rate(), Fraction(1, 2));
}

// ==============================================================================
// Scaled ticker
// ==============================================================================

TEST(ClockRateTest, TickerRunsInGameTime) {
    ClockRate rate;
    ASSERT_TRUE(rate.set_rate(1, 2).has_value());

    auto ticker = rate.ticker(*Frequency::from_hz(60));
    ASSERT_TRUE(ticker.has_value());
    EXPECT_EQ(ticker->frequency(), *Frequency::from_hz(30));

    // One real second is half a game second: 30 of the 60 Hz ticks
    EXPECT_EQ(*ticker->tick_count(TimeSpan::second()), 30u);
}

TEST(ClockRateTest, TickerStartsAtGameNow) {
    ClockRate rate;
    ASSERT_TRUE(rate.step(ms(40)).has_value());
    auto ticker = rate.ticker(*Frequency::from_hz(100));
    ASSERT_TRUE(ticker.has_value());
    EXPECT_EQ(ticker->now(), rate.now());
}

TEST(ClockRateTest, TickerUnavailableWhilePaused) {
    ClockRate rate;
    rate.pause();
    EXPECT_EQ(rate.ticker(*Frequency::from_hz(60)).error(), TimeError::invalid_frequency);
}
