#include <limits>

#include <cstdint>
#include <gtest/gtest.h>
#include <steptime.hpp>

using namespace steptime;

namespace {

TimeStamp at_ns(int64_t ns) {
    return TimeStamp::now_from(TimeSpan::from_nanoseconds(ns));
}

} // namespace

TEST(TimeStampTest, EpochIsZeroOffset) {
    EXPECT_EQ(TimeStamp::epoch().since_epoch(), TimeSpan::zero());
    EXPECT_EQ(TimeStamp(), TimeStamp::epoch());
}

TEST(TimeStampTest, NowFromAndFromEpochAgree) {
    const TimeSpan offset = TimeSpan::from_nanoseconds(42);
    EXPECT_EQ(TimeStamp::now_from(offset), TimeStamp::from_epoch(offset));
    EXPECT_EQ(TimeStamp::now_from(offset).since_epoch(), offset);
}

TEST(TimeStampTest, DifferenceIsExact) {
    auto t1 = at_ns(1'000'000'123);
    auto t2 = at_ns(16'666'667);
    auto d = t1.sub(t2);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->nanoseconds(), 983'333'456);
    EXPECT_EQ(*t1.elapsed_since(t2), *d);
}

TEST(TimeStampTest, DifferenceNegativeWhenOtherIsLater) {
    auto early = at_ns(10);
    auto late = at_ns(25);
    EXPECT_EQ(early.sub(late)->nanoseconds(), -15);
}

TEST(TimeStampTest, SubIsAntisymmetric) {
    const int64_t points[] = {0, 1, -1, 16'666'667, -5'000'000'000, 86'400'000'000'000};
    for (int64_t a : points) {
        for (int64_t b : points) {
            auto t1 = at_ns(a);
            auto t2 = at_ns(b);
            EXPECT_EQ(t1 - t2, -(t2 - t1));
        }
    }
}

TEST(TimeStampTest, OffsetRoundTrip) {
    auto t = at_ns(500);
    auto later = t.add(TimeSpan::millisecond());
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->since_epoch().nanoseconds(), 1'000'500);
    EXPECT_EQ(*later->sub_span(TimeSpan::millisecond()), t);
    EXPECT_EQ(*later - t, TimeSpan::millisecond());
}

TEST(TimeStampTest, OffsetOverflow) {
    auto last = TimeStamp::from_epoch(TimeSpan::max());
    auto r = last.add(TimeSpan::nanosecond());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), TimeError::arithmetic_overflow);

    auto first = TimeStamp::from_epoch(TimeSpan::min());
    EXPECT_EQ(first.sub_span(TimeSpan::nanosecond()).error(), TimeError::arithmetic_overflow);
}

TEST(TimeStampTest, DifferenceOverflow) {
    auto last = TimeStamp::from_epoch(TimeSpan::max());
    auto first = TimeStamp::from_epoch(TimeSpan::min());
    EXPECT_EQ(last.sub(first).error(), TimeError::arithmetic_overflow);
    EXPECT_THROW((void)(last - first), TimeException);
}

TEST(TimeStampTest, Operators) {
    TimeStamp t;
    t += TimeSpan::second();
    t -= TimeSpan::millisecond();
    EXPECT_EQ(t.since_epoch().nanoseconds(), 999'000'000);
    EXPECT_EQ(t + TimeSpan::millisecond(), at_ns(1'000'000'000));
    EXPECT_EQ(t - TimeSpan::second(), at_ns(-1'000'000));
    EXPECT_THROW((void)(TimeStamp::from_epoch(TimeSpan::max()) + TimeSpan::nanosecond()),
                 TimeException);
}

TEST(TimeStampTest, OrderingFollowsOffset) {
    EXPECT_LT(at_ns(-1), TimeStamp::epoch());
    EXPECT_LT(at_ns(1), at_ns(2));
    EXPECT_GE(at_ns(2), at_ns(2));
}
