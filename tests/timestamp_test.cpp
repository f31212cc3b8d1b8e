#include <chrono>

#include <gtest/gtest.h>
#include <pcapstore/timestamp.hpp>

using namespace pcapstore;

// Test fixture for Timestamp tests
class TimestampTest : public ::testing::Test {
protected:
    static constexpr uint32_t test_seconds = 1699000000;  // Example timestamp
    static constexpr uint32_t test_nanoseconds = 500'000; // 500 microseconds
};

// Construction tests
TEST_F(TimestampTest, DefaultConstruction) {
    Timestamp ts;
    EXPECT_EQ(ts.seconds(), 0);
    EXPECT_EQ(ts.nanoseconds(), 0);
    EXPECT_EQ(ts.total_nanoseconds(), 0);
}

TEST_F(TimestampTest, ComponentConstruction) {
    Timestamp ts(test_seconds, test_nanoseconds);
    EXPECT_EQ(ts.seconds(), test_seconds);
    EXPECT_EQ(ts.nanoseconds(), test_nanoseconds);
}

TEST_F(TimestampTest, NormalizationOnConstruction) {
    // 2.5 seconds worth of nanoseconds
    Timestamp ts(100, 2'500'000'000U);
    EXPECT_EQ(ts.seconds(), 102);
    EXPECT_EQ(ts.nanoseconds(), 500'000'000U);
}

TEST_F(TimestampTest, NormalizationSaturatesAtMax) {
    Timestamp ts(UINT32_MAX, 1'500'000'000U);
    EXPECT_EQ(ts, Timestamp::max());
}

TEST_F(TimestampTest, TotalNanoseconds) {
    Timestamp ts(2, 5);
    EXPECT_EQ(ts.total_nanoseconds(), 2'000'000'005);
    EXPECT_EQ(ts.to_nanoseconds(), std::chrono::nanoseconds{2'000'000'005});
}

// Factory method tests
TEST_F(TimestampTest, FromSeconds) {
    auto ts = Timestamp::from_seconds(test_seconds);
    EXPECT_EQ(ts.seconds(), test_seconds);
    EXPECT_EQ(ts.nanoseconds(), 0);
}

TEST_F(TimestampTest, FromNanoseconds) {
    auto ts = Timestamp::from_nanoseconds(std::chrono::nanoseconds{1'700'000'000'123'456'789LL});
    EXPECT_EQ(ts.seconds(), 1'700'000'000U);
    EXPECT_EQ(ts.nanoseconds(), 123'456'789U);
}

TEST_F(TimestampTest, FromNegativeNanosecondsClampsToEpoch) {
    auto ts = Timestamp::from_nanoseconds(std::chrono::nanoseconds{-5});
    EXPECT_EQ(ts, Timestamp{});
}

TEST_F(TimestampTest, Now) {
    auto before = std::chrono::system_clock::now();
    auto ts = Timestamp::now();
    auto after = std::chrono::system_clock::now();

    auto before_sec =
        std::chrono::duration_cast<std::chrono::seconds>(before.time_since_epoch()).count();
    auto after_sec =
        std::chrono::duration_cast<std::chrono::seconds>(after.time_since_epoch()).count();

    EXPECT_GE(ts.seconds(), before_sec);
    EXPECT_LE(ts.seconds(), after_sec);
}

TEST_F(TimestampTest, ChronoRoundTrip) {
    Timestamp ts(test_seconds, 123'456'000);
    auto tp = ts.to_chrono();
    EXPECT_EQ(Timestamp::from_chrono(tp), ts);
}

// Comparison tests
TEST_F(TimestampTest, Ordering) {
    Timestamp a(test_seconds, 10);
    Timestamp b(test_seconds, 20);
    Timestamp c(test_seconds + 1, 0);

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_GT(c, a);
    EXPECT_EQ(a, Timestamp(test_seconds, 10));
    EXPECT_NE(a, b);
}

// Arithmetic tests
TEST_F(TimestampTest, OffsetByCarriesIntoSeconds) {
    Timestamp ts(test_seconds, 900'000'000);
    auto later = ts.offset_by(std::chrono::milliseconds{200});
    EXPECT_EQ(later.seconds(), test_seconds + 1);
    EXPECT_EQ(later.nanoseconds(), 100'000'000U);
}

TEST_F(TimestampTest, OffsetByNegative) {
    Timestamp ts(test_seconds, 100);
    auto earlier = ts.offset_by(std::chrono::nanoseconds{-200});
    EXPECT_EQ(earlier.seconds(), test_seconds - 1);
    EXPECT_EQ(earlier.nanoseconds(), 999'999'900U);
}

TEST_F(TimestampTest, OffsetBySaturates) {
    EXPECT_EQ(Timestamp(1, 0).offset_by(std::chrono::seconds{-5}), Timestamp{});
    EXPECT_EQ(Timestamp::max().offset_by(std::chrono::seconds{1}), Timestamp::max());
}

TEST_F(TimestampTest, Difference) {
    Timestamp a(test_seconds, 0);
    Timestamp b(test_seconds + 2, 500);
    EXPECT_EQ(b - a, std::chrono::nanoseconds{2'000'000'500});
    EXPECT_EQ(a - b, std::chrono::nanoseconds{-2'000'000'500});
}
