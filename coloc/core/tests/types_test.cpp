#include <coloc/core/types.hpp>
#include <coloc/core/result.hpp>
#include <coloc/core/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace coloc::core;

// ============================================================================
// Duration tests
// ============================================================================

TEST(DurationTest, Factories) {
    Duration d1 = duration_from_seconds(1.5);
    EXPECT_DOUBLE_EQ(duration_to_seconds(d1), 1.5);

    Duration d2 = duration_from_nanoseconds(500);
    EXPECT_EQ(duration_to_nanoseconds(d2), 500);

    Duration d3 = duration_from_milliseconds(800);
    EXPECT_EQ(duration_to_nanoseconds(d3), 800'000'000);
    EXPECT_EQ(d3.milliseconds(), 800);

    EXPECT_EQ(Duration{}, Duration::zero());
}

TEST(DurationTest, Arithmetic) {
    Duration a = duration_from_seconds(5.0);
    Duration b = duration_from_seconds(3.0);

    EXPECT_DOUBLE_EQ(duration_to_seconds(a + b), 8.0);
    EXPECT_DOUBLE_EQ(duration_to_seconds(a - b), 2.0);

    Duration c = a;
    c -= b;
    EXPECT_EQ(c, duration_from_seconds(2.0));
    EXPECT_LT(b, a);
    EXPECT_DOUBLE_EQ(duration_to_seconds(-a), -5.0);
}

// ============================================================================
// TimePoint tests
// ============================================================================

TEST(TimePointTest, EpochArithmetic) {
    TimePoint t = time_from_seconds(1700000000.25);
    EXPECT_DOUBLE_EQ(time_to_seconds(t), 1700000000.25);

    TimePoint later = t + duration_from_milliseconds(750);
    EXPECT_EQ(later - t, duration_from_milliseconds(750));
    EXPECT_GT(later, t);

    EXPECT_EQ(time_from_epoch(duration_from_seconds(2.0)), time_from_seconds(2.0));
    EXPECT_EQ(TimePoint::epoch(), TimePoint{});
}

// ============================================================================
// Status / Result tests
// ============================================================================

TEST(ResultTest, DefaultStatusIsSuccess) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_TRUE(static_cast<bool>(status));
    EXPECT_THROW((void)status.error(), InvalidStateError);
}

TEST(ResultTest, FailureCarriesKindAndMessage) {
    Status status = Status::failure(ErrorKind::NotFound, "no such process");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(status.error().message, "no such process");
    EXPECT_EQ(to_string(status.error().kind), "not_found");
}

TEST(ResultTest, ValueAccess) {
    Result<int> good = 42;
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.value(), 42);
    EXPECT_TRUE(good.status().ok());
    EXPECT_THROW((void)good.error(), InvalidStateError);

    Result<int> bad = Result<int>::failure(ErrorKind::Transient, "try later");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, ErrorKind::Transient);
    EXPECT_FALSE(bad.status().ok());
    EXPECT_THROW((void)bad.value(), InvalidStateError);
}

TEST(ResultTest, ErrorHierarchy) {
    try {
        throw OutOfRangeError("core 9");
    } catch (const ControllerError& e) {
        EXPECT_EQ(std::string(e.what()), "core 9");
    }
}
