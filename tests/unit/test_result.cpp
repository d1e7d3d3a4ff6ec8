/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace sandbox_runner;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThenShortCircuits) {
    auto halve = [](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorKind::Validation, "odd"};
        return v / 2;
    };
    Result<int> even = 8;
    Result<int> odd = 7;
    EXPECT_EQ(*even.and_then(halve), 4);
    auto failed = odd.and_then(halve);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::Validation);
}

TEST(ResultTest, AccessingWrongAlternativeThrows) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)success.error(), std::runtime_error);
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok;
    Result<void> bad = Error{ErrorKind::Provision, "no room", "capacity"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().reason, "capacity");
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorKind::Timeout, "too slow", "wall_clock");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(r.error().message, "too slow");
    EXPECT_EQ(r.error().reason, "wall_clock");
}

// ─── Error taxonomy ──────────────────────────

TEST(ErrorKindTest, DefaultKindIsInternal) {
    Error error{"plain"};
    EXPECT_EQ(error.kind, ErrorKind::Internal);
    EXPECT_TRUE(error.reason.empty());
}

TEST(ErrorKindTest, WireNames) {
    EXPECT_EQ(to_string(ErrorKind::Auth), "auth_error");
    EXPECT_EQ(to_string(ErrorKind::Validation), "validation_error");
    EXPECT_EQ(to_string(ErrorKind::AdmissionRejected), "admission_rejected");
    EXPECT_EQ(to_string(ErrorKind::Provision), "provision_error");
    EXPECT_EQ(to_string(ErrorKind::ExecutionFailure), "execution_failure");
    EXPECT_EQ(to_string(ErrorKind::Timeout), "timeout_error");
    EXPECT_EQ(to_string(ErrorKind::Internal), "internal_error");
}

TEST(ErrorKindTest, OnlyCapacityProblemsAreRetryable) {
    EXPECT_TRUE(is_retryable(ErrorKind::AdmissionRejected));
    EXPECT_TRUE(is_retryable(ErrorKind::Provision));
    EXPECT_FALSE(is_retryable(ErrorKind::Auth));
    EXPECT_FALSE(is_retryable(ErrorKind::Validation));
    EXPECT_FALSE(is_retryable(ErrorKind::ExecutionFailure));
    EXPECT_FALSE(is_retryable(ErrorKind::Timeout));
    EXPECT_FALSE(is_retryable(ErrorKind::Internal));
}
