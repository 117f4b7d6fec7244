/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E>
 */

#include <gtest/gtest.h>
#include <bsonuuid/core/error.hpp>
#include <bsonuuid/core/result.hpp>

#include <stdexcept>
#include <string>

using namespace bsonuuid::core;

using IntResult = Result<int, InvalidArgument>;

TEST(ResultTest, OkHoldsValue) {
    auto r = IntResult::ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW(r.error(), std::logic_error);
}

TEST(ResultTest, ErrHoldsError) {
    auto r = IntResult::err(InvalidArgument("bad input"));
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_STREQ(r.error().what(), "bad input");
    EXPECT_THROW(r.value(), std::logic_error);
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ(IntResult::ok(1).value_or(7), 1);
    EXPECT_EQ(IntResult::err(InvalidArgument("x")).value_or(7), 7);
}

TEST(ResultTest, MapTransformsOnlyValues) {
    auto doubled = IntResult::ok(21).map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.is_ok());
    EXPECT_EQ(doubled.value(), 42);

    auto text = IntResult::err(InvalidArgument("nope")).map([](int v) { return std::to_string(v); });
    ASSERT_TRUE(text.is_err());
    EXPECT_STREQ(text.error().what(), "nope");
}

TEST(ResultTest, MoveOutValue) {
    auto r = Result<std::string, InvalidArgument>::ok("payload");
    std::string taken = std::move(r).value();
    EXPECT_EQ(taken, "payload");
}
