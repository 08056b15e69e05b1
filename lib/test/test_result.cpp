#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

namespace {

struct TestError : tally::RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = tally::ResultOrError<T, TestError>;

Roe<int> half(int value) {
    if (value % 2 != 0) {
        return TestError(3, "odd value " + std::to_string(value));
    }
    return value / 2;
}

Roe<void> checkPositive(int value) {
    if (value <= 0) {
        return TestError("not positive");
    }
    return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
    auto result = half(10);
    ASSERT_TRUE(result.isOk());
    EXPECT_FALSE(result.isError());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 5);
    EXPECT_EQ(*result, 5);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
    auto result = half(7);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, 3);
    EXPECT_EQ(result.error().message, "odd value 7");
    EXPECT_THROW(result.value(), std::runtime_error);
    EXPECT_EQ(result.valueOr(-1), -1);
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasNegativeCode) {
    auto result = checkPositive(0);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, -1);
    EXPECT_EQ(result.error().message, "not positive");

    EXPECT_TRUE(checkPositive(1).isOk());
}

TEST(ResultOrErrorTest, CopyAndMovePreserveState) {
    Roe<std::string> ok = std::string("value");
    Roe<std::string> err = TestError(9, "bad");

    Roe<std::string> okCopy = ok;
    Roe<std::string> errMoved = std::move(err);
    EXPECT_EQ(okCopy.value(), "value");
    EXPECT_EQ(errMoved.error().code, 9);

    okCopy = errMoved;
    EXPECT_TRUE(okCopy.isError());
    EXPECT_EQ(okCopy.error().message, "bad");
    EXPECT_THROW(okCopy.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, ArrowAccessesValue) {
    Roe<std::string> result = std::string("abc");
    EXPECT_EQ(result->size(), 3u);
}

TEST(ResultOrErrorTest, MoveOnlyValue) {
    Roe<std::unique_ptr<int>> result = std::make_unique<int>(4);
    ASSERT_TRUE(result.isOk());
    std::unique_ptr<int> owned = std::move(result.value());
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 4);
}

TEST(ResultOrErrorTest, ErrorStreamsCodeAndMessage) {
    std::ostringstream oss;
    oss << TestError(2, "broken");
    EXPECT_EQ(oss.str(), "[2] broken");
}
