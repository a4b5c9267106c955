#include "../ResultOrError.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

struct TestError : ws::RoeErrorBase {
    using ws::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ws::ResultOrError<T, TestError>;

Roe<int> half(int value) {
    if (value % 2 != 0) {
        return TestError(5, "odd value " + std::to_string(value));
    }
    return value / 2;
}

Roe<void> check(bool ok) {
    if (!ok) {
        return TestError(6, "check failed");
    }
    return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
    auto result = half(10);
    ASSERT_TRUE(result.isOk());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 5);
    EXPECT_EQ(*result, 5);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
    auto result = half(3);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, 5);
    EXPECT_EQ(result.error().message, "odd value 3");
    EXPECT_EQ(result.valueOr(-1), -1);
    EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, CopyAndMovePreserveState) {
    Roe<std::vector<std::string>> original(std::vector<std::string>{"a", "b"});
    Roe<std::vector<std::string>> copy = original;
    Roe<std::vector<std::string>> moved = std::move(original);
    EXPECT_EQ(copy->size(), 2u);
    EXPECT_EQ(moved.value()[1], "b");

    Roe<std::vector<std::string>> failed = TestError(1, "x");
    copy = failed;
    EXPECT_TRUE(copy.isError());
    EXPECT_EQ(copy.error().message, "x");
}

TEST(ResultOrErrorTest, VoidSpecialization) {
    EXPECT_TRUE(check(true).isOk());
    auto failed = check(false);
    ASSERT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().code, 6);
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
    TestError error("plain");
    EXPECT_EQ(error.code, -1);
    EXPECT_EQ(error.message, "plain");
}
