#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace {

struct TestError : pos::RoeErrorBase {
  using pos::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = pos::ResultOrError<T, TestError>;

Roe<int> parsePositive(int value) {
  if (value <= 0) {
    return TestError(7, "not positive");
  }
  return value;
}

Roe<void> check(bool ok) {
  if (!ok) {
    return TestError("failed");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = parsePositive(5);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
  EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = parsePositive(-1);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 7);
  EXPECT_EQ(result.error().message, "not positive");
  EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
  auto result = check(false);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, -1);
  EXPECT_TRUE(check(true).isOk());
}

TEST(ResultOrErrorTest, CopyAndMoveKeepContents) {
  Roe<std::vector<std::string>> original(std::vector<std::string>{ "a", "b" });
  Roe<std::vector<std::string>> copy = original;
  ASSERT_TRUE(copy.isOk());
  EXPECT_EQ(copy->size(), 2u);

  Roe<std::vector<std::string>> moved = std::move(copy);
  ASSERT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value()[1], "b");

  moved = TestError(3, "replaced");
  ASSERT_TRUE(moved.isError());
  EXPECT_EQ(moved.error().code, 3);
}

TEST(ResultOrErrorTest, ErrorPrints) {
  std::ostringstream oss;
  oss << TestError(12, "bad hash");
  EXPECT_EQ(oss.str(), "[12] bad hash");
}
