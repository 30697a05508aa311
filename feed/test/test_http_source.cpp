#include "HttpSource.h"
#include <gtest/gtest.h>

class HttpSourceTest : public ::testing::Test {
protected:
  HttpSourceTest() : rng_(3), filler_(rng_) {}

  std::mt19937_64 rng_;
  pos::feed::SyntheticSource filler_;
};

TEST_F(HttpSourceTest, ParseBodyUsesTitles) {
  pos::feed::HttpSource source(pos::feed::HttpSource::Config{}, filler_);

  auto records = source.parseBody(
      R"([{"id":1,"title":"first"},{"id":2,"title":"second"}])", 5);
  ASSERT_TRUE(records.isOk()) << records.error().message;
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ(records.value()[0].data.at("api_title"), "first");
  EXPECT_EQ(records.value()[1].data.at("api_title"), "second");
  EXPECT_GE(records.value()[0].amount, pos::feed::SyntheticSource::MIN_AMOUNT);
  EXPECT_TRUE(pos::feed::AddressGenerator::isValidAddress(records.value()[0].sender));
}

TEST_F(HttpSourceTest, ParseBodyDefaultsMissingTitle) {
  pos::feed::HttpSource source(pos::feed::HttpSource::Config{}, filler_);

  auto records = source.parseBody(R"([{"id":1},{"title":7}])", 5);
  ASSERT_TRUE(records.isOk());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ(records.value()[0].data.at("api_title"), "N/A");
  EXPECT_EQ(records.value()[1].data.at("api_title"), "N/A");
}

TEST_F(HttpSourceTest, ParseBodyLimitsCount) {
  pos::feed::HttpSource source(pos::feed::HttpSource::Config{}, filler_);

  auto records = source.parseBody(R"([{"title":"a"},{"title":"b"},{"title":"c"}])", 2);
  ASSERT_TRUE(records.isOk());
  EXPECT_EQ(records->size(), 2u);
}

TEST_F(HttpSourceTest, ParseBodyRejectsMalformedPayload) {
  pos::feed::HttpSource source(pos::feed::HttpSource::Config{}, filler_);

  auto notJson = source.parseBody("<html>", 5);
  ASSERT_TRUE(notJson.isError());
  EXPECT_EQ(notJson.error().code, pos::feed::TransactionSource::E_PAYLOAD);

  auto notArray = source.parseBody(R"({"title":"x"})", 5);
  ASSERT_TRUE(notArray.isError());
  EXPECT_EQ(notArray.error().code, pos::feed::TransactionSource::E_PAYLOAD);
}

TEST_F(HttpSourceTest, UnreachableHostIsTransportError) {
  pos::feed::HttpSource::Config config;
  config.baseUrl = "http://127.0.0.1:1";
  config.connectTimeoutMs = 500;
  config.readTimeoutMs = 500;
  pos::feed::HttpSource source(config, filler_);

  auto records = source.fetch(5);
  ASSERT_TRUE(records.isError());
  EXPECT_EQ(records.error().code, pos::feed::TransactionSource::E_TRANSPORT);
  EXPECT_EQ(source.getName(), "http://127.0.0.1:1/posts");
}
