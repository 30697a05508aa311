#include "SyntheticSource.h"
#include <gtest/gtest.h>

#include <cmath>

TEST(SyntheticSourceTest, FetchReturnsRequestedCount) {
  std::mt19937_64 rng(7);
  pos::feed::SyntheticSource source(rng);

  auto records = source.fetch(8);
  ASSERT_TRUE(records.isOk());
  EXPECT_EQ(records->size(), 8u);

  auto none = source.fetch(0);
  ASSERT_TRUE(none.isOk());
  EXPECT_TRUE(none->empty());
}

TEST(SyntheticSourceTest, AmountsInRangeWithFourDecimals) {
  std::mt19937_64 rng(11);
  pos::feed::SyntheticSource source(rng);

  for (int i = 0; i < 500; ++i) {
    auto record = source.generate();
    EXPECT_GE(record.amount, pos::feed::SyntheticSource::MIN_AMOUNT);
    EXPECT_LE(record.amount, pos::feed::SyntheticSource::MAX_AMOUNT);
    double scaled = record.amount * 1e4;
    EXPECT_NEAR(scaled, std::round(scaled), 1e-6) << record.amount;
  }
}

TEST(SyntheticSourceTest, PartiesAreAddresses) {
  std::mt19937_64 rng(13);
  pos::feed::SyntheticSource source(rng);

  auto record = source.generate();
  EXPECT_TRUE(pos::feed::AddressGenerator::isValidAddress(record.sender));
  EXPECT_TRUE(pos::feed::AddressGenerator::isValidAddress(record.receiver));
  EXPECT_NE(record.sender, record.receiver);
  EXPECT_TRUE(record.data.empty());
  EXPECT_EQ(source.getName(), "synthetic");
}
