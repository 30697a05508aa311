#include "TransactionPool.h"
#include <gtest/gtest.h>

namespace {

pos::Transaction makeTx(int i) {
  return pos::Transaction::create("sender" + std::to_string(i), "receiver",
                                  static_cast<double>(i), {},
                                  static_cast<double>(i))
      .value();
}

} // namespace

TEST(TransactionPoolTest, StartsEmpty) {
  pos::consensus::TransactionPool pool;
  EXPECT_TRUE(pool.empty());
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_TRUE(pool.peek(5).empty());
  EXPECT_EQ(pool.drain(5), 0u);
}

TEST(TransactionPoolTest, PeekKeepsOrderAndContents) {
  pos::consensus::TransactionPool pool;
  for (int i = 1; i <= 7; ++i) {
    pool.add(makeTx(i));
  }

  auto batch = pool.peek(5);
  ASSERT_EQ(batch.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(batch[i], makeTx(i + 1));
  }
  EXPECT_EQ(pool.size(), 7u);
}

TEST(TransactionPoolTest, PeekShortPool) {
  pos::consensus::TransactionPool pool;
  pool.add(std::vector<pos::Transaction>{ makeTx(1), makeTx(2) });
  EXPECT_EQ(pool.peek(5).size(), 2u);
}

TEST(TransactionPoolTest, DrainRemovesOldestFirst) {
  pos::consensus::TransactionPool pool;
  for (int i = 1; i <= 7; ++i) {
    pool.add(makeTx(i));
  }

  EXPECT_EQ(pool.drain(5), 5u);
  auto rest = pool.getTransactions();
  ASSERT_EQ(rest.size(), 2u);
  EXPECT_EQ(rest[0], makeTx(6));
  EXPECT_EQ(rest[1], makeTx(7));

  EXPECT_EQ(pool.drain(5), 2u);
  EXPECT_TRUE(pool.empty());
}
