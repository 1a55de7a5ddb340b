#include "consensus/fetcher_cursor.hpp"

#include <random>
#include <set>

#include <gtest/gtest.h>
#include "storage/in_memory/in_memory_log_database.hpp"
#include "testutil/consensus/execution_log.hpp"
#include "testutil/outcome.hpp"

using namespace qstore::consensus;
using qstore::concurrency::Ctx;
using qstore::primitives::BlockHash;
using qstore::primitives::ExecBlockNumber;
using qstore::storage::ConnectionPool;
using qstore::storage::InMemoryLogDatabase;

class FetcherCursorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    pool_ = ConnectionPool::create(
        std::make_shared<InMemoryLogDatabase>(), 4, std::chrono::seconds(1));
  }

  static FetchedBlock makeBlock(ExecBlockNumber number,
                                qstore::primitives::BatchNumber batch,
                                bool last_in_batch,
                                size_t tx_count = 2) {
    FetchedBlock block;
    block.number = number;
    block.batch_number = batch;
    block.last_in_batch = last_in_batch;
    block.protocol_version = 24;
    block.timestamp = 1000 + number;
    block.l1_gas_price = 7;
    block.l2_fair_gas_price = 3;
    block.virtual_blocks = 1;
    block.operator_address[0] = 0x11;
    block.transactions =
        test::makeTransactions(static_cast<uint8_t>(number), tx_count);
    return block;
  }

  outcome::result<FetcherCursor> load() {
    OUTCOME_TRY((auto &&, conn), pool_->accessTagged(Ctx::background(), "t"));
    return FetcherCursor::load(*conn);
  }

  std::shared_ptr<ConnectionPool> pool_;
};

/**
 * @given an empty execution log
 * @when a cursor is loaded
 * @then it expects block 0 after the zero hash, outside of any batch
 */
TEST_F(FetcherCursorTest, LoadFromEmptyLog) {
  EXPECT_OUTCOME_TRUE(cursor, load());
  EXPECT_EQ(cursor.nextBlock(), 0u);
  EXPECT_EQ(cursor.prevBlockHash(), BlockHash{});
  EXPECT_FALSE(cursor.batch());
}

/**
 * @given a sealed batch followed by a block of an open batch
 * @when a cursor is loaded
 * @then it resumes after the newest block inside the open batch
 */
TEST_F(FetcherCursorTest, LoadResumesOpenBatch) {
  test::ExecutionLog log(pool_);
  ASSERT_TRUE(log.sealBlock(0, false));
  ASSERT_TRUE(log.sealBlock(0, true));
  EXPECT_OUTCOME_TRUE(newest, log.sealBlock(1, false));

  EXPECT_OUTCOME_TRUE(cursor, load());
  EXPECT_EQ(cursor.nextBlock(), 3u);
  EXPECT_EQ(cursor.prevBlockHash(), newest.hash);
  ASSERT_TRUE(cursor.batch());
  EXPECT_EQ(*cursor.batch(), 1u);
}

/**
 * @given a log whose newest block sealed its batch
 * @when a cursor is loaded
 * @then the cursor stays on the sealed batch, so the next block opens a new
 * one
 */
TEST_F(FetcherCursorTest, LoadAfterSealedBatch) {
  test::ExecutionLog log(pool_);
  ASSERT_TRUE(log.sealBlocks(4));

  EXPECT_OUTCOME_TRUE(cursor, load());
  EXPECT_EQ(cursor.nextBlock(), 4u);
  ASSERT_TRUE(cursor.batch());
  EXPECT_EQ(*cursor.batch(), 1u);

  EXPECT_OUTCOME_TRUE(actions, cursor.advance(makeBlock(4, 2, false)));
  EXPECT_NE(boost::get<OpenBatch>(&actions.front()), nullptr);
}

/**
 * @given a fresh cursor
 * @when three blocks of one batch are advanced
 * @then the batch is opened once, miniblocks follow, and the last block
 * seals the batch
 */
TEST_F(FetcherCursorTest, ActionsOfABatch) {
  FetcherCursor cursor(0, BlockHash{}, boost::none);

  EXPECT_OUTCOME_TRUE(first, cursor.advance(makeBlock(0, 0, false)));
  ASSERT_EQ(first.size(), 4u);
  const auto &open = boost::get<OpenBatch>(first[0]);
  EXPECT_EQ(open.number, 0u);
  EXPECT_EQ(open.first_block_number, 0u);
  EXPECT_EQ(open.timestamp, 1000u);
  EXPECT_EQ(open.protocol_version, 24);
  EXPECT_EQ(open.prev_block_hash, BlockHash{});
  EXPECT_EQ(boost::get<Tx>(first[1]).tx, makeBlock(0, 0, false).transactions[0]);
  EXPECT_NO_THROW(boost::get<SealMiniblock>(first[3]));

  EXPECT_OUTCOME_TRUE(second, cursor.advance(makeBlock(1, 0, false, 0)));
  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(boost::get<Miniblock>(second[0]), (Miniblock{1, 1001, 1}));

  EXPECT_OUTCOME_TRUE(third, cursor.advance(makeBlock(2, 0, true, 1)));
  ASSERT_EQ(third.size(), 3u);
  EXPECT_EQ(boost::get<SealBatch>(third[2]).virtual_blocks, 1u);

  EXPECT_EQ(cursor.nextBlock(), 3u);
  ASSERT_TRUE(cursor.batch());
  EXPECT_EQ(*cursor.batch(), 0u);
}

/**
 * @given blocks chained by the execution log
 * @when a follower cursor advances over their payloads
 * @then it computes the same block hashes as the sealing node
 */
TEST_F(FetcherCursorTest, HashesChainLikeTheSealingNode) {
  FetcherCursor cursor(0, BlockHash{}, boost::none);
  BlockHash prev;
  for (ExecBlockNumber n = 0; n < 3; ++n) {
    auto block = makeBlock(n, 0, n == 2);
    block.reference_hash =
        computeBlockHash(n, block.timestamp, prev, block.transactions);
    EXPECT_OUTCOME_TRUE_1(cursor.advance(block));
    EXPECT_EQ(cursor.prevBlockHash(), block.reference_hash);
    prev = block.reference_hash;
  }
}

/**
 * @given a cursor expecting block 2
 * @when blocks 1 and 3 are advanced
 * @then both fail with BLOCK_GAP and the cursor does not move
 */
TEST_F(FetcherCursorTest, BlockGap) {
  FetcherCursor cursor(2, BlockHash{}, 0);
  EXPECT_OUTCOME_ERROR(cursor.advance(makeBlock(1, 0, false)),
                       CursorError::BLOCK_GAP);
  EXPECT_OUTCOME_ERROR(cursor.advance(makeBlock(3, 0, false)),
                       CursorError::BLOCK_GAP);
  EXPECT_EQ(cursor.nextBlock(), 2u);
  EXPECT_EQ(*cursor.batch(), 0u);
}

/**
 * @given a cursor inside batch 0
 * @when a block opening batch 2 arrives
 * @then BATCH_GAP is returned and the cursor does not move
 */
TEST_F(FetcherCursorTest, BatchGap) {
  FetcherCursor cursor(2, BlockHash{}, 0);
  EXPECT_OUTCOME_ERROR(cursor.advance(makeBlock(2, 2, false)),
                       CursorError::BATCH_GAP);
  EXPECT_EQ(cursor.nextBlock(), 2u);
  EXPECT_OUTCOME_TRUE_1(cursor.advance(makeBlock(2, 1, false)));
}

/**
 * @given a stream of block numbers shuffled with duplicates and replays
 * @when every block is advanced in that order
 * @then each block yields actions at most once and the expected number
 * never decreases
 */
TEST_F(FetcherCursorTest, MonotonicUnderReplays) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<ExecBlockNumber> pick(0, 20);

  FetcherCursor cursor(0, BlockHash{}, boost::none);
  std::set<ExecBlockNumber> emitted;
  auto last_next = cursor.nextBlock();
  for (int i = 0; i < 2000; ++i) {
    // occasionally feed the expected block so the cursor makes progress
    auto number = (i % 3 == 0) ? cursor.nextBlock() : pick(rng);
    auto res = cursor.advance(makeBlock(number, number / 4, number % 4 == 3));
    if (res) {
      EXPECT_TRUE(emitted.insert(number).second) << "block " << number;
    }
    EXPECT_GE(cursor.nextBlock(), last_next);
    last_next = cursor.nextBlock();
  }
  EXPECT_GT(emitted.size(), 20u);
}
