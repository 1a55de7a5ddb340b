#include "consensus/store.hpp"

#include <functional>

#include <gtest/gtest.h>
#include "consensus/store_error.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "dal/consensus_dal.hpp"
#include "dal/keys.hpp"
#include "mock/src/storage/transaction_mock.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_log_database.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace qstore::consensus;
using namespace std::chrono_literals;
using qstore::base::Buffer;
using qstore::concurrency::Ctx;
using qstore::storage::ConnectionPool;
using qstore::storage::DatabaseError;
using qstore::storage::LogEntry;
using qstore::storage::LogTransaction;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

using TransactionMock =
    NiceMock<qstore::storage::face::TransactionMock<Buffer, Buffer>>;
using DatabaseMock =
    NiceMock<qstore::storage::face::TransactionalStorageMock<Buffer, Buffer>>;

/**
 * Store over a database whose transactions are mocks; every new transaction
 * behaves like an empty database unless a test reconfigures it
 */
class StoreFailureTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(*db_, begin()).WillByDefault(Invoke([this] {
      auto txn = std::make_unique<TransactionMock>();
      ON_CALL(*txn, get(_)).WillByDefault(Return(DatabaseError::NOT_FOUND));
      ON_CALL(*txn, put(_, _)).WillByDefault(Return(outcome::success()));
      ON_CALL(*txn, insert(_, _)).WillByDefault(Return(outcome::success()));
      ON_CALL(*txn, remove(_)).WillByDefault(Return(outcome::success()));
      ON_CALL(*txn, first(_))
          .WillByDefault(Return(boost::optional<LogEntry>{}));
      ON_CALL(*txn, last(_)).WillByDefault(Return(boost::optional<LogEntry>{}));
      ON_CALL(*txn, rollbackToSavePoint())
          .WillByDefault(Return(outcome::success()));
      ON_CALL(*txn, popSavePoint()).WillByDefault(Return(outcome::success()));
      ON_CALL(*txn, commit()).WillByDefault(Return(outcome::success()));
      if (configure_) {
        configure_(*txn);
      }
      return std::unique_ptr<LogTransaction>(std::move(txn));
    }));
    pool_ = ConnectionPool::create(db_, 2, 100ms);
    config_.operator_address[0] = 0x0F;
    store_ = std::make_shared<Store>(pool_, provider_, config_);
  }

  /// Raw certificate row as written by a real database
  static Buffer certificateRow(qstore::primitives::BlockNumber number) {
    auto pool = ConnectionPool::create(
        std::make_shared<qstore::storage::InMemoryLogDatabase>(), 1, 100ms);
    auto conn = pool->accessTagged(Ctx::background(), "test");
    EXPECT_TRUE(conn);
    qstore::primitives::CommitQC qc;
    qc.header.number = number;
    EXPECT_TRUE(qstore::dal::ConsensusDal(*conn.value())
                    .insertCertificate(qc, qstore::primitives::Address{}));
    auto row = conn.value()->run([&](LogTransaction &txn) {
      return txn.get(qstore::dal::certificateKey(number));
    });
    EXPECT_TRUE(row);
    return row.value();
  }

  Ctx ctx_ = Ctx::background();
  std::shared_ptr<DatabaseMock> db_ = std::make_shared<DatabaseMock>();
  std::function<void(TransactionMock &)> configure_;
  std::shared_ptr<qstore::crypto::ED25519Provider> provider_ =
      std::make_shared<qstore::crypto::ED25519ProviderImpl>();
  StoreConfig config_;
  std::shared_ptr<ConnectionPool> pool_;
  std::shared_ptr<Store> store_;
};

/**
 * @given a log where the first certificate exists but the last one cannot
 * be found
 * @when the certified range is read
 * @then GENESIS_DISAPPEARED is returned
 */
TEST_F(StoreFailureTest, GenesisDisappeared) {
  auto row = certificateRow(0);
  configure_ = [row](TransactionMock &txn) {
    ON_CALL(txn, first(_))
        .WillByDefault(Return(boost::make_optional(
            LogEntry{qstore::dal::certificateKey(0), row})));
  };
  EXPECT_OUTCOME_ERROR(store_->state(ctx_), StoreError::GENESIS_DISAPPEARED);
}

/**
 * @given a log whose reads fail
 * @when the store reads certificates and replica state
 * @then the storage error is returned unchanged
 */
TEST_F(StoreFailureTest, ReadErrorsPropagate) {
  configure_ = [](TransactionMock &txn) {
    ON_CALL(txn, get(_)).WillByDefault(Return(DatabaseError::IO_ERROR));
    ON_CALL(txn, first(_)).WillByDefault(Return(DatabaseError::IO_ERROR));
  };
  EXPECT_OUTCOME_ERROR(store_->state(ctx_), DatabaseError::IO_ERROR);
  EXPECT_OUTCOME_ERROR(store_->block(ctx_, 3), DatabaseError::IO_ERROR);
  EXPECT_OUTCOME_ERROR(store_->replicaState(ctx_), DatabaseError::IO_ERROR);
  EXPECT_OUTCOME_ERROR(store_->propose(ctx_, 3), DatabaseError::IO_ERROR);
}

/**
 * @given a log that fails to commit
 * @when the replica state is written
 * @then the commit error is returned
 */
TEST_F(StoreFailureTest, CommitErrorPropagates) {
  configure_ = [](TransactionMock &txn) {
    ON_CALL(txn, commit()).WillByDefault(Return(DatabaseError::CONFLICT));
  };
  EXPECT_OUTCOME_ERROR(store_->setReplicaState(ctx_, "state"_buf),
                       DatabaseError::CONFLICT);
}

/**
 * @given an empty log
 * @when nothing is certified
 * @then state and block report absence without errors
 */
TEST_F(StoreFailureTest, EmptyLog) {
  EXPECT_OUTCOME_TRUE(state, store_->state(ctx_));
  EXPECT_FALSE(state);
  EXPECT_OUTCOME_TRUE(block, store_->block(ctx_, 0));
  EXPECT_FALSE(block);
  EXPECT_OUTCOME_TRUE(replica, store_->replicaState(ctx_));
  EXPECT_FALSE(replica);
}
