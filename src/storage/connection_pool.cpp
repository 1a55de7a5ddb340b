#include "storage/connection_pool.hpp"

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::storage, PoolError, e) {
  using E = qstore::storage::PoolError;
  switch (e) {
    case E::POOL_EXHAUSTED:
      return "timed out waiting for a free database connection";
    case E::POOL_CLOSED:
      return "connection pool is closed";
  }
  return "unknown connection pool error";
}

namespace qstore::storage {

  Connection::Connection(std::shared_ptr<ConnectionPool> pool,
                         std::shared_ptr<LogDatabase> database,
                         std::string tag)
      : pool_{std::move(pool)},
        database_{std::move(database)},
        tag_{std::move(tag)} {}

  Connection::~Connection() {
    if (txn_) {
      txn_->rollback();
      txn_.reset();
    }
    pool_->release();
  }

  outcome::result<void> Connection::begin() {
    if (!txn_) {
      txn_ = database_->begin();
    } else {
      txn_->setSavePoint();
    }
    ++depth_;
    return outcome::success();
  }

  outcome::result<void> Connection::commit() {
    if (!txn_) {
      return DatabaseError::NO_TRANSACTION;
    }
    if (--depth_ > 0) {
      return txn_->popSavePoint();
    }
    auto txn = std::move(txn_);
    return txn->commit();
  }

  outcome::result<void> Connection::rollback() {
    if (!txn_) {
      return DatabaseError::NO_TRANSACTION;
    }
    if (--depth_ > 0) {
      return txn_->rollbackToSavePoint();
    }
    auto txn = std::move(txn_);
    txn->rollback();
    return outcome::success();
  }

  std::shared_ptr<ConnectionPool> ConnectionPool::create(
      std::shared_ptr<LogDatabase> database,
      size_t size,
      std::chrono::milliseconds acquire_timeout) {
    return std::shared_ptr<ConnectionPool>(
        new ConnectionPool(std::move(database), size, acquire_timeout));
  }

  ConnectionPool::ConnectionPool(std::shared_ptr<LogDatabase> database,
                                 size_t size,
                                 std::chrono::milliseconds acquire_timeout)
      : database_{std::move(database)},
        size_{size},
        acquire_timeout_{acquire_timeout},
        available_{size},
        logger_{base::createLogger("ConnectionPool")} {}

  outcome::result<std::unique_ptr<Connection>> ConnectionPool::accessTagged(
      const concurrency::Ctx &ctx, std::string_view tag) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto until = concurrency::Ctx::Clock::now() + acquire_timeout_;
    OUTCOME_TRY((auto &&, acquired),
                ctx.wait(
                    lock,
                    cv_,
                    [this] { return closed_ || available_ > 0; },
                    until));
    if (closed_) {
      return PoolError::POOL_CLOSED;
    }
    if (!acquired) {
      logger_->warn("{}: no free connection after {} ms",
                    tag,
                    acquire_timeout_.count());
      return PoolError::POOL_EXHAUSTED;
    }
    --available_;
    lock.unlock();

    return std::unique_ptr<Connection>(
        new Connection(shared_from_this(), database_, std::string(tag)));
  }

  void ConnectionPool::close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
  }

  void ConnectionPool::release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++available_;
    }
    cv_.notify_one();
  }

}  // namespace qstore::storage
