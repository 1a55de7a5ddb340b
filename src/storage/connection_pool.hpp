#ifndef QSTORE_STORAGE_CONNECTION_POOL_HPP
#define QSTORE_STORAGE_CONNECTION_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "base/logger.hpp"
#include "concurrency/ctx.hpp"
#include "storage/log_types.hpp"

namespace qstore::storage {

  enum class PoolError {
    /// no connection became free before the acquire timeout
    POOL_EXHAUSTED = 1,
    POOL_CLOSED,
  };

  class ConnectionPool;

  /**
   * @brief Exclusive handle on the log database borrowed from a
   * ConnectionPool. Outside of begin()/commit() every statement runs in its
   * own transaction committed immediately. begin() opens a transaction scope
   * shared by all following statements; nested begin() calls open save
   * points. Destroying the connection rolls back whatever is still open and
   * returns it to the pool.
   */
  class Connection {
   public:
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    /// Label given at acquisition, used in logs
    const std::string &tag() const {
      return tag_;
    }

    bool inTransaction() const {
      return txn_ != nullptr;
    }

    /// Open a transaction scope, or a save point inside the current one
    outcome::result<void> begin();

    /// Close the innermost scope keeping its writes; closing the outermost
    /// one commits
    outcome::result<void> commit();

    /// Undo the innermost scope
    outcome::result<void> rollback();

    /**
     * Run a statement against the open transaction, or against a fresh one
     * which is committed if the statement succeeds
     * @param statement callable taking LogTransaction & and returning
     * outcome::result
     */
    template <typename Statement>
    auto run(Statement &&statement)
        -> decltype(statement(std::declval<LogTransaction &>())) {
      if (txn_) {
        return statement(*txn_);
      }
      auto txn = database_->begin();
      auto result = statement(*txn);
      if (result.has_error()) {
        return result;
      }
      BOOST_OUTCOME_TRYV2(auto &&, txn->commit());
      return result;
    }

   private:
    friend class ConnectionPool;

    Connection(std::shared_ptr<ConnectionPool> pool,
               std::shared_ptr<LogDatabase> database,
               std::string tag);

    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<LogDatabase> database_;
    std::string tag_;
    std::unique_ptr<LogTransaction> txn_;
    size_t depth_ = 0;
  };

  /**
   * @brief Bounded set of connections to the log database shared by all
   * components of the node
   */
  class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
   public:
    static std::shared_ptr<ConnectionPool> create(
        std::shared_ptr<LogDatabase> database,
        size_t size,
        std::chrono::milliseconds acquire_timeout);

    /**
     * Borrow a connection, waiting for one to be returned if all are in use
     * @param ctx cancels the wait
     * @param tag label for logs
     * @return connection, PoolError::POOL_EXHAUSTED after the acquire
     * timeout, or a CtxError
     */
    outcome::result<std::unique_ptr<Connection>> accessTagged(
        const concurrency::Ctx &ctx, std::string_view tag);

    /// Refuse further acquisitions and fail current waiters
    void close();

    size_t size() const {
      return size_;
    }

    size_t available() const;

   private:
    friend class Connection;

    ConnectionPool(std::shared_ptr<LogDatabase> database,
                   size_t size,
                   std::chrono::milliseconds acquire_timeout);

    void release();

    std::shared_ptr<LogDatabase> database_;
    const size_t size_;
    const std::chrono::milliseconds acquire_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
    bool closed_ = false;

    base::Logger logger_;
  };

}  // namespace qstore::storage

OUTCOME_HPP_DECLARE_ERROR_2(qstore::storage, PoolError);

#endif  // QSTORE_STORAGE_CONNECTION_POOL_HPP
