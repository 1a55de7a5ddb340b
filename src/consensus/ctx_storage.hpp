#ifndef QSTORE_CONSENSUS_CTX_STORAGE_HPP
#define QSTORE_CONSENSUS_CTX_STORAGE_HPP

#include <memory>
#include <string>

#include <boost/optional.hpp>
#include "base/logger.hpp"
#include "consensus/fetcher_cursor.hpp"
#include "primitives/block.hpp"
#include "storage/connection_pool.hpp"

namespace qstore::consensus {

  /**
   * Connection to the log scoped to the consensus subsystem. Every call
   * checks the context first and goes to the database; nothing is cached.
   */
  class CtxStorage {
   public:
    /// Tag of the connections taken by consensus
    static constexpr const char *kTag = "consensus";

    /**
     * Borrow a connection from the pool
     * @return PoolError::POOL_EXHAUSTED or CtxError on failure
     */
    static outcome::result<CtxStorage> access(const concurrency::Ctx &ctx,
                                              storage::ConnectionPool &pool);

    CtxStorage(CtxStorage &&other) noexcept;
    CtxStorage &operator=(CtxStorage &&) = delete;
    CtxStorage(const CtxStorage &) = delete;
    CtxStorage &operator=(const CtxStorage &) = delete;

    /// Rolls back the transaction scope if it was not committed
    ~CtxStorage();

    /**
     * Open a nested transaction scope on the same connection. Its writes stay
     * invisible to other connections until commit() of the outermost scope.
     * The returned scope must not outlive this one.
     */
    outcome::result<CtxStorage> startTransaction(const concurrency::Ctx &ctx);

    /// Close the transaction scope keeping its writes
    outcome::result<void> commit(const concurrency::Ctx &ctx);

    /// Newest sealed execution block
    outcome::result<boost::optional<primitives::BlockNumber>> lastBlockNumber(
        const concurrency::Ctx &ctx);

    /**
     * Payload of a sealed block
     * @return none if the block is not sealed yet,
     * PrimitivesError::BLOCK_NUMBER_OVERFLOW for numbers beyond the execution
     * range
     */
    outcome::result<boost::optional<primitives::Payload>> payload(
        const concurrency::Ctx &ctx,
        primitives::BlockNumber number,
        const primitives::Address &operator_address);

    outcome::result<boost::optional<primitives::CommitQC>> firstCertificate(
        const concurrency::Ctx &ctx);

    outcome::result<boost::optional<primitives::CommitQC>> lastCertificate(
        const concurrency::Ctx &ctx);

    outcome::result<boost::optional<primitives::CommitQC>> certificate(
        const concurrency::Ctx &ctx, primitives::BlockNumber number);

    outcome::result<void> insertCertificate(
        const concurrency::Ctx &ctx,
        const primitives::CommitQC &qc,
        const primitives::Address &operator_address);

    /// @return DatabaseError::DUPLICATE_KEY if genesis was already claimed
    outcome::result<void> claimGenesis(const concurrency::Ctx &ctx,
                                       primitives::BlockNumber number);

    outcome::result<boost::optional<primitives::ReplicaState>> replicaState(
        const concurrency::Ctx &ctx, const std::string &node_id);

    outcome::result<void> setReplicaState(
        const concurrency::Ctx &ctx,
        const std::string &node_id,
        const primitives::ReplicaState &state);

    outcome::result<FetcherCursor> newFetcherCursor(
        const concurrency::Ctx &ctx);

   private:
    CtxStorage(std::unique_ptr<storage::Connection> owned,
               storage::Connection *conn,
               bool scoped);

    std::unique_ptr<storage::Connection> owned_;
    storage::Connection *conn_;
    /// true for a transaction scope still waiting for commit
    bool scoped_;
    base::Logger logger_;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_CTX_STORAGE_HPP
