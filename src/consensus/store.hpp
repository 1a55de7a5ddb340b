#ifndef QSTORE_CONSENSUS_STORE_HPP
#define QSTORE_CONSENSUS_STORE_HPP

#include <chrono>
#include <mutex>
#include <string>

#include "consensus/action_queue.hpp"
#include "consensus/block_store.hpp"
#include "consensus/ctx_storage.hpp"
#include "consensus/payload_manager.hpp"
#include "consensus/replica_store.hpp"
#include "crypto/ed25519_provider.hpp"

namespace qstore::consensus {

  struct StoreConfig {
    /// operator which seals the blocks of this node
    primitives::Address operator_address;
    /// identity of the local replica
    std::string node_id = "main";
    /// pause between checks of the execution log
    std::chrono::milliseconds poll_interval{50};
  };

  /**
   * Consensus storage on top of the shared block log. Serves the block
   * store, the replica store and the payload manager of the consensus
   * engine. On follower nodes it also feeds certified blocks to the
   * execution pipeline.
   */
  class Store : public PersistentBlockStore,
                public ReplicaStore,
                public PayloadManager {
   public:
    Store(std::shared_ptr<storage::ConnectionPool> pool,
          std::shared_ptr<crypto::ED25519Provider> crypto_provider,
          StoreConfig config);

    ~Store() override = default;

    /**
     * Create the genesis certificate over the newest sealed block unless
     * the chain already has one. Safe to run concurrently from several
     * nodes sharing the log.
     */
    outcome::result<void> tryInitGenesis(
        const concurrency::Ctx &ctx,
        const std::vector<crypto::ED25519Keypair> &validator_keys);

    /**
     * Start forwarding certified blocks to the execution pipeline, resuming
     * after the newest sealed block
     */
    outcome::result<void> setActionsQueue(const concurrency::Ctx &ctx,
                                          ActionQueueSender sender);

    outcome::result<boost::optional<primitives::BlockStoreState>> state(
        const concurrency::Ctx &ctx) override;

    outcome::result<boost::optional<primitives::FinalBlock>> block(
        const concurrency::Ctx &ctx, primitives::BlockNumber number) override;

    outcome::result<void> storeNextBlock(
        const concurrency::Ctx &ctx,
        const primitives::FinalBlock &block) override;

    outcome::result<boost::optional<primitives::ReplicaState>> replicaState(
        const concurrency::Ctx &ctx) override;

    outcome::result<void> setReplicaState(
        const concurrency::Ctx &ctx,
        const primitives::ReplicaState &state) override;

    outcome::result<base::Buffer> propose(
        const concurrency::Ctx &ctx, primitives::BlockNumber number) override;

    outcome::result<void> verify(const concurrency::Ctx &ctx,
                                 primitives::BlockNumber number,
                                 const base::Buffer &payload) override;

   private:
    struct Follower {
      FetcherCursor cursor;
      ActionQueueSender sender;
    };

    outcome::result<CtxStorage> access(const concurrency::Ctx &ctx);

    /// Translate the block for the execution pipeline if this is a follower
    outcome::result<void> forwardBlock(const concurrency::Ctx &ctx,
                                       const primitives::FinalBlock &block);

    /**
     * Persist the certificate if it extends the certified chain by one.
     * Storing a certificate that is already there does nothing.
     * @return StoreError::NOT_NEXT_BLOCK if the block leaves a gap or there
     * is no genesis, DatabaseError::DUPLICATE_KEY if a different certificate
     * is stored for the block
     */
    outcome::result<void> insertNextCertificate(const concurrency::Ctx &ctx,
                                                CtxStorage &conn,
                                                const primitives::CommitQC &qc);

    /// Wait until the execution log sealed the block
    outcome::result<void> waitUntilSealed(const concurrency::Ctx &ctx,
                                          primitives::BlockNumber number);

    std::shared_ptr<storage::ConnectionPool> pool_;
    std::shared_ptr<crypto::ED25519Provider> crypto_provider_;
    StoreConfig config_;

    std::mutex follower_mutex_;
    boost::optional<Follower> follower_;

    base::Logger logger_;
  };

}  // namespace qstore::consensus

#endif  // QSTORE_CONSENSUS_STORE_HPP
